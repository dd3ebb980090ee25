#include "liqmap/plugins/liquidity_sweep.hpp"

#include <algorithm>

namespace liqmap {

LiquiditySweepPlugin::LiquiditySweepPlugin(Timeframe timeframe,
                                           const LiquidityLevelPlugin &levels)
    : PatternPlugin("liquidity_sweep", timeframe), levels_(levels) {}

std::vector<LiquidityZone>
LiquiditySweepPlugin::detect(const std::vector<Candle> &candles,
                             const TimeframeConfig & /*config*/) {
  std::vector<LiquidityZone> found;
  const auto levels = levels_.levels();

  std::set<std::string> live;
  for (const auto &lvl : levels) {
    if (converted_.count(lvl.zone.id)) {
      live.insert(lvl.zone.id);
    }
  }
  converted_.swap(live);

  for (const auto &lvl : levels) {
    if (!lvl.is_swept || !lvl.sweep_ts || converted_.count(lvl.zone.id)) {
      continue;
    }
    converted_.insert(lvl.zone.id);

    // Buy-side sweeps set up a move down, sell-side sweeps a move up
    const bool bsl = lvl.side == LevelSide::BUY_SIDE;
    const double low = bsl ? lvl.price : lvl.sweep_extreme;
    const double high = bsl ? lvl.sweep_extreme : lvl.price;

    double volume = 0;
    auto it = std::find_if(candles.begin(), candles.end(), [&](const Candle &c) {
      return c.open_ts == *lvl.sweep_ts;
    });
    if (it != candles.end()) {
      volume = it->volume;
    }

    Record rec;
    rec.level_id = lvl.zone.id;
    rec.level_price = lvl.price;
    rec.last_seen_ts = *lvl.sweep_ts;
    rec.zone = make_zone(make_id(bsl ? "sweep_bsl" : "sweep_ssl", lvl.zone.created_ts),
                         timeframe(), ZoneKind::LIQUIDITY_SWEEP,
                         bsl ? ZoneDirection::BEARISH : ZoneDirection::BULLISH,
                         low, high, *lvl.sweep_ts, volume, ZoneStrength::WEAK);
    rec.zone.touch_count = lvl.zone.touch_count;
    rec.zone.source = name();
    records_.push_back(rec);
    found.push_back(rec.zone);
  }
  return found;
}

void LiquiditySweepPlugin::update(const std::vector<Candle> &candles,
                                  double /*current_price*/,
                                  const TimeframeConfig &config) {
  const double rejection = config.sweep_rejection_pct;

  for (auto &rec : records_) {
    LiquidityZone &z = rec.zone;
    if (!z.is_active) {
      continue;
    }
    const bool bearish = z.direction == ZoneDirection::BEARISH;

    for (std::size_t i = detail::first_after(candles, rec.last_seen_ts);
         i < candles.size(); ++i) {
      const Candle &c = candles[i];
      rec.last_seen_ts = c.open_ts;

      if (rec.confirmed) {
        // Price reclaiming the sweep extreme cancels the reversal
        const bool invalidated =
            bearish ? c.close > z.price_high : c.close < z.price_low;
        if (invalidated) {
          z.is_active = false;
          break;
        }
        continue;
      }

      ++rec.candles_seen;
      const bool reversed =
          bearish ? c.close <= rec.level_price * (1.0 - rejection)
                  : c.close >= rec.level_price * (1.0 + rejection);
      if (reversed) {
        rec.confirmed = true;
        z.strength = ZoneStrength::STRONG;
        continue;
      }
      if (rec.candles_seen >= kConfirmWindow) {
        z.is_active = false;
        break;
      }
    }
  }

  detail::prune_records(records_, candles, config);
}

std::vector<LiquidityZone>
LiquiditySweepPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

bool LiquiditySweepPlugin::is_confirmed(const std::string &id) const {
  for (const auto &rec : records_) {
    if (rec.zone.id == id) {
      return rec.confirmed;
    }
  }
  return false;
}

} // namespace liqmap
