#include "liqmap/plugins/liquidity_level.hpp"

#include "liqmap/indicators.hpp"

#include <algorithm>
#include <cmath>

namespace liqmap {

namespace {

ZoneStrength grade_touches(uint32_t touches) {
  if (touches >= 4) {
    return ZoneStrength::STRONG;
  }
  if (touches >= 3) {
    return ZoneStrength::MODERATE;
  }
  return ZoneStrength::WEAK;
}

bool near(double a, double b) {
  return std::fabs(a - b) <= b * LiquidityLevelPlugin::kEqualTolerancePct;
}

} // namespace

LiquidityLevelPlugin::LiquidityLevelPlugin(Timeframe timeframe)
    : PatternPlugin("liquidity_level", timeframe) {}

std::vector<LiquidityZone>
LiquidityLevelPlugin::detect(const std::vector<Candle> &candles,
                             const TimeframeConfig &config) {
  std::vector<LiquidityZone> found;
  auto pivots = detect_pivots(candles, kSwingWindow, kSwingWindow);

  for (bool highs : {true, false}) {
    const LevelSide side = highs ? LevelSide::BUY_SIDE : LevelSide::SELL_SIDE;

    std::vector<Pivot> swings;
    for (const auto &p : pivots) {
      if (p.is_high == highs) {
        swings.push_back(p);
      }
    }

    std::vector<bool> used(swings.size(), false);
    for (std::size_t i = 0; i < swings.size(); ++i) {
      if (used[i]) {
        continue;
      }

      std::vector<std::size_t> members{i};
      for (std::size_t j = i + 1; j < swings.size(); ++j) {
        if (!used[j] && near(swings[j].price, swings[i].price)) {
          members.push_back(j);
        }
      }
      if (members.size() < kMinTouches) {
        continue;
      }

      double sum = 0;
      double volume = 0;
      uint64_t last_touch = 0;
      for (std::size_t m : members) {
        used[m] = true;
        sum += swings[m].price;
        volume += candles[swings[m].index].volume;
        last_touch = std::max(last_touch, swings[m].open_ts);
      }
      const double price = sum / static_cast<double>(members.size());
      const auto touches = static_cast<uint32_t>(members.size());

      // Same pool seen from a later window: refresh instead of duplicating
      auto existing = std::find_if(
          records_.begin(), records_.end(), [&](const LiquidityLevel &lvl) {
            return lvl.side == side && !lvl.is_swept && near(price, lvl.price);
          });
      if (existing != records_.end()) {
        existing->zone.touch_count =
            std::max(existing->zone.touch_count, touches);
        existing->zone.strength = grade_touches(existing->zone.touch_count);
        existing->last_touch_ts = std::max(existing->last_touch_ts, last_touch);
        continue;
      }

      const uint64_t first_ts = swings[i].open_ts;
      std::string id = make_id(highs ? "bsl" : "ssl", first_ts);
      if (detail::contains_id(records_, id)) {
        continue;
      }

      const double half = price * config.zone_buffer_pct;
      LiquidityLevel lvl;
      lvl.side = side;
      lvl.price = price;
      lvl.last_touch_ts = last_touch;
      lvl.last_seen_ts = last_touch;
      lvl.zone = make_zone(std::move(id), timeframe(), ZoneKind::LIQUIDITY_LEVEL,
                           highs ? ZoneDirection::BEARISH : ZoneDirection::BULLISH,
                           price - half, price + half, first_ts, volume,
                           grade_touches(touches));
      lvl.zone.touch_count = touches;
      lvl.zone.source = name();
      records_.push_back(lvl);
      found.push_back(lvl.zone);
    }
  }
  return found;
}

void LiquidityLevelPlugin::update(const std::vector<Candle> &candles,
                                  double /*current_price*/,
                                  const TimeframeConfig &config) {
  const double pen = config.sweep_penetration_pct;

  for (auto &lvl : records_) {
    if (lvl.is_swept || !lvl.zone.is_active) {
      continue;
    }
    const bool bsl = lvl.side == LevelSide::BUY_SIDE;

    for (std::size_t i = detail::first_after(candles, lvl.last_seen_ts);
         i < candles.size(); ++i) {
      const Candle &c = candles[i];
      lvl.last_seen_ts = c.open_ts;

      const bool swept = bsl ? c.high > lvl.price * (1.0 + pen)
                             : c.low < lvl.price * (1.0 - pen);
      if (swept) {
        lvl.is_swept = true;
        lvl.sweep_ts = c.open_ts;
        lvl.sweep_extreme = bsl ? c.high : c.low;
        lvl.zone.is_mitigated = true;
        lvl.zone.is_active = false;
        break;
      }

      if (near(bsl ? c.high : c.low, lvl.price)) {
        ++lvl.zone.touch_count;
        lvl.zone.strength = grade_touches(lvl.zone.touch_count);
        lvl.last_touch_ts = c.open_ts;
      }
    }
  }

  // Swept levels stay until the sweep plugin has had a refresh to read them
  detail::prune_records(records_, candles, config,
                        [](const LiquidityLevel &lvl, uint64_t window_start) {
                          return lvl.is_swept && lvl.sweep_ts &&
                                 *lvl.sweep_ts >= window_start;
                        });
}

std::vector<LiquidityZone>
LiquidityLevelPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

} // namespace liqmap
