#include "liqmap/plugins/breaker_block.hpp"

namespace liqmap {

BreakerBlockPlugin::BreakerBlockPlugin(Timeframe timeframe,
                                       const OrderBlockPlugin &order_blocks)
    : PatternPlugin("breaker_block", timeframe), order_blocks_(order_blocks) {}

std::vector<LiquidityZone>
BreakerBlockPlugin::detect(const std::vector<Candle> & /*candles*/,
                           const TimeframeConfig & /*config*/) {
  std::vector<LiquidityZone> found;
  const auto blocks = order_blocks_.blocks();

  // Forget conversions whose order block has been pruned upstream
  std::set<std::string> live;
  for (const auto &ob : blocks) {
    if (converted_.count(ob.zone.id)) {
      live.insert(ob.zone.id);
    }
  }
  converted_.swap(live);

  for (const auto &ob : blocks) {
    if (!ob.is_breaker || !ob.broken_ts || converted_.count(ob.zone.id)) {
      continue;
    }
    converted_.insert(ob.zone.id);

    // A broken bullish block now resists from above, and vice versa
    const ZoneDirection flipped = ob.zone.direction == ZoneDirection::BULLISH
                                      ? ZoneDirection::BEARISH
                                      : ZoneDirection::BULLISH;
    Record rec;
    rec.order_block_id = ob.zone.id;
    rec.last_seen_ts = *ob.broken_ts;
    rec.zone = make_zone(make_id("bb", ob.zone.created_ts), timeframe(),
                         ZoneKind::BREAKER_BLOCK, flipped, ob.zone.price_low,
                         ob.zone.price_high, *ob.broken_ts, ob.zone.volume,
                         ob.zone.strength);
    rec.zone.source = name();
    records_.push_back(rec);
    found.push_back(rec.zone);
  }
  return found;
}

void BreakerBlockPlugin::update(const std::vector<Candle> &candles,
                                double /*current_price*/,
                                const TimeframeConfig &config) {
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

      const bool invalidated =
          bearish ? c.close > z.price_high : c.close < z.price_low;
      if (invalidated) {
        z.is_active = false;
        break;
      }
      const bool retest = bearish ? c.high >= z.price_low : c.low <= z.price_high;
      if (retest) {
        ++rec.retests;
        ++z.touch_count;
        z.is_mitigated = true;
      }
    }
  }

  detail::prune_records(records_, candles, config);
}

std::vector<LiquidityZone>
BreakerBlockPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

uint32_t BreakerBlockPlugin::retest_count(const std::string &id) const {
  for (const auto &rec : records_) {
    if (rec.zone.id == id) {
      return rec.retests;
    }
  }
  return 0;
}

} // namespace liqmap
