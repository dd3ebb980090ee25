#include "liqmap/plugins/order_block.hpp"

#include "liqmap/indicators.hpp"

#include <algorithm>
#include <cmath>

namespace liqmap {

namespace {

ZoneStrength grade_move(double move_pct) {
  const double score = std::min(1.0, move_pct * 50.0);
  if (score > 0.7) {
    return ZoneStrength::STRONG;
  }
  if (score > 0.4) {
    return ZoneStrength::MODERATE;
  }
  return ZoneStrength::WEAK;
}

bool is_bullish(const Candle &c) { return c.close > c.open; }
bool is_bearish(const Candle &c) { return c.close < c.open; }

} // namespace

OrderBlockPlugin::OrderBlockPlugin(Timeframe timeframe)
    : PatternPlugin("order_block", timeframe) {}

std::vector<LiquidityZone>
OrderBlockPlugin::detect(const std::vector<Candle> &candles,
                         const TimeframeConfig & /*config*/) {
  std::vector<LiquidityZone> found;

  for (std::size_t i = 1; i < candles.size(); ++i) {
    const Candle &move = candles[i];
    const double body = std::fabs(move.close - move.open);
    const double avg = average_body(candles, i, kBodyLookback);
    if (avg <= 0 || body <= kDisplacementBodyMultiple * avg || move.open <= 0) {
      continue;
    }

    const bool bullish = is_bullish(move);
    const std::size_t stop = i > kMaxOriginDistance ? i - kMaxOriginDistance : 0;
    for (std::size_t j = i; j-- > stop;) {
      const Candle &origin = candles[j];
      if (bullish ? !is_bearish(origin) : !is_bullish(origin)) {
        continue;
      }

      std::string id = make_id("ob", origin.open_ts);
      if (!detail::contains_id(records_, id)) {
        OrderBlock ob;
        ob.move_pct = body / move.open;
        ob.displacement_ts = move.open_ts;
        ob.last_seen_ts = move.open_ts;
        ob.zone = make_zone(std::move(id), timeframe(), ZoneKind::ORDER_BLOCK,
                            bullish ? ZoneDirection::BULLISH
                                    : ZoneDirection::BEARISH,
                            origin.low, origin.high, origin.open_ts,
                            origin.volume, grade_move(ob.move_pct));
        ob.zone.source = name();
        records_.push_back(ob);
        found.push_back(ob.zone);
      }
      break;
    }
  }
  return found;
}

void OrderBlockPlugin::update(const std::vector<Candle> &candles,
                              double current_price,
                              const TimeframeConfig &config) {
  for (auto &ob : records_) {
    LiquidityZone &z = ob.zone;
    if (!z.is_active) {
      continue;
    }

    for (std::size_t i = detail::first_after(candles, ob.last_seen_ts);
         i < candles.size(); ++i) {
      const Candle &c = candles[i];
      ob.last_seen_ts = c.open_ts;

      const bool bullish = z.direction == ZoneDirection::BULLISH;
      const bool closed_through =
          bullish ? c.close < z.price_low : c.close > z.price_high;
      if (closed_through) {
        ob.is_breaker = true;
        ob.broken_ts = c.open_ts;
        z.is_active = false;
        break;
      }

      const bool revisited = bullish ? c.low <= z.price_high
                                     : c.high >= z.price_low;
      if (revisited) {
        z.is_mitigated = true;
        ++z.touch_count;
      }
    }

    if (z.is_active && z.contains(current_price)) {
      z.is_mitigated = true;
    }
  }

  // A break inside the window has not necessarily been read by the breaker
  // plugin yet
  detail::prune_records(records_, candles, config,
                        [](const OrderBlock &ob, uint64_t window_start) {
                          return ob.is_breaker && ob.broken_ts &&
                                 *ob.broken_ts >= window_start;
                        });
}

std::vector<LiquidityZone>
OrderBlockPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

} // namespace liqmap
