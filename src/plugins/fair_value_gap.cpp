#include "liqmap/plugins/fair_value_gap.hpp"

#include <algorithm>
#include <cmath>

namespace liqmap {

namespace {

// Gap size relative to the middle candle's body
ZoneStrength grade_gap(double gap, const Candle &middle) {
  const double body = std::fabs(middle.close - middle.open);
  if (body <= 0) {
    return ZoneStrength::WEAK;
  }
  const double ratio = gap / body;
  if (ratio >= 0.5) {
    return ZoneStrength::STRONG;
  }
  if (ratio >= 0.25) {
    return ZoneStrength::MODERATE;
  }
  return ZoneStrength::WEAK;
}

} // namespace

FairValueGapPlugin::FairValueGapPlugin(Timeframe timeframe)
    : PatternPlugin("fair_value_gap", timeframe) {}

std::vector<LiquidityZone>
FairValueGapPlugin::detect(const std::vector<Candle> &candles,
                           const TimeframeConfig & /*config*/) {
  std::vector<LiquidityZone> found;
  if (candles.size() < 3) {
    return found;
  }

  for (std::size_t i = 1; i + 1 < candles.size(); ++i) {
    const Candle &prev = candles[i - 1];
    const Candle &mid = candles[i];
    const Candle &next = candles[i + 1];

    double low = 0;
    double high = 0;
    ZoneDirection direction = ZoneDirection::NONE;
    if (prev.high < next.low) {
      low = prev.high;
      high = next.low;
      direction = ZoneDirection::BULLISH;
    } else if (prev.low > next.high) {
      low = next.high;
      high = prev.low;
      direction = ZoneDirection::BEARISH;
    } else {
      continue;
    }

    std::string id = make_id("fvg", mid.open_ts);
    if (detail::contains_id(records_, id)) {
      continue;
    }

    Record rec;
    rec.zone = make_zone(std::move(id), timeframe(), ZoneKind::FAIR_VALUE_GAP,
                         direction, low, high, mid.open_ts, mid.volume,
                         grade_gap(high - low, mid));
    rec.zone.source = name();
    rec.last_seen_ts = next.open_ts;
    records_.push_back(rec);
    found.push_back(rec.zone);
  }
  return found;
}

void FairValueGapPlugin::update(const std::vector<Candle> &candles,
                                double /*current_price*/,
                                const TimeframeConfig &config) {
  for (auto &rec : records_) {
    LiquidityZone &z = rec.zone;
    if (!z.is_active) {
      continue;
    }
    const double size = z.size();

    for (std::size_t i = detail::first_after(candles, rec.last_seen_ts);
         i < candles.size(); ++i) {
      const Candle &c = candles[i];
      rec.last_seen_ts = c.open_ts;
      if (c.low > z.price_high || c.high < z.price_low) {
        continue;
      }

      // Bullish gaps sit below price and fill from the top, bearish from below
      double filled = 0;
      if (z.direction == ZoneDirection::BULLISH) {
        filled = z.price_high - std::max(c.low, z.price_low);
      } else {
        filled = std::min(c.high, z.price_high) - z.price_low;
      }
      const double pct = size > 0 ? std::min(100.0, filled / size * 100.0) : 100.0;
      rec.fill_pct = std::max(rec.fill_pct, pct);
      z.is_mitigated = true;
      ++z.touch_count;

      if (rec.fill_pct >= kFilledPct) {
        z.is_active = false;
        break;
      }
    }
  }

  detail::prune_records(records_, candles, config);
}

std::vector<LiquidityZone>
FairValueGapPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

double FairValueGapPlugin::fill_percentage(const std::string &id) const {
  for (const auto &rec : records_) {
    if (rec.zone.id == id) {
      return rec.fill_pct;
    }
  }
  return -1.0;
}

} // namespace liqmap
