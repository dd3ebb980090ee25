#include "liqmap/plugins/structure_break.hpp"

#include "liqmap/indicators.hpp"

#include <cmath>
#include <optional>

namespace liqmap {

namespace {

struct Swing {
  double price{0};
  bool broken{false};
};

ZoneStrength grade_break(const std::vector<Candle> &window, std::size_t k) {
  const double body = std::fabs(window[k].close - window[k].open);
  const double avg = average_body(window, k, window.size());
  if (avg <= 0) {
    return ZoneStrength::WEAK;
  }
  if (body > 1.5 * avg) {
    return ZoneStrength::STRONG;
  }
  if (body > avg) {
    return ZoneStrength::MODERATE;
  }
  return ZoneStrength::WEAK;
}

} // namespace

StructureBreakPlugin::StructureBreakPlugin(Timeframe timeframe)
    : PatternPlugin("structure_break", timeframe) {}

std::vector<LiquidityZone>
StructureBreakPlugin::detect(const std::vector<Candle> &candles,
                             const TimeframeConfig &config) {
  std::vector<LiquidityZone> found;
  const std::size_t start =
      candles.size() > kScanWindow ? candles.size() - kScanWindow : 0;
  std::vector<Candle> window(candles.begin() + start, candles.end());

  auto pivots = detect_pivots(window, kSwingLookback, kSwingLookback);
  std::size_t next_pivot = 0;
  std::optional<Swing> last_high;
  std::optional<Swing> last_low;
  StructureTrend trend = StructureTrend::RANGING;

  for (std::size_t k = 0; k < window.size(); ++k) {
    // Swings become usable once their right-hand confirmation has closed
    while (next_pivot < pivots.size() &&
           pivots[next_pivot].index + static_cast<std::size_t>(kSwingLookback) < k) {
      const Pivot &p = pivots[next_pivot++];
      if (p.is_high) {
        last_high = Swing{p.price, false};
      } else {
        last_low = Swing{p.price, false};
      }
    }

    const Candle &c = window[k];
    for (bool up : {true, false}) {
      std::optional<Swing> &swing = up ? last_high : last_low;
      if (!swing || swing->broken) {
        continue;
      }
      const bool crossed = up ? c.close > swing->price : c.close < swing->price;
      if (!crossed) {
        continue;
      }
      swing->broken = true;

      const StructureTrend against =
          up ? StructureTrend::DOWN : StructureTrend::UP;
      const BreakType type = trend == against ? BreakType::CHOCH : BreakType::BOS;
      trend = up ? StructureTrend::UP : StructureTrend::DOWN;

      std::string id = make_id(up ? "brk_up" : "brk_dn", c.open_ts);
      if (detail::contains_id(records_, id)) {
        continue;
      }

      const double half = swing->price * config.zone_buffer_pct;
      Record rec;
      rec.type = type;
      rec.level = swing->price;
      rec.last_seen_ts = c.open_ts;
      rec.zone = make_zone(std::move(id), timeframe(), ZoneKind::STRUCTURE_BREAK,
                           up ? ZoneDirection::BULLISH : ZoneDirection::BEARISH,
                           swing->price - half, swing->price + half, c.open_ts,
                           c.volume, grade_break(window, k));
      rec.zone.source = name();
      records_.push_back(rec);
      found.push_back(rec.zone);
    }
  }

  trend_ = trend;
  return found;
}

void StructureBreakPlugin::update(const std::vector<Candle> &candles,
                                  double /*current_price*/,
                                  const TimeframeConfig &config) {
  for (auto &rec : records_) {
    LiquidityZone &z = rec.zone;
    if (!z.is_active) {
      continue;
    }
    const bool up = z.direction == ZoneDirection::BULLISH;

    for (std::size_t i = detail::first_after(candles, rec.last_seen_ts);
         i < candles.size(); ++i) {
      const Candle &c = candles[i];
      rec.last_seen_ts = c.open_ts;

      const bool failed = up ? c.close < z.price_low : c.close > z.price_high;
      if (failed) {
        z.is_active = false;
        break;
      }
      const bool retest = up ? c.low <= z.price_high : c.high >= z.price_low;
      if (retest) {
        ++z.touch_count;
        z.is_mitigated = true;
      }
    }
  }

  detail::prune_records(records_, candles, config);
}

std::vector<LiquidityZone>
StructureBreakPlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

BreakType StructureBreakPlugin::break_type(const std::string &id) const {
  for (const auto &rec : records_) {
    if (rec.zone.id == id) {
      return rec.type;
    }
  }
  return BreakType::BOS;
}

} // namespace liqmap
