#include "liqmap/plugins/support_resistance.hpp"

#include "liqmap/indicators.hpp"

#include <cmath>

namespace liqmap {

namespace {

ZoneStrength grade(uint32_t touches, double volume, double top_volume) {
  if (touches >= 3 && volume >= top_volume) {
    return ZoneStrength::STRONG;
  }
  if (touches >= 2 || volume >= top_volume * 0.5) {
    return ZoneStrength::MODERATE;
  }
  return ZoneStrength::WEAK;
}

double top_volume_threshold(const std::vector<Candle> &candles) {
  std::vector<double> volumes;
  volumes.reserve(candles.size());
  for (const auto &c : candles) {
    volumes.push_back(c.volume);
  }
  return percentile(volumes, 70.0);
}

} // namespace

SupportResistancePlugin::SupportResistancePlugin(Timeframe timeframe)
    : PatternPlugin("support_resistance", timeframe) {}

std::vector<LiquidityZone>
SupportResistancePlugin::detect(const std::vector<Candle> &candles,
                                const TimeframeConfig &config) {
  std::vector<LiquidityZone> found;
  auto pivots = detect_pivots(candles, config.pivot_left, config.pivot_right);
  if (pivots.empty()) {
    return found;
  }

  auto clusters =
      volume_clusters(candles, kVolumeBins, config.min_volume_percentile);
  const double top_volume = top_volume_threshold(candles);

  for (const auto &pivot : pivots) {
    bool backed = false;
    for (const auto &cluster : clusters) {
      if (std::fabs(cluster.price - pivot.price) / pivot.price <=
          kClusterProximityPct) {
        backed = true;
        break;
      }
    }
    if (!backed) {
      continue;
    }

    std::string id = make_id(pivot.is_high ? "res" : "sup", pivot.open_ts);
    if (detail::contains_id(records_, id)) {
      continue;
    }

    const Candle &origin = candles[pivot.index];
    const double half = pivot.price * config.zone_buffer_pct;
    Record rec;
    rec.zone = make_zone(std::move(id), timeframe(),
                         pivot.is_high ? ZoneKind::RESISTANCE : ZoneKind::SUPPORT,
                         pivot.is_high ? ZoneDirection::BEARISH
                                       : ZoneDirection::BULLISH,
                         pivot.price - half, pivot.price + half, pivot.open_ts,
                         origin.volume);
    rec.zone.strength = grade(0, origin.volume, top_volume);
    rec.zone.source = name();
    // Candles that confirmed the pivot do not count as touches
    rec.last_seen_ts = candles[pivot.index + config.pivot_right].open_ts;
    records_.push_back(rec);
    found.push_back(rec.zone);
  }
  return found;
}

void SupportResistancePlugin::update(const std::vector<Candle> &candles,
                                     double current_price,
                                     const TimeframeConfig &config) {
  if (candles.empty()) {
    return;
  }

  const std::size_t tail =
      candles.size() > kTouchWindow ? candles.size() - kTouchWindow : 0;
  std::vector<Candle> recent(candles.begin() + tail, candles.end());
  const double top_volume = top_volume_threshold(recent);

  for (auto &rec : records_) {
    LiquidityZone &z = rec.zone;
    if (!z.is_active) {
      continue;
    }

    for (std::size_t i = detail::first_after(recent, rec.last_seen_ts);
         i < recent.size(); ++i) {
      const Candle &c = recent[i];
      rec.last_seen_ts = c.open_ts;

      const bool broken = z.kind == ZoneKind::SUPPORT ? c.close < z.price_low
                                                      : c.close > z.price_high;
      if (broken) {
        z.is_active = false;
        break;
      }
      if (c.low <= z.price_high && c.high >= z.price_low) {
        ++z.touch_count;
        z.is_mitigated = true;
      }
    }

    if (z.is_active && z.contains(current_price)) {
      z.is_mitigated = true;
    }
    z.strength = grade(z.touch_count, z.volume, top_volume);
  }

  detail::prune_records(records_, candles, config);
}

std::vector<LiquidityZone>
SupportResistancePlugin::get(const ZoneFilter &filter) const {
  return detail::collect_zones(records_, filter);
}

} // namespace liqmap
