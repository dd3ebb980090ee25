#include "liqmap/displacement.hpp"

#include <cmath>
#include <stdexcept>

namespace liqmap {

namespace {

bool qualifies(const Candle &c, double baseline, const DisplacementConfig &config) {
  if (c.volume < baseline * config.min_volume_ratio) {
    return false;
  }
  const double range = c.high - c.low;
  if (range <= 0) {
    return false;
  }
  return std::fabs(c.close - c.open) / range >= config.min_body_pct;
}

double metric_value(const Displacement &d, DisplacementMetric metric) {
  switch (metric) {
  case DisplacementMetric::MOVE_PCT:
    return d.move_pct;
  case DisplacementMetric::VOLUME_SURGE:
    return d.volume_surge_ratio;
  case DisplacementMetric::NUM_CANDLES:
    return static_cast<double>(d.num_candles);
  }
  return d.move_pct;
}

} // namespace

std::vector<Displacement>
detect_displacements(const std::vector<Candle> &candles, Timeframe timeframe,
                     const DisplacementConfig &config) {
  if (config.min_candles == 0 || config.volume_lookback == 0) {
    throw std::invalid_argument(
        "displacement min_candles and volume_lookback must be positive");
  }

  std::vector<Displacement> found;
  if (candles.size() < config.min_candles + config.volume_lookback) {
    return found;
  }

  double baseline = 0;
  for (std::size_t i = candles.size() - config.volume_lookback;
       i < candles.size(); ++i) {
    baseline += candles[i].volume;
  }
  baseline /= static_cast<double>(config.volume_lookback);

  std::size_t i = config.volume_lookback;
  while (i < candles.size()) {
    const Candle &first = candles[i];
    if (!qualifies(first, baseline, config)) {
      ++i;
      continue;
    }

    const bool bullish = first.close > first.open;
    std::size_t end = i;
    double volume = first.volume;
    while (end + 1 < candles.size()) {
      const Candle &next = candles[end + 1];
      if ((next.close > next.open) != bullish || !qualifies(next, baseline, config)) {
        break;
      }
      ++end;
      volume += next.volume;
    }

    const auto count = static_cast<uint32_t>(end - i + 1);
    if (count < config.min_candles || first.open <= 0) {
      ++i;
      continue;
    }

    Displacement d;
    d.timeframe = timeframe;
    d.direction = bullish ? ZoneDirection::BULLISH : ZoneDirection::BEARISH;
    d.start_price = first.open;
    d.end_price = candles[end].close;
    d.start_ts = first.open_ts;
    d.end_ts = candles[end].open_ts;
    d.num_candles = count;
    d.move_pct = std::fabs(d.end_price - d.start_price) / d.start_price;
    d.avg_volume = volume / count;
    d.volume_surge_ratio = baseline > 0 ? d.avg_volume / baseline : 1.0;
    found.push_back(d);

    i = end + 1;
  }
  return found;
}

std::optional<Displacement>
strongest_displacement(const std::vector<Displacement> &displacements,
                       DisplacementMetric metric) {
  std::optional<Displacement> best;
  for (const auto &d : displacements) {
    if (!best || metric_value(d, metric) > metric_value(*best, metric)) {
      best = d;
    }
  }
  return best;
}

} // namespace liqmap
