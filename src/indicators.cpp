#include "liqmap/indicators.hpp"

#include <algorithm>
#include <cmath>

namespace liqmap {

double true_range(const Candle &candle, const Candle *prev) {
  double range = candle.high - candle.low;
  if (prev) {
    range = std::max(range, std::fabs(candle.high - prev->close));
    range = std::max(range, std::fabs(candle.low - prev->close));
  }
  return range;
}

std::optional<double> average_true_range(const std::vector<Candle> &candles,
                                         std::size_t period) {
  if (period == 0 || candles.size() < period + 1) {
    return std::nullopt;
  }

  double sum = 0;
  for (std::size_t i = candles.size() - period; i < candles.size(); ++i) {
    sum += true_range(candles[i], &candles[i - 1]);
  }
  return sum / static_cast<double>(period);
}

std::optional<VolatilityReading>
classify_volatility(const std::vector<Candle> &candles,
                    const TimeframeConfig &config) {
  const std::size_t period = config.atr_period;
  if (candles.size() < 2 * period + 1) {
    return std::nullopt;
  }

  auto current = average_true_range(candles, period);
  std::vector<Candle> history(candles.begin(), candles.end() - period);
  auto baseline = average_true_range(history, period);
  if (!current || !baseline) {
    return std::nullopt;
  }

  VolatilityReading reading;
  reading.current_atr = *current;
  reading.baseline_atr = *baseline;
  if (*baseline > 0) {
    if (*current < config.low_volatility_ratio * *baseline) {
      reading.level = Volatility::LOW;
    } else if (*current > config.high_volatility_ratio * *baseline) {
      reading.level = Volatility::HIGH;
    }
  }
  return reading;
}

bool volatility_gate_blocks(const VolatilityReading &reading,
                            const TimeframeConfig &config) {
  if (reading.baseline_atr <= 0) {
    return false;
  }
  switch (reading.level) {
  case Volatility::LOW:
    return reading.current_atr <
           config.atr_min_multiplier * reading.baseline_atr;
  case Volatility::HIGH:
    return reading.current_atr >
           config.atr_max_multiplier * reading.baseline_atr;
  case Volatility::NORMAL:
    break;
  }
  return false;
}

std::optional<double> volume_spike_ratio(const std::vector<Candle> &candles,
                                         std::size_t index,
                                         std::size_t lookback) {
  if (index >= candles.size() || index == 0 || lookback == 0) {
    return std::nullopt;
  }

  const std::size_t begin = index > lookback ? index - lookback : 0;
  double sum = 0;
  for (std::size_t i = begin; i < index; ++i) {
    sum += candles[i].volume;
  }
  const double mean = sum / static_cast<double>(index - begin);
  if (mean <= 0) {
    return std::nullopt;
  }
  return candles[index].volume / mean;
}

double average_body(const std::vector<Candle> &candles, std::size_t end,
                    std::size_t lookback) {
  end = std::min(end, candles.size());
  const std::size_t begin = end > lookback ? end - lookback : 0;
  if (begin == end) {
    return 0;
  }
  double sum = 0;
  for (std::size_t i = begin; i < end; ++i) {
    sum += std::fabs(candles[i].close - candles[i].open);
  }
  return sum / static_cast<double>(end - begin);
}

std::vector<Pivot> detect_pivots(const std::vector<Candle> &candles, int left,
                                 int right) {
  std::vector<Pivot> pivots;
  if (left <= 0 || right <= 0) {
    return pivots;
  }

  const std::size_t l = static_cast<std::size_t>(left);
  const std::size_t r = static_cast<std::size_t>(right);
  if (candles.size() < l + r + 1) {
    return pivots;
  }

  for (std::size_t i = l; i + r < candles.size(); ++i) {
    const Candle &c = candles[i];
    bool is_high = true;
    bool is_low = true;
    for (std::size_t j = i - l; j <= i + r; ++j) {
      if (j == i) {
        continue;
      }
      if (candles[j].high >= c.high) {
        is_high = false;
      }
      if (candles[j].low <= c.low) {
        is_low = false;
      }
      if (!is_high && !is_low) {
        break;
      }
    }
    if (is_high) {
      pivots.push_back(Pivot{i, c.open_ts, c.high, true});
    }
    if (is_low) {
      pivots.push_back(Pivot{i, c.open_ts, c.low, false});
    }
  }
  return pivots;
}

double typical_price(const Candle &candle) {
  return (candle.high + candle.low + candle.close) / 3.0;
}

double percentile(std::vector<double> values, double pct) {
  if (values.empty()) {
    return 0;
  }
  std::sort(values.begin(), values.end());
  pct = std::min(100.0, std::max(0.0, pct));
  const double rank = pct / 100.0 * static_cast<double>(values.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
  const std::size_t hi = static_cast<std::size_t>(std::ceil(rank));
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

std::vector<VolumeCluster> volume_clusters(const std::vector<Candle> &candles,
                                           std::size_t bins,
                                           double min_percentile) {
  std::vector<VolumeCluster> clusters;
  if (candles.empty() || bins == 0) {
    return clusters;
  }

  double lo = typical_price(candles.front());
  double hi = lo;
  for (const auto &c : candles) {
    const double p = typical_price(c);
    lo = std::min(lo, p);
    hi = std::max(hi, p);
  }

  const double width = (hi - lo) / static_cast<double>(bins);
  std::vector<double> per_bin(bins, 0.0);
  for (const auto &c : candles) {
    std::size_t idx = 0;
    if (width > 0) {
      idx = static_cast<std::size_t>((typical_price(c) - lo) / width);
      idx = std::min(idx, bins - 1);
    }
    per_bin[idx] += c.volume;
  }

  const double threshold = percentile(per_bin, min_percentile);
  for (std::size_t i = 0; i < bins; ++i) {
    if (per_bin[i] > 0 && per_bin[i] >= threshold) {
      const double centre = lo + width * (static_cast<double>(i) + 0.5);
      clusters.push_back(VolumeCluster{centre, per_bin[i]});
    }
  }
  return clusters;
}

} // namespace liqmap
