#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/timeframe_config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace liqmap {

/// True range of `candle`; the previous close widens the range when present
double true_range(const Candle &candle, const Candle *prev);

/// Simple moving average of the true range over the last `period` candles.
/// Returns nullopt when fewer than period + 1 candles are available.
std::optional<double> average_true_range(const std::vector<Candle> &candles,
                                         std::size_t period);

enum class Volatility { LOW, NORMAL, HIGH };

struct VolatilityReading {
  double current_atr{0};
  double baseline_atr{0}; // ATR of the window with the latest period dropped
  Volatility level{Volatility::NORMAL};

  double ratio() const {
    return baseline_atr > 0 ? current_atr / baseline_atr : 1.0;
  }
};

/// Classify the current ATR against its baseline using the config thresholds.
/// Returns nullopt until 2 x atr_period + 1 candles are available.
std::optional<VolatilityReading>
classify_volatility(const std::vector<Candle> &candles,
                    const TimeframeConfig &config);

/// True when the refresh must skip detection: the market is classified low
/// and below atr_min_multiplier x baseline, or high and above
/// atr_max_multiplier x baseline.
bool volatility_gate_blocks(const VolatilityReading &reading,
                            const TimeframeConfig &config);

/// volume[index] / mean(volume[index - lookback .. index - 1]).
/// Returns nullopt when the trailing window is empty or its mean is zero.
std::optional<double> volume_spike_ratio(const std::vector<Candle> &candles,
                                         std::size_t index,
                                         std::size_t lookback);

/// Mean candle body over the last `lookback` candles before `end`
double average_body(const std::vector<Candle> &candles, std::size_t end,
                    std::size_t lookback);

struct Pivot {
  std::size_t index{0};
  uint64_t open_ts{0};
  double price{0};
  bool is_high{false};
};

/// Confirmed swing highs and lows. A candle is a swing high when its high is
/// strictly greater than every high in [i - left, i - 1] and
/// [i + 1, i + right]; lows mirror this. Results are ordered by index, highs
/// before lows on the same candle.
std::vector<Pivot> detect_pivots(const std::vector<Candle> &candles, int left,
                                 int right);

/// Typical price (high + low + close) / 3
double typical_price(const Candle &candle);

/// Linear-interpolated percentile of `values` (pct in [0, 100])
double percentile(std::vector<double> values, double pct);

struct VolumeCluster {
  double price{0};  // bin centre
  double volume{0};
};

/// Volume profile over typical prices, keeping bins at or above the
/// `min_percentile` bin volume
std::vector<VolumeCluster> volume_clusters(const std::vector<Candle> &candles,
                                           std::size_t bins,
                                           double min_percentile);

} // namespace liqmap
