#pragma once

#include "liqmap/candle_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace liqmap {

/// Per-timeframe detection parameters.
///
/// Higher timeframes use stricter filters, wider zones and longer pivot
/// confirmation; lower timeframes respond faster with looser filters.
/// Instances are built and validated by TimeframeConfigBuilder and treated
/// as immutable afterwards.
struct TimeframeConfig {
  Timeframe timeframe{Timeframe::MIN_5};

  // Pivot confirmation
  int pivot_left{4};
  int pivot_right{4};

  // History
  std::size_t lookback_candles{100};
  uint32_t max_zone_age_candles{100};

  // Volume filters
  double min_volume_percentile{70.0};
  double volume_spike_multiplier{1.6};
  std::size_t volume_lookback{20};

  // Zone geometry (fractions of price)
  double zone_buffer_pct{0.001};
  double merge_radius_pct{0.0015};
  double min_zone_distance_pct{0.0008};

  // Volatility gate
  std::size_t atr_period{14};
  double low_volatility_ratio{0.7};  // current ATR below this x baseline is "low"
  double high_volatility_ratio{1.5}; // current ATR above this x baseline is "high"
  double atr_min_multiplier{0.6};
  double atr_max_multiplier{1.8};

  // Sweep sensitivity (fractions of level price)
  double sweep_penetration_pct{0.0008};
  double sweep_rejection_pct{0.0006};

  // Multi-timeframe weighting
  int tf_weight{2};

  std::string description;

  /// @throws std::invalid_argument describing the first bad field
  void validate() const;
};

/// Canonical parameters for a timeframe (validated)
TimeframeConfig default_timeframe_config(Timeframe tf);

/// Fluent builder that starts from the timeframe defaults
class TimeframeConfigBuilder {
public:
  explicit TimeframeConfigBuilder(Timeframe tf);

  TimeframeConfigBuilder &pivot_window(int left, int right);
  TimeframeConfigBuilder &lookback_candles(std::size_t n);
  TimeframeConfigBuilder &max_zone_age_candles(uint32_t n);
  TimeframeConfigBuilder &min_volume_percentile(double pct);
  TimeframeConfigBuilder &volume_spike_multiplier(double m);
  TimeframeConfigBuilder &volume_lookback(std::size_t n);
  TimeframeConfigBuilder &zone_buffer_pct(double pct);
  TimeframeConfigBuilder &merge_radius_pct(double pct);
  TimeframeConfigBuilder &min_zone_distance_pct(double pct);
  TimeframeConfigBuilder &atr_period(std::size_t n);
  TimeframeConfigBuilder &volatility_ratios(double low, double high);
  TimeframeConfigBuilder &atr_multipliers(double min, double max);
  TimeframeConfigBuilder &sweep_thresholds(double penetration, double rejection);
  TimeframeConfigBuilder &tf_weight(int weight);
  TimeframeConfigBuilder &description(std::string text);

  /// Validate and return the config
  /// @throws std::invalid_argument on any out-of-range field
  TimeframeConfig build() const;

private:
  TimeframeConfig config_;
};

/// Derive the per-refresh variant of `base` for the given trend.
/// The returned copy is not validated and must not be stored.
TimeframeConfig adapt_for_trend(const TimeframeConfig &base,
                                const TrendState &trend);

} // namespace liqmap
