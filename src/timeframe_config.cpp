#include "liqmap/timeframe_config.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace liqmap {

namespace {

void require(bool ok, const TimeframeConfig &cfg, const char *what) {
  if (!ok) {
    throw std::invalid_argument("invalid TimeframeConfig(" +
                                timeframe_label(cfg.timeframe) + "): " + what);
  }
}

int scale_window(int window, double factor) {
  long scaled = std::lround(static_cast<double>(window) * factor);
  return static_cast<int>(std::max(1L, scaled));
}

} // namespace

void TimeframeConfig::validate() const {
  require(pivot_left > 0 && pivot_left <= 20, *this, "pivot_left must be 1-20");
  require(pivot_right > 0 && pivot_right <= 20, *this,
          "pivot_right must be 1-20");
  require(lookback_candles >= 10 && lookback_candles <= 500, *this,
          "lookback_candles must be 10-500");
  require(lookback_candles >= static_cast<std::size_t>(pivot_left + pivot_right + 1),
          *this, "lookback_candles must cover the pivot window");
  require(max_zone_age_candles >= 10 && max_zone_age_candles <= 1000, *this,
          "max_zone_age_candles must be 10-1000");
  require(min_volume_percentile > 0 && min_volume_percentile <= 100, *this,
          "min_volume_percentile must be 0-100");
  require(volume_spike_multiplier >= 1.0 && volume_spike_multiplier <= 5.0,
          *this, "volume_spike_multiplier must be 1.0-5.0");
  require(volume_lookback > 0, *this, "volume_lookback must be > 0");
  require(zone_buffer_pct > 0 && zone_buffer_pct <= 0.01, *this,
          "zone_buffer_pct must be 0-1%");
  require(merge_radius_pct > 0 && merge_radius_pct <= 0.01, *this,
          "merge_radius_pct must be 0-1%");
  require(min_zone_distance_pct >= 0 && min_zone_distance_pct <= 0.01, *this,
          "min_zone_distance_pct must be 0-1%");
  require(atr_period > 0, *this, "atr_period must be > 0");
  require(low_volatility_ratio > 0 && low_volatility_ratio < 1.0, *this,
          "low_volatility_ratio must be in (0, 1)");
  require(high_volatility_ratio > 1.0, *this,
          "high_volatility_ratio must be > 1");
  require(atr_min_multiplier >= 0.1 && atr_min_multiplier <= 2.0, *this,
          "atr_min_multiplier must be 0.1-2.0");
  require(atr_max_multiplier >= 0.5 && atr_max_multiplier <= 5.0, *this,
          "atr_max_multiplier must be 0.5-5.0");
  require(atr_min_multiplier < atr_max_multiplier, *this,
          "atr_min_multiplier must be below atr_max_multiplier");
  require(sweep_penetration_pct >= 0.0001 && sweep_penetration_pct <= 0.01,
          *this, "sweep_penetration_pct must be 0.01%-1%");
  require(sweep_rejection_pct >= 0.0001 && sweep_rejection_pct <= 0.01, *this,
          "sweep_rejection_pct must be 0.01%-1%");
  require(tf_weight >= 1 && tf_weight <= 10, *this, "tf_weight must be 1-10");
}

TimeframeConfig default_timeframe_config(Timeframe tf) {
  TimeframeConfig cfg;
  cfg.timeframe = tf;

  switch (tf) {
  case Timeframe::MIN_1:
    cfg.pivot_left = 3;
    cfg.pivot_right = 3;
    cfg.lookback_candles = 80;
    cfg.max_zone_age_candles = 40;
    cfg.min_volume_percentile = 65.0;
    cfg.volume_spike_multiplier = 1.5;
    cfg.zone_buffer_pct = 0.0008;
    cfg.merge_radius_pct = 0.0012;
    cfg.min_zone_distance_pct = 0.0005;
    cfg.atr_min_multiplier = 0.5;
    cfg.atr_max_multiplier = 1.5;
    cfg.sweep_penetration_pct = 0.0006;
    cfg.sweep_rejection_pct = 0.0005;
    cfg.tf_weight = 1;
    cfg.description = "Micro structure - scalping zones";
    break;
  case Timeframe::MIN_5:
    cfg.description = "Intraday structure - day trading zones";
    break;
  case Timeframe::MIN_15:
    cfg.pivot_left = 5;
    cfg.pivot_right = 5;
    cfg.lookback_candles = 100;
    cfg.max_zone_age_candles = 150;
    cfg.min_volume_percentile = 70.0;
    cfg.volume_spike_multiplier = 1.8;
    cfg.zone_buffer_pct = 0.0015;
    cfg.merge_radius_pct = 0.0018;
    cfg.min_zone_distance_pct = 0.001;
    cfg.atr_min_multiplier = 0.7;
    cfg.atr_max_multiplier = 2.0;
    cfg.sweep_penetration_pct = 0.0012;
    cfg.sweep_rejection_pct = 0.0008;
    cfg.tf_weight = 3;
    cfg.description = "Swing structure - session highs/lows";
    break;
  case Timeframe::HOUR_1:
    cfg.pivot_left = 8;
    cfg.pivot_right = 8;
    cfg.lookback_candles = 120;
    cfg.max_zone_age_candles = 200;
    cfg.min_volume_percentile = 75.0;
    cfg.volume_spike_multiplier = 2.2;
    cfg.zone_buffer_pct = 0.002;
    cfg.merge_radius_pct = 0.0025;
    cfg.min_zone_distance_pct = 0.0015;
    cfg.atr_min_multiplier = 0.8;
    cfg.atr_max_multiplier = 2.5;
    cfg.sweep_penetration_pct = 0.002;
    cfg.sweep_rejection_pct = 0.0012;
    cfg.tf_weight = 4;
    cfg.description = "Major structure - daily key levels";
    break;
  case Timeframe::HOUR_4:
    cfg.pivot_left = 8;
    cfg.pivot_right = 8;
    cfg.lookback_candles = 150;
    cfg.max_zone_age_candles = 180;
    cfg.min_volume_percentile = 75.0;
    cfg.volume_spike_multiplier = 2.2;
    cfg.zone_buffer_pct = 0.0025;
    cfg.merge_radius_pct = 0.003;
    cfg.min_zone_distance_pct = 0.002;
    cfg.atr_min_multiplier = 0.8;
    cfg.atr_max_multiplier = 2.5;
    cfg.sweep_penetration_pct = 0.0025;
    cfg.sweep_rejection_pct = 0.0015;
    cfg.tf_weight = 5;
    cfg.description = "Higher structure - weekly swing levels";
    break;
  case Timeframe::DAY_1:
    cfg.pivot_left = 10;
    cfg.pivot_right = 10;
    cfg.lookback_candles = 200;
    cfg.max_zone_age_candles = 250;
    cfg.min_volume_percentile = 80.0;
    cfg.volume_spike_multiplier = 2.5;
    cfg.zone_buffer_pct = 0.004;
    cfg.merge_radius_pct = 0.005;
    cfg.min_zone_distance_pct = 0.003;
    cfg.atr_min_multiplier = 0.8;
    cfg.atr_max_multiplier = 3.0;
    cfg.sweep_penetration_pct = 0.004;
    cfg.sweep_rejection_pct = 0.0025;
    cfg.tf_weight = 6;
    cfg.description = "Macro structure - monthly levels";
    break;
  }

  cfg.validate();
  return cfg;
}

TimeframeConfigBuilder::TimeframeConfigBuilder(Timeframe tf)
    : config_(default_timeframe_config(tf)) {}

TimeframeConfigBuilder &TimeframeConfigBuilder::pivot_window(int left,
                                                             int right) {
  config_.pivot_left = left;
  config_.pivot_right = right;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::lookback_candles(std::size_t n) {
  config_.lookback_candles = n;
  return *this;
}

TimeframeConfigBuilder &
TimeframeConfigBuilder::max_zone_age_candles(uint32_t n) {
  config_.max_zone_age_candles = n;
  return *this;
}

TimeframeConfigBuilder &
TimeframeConfigBuilder::min_volume_percentile(double pct) {
  config_.min_volume_percentile = pct;
  return *this;
}

TimeframeConfigBuilder &
TimeframeConfigBuilder::volume_spike_multiplier(double m) {
  config_.volume_spike_multiplier = m;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::volume_lookback(std::size_t n) {
  config_.volume_lookback = n;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::zone_buffer_pct(double pct) {
  config_.zone_buffer_pct = pct;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::merge_radius_pct(double pct) {
  config_.merge_radius_pct = pct;
  return *this;
}

TimeframeConfigBuilder &
TimeframeConfigBuilder::min_zone_distance_pct(double pct) {
  config_.min_zone_distance_pct = pct;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::atr_period(std::size_t n) {
  config_.atr_period = n;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::volatility_ratios(double low,
                                                                  double high) {
  config_.low_volatility_ratio = low;
  config_.high_volatility_ratio = high;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::atr_multipliers(double min,
                                                                double max) {
  config_.atr_min_multiplier = min;
  config_.atr_max_multiplier = max;
  return *this;
}

TimeframeConfigBuilder &
TimeframeConfigBuilder::sweep_thresholds(double penetration, double rejection) {
  config_.sweep_penetration_pct = penetration;
  config_.sweep_rejection_pct = rejection;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::tf_weight(int weight) {
  config_.tf_weight = weight;
  return *this;
}

TimeframeConfigBuilder &TimeframeConfigBuilder::description(std::string text) {
  config_.description = std::move(text);
  return *this;
}

TimeframeConfig TimeframeConfigBuilder::build() const {
  config_.validate();
  return config_;
}

TimeframeConfig adapt_for_trend(const TimeframeConfig &base,
                                const TrendState &trend) {
  TimeframeConfig adapted = base;

  switch (trend.strength) {
  case TrendStrength::STRONG:
  case TrendStrength::VERY_STRONG:
    // Faster confirmation, tighter zones, stricter volume filter
    adapted.pivot_left = scale_window(base.pivot_left, 0.7);
    adapted.pivot_right = scale_window(base.pivot_right, 0.7);
    adapted.zone_buffer_pct = base.zone_buffer_pct * 0.8;
    adapted.min_volume_percentile =
        std::min(100.0, base.min_volume_percentile + 5.0);
    break;
  case TrendStrength::WEAK:
  case TrendStrength::VERY_WEAK:
    // Ranging market: looser requirements for reversal zones
    adapted.pivot_left = scale_window(base.pivot_left, 1.2);
    adapted.pivot_right = scale_window(base.pivot_right, 1.2);
    adapted.zone_buffer_pct = base.zone_buffer_pct * 1.2;
    adapted.min_volume_percentile =
        std::max(1.0, base.min_volume_percentile - 5.0);
    break;
  case TrendStrength::MODERATE:
    break;
  }

  return adapted;
}

} // namespace liqmap
