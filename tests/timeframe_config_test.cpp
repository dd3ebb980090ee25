#include "liqmap/timeframe_config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace liqmap {

TEST(TimeframeConfigTest, DefaultsTightenWithTimeframe) {
  const auto m1 = default_timeframe_config(Timeframe::MIN_1);
  const auto m5 = default_timeframe_config(Timeframe::MIN_5);
  const auto m15 = default_timeframe_config(Timeframe::MIN_15);
  const auto h1 = default_timeframe_config(Timeframe::HOUR_1);

  EXPECT_EQ(m1.pivot_left, 3);
  EXPECT_EQ(m1.lookback_candles, 80u);
  EXPECT_EQ(m1.max_zone_age_candles, 40u);
  EXPECT_DOUBLE_EQ(m1.min_volume_percentile, 65.0);
  EXPECT_EQ(m1.tf_weight, 1);

  EXPECT_EQ(m5.pivot_left, 4);
  EXPECT_DOUBLE_EQ(m5.volume_spike_multiplier, 1.6);
  EXPECT_DOUBLE_EQ(m5.zone_buffer_pct, 0.001);
  EXPECT_EQ(m5.tf_weight, 2);

  EXPECT_EQ(m15.pivot_right, 5);
  EXPECT_EQ(m15.tf_weight, 3);

  EXPECT_EQ(h1.pivot_left, 8);
  EXPECT_EQ(h1.max_zone_age_candles, 200u);
  EXPECT_DOUBLE_EQ(h1.merge_radius_pct, 0.0025);
  EXPECT_EQ(h1.tf_weight, 4);

  EXPECT_LT(m1.zone_buffer_pct, m5.zone_buffer_pct);
  EXPECT_LT(m5.zone_buffer_pct, m15.zone_buffer_pct);
  EXPECT_LT(m15.zone_buffer_pct, h1.zone_buffer_pct);
}

TEST(TimeframeConfigTest, EveryTimeframeHasValidDefaults) {
  for (Timeframe tf : {Timeframe::MIN_1, Timeframe::MIN_5, Timeframe::MIN_15,
                       Timeframe::HOUR_1, Timeframe::HOUR_4,
                       Timeframe::DAY_1}) {
    TimeframeConfig cfg;
    EXPECT_NO_THROW(cfg = default_timeframe_config(tf)) << timeframe_label(tf);
    EXPECT_EQ(cfg.timeframe, tf);
    EXPECT_FALSE(cfg.description.empty());
  }
  EXPECT_GT(default_timeframe_config(Timeframe::DAY_1).tf_weight,
            default_timeframe_config(Timeframe::HOUR_4).tf_weight);
}

TEST(TimeframeConfigTest, BuilderOverridesAndValidates) {
  auto cfg = TimeframeConfigBuilder(Timeframe::MIN_15)
                 .pivot_window(6, 4)
                 .lookback_candles(150)
                 .tf_weight(7)
                 .description("custom")
                 .build();

  EXPECT_EQ(cfg.timeframe, Timeframe::MIN_15);
  EXPECT_EQ(cfg.pivot_left, 6);
  EXPECT_EQ(cfg.pivot_right, 4);
  EXPECT_EQ(cfg.lookback_candles, 150u);
  EXPECT_EQ(cfg.tf_weight, 7);
  EXPECT_EQ(cfg.description, "custom");
  // Untouched fields keep the timeframe default
  EXPECT_DOUBLE_EQ(cfg.volume_spike_multiplier, 1.8);
}

TEST(TimeframeConfigTest, OutOfRangeFieldsRejected) {
  const Timeframe tf = Timeframe::MIN_5;
  EXPECT_THROW(TimeframeConfigBuilder(tf).pivot_window(0, 4).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).pivot_window(4, 21).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).lookback_candles(9).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).lookback_candles(501).build(),
               std::invalid_argument);
  // Lookback shorter than the pivot window
  EXPECT_THROW(
      TimeframeConfigBuilder(tf).pivot_window(10, 10).lookback_candles(15).build(),
      std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).max_zone_age_candles(5).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).min_volume_percentile(0).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).min_volume_percentile(101).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).volume_spike_multiplier(0.9).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).zone_buffer_pct(0.02).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).merge_radius_pct(0).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).atr_multipliers(1.5, 1.0).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).atr_multipliers(0.05, 1.0).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).volatility_ratios(1.2, 1.5).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).sweep_thresholds(0.05, 0.001).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).tf_weight(11).build(),
               std::invalid_argument);
  EXPECT_THROW(TimeframeConfigBuilder(tf).atr_period(0).build(),
               std::invalid_argument);
}

// ============================================================================
// Trend adaptation
// ============================================================================

TEST(TrendAdaptationTest, StrongTrendTightens) {
  const auto base = default_timeframe_config(Timeframe::MIN_5);
  TrendState trend;
  trend.direction = TrendDirection::STRONG_BULLISH;
  trend.strength = TrendStrength::STRONG;

  const auto adapted = adapt_for_trend(base, trend);
  EXPECT_EQ(adapted.pivot_left, 3); // round(4 * 0.7)
  EXPECT_EQ(adapted.pivot_right, 3);
  EXPECT_DOUBLE_EQ(adapted.zone_buffer_pct, base.zone_buffer_pct * 0.8);
  EXPECT_DOUBLE_EQ(adapted.min_volume_percentile, 75.0);

  // Base is never mutated
  EXPECT_EQ(base.pivot_left, 4);
}

TEST(TrendAdaptationTest, WeakTrendLoosens) {
  const auto base = default_timeframe_config(Timeframe::HOUR_1);
  TrendState trend;
  trend.strength = TrendStrength::VERY_WEAK;

  const auto adapted = adapt_for_trend(base, trend);
  EXPECT_EQ(adapted.pivot_left, 10); // round(8 * 1.2)
  EXPECT_DOUBLE_EQ(adapted.zone_buffer_pct, base.zone_buffer_pct * 1.2);
  EXPECT_DOUBLE_EQ(adapted.min_volume_percentile, 70.0);
}

TEST(TrendAdaptationTest, ModerateTrendLeavesConfigAlone) {
  const auto base = default_timeframe_config(Timeframe::MIN_15);
  const auto adapted = adapt_for_trend(base, TrendState{});
  EXPECT_EQ(adapted.pivot_left, base.pivot_left);
  EXPECT_DOUBLE_EQ(adapted.zone_buffer_pct, base.zone_buffer_pct);
  EXPECT_DOUBLE_EQ(adapted.min_volume_percentile, base.min_volume_percentile);
}

TEST(TrendAdaptationTest, WindowsNeverDropBelowOne) {
  auto base = TimeframeConfigBuilder(Timeframe::MIN_1).pivot_window(1, 1).build();
  TrendState trend;
  trend.strength = TrendStrength::VERY_STRONG;

  const auto adapted = adapt_for_trend(base, trend);
  EXPECT_EQ(adapted.pivot_left, 1);
  EXPECT_EQ(adapted.pivot_right, 1);
}

TEST(TrendAdaptationTest, PercentileStaysInRange) {
  auto high = TimeframeConfigBuilder(Timeframe::MIN_5)
                  .min_volume_percentile(98)
                  .build();
  auto low = TimeframeConfigBuilder(Timeframe::MIN_5)
                 .min_volume_percentile(3)
                 .build();
  TrendState strong{TrendDirection::BULLISH, TrendStrength::STRONG};
  TrendState weak{TrendDirection::NEUTRAL, TrendStrength::WEAK};

  EXPECT_DOUBLE_EQ(adapt_for_trend(high, strong).min_volume_percentile, 100.0);
  EXPECT_DOUBLE_EQ(adapt_for_trend(low, weak).min_volume_percentile, 1.0);
}

} // namespace liqmap
