#include "liqmap/confluence.hpp"
#include "liqmap/liquidity_map.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace liqmap {

namespace {

Candle bar(Timeframe tf, uint64_t i, double open, double high, double low,
           double close, double volume = 10) {
  Candle candle;
  candle.symbol = "BTCUSDT";
  candle.timeframe = tf;
  candle.open_ts = i * interval_seconds(tf);
  candle.close_ts = candle.open_ts + interval_seconds(tf) - 1;
  candle.open = open;
  candle.high = high;
  candle.low = low;
  candle.close = close;
  candle.volume = volume;
  candle.is_closed = true;
  return candle;
}

/// Flat range, then a high-volume displacement leaving a bullish gap
/// [100.5, 101] anchored on candle `first + 10`
std::vector<Candle> gap_series(Timeframe tf, double spike_volume = 40,
                               uint64_t first = 0) {
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 10; ++i) {
    candles.push_back(bar(tf, first + i, 100, 100.5, 99.5, 100));
  }
  candles.push_back(bar(tf, first + 10, 100, 103, 99.8, 102.8, spike_volume));
  candles.push_back(bar(tf, first + 11, 102.8, 103.5, 101, 103.2));
  return candles;
}

std::vector<Candle> flat_series(Timeframe tf, uint64_t first, std::size_t n) {
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < n; ++i) {
    candles.push_back(bar(tf, first + i, 100, 100.5, 99.5, 100));
  }
  return candles;
}

LiquidityMapOptions gap_only_options(std::vector<Timeframe> tfs) {
  LiquidityMapOptions options;
  options.symbol = "BTCUSDT";
  for (Timeframe tf : tfs) {
    options.timeframes.push_back(default_timeframe_config(tf));
  }
  options.enable_support_resistance = false;
  options.enable_order_blocks = false;
  options.enable_liquidity_levels = false;
  options.enable_structure_breaks = false;
  options.enable_breaker_blocks = false;
  options.enable_liquidity_sweeps = false;
  return options;
}

LiquidityZone zone_at(Timeframe tf, double low, double high,
                      ZoneStrength strength = ZoneStrength::WEAK) {
  static int seq = 0;
  return make_zone("z" + std::to_string(++seq), tf, ZoneKind::SUPPORT,
                   ZoneDirection::BULLISH, low, high, 0, 10, strength);
}

std::map<Timeframe, TimeframeWeight> default_weights() {
  std::map<Timeframe, TimeframeWeight> weights;
  for (Timeframe tf : {Timeframe::MIN_1, Timeframe::MIN_5, Timeframe::MIN_15,
                       Timeframe::HOUR_1}) {
    const auto cfg = default_timeframe_config(tf);
    weights[tf] = TimeframeWeight{cfg.tf_weight, cfg.merge_radius_pct};
  }
  return weights;
}

/// 5m map with a short window and only the named source/dependent plugins
LiquidityMapOptions sliding_options(bool order_blocks, bool levels) {
  LiquidityMapOptions options = gap_only_options({});
  options.timeframes = {
      TimeframeConfigBuilder(Timeframe::MIN_5).lookback_candles(12).build()};
  options.enable_fair_value_gaps = false;
  options.enable_order_blocks = order_blocks;
  options.enable_breaker_blocks = order_blocks;
  options.enable_liquidity_levels = levels;
  options.enable_liquidity_sweeps = levels;
  return options;
}

} // namespace

// ============================================================================
// Refresh pipeline
// ============================================================================

TEST(LiquidityMapTest, GapWithVolumeSpikeBecomesZone) {
  auto events = std::make_shared<InMemoryPublisher>();
  auto options = gap_only_options({Timeframe::MIN_5});
  options.publisher = events;
  LiquidityMap map(std::move(options));

  auto report = map.on_candle_close(Timeframe::MIN_5,
                                    gap_series(Timeframe::MIN_5), 103.2);
  EXPECT_FALSE(report.gated);
  EXPECT_FALSE(report.insufficient);
  EXPECT_EQ(report.candidates, 1u);
  EXPECT_EQ(report.added, 1u);

  auto zones = map.get_zones(Timeframe::MIN_5);
  ASSERT_EQ(zones.size(), 1u);
  EXPECT_EQ(zones[0].id, "fvg:5m:3000");
  EXPECT_EQ(zones[0].source, "fair_value_gap");
  EXPECT_DOUBLE_EQ(zones[0].price_low, 100.5);
  EXPECT_DOUBLE_EQ(zones[0].price_high, 101);

  auto snapshots = events->snapshots();
  ASSERT_EQ(snapshots.size(), 1u);
  EXPECT_EQ(snapshots[0].symbol, "BTCUSDT");
  EXPECT_EQ(snapshots[0].timeframe, Timeframe::MIN_5);
  EXPECT_EQ(snapshots[0].as_of_ts, 11u * 300);
  EXPECT_EQ(snapshots[0].zones.size(), 1u);

  auto stats = map.statistics();
  EXPECT_EQ(stats.filters.refreshes, 1u);
  EXPECT_EQ(stats.filters.zones_created, 1u);
  ASSERT_EQ(stats.timeframes.size(), 1u);
  EXPECT_EQ(stats.timeframes[0].zone_count, 1u);
  EXPECT_EQ(stats.timeframes[0].last_refresh_ts, 11u * 300);
}

TEST(LiquidityMapTest, VolatilityGateBlocksNewZones) {
  LiquidityMapOptions options;
  options.symbol = "BTCUSDT";
  options.timeframes = {default_timeframe_config(Timeframe::MIN_5)};
  LiquidityMap map(std::move(options));

  // Wide swings with a volume spike, then the last 14 candles compress
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 20; ++i) {
    const double volume = i == 10 ? 80 : 10;
    const double high = i == 10 ? 112 : 105;
    candles.push_back(bar(Timeframe::MIN_5, i, 100, high, 95, 100, volume));
  }
  for (uint64_t i = 20; i < 34; ++i) {
    candles.push_back(bar(Timeframe::MIN_5, i, 100, 101, 99, 100));
  }

  auto report = map.on_candle_close(Timeframe::MIN_5, candles, 100);
  EXPECT_TRUE(report.gated);
  EXPECT_EQ(report.candidates, 0u);
  EXPECT_EQ(report.added, 0u);
  EXPECT_TRUE(map.get_zones(Timeframe::MIN_5).empty());
  EXPECT_EQ(map.statistics().filters.atr_filtered, 1u);
  EXPECT_EQ(map.statistics().filters.zones_created, 0u);
}

TEST(LiquidityMapTest, WeakVolumeCandidateFiltered) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));

  auto report = map.on_candle_close(Timeframe::MIN_5,
                                    gap_series(Timeframe::MIN_5, 12), 103.2);
  EXPECT_EQ(report.candidates, 1u);
  EXPECT_EQ(report.added, 0u);
  EXPECT_TRUE(map.get_zones(Timeframe::MIN_5).empty());
  EXPECT_EQ(map.statistics().filters.volume_filtered, 1u);
}

TEST(LiquidityMapTest, CandidateAtCurrentPriceFiltered) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));

  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 100.75);
  EXPECT_TRUE(map.get_zones(Timeframe::MIN_5).empty());
  EXPECT_EQ(map.statistics().filters.distance_filtered, 1u);
}

TEST(LiquidityMapTest, ShortWindowSkipsDetection) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));

  auto report = map.on_candle_close(Timeframe::MIN_5,
                                    flat_series(Timeframe::MIN_5, 0, 5), 100);
  EXPECT_TRUE(report.insufficient);
  EXPECT_EQ(report.candidates, 0u);
  EXPECT_EQ(map.statistics().filters.refreshes, 1u);
}

TEST(LiquidityMapTest, OldZonesAgeOut) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);
  ASSERT_EQ(map.get_zones(Timeframe::MIN_5).size(), 1u);

  // 200 candles later, past the 5m max age of 100
  auto report = map.on_candle_close(
      Timeframe::MIN_5, flat_series(Timeframe::MIN_5, 200, 12), 100);
  EXPECT_EQ(report.aged_out, 1u);
  EXPECT_TRUE(map.get_zones(Timeframe::MIN_5).empty());
  EXPECT_EQ(map.statistics().filters.age_filtered, 1u);
  EXPECT_TRUE(map.get_patterns(Timeframe::MIN_5, "fair_value_gap").empty());
}

TEST(LiquidityMapTest, TrendAdaptationLeavesStoredConfigUntouched) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  TrendState trend{TrendDirection::STRONG_BULLISH, TrendStrength::VERY_STRONG};

  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2,
                      trend);
  EXPECT_EQ(map.config(Timeframe::MIN_5).pivot_left, 4);
  EXPECT_DOUBLE_EQ(map.config(Timeframe::MIN_5).min_volume_percentile, 70.0);
  EXPECT_EQ(map.get_zones(Timeframe::MIN_5).size(), 1u);
}

TEST(LiquidityMapTest, InvalidCallsThrow) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  const auto candles = gap_series(Timeframe::MIN_5);

  EXPECT_THROW(map.on_candle_close(Timeframe::HOUR_4, candles, 100),
               std::invalid_argument);
  EXPECT_THROW(map.on_candle_close(Timeframe::MIN_5, candles, 0),
               std::invalid_argument);
  EXPECT_THROW(map.get_zones(Timeframe::DAY_1), std::invalid_argument);
  EXPECT_THROW(map.get_patterns(Timeframe::MIN_5, "head_and_shoulders"),
               std::invalid_argument);
}

TEST(LiquidityMapTest, ConstructionValidatesConfigs) {
  LiquidityMapOptions duplicated;
  duplicated.timeframes = {default_timeframe_config(Timeframe::MIN_5),
                           default_timeframe_config(Timeframe::MIN_5)};
  EXPECT_THROW(LiquidityMap{std::move(duplicated)}, std::invalid_argument);

  LiquidityMapOptions invalid;
  auto cfg = default_timeframe_config(Timeframe::MIN_5);
  cfg.pivot_left = 0;
  invalid.timeframes = {cfg};
  EXPECT_THROW(LiquidityMap{std::move(invalid)}, std::invalid_argument);

  LiquidityMap defaults(LiquidityMapOptions{});
  auto tfs = defaults.timeframes();
  ASSERT_EQ(tfs.size(), 4u);
  EXPECT_EQ(tfs.front(), Timeframe::MIN_1);
  EXPECT_EQ(tfs.back(), Timeframe::HOUR_1);
}

TEST(LiquidityMapTest, BreakerDetectedAfterOrderBlockLeavesWindow) {
  LiquidityMap map(sliding_options(true, false));
  const Timeframe tf = Timeframe::MIN_5;

  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 10; ++i) {
    candles.push_back(bar(tf, i, 100, 100.5, 99.8, 100.2));
  }
  candles.push_back(bar(tf, 10, 100.1, 100.3, 99.7, 100.0, 25));
  candles.push_back(bar(tf, 11, 100, 103.2, 99.9, 103, 40));
  map.on_candle_close(tf, candles, 103);
  ASSERT_EQ(map.get_patterns(tf, "order_block").size(), 1u);

  // Close through the block once the window starts after its origin candle
  for (uint64_t i = 12; i < 24; ++i) {
    candles.push_back(bar(tf, i, 103, 103.6, 102.8, 103.5));
  }
  candles.push_back(bar(tf, 24, 100.2, 100.3, 99.4, 99.5, 40));
  map.on_candle_close(tf, candles, 99.5);

  candles.push_back(bar(tf, 25, 99.5, 99.6, 99.2, 99.4));
  map.on_candle_close(tf, candles, 99.4);

  auto breakers = map.get_patterns(tf, "breaker_block");
  ASSERT_EQ(breakers.size(), 1u);
  EXPECT_EQ(breakers[0].id, "bb:5m:3000");
  EXPECT_EQ(breakers[0].direction, ZoneDirection::BEARISH);

  ZoneFilter kind;
  kind.kind = ZoneKind::BREAKER_BLOCK;
  auto zones = map.get_zones(tf, kind);
  ASSERT_EQ(zones.size(), 1u);
  EXPECT_EQ(zones[0].created_ts, 7200u);
}

TEST(LiquidityMapTest, SweepDetectedAfterFirstSwingLeavesWindow) {
  LiquidityMap map(sliding_options(false, true));
  const Timeframe tf = Timeframe::MIN_5;

  // Equal highs at bars 3 and 9
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 15; ++i) {
    const double high = i == 3 ? 105 : (i == 9 ? 105.05 : 101);
    candles.push_back(bar(tf, i, 100, high, 99, 100));
  }
  const std::vector<Candle> first(candles.begin(), candles.begin() + 12);
  map.on_candle_close(tf, first, 100);
  ASSERT_EQ(map.get_patterns(tf, "liquidity_level").size(), 1u);

  // Window now starts at bar 4
  candles.push_back(bar(tf, 15, 100, 105.2, 99.5, 104.9, 80));
  map.on_candle_close(tf, candles, 104.9);

  candles.push_back(bar(tf, 16, 104.9, 105, 104.5, 104.7));
  map.on_candle_close(tf, candles, 104.7);

  auto sweeps = map.get_patterns(tf, "liquidity_sweep");
  ASSERT_EQ(sweeps.size(), 1u);
  EXPECT_EQ(sweeps[0].id, "sweep_bsl:5m:900");
  EXPECT_EQ(sweeps[0].strength, ZoneStrength::STRONG); // reversal confirmed

  ZoneFilter kind;
  kind.kind = ZoneKind::LIQUIDITY_SWEEP;
  EXPECT_EQ(map.get_zones(tf, kind).size(), 1u);
}

// ============================================================================
// Displacements and gap queries
// ============================================================================

namespace {

/// 20 quiet candles, three full-bodied 4x volume candles up from 100 to 103,
/// one quiet candle. Leaves bullish gaps at bars 20, 21 and 22.
std::vector<Candle> displacement_series(Timeframe tf) {
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 20; ++i) {
    candles.push_back(bar(tf, i, 100, 100.5, 99.5, 100.2));
  }
  candles.push_back(bar(tf, 20, 100, 101.1, 99.95, 101, 40));
  candles.push_back(bar(tf, 21, 101, 102.1, 100.95, 102, 40));
  candles.push_back(bar(tf, 22, 102, 103.1, 101.95, 103, 40));
  candles.push_back(bar(tf, 23, 103, 103.3, 102.9, 103.1));
  return candles;
}

} // namespace

TEST(LiquidityMapTest, DisplacementsFromLatestWindow) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5, Timeframe::MIN_15}));
  map.on_candle_close(Timeframe::MIN_5, displacement_series(Timeframe::MIN_5),
                      103.1);
  map.on_candle_close(Timeframe::MIN_15,
                      displacement_series(Timeframe::MIN_15), 103.1);

  auto all = map.get_displacements();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].timeframe, Timeframe::MIN_15); // ends later
  EXPECT_EQ(all[0].end_ts, 22u * 900);

  auto m5 = map.get_displacements(Timeframe::MIN_5);
  ASSERT_EQ(m5.size(), 1u);
  EXPECT_EQ(m5[0].num_candles, 3u);
  EXPECT_EQ(m5[0].start_ts, 6000u);
  EXPECT_TRUE(map.get_displacements(std::nullopt, ZoneDirection::BEARISH).empty());
  EXPECT_TRUE(map.get_displacements(std::nullopt, std::nullopt, 4).empty());

  EXPECT_EQ(map.get_recent_displacements(std::nullopt, 1).size(), 1u);
  auto strongest = map.get_strongest_displacement(Timeframe::MIN_5);
  ASSERT_TRUE(strongest.has_value());
  EXPECT_NEAR(strongest->move_pct, 0.03, 1e-12);

  EXPECT_EQ(map.statistics().timeframes[0].displacements, 1u);
  EXPECT_THROW(map.get_displacements(Timeframe::HOUR_1), std::invalid_argument);

  // Replaced on every refresh
  map.on_candle_close(Timeframe::MIN_5, flat_series(Timeframe::MIN_5, 24, 24),
                      100);
  EXPECT_TRUE(map.get_displacements(Timeframe::MIN_5).empty());
}

TEST(LiquidityMapTest, FvgQueries) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  map.on_candle_close(Timeframe::MIN_5, displacement_series(Timeframe::MIN_5),
                      103.1);

  auto gaps = map.get_fvgs();
  ASSERT_EQ(gaps.size(), 3u);
  EXPECT_EQ(gaps[0].id, "fvg:5m:6600"); // newest first
  EXPECT_EQ(gaps[2].id, "fvg:5m:6000");
  EXPECT_TRUE(map.get_fvgs(Timeframe::MIN_5, true, ZoneDirection::BEARISH).empty());

  auto below = map.get_nearest_fvg(103.1, PriceSide::BELOW);
  ASSERT_TRUE(below.has_value());
  EXPECT_EQ(below->id, "fvg:5m:6600");
  EXPECT_FALSE(map.get_nearest_fvg(103.1, PriceSide::ABOVE).has_value());

  auto above = map.get_nearest_fvg(100, PriceSide::ABOVE);
  ASSERT_TRUE(above.has_value());
  EXPECT_EQ(above->id, "fvg:5m:6000");

  auto closest = map.get_nearest_fvg(101.5);
  ASSERT_TRUE(closest.has_value());
  EXPECT_EQ(closest->id, "fvg:5m:6300");
}

// ============================================================================
// Queries
// ============================================================================

TEST(LiquidityMapTest, NearestSupportAndResistance) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);

  auto support = map.get_nearest_support(103.2);
  ASSERT_TRUE(support.has_value());
  EXPECT_EQ(support->id, "fvg:5m:3000");
  EXPECT_FALSE(map.get_nearest_resistance(103.2).has_value());

  auto resistance = map.get_nearest_resistance(99);
  ASSERT_TRUE(resistance.has_value());
  EXPECT_EQ(resistance->id, "fvg:5m:3000");
  EXPECT_FALSE(map.get_nearest_support(99).has_value());
}

TEST(LiquidityMapTest, QueriesReturnCopies) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);

  auto zones = map.get_zones(Timeframe::MIN_5);
  zones[0].price_low = 1;
  zones[0].is_active = false;
  EXPECT_DOUBLE_EQ(map.get_zones(Timeframe::MIN_5)[0].price_low, 100.5);
}

TEST(LiquidityMapTest, PluginToggleAndStatus) {
  LiquidityMap map(LiquidityMapOptions{});

  EXPECT_TRUE(map.disable_plugin("order_block"));
  EXPECT_FALSE(map.disable_plugin("elliott_wave"));

  auto status = map.plugin_status();
  EXPECT_EQ(status.size(), 4u * 7u);
  for (const auto &s : status) {
    EXPECT_EQ(s.enabled, s.name != "order_block") << s.name;
  }

  EXPECT_TRUE(map.enable_plugin("order_block"));
  for (const auto &s : map.plugin_status()) {
    EXPECT_TRUE(s.enabled) << s.name;
  }
}

TEST(LiquidityMapTest, DisabledPluginDetectsNothing) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  ASSERT_TRUE(map.disable_plugin("fair_value_gap"));

  auto report = map.on_candle_close(Timeframe::MIN_5,
                                    gap_series(Timeframe::MIN_5), 103.2);
  EXPECT_EQ(report.candidates, 0u);
  EXPECT_TRUE(map.get_patterns(Timeframe::MIN_5, "fair_value_gap").empty());
}

TEST(LiquidityMapTest, ResetStatisticsKeepsZones) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);
  map.reset_statistics();

  auto stats = map.statistics();
  EXPECT_EQ(stats.filters.refreshes, 0u);
  EXPECT_EQ(stats.filters.zones_created, 0u);
  EXPECT_EQ(stats.timeframes[0].zone_count, 1u);
}

// ============================================================================
// Confluence
// ============================================================================

TEST(ConfluenceTest, WeightCountsDistinctTimeframes) {
  std::vector<LiquidityZone> zones{
      zone_at(Timeframe::HOUR_1, 100, 100.2),
      zone_at(Timeframe::MIN_15, 100.05, 100.25),
      zone_at(Timeframe::MIN_5, 100.1, 100.3),
      zone_at(Timeframe::MIN_5, 200, 200.2),
      zone_at(Timeframe::MIN_1, 200.1, 200.3),
      zone_at(Timeframe::MIN_1, 200.15, 200.35),
  };

  auto groups = compute_confluence(zones, default_weights(), 2);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_DOUBLE_EQ(groups[0].confluence_weight, 9);
  EXPECT_EQ(groups[0].confluence_count, 3u);
  EXPECT_EQ(groups[0].timeframe, Timeframe::HOUR_1);
  EXPECT_DOUBLE_EQ(groups[1].confluence_weight, 3);
  EXPECT_EQ(groups[1].confluence_count, 2u);
  EXPECT_EQ(groups[1].timeframe, Timeframe::MIN_5);

  auto strict = compute_confluence(zones, default_weights(), 3);
  ASSERT_EQ(strict.size(), 1u);
  EXPECT_DOUBLE_EQ(strict[0].confluence_weight, 9);
}

TEST(ConfluenceTest, RepresentativeTieBreaks) {
  auto weak = zone_at(Timeframe::MIN_15, 100, 100.2, ZoneStrength::WEAK);
  auto strong = zone_at(Timeframe::MIN_15, 100.1, 100.3, ZoneStrength::STRONG);
  auto low_tf = zone_at(Timeframe::MIN_5, 100, 100.2, ZoneStrength::STRONG);
  low_tf.touch_count = 9;

  auto groups = compute_confluence({weak, low_tf, strong}, default_weights(), 2);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].id, strong.id);
  EXPECT_DOUBLE_EQ(groups[0].confluence_weight, 5);
}

TEST(ConfluenceTest, SingleTimeframeGroupsDropped) {
  std::vector<LiquidityZone> zones{zone_at(Timeframe::MIN_5, 100, 100.2),
                                   zone_at(Timeframe::MIN_5, 100.1, 100.3)};
  EXPECT_TRUE(compute_confluence(zones, default_weights(), 2).empty());
  EXPECT_EQ(compute_confluence(zones, default_weights(), 1).size(), 1u);
  EXPECT_TRUE(compute_confluence({}, default_weights(), 1).empty());
}

TEST(ConfluenceTest, MapWritesConfluenceOntoRepresentative) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5, Timeframe::MIN_15}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);
  map.on_candle_close(Timeframe::MIN_15, gap_series(Timeframe::MIN_15), 103.2);

  auto groups = map.get_confluence_zones(2);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].timeframe, Timeframe::MIN_15);
  EXPECT_DOUBLE_EQ(groups[0].confluence_weight, 5);
  EXPECT_EQ(groups[0].confluence_count, 2u);

  auto stored = map.get_zones(Timeframe::MIN_15);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_DOUBLE_EQ(stored[0].confluence_weight, 5);
}

TEST(ConfluenceTest, DissolvedGroupClearsStoredConfluence) {
  LiquidityMap map(gap_only_options({Timeframe::MIN_5, Timeframe::MIN_15}));
  map.on_candle_close(Timeframe::MIN_5, gap_series(Timeframe::MIN_5), 103.2);
  map.on_candle_close(Timeframe::MIN_15, gap_series(Timeframe::MIN_15), 103.2);
  ASSERT_EQ(map.get_confluence_zones(2).size(), 1u);

  // 5m zone ages out, leaving the 15m zone alone
  map.on_candle_close(Timeframe::MIN_5, flat_series(Timeframe::MIN_5, 200, 12),
                      100);
  EXPECT_TRUE(map.get_confluence_zones(2).empty());

  auto stored = map.get_zones(Timeframe::MIN_15);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_DOUBLE_EQ(stored[0].confluence_weight, 0);
  EXPECT_EQ(stored[0].confluence_count, 0u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(LiquidityMapConcurrencyTest, TimeframesRefreshInParallel) {
  LiquidityMap map(LiquidityMapOptions{});
  const std::vector<Timeframe> tfs = map.timeframes();
  constexpr int kRounds = 25;

  std::vector<std::thread> workers;
  for (Timeframe tf : tfs) {
    workers.emplace_back([&map, tf]() {
      for (int r = 0; r < kRounds; ++r) {
        auto candles = gap_series(tf, 40, static_cast<uint64_t>(r) * 12);
        map.on_candle_close(tf, candles, 103.2);
      }
    });
  }
  // Readers race the writers
  workers.emplace_back([&map]() {
    for (int r = 0; r < kRounds; ++r) {
      map.get_confluence_zones(2);
      map.get_nearest_support(103.2);
      map.statistics();
    }
  });
  for (auto &w : workers) {
    w.join();
  }

  EXPECT_EQ(map.statistics().filters.refreshes,
            static_cast<uint64_t>(kRounds) * tfs.size());
}

} // namespace liqmap
