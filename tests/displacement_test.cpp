#include "liqmap/displacement.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace liqmap;

namespace {

Candle bar(uint64_t i, double open, double high, double low, double close,
           double volume = 10) {
  Candle candle;
  candle.symbol = "BTCUSDT";
  candle.timeframe = Timeframe::MIN_5;
  candle.open_ts = i * 300;
  candle.close_ts = candle.open_ts + 299;
  candle.open = open;
  candle.high = high;
  candle.low = low;
  candle.close = close;
  candle.volume = volume;
  candle.is_closed = true;
  return candle;
}

/// 20 quiet candles, `run` full-bodied candles on 4x volume, one quiet candle
std::vector<Candle> run_series(int run, bool bullish = true) {
  std::vector<Candle> candles;
  for (uint64_t i = 0; i < 20; ++i) {
    candles.push_back(bar(i, 100, 100.5, 99.5, 100.2));
  }
  double price = 100;
  for (int k = 0; k < run; ++k) {
    const uint64_t i = 20 + static_cast<uint64_t>(k);
    const double next = bullish ? price + 1 : price - 1;
    candles.push_back(bullish ? bar(i, price, next + 0.1, price - 0.05, next, 40)
                              : bar(i, price, price + 0.05, next - 0.1, next, 40));
    price = next;
  }
  const uint64_t last = 20 + static_cast<uint64_t>(run);
  candles.push_back(bar(last, price, price + 0.3, price - 0.1, price + 0.1));
  return candles;
}

} // namespace

TEST(DisplacementTest, ThreeSurgingCandlesFormDisplacement) {
  auto found = detect_displacements(run_series(3), Timeframe::MIN_5);

  ASSERT_EQ(found.size(), 1u);
  const auto &d = found[0];
  EXPECT_EQ(d.direction, ZoneDirection::BULLISH);
  EXPECT_TRUE(d.is_bullish());
  EXPECT_EQ(d.num_candles, 3u);
  EXPECT_EQ(d.start_ts, 6000u);
  EXPECT_EQ(d.end_ts, 6600u);
  EXPECT_DOUBLE_EQ(d.start_price, 100);
  EXPECT_DOUBLE_EQ(d.end_price, 103);
  EXPECT_NEAR(d.move_pct, 0.03, 1e-12);
  EXPECT_DOUBLE_EQ(d.avg_volume, 40);
  // Baseline: last 20 volumes = 16 x 10 + 3 x 40 + 10
  EXPECT_NEAR(d.volume_surge_ratio, 40.0 / 14.5, 1e-12);
}

TEST(DisplacementTest, BearishRun) {
  auto found = detect_displacements(run_series(4, false), Timeframe::MIN_5);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].direction, ZoneDirection::BEARISH);
  EXPECT_EQ(found[0].num_candles, 4u);
  EXPECT_DOUBLE_EQ(found[0].end_price, 96);
}

TEST(DisplacementTest, ShortRunIsIgnored) {
  EXPECT_TRUE(detect_displacements(run_series(2), Timeframe::MIN_5).empty());

  DisplacementConfig loose;
  loose.min_candles = 2;
  EXPECT_EQ(detect_displacements(run_series(2), Timeframe::MIN_5, loose).size(),
            1u);
}

TEST(DisplacementTest, DirectionChangeEndsRun) {
  auto candles = run_series(3);
  // Middle candle reverses with the same body and volume
  candles[21] = bar(21, 101, 101.05, 99.9, 100, 40);
  EXPECT_TRUE(detect_displacements(candles, Timeframe::MIN_5).empty());
}

TEST(DisplacementTest, SmallBodiesDoNotQualify) {
  auto candles = run_series(3);
  for (std::size_t i = 20; i < 23; ++i) {
    candles[i].high += 2; // body now under 60% of range
  }
  EXPECT_TRUE(detect_displacements(candles, Timeframe::MIN_5).empty());
}

TEST(DisplacementTest, NeedsLookbackPlusMinCandles) {
  auto candles = run_series(3);
  candles.erase(candles.begin(), candles.begin() + 2);
  EXPECT_TRUE(detect_displacements(candles, Timeframe::MIN_5).empty());
  EXPECT_TRUE(detect_displacements({}, Timeframe::MIN_5).empty());
}

TEST(DisplacementTest, InvalidConfigThrows) {
  DisplacementConfig cfg;
  cfg.volume_lookback = 0;
  EXPECT_THROW(detect_displacements(run_series(3), Timeframe::MIN_5, cfg),
               std::invalid_argument);
}

TEST(DisplacementTest, StrongestByMetric) {
  Displacement far;
  far.move_pct = 0.05;
  far.volume_surge_ratio = 2;
  far.num_candles = 3;
  Displacement loud;
  loud.move_pct = 0.02;
  loud.volume_surge_ratio = 6;
  loud.num_candles = 5;

  EXPECT_DOUBLE_EQ(strongest_displacement({far, loud})->move_pct, 0.05);
  EXPECT_DOUBLE_EQ(
      strongest_displacement({far, loud}, DisplacementMetric::VOLUME_SURGE)
          ->volume_surge_ratio,
      6);
  EXPECT_EQ(strongest_displacement({far, loud}, DisplacementMetric::NUM_CANDLES)
                ->num_candles,
            5u);
  EXPECT_FALSE(strongest_displacement({}).has_value());
}
