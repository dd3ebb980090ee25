#pragma once

#include "liqmap/plugins/pattern_plugin.hpp"

#include <optional>

namespace liqmap {

/// BSL rests above equal highs, SSL below equal lows
enum class LevelSide { BUY_SIDE, SELL_SIDE };

struct LiquidityLevel {
  LiquidityZone zone;
  LevelSide side{LevelSide::BUY_SIDE};
  double price{0};
  uint64_t last_touch_ts{0};
  bool is_swept{false};
  std::optional<uint64_t> sweep_ts;
  double sweep_extreme{0}; // wick high (BSL) or low (SSL) of the sweep candle
  uint64_t last_seen_ts{0};
};

/// Equal highs / equal lows within kEqualTolerancePct, two or more touches.
/// A wick beyond sweep_penetration_pct sweeps the level (read by
/// LiquiditySweepPlugin).
class LiquidityLevelPlugin : public PatternPlugin {
public:
  static constexpr double kEqualTolerancePct = 0.001;
  static constexpr uint32_t kMinTouches = 2;
  static constexpr int kSwingWindow = 2;

  explicit LiquidityLevelPlugin(Timeframe timeframe);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override { records_.clear(); }

  /// Copy of every stored level, swept ones included
  std::vector<LiquidityLevel> levels() const { return records_; }

private:
  std::vector<LiquidityLevel> records_;
};

} // namespace liqmap
