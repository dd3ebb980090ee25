#pragma once

#include "liqmap/plugins/pattern_plugin.hpp"

#include <optional>

namespace liqmap {

/// Order block with its lifecycle state
struct OrderBlock {
  LiquidityZone zone;
  uint64_t displacement_ts{0}; // candle whose body qualified the move
  double move_pct{0};          // displacement body / open
  bool is_breaker{false};      // closed through, polarity flipped
  std::optional<uint64_t> broken_ts;
  uint64_t last_seen_ts{0};
};

/// Last opposite candle before a displacement move.
/// A revisit mitigates the block; a close through it turns it into a
/// breaker (read by BreakerBlockPlugin).
class OrderBlockPlugin : public PatternPlugin {
public:
  static constexpr double kDisplacementBodyMultiple = 1.5;
  static constexpr std::size_t kBodyLookback = 100;
  static constexpr std::size_t kMaxOriginDistance = 10;

  explicit OrderBlockPlugin(Timeframe timeframe);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override { records_.clear(); }

  /// Copy of every stored block, including broken ones
  std::vector<OrderBlock> blocks() const { return records_; }

private:
  std::vector<OrderBlock> records_;
};

} // namespace liqmap
