#pragma once

#include "liqmap/plugins/order_block.hpp"

#include <set>

namespace liqmap {

/// Order blocks that were closed through, with flipped polarity.
/// Reads the order-block plugin it was constructed with and never mutates it.
class BreakerBlockPlugin : public PatternPlugin {
public:
  BreakerBlockPlugin(Timeframe timeframe, const OrderBlockPlugin &order_blocks);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override {
    records_.clear();
    converted_.clear();
  }

  /// Retests counted for a stored breaker, 0 when the id is unknown
  uint32_t retest_count(const std::string &id) const;

private:
  struct Record {
    LiquidityZone zone;
    std::string order_block_id;
    uint32_t retests{0};
    uint64_t last_seen_ts{0};
  };

  const OrderBlockPlugin &order_blocks_;
  std::vector<Record> records_;
  std::set<std::string> converted_; // order block ids already flipped
};

} // namespace liqmap
