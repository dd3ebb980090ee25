#pragma once

#include "liqmap/plugins/liquidity_level.hpp"

#include <set>

namespace liqmap {

/// Swept liquidity levels awaiting a reversal.
/// A sweep is confirmed when price reverses by sweep_rejection_pct within
/// kConfirmWindow candles and dropped otherwise. Reads the liquidity-level
/// plugin it was constructed with and never mutates it.
class LiquiditySweepPlugin : public PatternPlugin {
public:
  static constexpr std::size_t kConfirmWindow = 5;

  LiquiditySweepPlugin(Timeframe timeframe, const LiquidityLevelPlugin &levels);

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

  /// True once the stored sweep has shown its reversal
  bool is_confirmed(const std::string &id) const;

private:
  struct Record {
    LiquidityZone zone;
    std::string level_id;
    double level_price{0};
    bool confirmed{false};
    std::size_t candles_seen{0};
    uint64_t last_seen_ts{0};
  };

  const LiquidityLevelPlugin &levels_;
  std::vector<Record> records_;
  std::set<std::string> converted_; // level ids already turned into sweeps
};

} // namespace liqmap
