#pragma once

#include "liqmap/plugins/pattern_plugin.hpp"

namespace liqmap {

/// Three-candle imbalance. Bullish when the first candle's high sits below
/// the third candle's low, bearish when its low sits above the third's high.
class FairValueGapPlugin : public PatternPlugin {
public:
  static constexpr double kFilledPct = 75.0;

  explicit FairValueGapPlugin(Timeframe timeframe);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override { records_.clear(); }

  /// Fill percentage of a stored gap, or -1 when the id is unknown
  double fill_percentage(const std::string &id) const;

private:
  struct Record {
    LiquidityZone zone;
    double fill_pct{0};
    uint64_t last_seen_ts{0}; // starts at the third candle
  };

  std::vector<Record> records_;
};

} // namespace liqmap
