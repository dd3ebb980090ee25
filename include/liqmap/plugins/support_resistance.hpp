#pragma once

#include "liqmap/plugins/pattern_plugin.hpp"

namespace liqmap {

/// Swing pivots confirmed by a nearby high-volume price cluster.
/// Swing highs become resistance, swing lows support.
class SupportResistancePlugin : public PatternPlugin {
public:
  static constexpr std::size_t kVolumeBins = 50;
  static constexpr double kClusterProximityPct = 0.005;
  static constexpr std::size_t kTouchWindow = 20;

  explicit SupportResistancePlugin(Timeframe timeframe);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override { records_.clear(); }

private:
  struct Record {
    LiquidityZone zone;
    uint64_t last_seen_ts{0};
  };

  std::vector<Record> records_;
};

} // namespace liqmap
