#pragma once

#include "liqmap/plugins/pattern_plugin.hpp"

namespace liqmap {

enum class StructureTrend { RANGING, UP, DOWN };

/// BOS continues the prevailing trend, CHOCH reverses it
enum class BreakType { BOS, CHOCH };

/// Closes through confirmed swing points. The broken swing price becomes the
/// zone; a close back through it invalidates the break.
class StructureBreakPlugin : public PatternPlugin {
public:
  static constexpr int kSwingLookback = 5;
  static constexpr std::size_t kScanWindow = 50;

  explicit StructureBreakPlugin(Timeframe timeframe);

  std::vector<LiquidityZone> detect(const std::vector<Candle> &candles,
                                    const TimeframeConfig &config) override;
  void update(const std::vector<Candle> &candles, double current_price,
              const TimeframeConfig &config) override;
  std::vector<LiquidityZone> get(const ZoneFilter &filter) const override;
  std::size_t size() const override { return records_.size(); }
  void clear() override {
    records_.clear();
    trend_ = StructureTrend::RANGING;
  }

  /// Trend after the most recent break seen by detect()
  StructureTrend trend() const { return trend_; }

  /// Break type of a stored zone id, BOS when unknown
  BreakType break_type(const std::string &id) const;

private:
  struct Record {
    LiquidityZone zone;
    BreakType type{BreakType::BOS};
    double level{0};
    uint64_t last_seen_ts{0};
  };

  std::vector<Record> records_;
  StructureTrend trend_{StructureTrend::RANGING};
};

} // namespace liqmap
