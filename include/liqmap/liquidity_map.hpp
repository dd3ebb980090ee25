#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/displacement.hpp"
#include "liqmap/liquidity_zone.hpp"
#include "liqmap/plugins/pattern_plugin.hpp"
#include "liqmap/publisher.hpp"
#include "liqmap/timeframe_config.hpp"
#include "liqmap/zone_book.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace liqmap {

/// Construction parameters for LiquidityMap
struct LiquidityMapOptions {
  std::string symbol;
  /// Validated per-timeframe configs; empty selects the 1m/5m/15m/1h defaults
  std::vector<TimeframeConfig> timeframes;

  bool enable_support_resistance{true};
  bool enable_order_blocks{true};
  bool enable_fair_value_gaps{true};
  bool enable_liquidity_levels{true};
  bool enable_structure_breaks{true};
  bool enable_breaker_blocks{true};
  bool enable_liquidity_sweeps{true};

  /// Multi-candle displacement scan run on every refresh window
  DisplacementConfig displacement;

  /// Receives a zone snapshot after every refresh (optional)
  std::shared_ptr<EventPublisher> publisher;
};

/// Counters incremented by the refresh pipeline
struct FilterStats {
  uint64_t refreshes{0};
  uint64_t atr_filtered{0};      // refreshes skipped by the volatility gate
  uint64_t volume_filtered{0};   // candidates without a volume spike
  uint64_t distance_filtered{0}; // candidates too close to price
  uint64_t age_filtered{0};      // zones removed by age
  uint64_t zones_created{0};
  uint64_t zones_merged{0};
};

struct TimeframeStats {
  Timeframe timeframe{Timeframe::MIN_1};
  std::size_t zone_count{0};
  std::size_t displacements{0};
  uint64_t last_refresh_ts{0};
};

struct LiquidityMapStats {
  FilterStats filters;
  std::vector<TimeframeStats> timeframes;
};

struct PluginStatus {
  std::string name;
  Timeframe timeframe{Timeframe::MIN_1};
  bool enabled{false};
  std::size_t patterns{0};
};

/// Which side of the price a query looks at
enum class PriceSide { ABOVE, BELOW, EITHER };

/// What one on_candle_close() call did
struct RefreshReport {
  bool gated{false};          // volatility gate skipped detection
  bool insufficient{false};   // window too short for the pivot window
  std::size_t candidates{0};  // detected before filtering
  std::size_t added{0};
  std::size_t merged{0};
  std::size_t aged_out{0};
  std::size_t deactivated{0}; // removed after plugin updates
};

/// Multi-timeframe liquidity zone engine.
///
/// Each timeframe owns a slot (config, zone book, plugin set, mutex). A
/// refresh holds only its slot's lock, so timeframes refresh in parallel
/// while refreshes of one timeframe are serialized. Confluence and
/// cross-timeframe queries hold every slot lock. All queries return copies.
class LiquidityMap {
public:
  /// @throws std::invalid_argument on an invalid or duplicated timeframe
  /// config, or an invalid displacement config
  explicit LiquidityMap(LiquidityMapOptions options);
  ~LiquidityMap();

  LiquidityMap(const LiquidityMap &) = delete;
  LiquidityMap &operator=(const LiquidityMap &) = delete;

  /// Run the refresh pipeline for one closed candle of `timeframe`.
  /// `candles` is ordered by open_ts and ends with the closed candle.
  /// @throws std::invalid_argument when the timeframe is not configured
  RefreshReport on_candle_close(Timeframe timeframe,
                                const std::vector<Candle> &candles,
                                double current_price,
                                const std::optional<TrendState> &trend =
                                    std::nullopt);

  /// Active zones of one timeframe matching `filter`, ordered by price
  std::vector<LiquidityZone> get_zones(Timeframe timeframe,
                                       const ZoneFilter &filter = {}) const;

  /// Cross-timeframe confluence groups with at least `min_timeframes`
  /// distinct timeframes. Stored representatives get their confluence
  /// fields updated.
  std::vector<LiquidityZone> get_confluence_zones(std::size_t min_timeframes = 2);

  /// Closest active zone entirely below / above `price` on any timeframe
  std::optional<LiquidityZone> get_nearest_support(double price) const;
  std::optional<LiquidityZone> get_nearest_resistance(double price) const;

  /// Fair value gaps held by the gap plugin of one or every timeframe,
  /// newest first. Unfilled gaps are the active ones.
  std::vector<LiquidityZone>
  get_fvgs(std::optional<Timeframe> timeframe = std::nullopt,
           bool only_unfilled = true,
           std::optional<ZoneDirection> direction = std::nullopt) const;

  /// ABOVE: lowest gap entirely above price. BELOW: highest gap entirely
  /// below. EITHER: gap whose midpoint is closest.
  std::optional<LiquidityZone>
  get_nearest_fvg(double price, PriceSide side = PriceSide::EITHER,
                  bool only_unfilled = true) const;

  /// Displacements found in each timeframe's latest refresh window, newest
  /// (by end_ts) first
  std::vector<Displacement>
  get_displacements(std::optional<Timeframe> timeframe = std::nullopt,
                    std::optional<ZoneDirection> direction = std::nullopt,
                    uint32_t min_candles = 0) const;

  std::vector<Displacement>
  get_recent_displacements(std::optional<Timeframe> timeframe = std::nullopt,
                           std::size_t count = 10) const;

  std::optional<Displacement> get_strongest_displacement(
      std::optional<Timeframe> timeframe = std::nullopt,
      DisplacementMetric metric = DisplacementMetric::MOVE_PCT) const;

  /// Patterns held by one plugin, including ones filtered out of the zone set
  /// @throws std::invalid_argument on an unknown timeframe or plugin name
  std::vector<LiquidityZone> get_patterns(Timeframe timeframe,
                                          const std::string &plugin,
                                          const ZoneFilter &filter = {}) const;

  /// Toggle a plugin on every timeframe. Returns false for unknown names.
  bool enable_plugin(const std::string &plugin);
  bool disable_plugin(const std::string &plugin);

  std::vector<PluginStatus> plugin_status() const;

  LiquidityMapStats statistics() const;
  void reset_statistics();

  std::vector<Timeframe> timeframes() const;
  const TimeframeConfig &config(Timeframe timeframe) const;
  const std::string &symbol() const { return symbol_; }

private:
  struct Slot;

  Slot &slot(Timeframe timeframe);
  const Slot &slot(Timeframe timeframe) const;
  bool set_plugin_enabled(const std::string &plugin, bool enabled);
  void publish_snapshot(ZoneSnapshot snapshot);

  std::string symbol_;
  std::map<Timeframe, std::unique_ptr<Slot>> slots_;
  std::shared_ptr<EventPublisher> publisher_;
  DisplacementConfig displacement_config_;

  std::atomic<uint64_t> refreshes_{0};
  std::atomic<uint64_t> atr_filtered_{0};
  std::atomic<uint64_t> volume_filtered_{0};
  std::atomic<uint64_t> distance_filtered_{0};
  std::atomic<uint64_t> age_filtered_{0};
  std::atomic<uint64_t> zones_created_{0};
  std::atomic<uint64_t> zones_merged_{0};
};

} // namespace liqmap
