#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/liquidity_zone.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace liqmap {

/// Inclusive range of missing candle open timestamps
struct GapRange {
  uint64_t first_open_ts{0};
  uint64_t last_open_ts{0};
  uint64_t missing{0};
};

/// Emitted by CandleSync when a live candle skips one or more intervals
struct GapEvent {
  std::string symbol;
  Timeframe timeframe{Timeframe::MIN_1};
  GapRange range;
  uint64_t trigger_open_ts{0}; // open_ts of the live candle that exposed the gap
};

/// Zone set of one timeframe as of its latest refresh
struct ZoneSnapshot {
  std::string symbol;
  Timeframe timeframe{Timeframe::MIN_1};
  uint64_t as_of_ts{0};
  std::vector<LiquidityZone> zones;
};

/// Abstract publisher interface for gap events and zone snapshots.
class EventPublisher {
public:
  virtual ~EventPublisher() = default;

  virtual void publish_gap(const GapEvent &event) = 0;

  virtual void publish_zones(const ZoneSnapshot &snapshot) = 0;
};

/// In-memory publisher used for tests and the replay tool's dry runs.
class InMemoryPublisher : public EventPublisher {
public:
  void publish_gap(const GapEvent &event) override;
  void publish_zones(const ZoneSnapshot &snapshot) override;

  std::vector<GapEvent> gaps() const;
  std::vector<ZoneSnapshot> snapshots() const;

private:
  mutable std::mutex mutex_;
  std::vector<GapEvent> gaps_;
  std::vector<ZoneSnapshot> snapshots_;
};

/// Protobuf payloads (liqmap.v1) for the JetStream wire
std::string encode_gap_event(const GapEvent &event);
std::string encode_zone_snapshot(const ZoneSnapshot &snapshot);

} // namespace liqmap
