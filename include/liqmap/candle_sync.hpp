#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/publisher.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace liqmap {

/// Outcome of offering one closed candle to a CandleSync
enum class SyncStatus {
  BOOTSTRAPPED,       // first candle of an unseeded sync, no gap check
  ACCEPTED,           // exactly last_open_ts + interval
  DUPLICATE,          // same open_ts as the last accepted candle
  GAP_DETECTED,       // accepted, one or more intervals missing before it
  REJECTED_STALE,     // older than the last accepted candle
  REJECTED_MISALIGNED // open_ts off the interval grid or wrong timeframe
};

const char *sync_status_label(SyncStatus status);

struct SyncResult {
  SyncStatus status{SyncStatus::REJECTED_STALE};
  std::optional<GapRange> gap;

  bool accepted() const {
    return status == SyncStatus::BOOTSTRAPPED ||
           status == SyncStatus::ACCEPTED ||
           status == SyncStatus::DUPLICATE ||
           status == SyncStatus::GAP_DETECTED;
  }
};

/// Forward-fill request: `count` candles starting at `start_open_ts`
struct BackfillRequest {
  std::string symbol;
  Timeframe timeframe{Timeframe::MIN_1};
  uint64_t start_open_ts{0};
  uint32_t count{0};

  uint64_t end_open_ts() const {
    return start_open_ts + (static_cast<uint64_t>(count) - 1) *
                               interval_seconds(timeframe);
  }
};

/// Receives backfill requests. Implementations must not block the caller
/// on network I/O.
class BackfillSink {
public:
  virtual ~BackfillSink() = default;

  virtual void submit(const BackfillRequest &request) = 0;
};

/// Sequencing guard for one symbol/timeframe stream.
///
/// Tracks the open timestamp of the last accepted candle, classifies each
/// incoming closed candle and requests forward-fill of skipped intervals.
/// last_open_ts_ leaves the unseeded state only through seed() or an
/// accepted candle.
class CandleSync {
public:
  CandleSync(std::string symbol, Timeframe timeframe,
             std::shared_ptr<BackfillSink> backfill = nullptr,
             std::shared_ptr<EventPublisher> events = nullptr);

  /// Seed from the latest persisted candle (called once at startup)
  void seed(uint64_t last_open_ts);

  /// Drop sequencing state; the next candle bootstraps again
  void resync();

  /// Classify and accept/reject a closed candle (thread-safe)
  SyncResult on_closed_candle(const Candle &candle);

  std::optional<uint64_t> last_open_ts() const;
  bool seeded() const;

  const std::string &symbol() const { return symbol_; }
  Timeframe timeframe() const { return timeframe_; }
  uint64_t interval() const { return interval_; }

private:
  SyncResult classify_locked(const Candle &candle);

  const std::string symbol_;
  const Timeframe timeframe_;
  const uint64_t interval_;
  std::shared_ptr<BackfillSink> backfill_;
  std::shared_ptr<EventPublisher> events_;

  std::optional<uint64_t> last_open_ts_;
  mutable std::mutex mutex_;
};

} // namespace liqmap
