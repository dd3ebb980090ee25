#include "liqmap/candle_sync.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <limits>
#include <utility>

namespace liqmap {

const char *sync_status_label(SyncStatus status) {
  switch (status) {
  case SyncStatus::BOOTSTRAPPED:
    return "bootstrapped";
  case SyncStatus::ACCEPTED:
    return "accepted";
  case SyncStatus::DUPLICATE:
    return "duplicate";
  case SyncStatus::GAP_DETECTED:
    return "gap-detected";
  case SyncStatus::REJECTED_STALE:
    return "rejected-stale";
  case SyncStatus::REJECTED_MISALIGNED:
    return "rejected-misaligned";
  }
  return "unknown";
}

CandleSync::CandleSync(std::string symbol, Timeframe timeframe,
                       std::shared_ptr<BackfillSink> backfill,
                       std::shared_ptr<EventPublisher> events)
    : symbol_(std::move(symbol)), timeframe_(timeframe),
      interval_(interval_seconds(timeframe)), backfill_(std::move(backfill)),
      events_(std::move(events)) {}

void CandleSync::seed(uint64_t last_open_ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_open_ts_ = last_open_ts;
  std::cout << "[SYNC] seed symbol=" << symbol_
            << " tf=" << timeframe_label(timeframe_)
            << " last_open_ts=" << last_open_ts << "\n";
}

void CandleSync::resync() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_open_ts_.reset();
  std::cout << "[SYNC] resync symbol=" << symbol_
            << " tf=" << timeframe_label(timeframe_) << "\n";
}

std::optional<uint64_t> CandleSync::last_open_ts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_open_ts_;
}

bool CandleSync::seeded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_open_ts_.has_value();
}

SyncResult CandleSync::on_closed_candle(const Candle &candle) {
  SyncResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = classify_locked(candle);
  }

  if (result.status != SyncStatus::GAP_DETECTED || !result.gap) {
    return result;
  }

  // Dispatch outside the lock; neither sink may hold up live ingestion.
  const GapRange &gap = *result.gap;
  std::cerr << "[SYNC] gap symbol=" << symbol_
            << " tf=" << timeframe_label(timeframe_)
            << " missing=" << gap.missing << " range=[" << gap.first_open_ts
            << "," << gap.last_open_ts << "]\n";

  if (events_) {
    GapEvent event;
    event.symbol = symbol_;
    event.timeframe = timeframe_;
    event.range = gap;
    event.trigger_open_ts = candle.open_ts;
    try {
      events_->publish_gap(event);
    } catch (const std::exception &ex) {
      std::cerr << "[SYNC] gap event publish failed: " << ex.what() << "\n";
    }
  }

  if (backfill_) {
    BackfillRequest request;
    request.symbol = symbol_;
    request.timeframe = timeframe_;
    request.start_open_ts = gap.first_open_ts;
    constexpr uint64_t kMaxCount = std::numeric_limits<uint32_t>::max();
    if (gap.missing > kMaxCount) {
      std::cerr << "[SYNC] gap too large for one backfill request symbol="
                << symbol_ << " tf=" << timeframe_label(timeframe_)
                << " missing=" << gap.missing << ", requesting " << kMaxCount
                << "\n";
    }
    request.count = static_cast<uint32_t>(std::min(gap.missing, kMaxCount));
    try {
      backfill_->submit(request);
    } catch (const std::exception &ex) {
      std::cerr << "[SYNC] backfill submit failed symbol=" << symbol_
                << " tf=" << timeframe_label(timeframe_)
                << " start=" << request.start_open_ts << ": " << ex.what()
                << "\n";
    }
  }

  return result;
}

SyncResult CandleSync::classify_locked(const Candle &candle) {
  SyncResult result;

  // Unseeded streams use the absolute grid; seeded ones keep the seed's phase
  const uint64_t phase = last_open_ts_ ? *last_open_ts_ % interval_ : 0;
  if (candle.timeframe != timeframe_ || candle.open_ts % interval_ != phase) {
    std::cerr << "[SYNC] rejected misaligned candle symbol=" << symbol_
              << " tf=" << timeframe_label(timeframe_)
              << " open_ts=" << candle.open_ts << "\n";
    result.status = SyncStatus::REJECTED_MISALIGNED;
    return result;
  }

  // First candle ever: nothing to compare against.
  if (!last_open_ts_) {
    last_open_ts_ = candle.open_ts;
    result.status = SyncStatus::BOOTSTRAPPED;
    return result;
  }

  const uint64_t last = *last_open_ts_;
  const uint64_t expected = last + interval_;

  if (candle.open_ts == expected) {
    last_open_ts_ = candle.open_ts;
    result.status = SyncStatus::ACCEPTED;
    return result;
  }

  if (candle.open_ts == last) {
    result.status = SyncStatus::DUPLICATE;
    return result;
  }

  if (candle.open_ts < last) {
    std::cerr << "[SYNC] rejected stale candle symbol=" << symbol_
              << " tf=" << timeframe_label(timeframe_)
              << " open_ts=" << candle.open_ts << " last_open_ts=" << last
              << "\n";
    result.status = SyncStatus::REJECTED_STALE;
    return result;
  }

  // open_ts > expected. Forward-fill always starts right after the last
  // accepted candle, never from the wall clock.
  GapRange gap;
  gap.first_open_ts = expected;
  gap.last_open_ts = candle.open_ts - interval_;
  gap.missing = (candle.open_ts - expected) / interval_;

  last_open_ts_ = candle.open_ts;
  result.status = SyncStatus::GAP_DETECTED;
  result.gap = gap;
  return result;
}

} // namespace liqmap
