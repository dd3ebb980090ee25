#include "liqmap/candle_history.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace liqmap {

CandleHistory::CandleHistory(std::string symbol, Timeframe timeframe,
                             std::size_t capacity)
    : symbol_(std::move(symbol)), timeframe_(timeframe), capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("CandleHistory capacity must be > 0");
  }
}

void CandleHistory::upsert(const Candle &candle) {
  std::lock_guard<std::mutex> lock(mutex_);
  candles_[candle.open_ts] = candle;
  trim_locked();
}

bool CandleHistory::insert_backfill(const Candle &candle) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Older than everything retained: it would be trimmed straight away.
  if (candles_.size() >= capacity_ && !candles_.empty() &&
      candle.open_ts < candles_.begin()->first) {
    return false;
  }

  bool inserted = candles_.emplace(candle.open_ts, candle).second;
  if (inserted) {
    trim_locked();
  }
  return inserted;
}

std::vector<Candle> CandleHistory::window(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Candle> out;
  if (count == 0 || candles_.empty()) {
    return out;
  }

  std::size_t take = count < candles_.size() ? count : candles_.size();
  out.reserve(take);

  auto it = candles_.end();
  std::advance(it, -static_cast<std::ptrdiff_t>(take));
  for (; it != candles_.end(); ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::optional<Candle> CandleHistory::last() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (candles_.empty()) {
    return std::nullopt;
  }
  return candles_.rbegin()->second;
}

std::size_t CandleHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return candles_.size();
}

void CandleHistory::trim_locked() {
  while (candles_.size() > capacity_) {
    candles_.erase(candles_.begin());
  }
}

} // namespace liqmap
