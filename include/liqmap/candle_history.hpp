#pragma once

#include "liqmap/candle_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace liqmap {

/// Bounded, open_ts-ordered candle store for one symbol/timeframe.
///
/// Live candles and backfilled candles both land here; the map key keeps
/// them in order regardless of arrival order.
class CandleHistory {
public:
  CandleHistory(std::string symbol, Timeframe timeframe, std::size_t capacity);

  /// Insert or replace the candle at candle.open_ts
  void upsert(const Candle &candle);

  /// Insert a recovered candle; never replaces a live one
  /// @return true if the candle was new
  bool insert_backfill(const Candle &candle);

  /// Latest `count` candles in ascending open_ts order (copy)
  std::vector<Candle> window(std::size_t count) const;

  std::optional<Candle> last() const;
  std::size_t size() const;

  const std::string &symbol() const { return symbol_; }
  Timeframe timeframe() const { return timeframe_; }

private:
  void trim_locked();

  std::string symbol_;
  Timeframe timeframe_;
  std::size_t capacity_;
  std::map<uint64_t, Candle> candles_; // key: open_ts
  mutable std::mutex mutex_;
};

} // namespace liqmap
