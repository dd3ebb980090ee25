#pragma once

#include "liqmap/candle_source.hpp"
#include "liqmap/candle_sync.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace liqmap {

/// Owns one CandleSync per symbol/timeframe and routes live candles to it.
class CandleSyncRegistry {
public:
  explicit CandleSyncRegistry(std::shared_ptr<BackfillSink> backfill = nullptr,
                              std::shared_ptr<EventPublisher> events = nullptr);

  /// Get or create the sync for a pair (thread-safe)
  CandleSync &get_or_create(const std::string &symbol, Timeframe timeframe);

  /// Seed every symbol x timeframe pair from the store's latest candle.
  /// get_last_candle is called exactly once per pair.
  /// @return number of pairs that were seeded
  std::size_t seed_from_store(CandleStore &store,
                              const std::vector<std::string> &symbols,
                              const std::vector<Timeframe> &timeframes);

  /// Route a closed live candle to its sync
  SyncResult on_closed_candle(const std::string &symbol, Timeframe timeframe,
                              const Candle &candle);

  /// Explicit reset of one pair's sequencing state
  void resync(const std::string &symbol, Timeframe timeframe);

  std::optional<uint64_t> last_open_ts(const std::string &symbol,
                                       Timeframe timeframe) const;

  std::size_t size() const;

private:
  using Key = std::pair<std::string, Timeframe>;

  std::shared_ptr<BackfillSink> backfill_;
  std::shared_ptr<EventPublisher> events_;
  std::map<Key, std::unique_ptr<CandleSync>> syncs_;
  mutable std::mutex mutex_;
};

} // namespace liqmap
