#include "liqmap/sync_registry.hpp"

#include <exception>
#include <iostream>

namespace liqmap {

CandleSyncRegistry::CandleSyncRegistry(std::shared_ptr<BackfillSink> backfill,
                                       std::shared_ptr<EventPublisher> events)
    : backfill_(std::move(backfill)), events_(std::move(events)) {}

CandleSync &CandleSyncRegistry::get_or_create(const std::string &symbol,
                                              Timeframe timeframe) {
  std::lock_guard<std::mutex> lock(mutex_);

  Key key{symbol, timeframe};
  auto it = syncs_.find(key);
  if (it != syncs_.end()) {
    return *it->second;
  }

  auto sync =
      std::make_unique<CandleSync>(symbol, timeframe, backfill_, events_);
  CandleSync &ref = *sync;
  syncs_.emplace(std::move(key), std::move(sync));
  return ref;
}

std::size_t
CandleSyncRegistry::seed_from_store(CandleStore &store,
                                    const std::vector<std::string> &symbols,
                                    const std::vector<Timeframe> &timeframes) {
  std::size_t seeded = 0;
  for (const auto &symbol : symbols) {
    for (Timeframe tf : timeframes) {
      CandleSync &sync = get_or_create(symbol, tf);

      std::optional<Candle> last;
      try {
        last = store.get_last_candle(symbol, tf);
      } catch (const std::exception &ex) {
        std::cerr << "[SYNC] last candle lookup failed symbol=" << symbol
                  << " tf=" << timeframe_label(tf) << ": " << ex.what()
                  << "\n";
        continue;
      }

      if (!last) {
        std::cout << "[SYNC] no persisted candles symbol=" << symbol
                  << " tf=" << timeframe_label(tf)
                  << ", first live candle bootstraps\n";
        continue;
      }

      sync.seed(last->open_ts);
      ++seeded;
    }
  }
  return seeded;
}

SyncResult CandleSyncRegistry::on_closed_candle(const std::string &symbol,
                                                Timeframe timeframe,
                                                const Candle &candle) {
  if (!candle.symbol.empty() && candle.symbol != symbol) {
    std::cerr << "[SYNC] candle symbol " << candle.symbol
              << " routed to stream " << symbol << ", rejecting\n";
    SyncResult result;
    result.status = SyncStatus::REJECTED_MISALIGNED;
    return result;
  }
  return get_or_create(symbol, timeframe).on_closed_candle(candle);
}

void CandleSyncRegistry::resync(const std::string &symbol,
                                Timeframe timeframe) {
  get_or_create(symbol, timeframe).resync();
}

std::optional<uint64_t>
CandleSyncRegistry::last_open_ts(const std::string &symbol,
                                 Timeframe timeframe) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = syncs_.find(Key{symbol, timeframe});
  if (it == syncs_.end()) {
    return std::nullopt;
  }
  return it->second->last_open_ts();
}

std::size_t CandleSyncRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return syncs_.size();
}

} // namespace liqmap
