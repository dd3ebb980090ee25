#pragma once

#include "liqmap/candle_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace liqmap {

/// Historical candle fetch (exchange REST client).
class CandleFetcher {
public:
  virtual ~CandleFetcher() = default;

  /// Candles with open_ts >= start_open_ts, ascending, no duplicates,
  /// at most `limit` of them. Throws on transport failure.
  virtual std::vector<Candle> fetch_candles(const std::string &symbol,
                                            Timeframe timeframe,
                                            uint64_t start_open_ts,
                                            uint32_t limit) = 0;
};

/// Latest persisted candle lookup (columnar store).
class CandleStore {
public:
  virtual ~CandleStore() = default;

  virtual std::optional<Candle> get_last_candle(const std::string &symbol,
                                                Timeframe timeframe) = 0;
};

} // namespace liqmap
