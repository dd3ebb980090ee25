#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace liqmap {

/// Candle aggregation interval (in seconds)
enum class Timeframe : uint32_t {
  MIN_1 = 60,
  MIN_5 = 300,
  MIN_15 = 900,
  HOUR_1 = 3600,
  HOUR_4 = 14400,
  DAY_1 = 86400
};

/// Interval length of a timeframe in seconds
constexpr uint64_t interval_seconds(Timeframe tf) {
  return static_cast<uint64_t>(tf);
}

/// Short label used in logs, zone ids and wire subjects ("1m", "1h", ...)
std::string timeframe_label(Timeframe tf);

/// Parse a label produced by timeframe_label()
/// @throws std::invalid_argument for unknown labels
Timeframe parse_timeframe(const std::string &label);

/// One closed (or still forming) OHLCV interval for a symbol/timeframe
struct Candle {
  std::string symbol;
  Timeframe timeframe;
  uint64_t open_ts;  // Unix seconds, multiple of the interval
  uint64_t close_ts; // Unix seconds
  double open;
  double high;
  double low;
  double close;
  double volume;     // Base asset volume
  bool is_closed;

  Candle()
      : timeframe(Timeframe::MIN_1), open_ts(0), close_ts(0), open(0),
        high(0), low(0), close(0), volume(0), is_closed(false) {}
};

/// True when open_ts sits exactly on an interval boundary
inline bool is_aligned(const Candle &candle) {
  return candle.open_ts % interval_seconds(candle.timeframe) == 0;
}

/// Optional external trend context consumed by trend adaptation
enum class TrendDirection {
  STRONG_BEARISH,
  BEARISH,
  NEUTRAL,
  BULLISH,
  STRONG_BULLISH
};

enum class TrendStrength { VERY_WEAK, WEAK, MODERATE, STRONG, VERY_STRONG };

struct TrendState {
  TrendDirection direction{TrendDirection::NEUTRAL};
  TrendStrength strength{TrendStrength::MODERATE};
};

} // namespace liqmap
