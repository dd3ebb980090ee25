#include "liqmap/candle_types.hpp"

#include <stdexcept>

namespace liqmap {

std::string timeframe_label(Timeframe tf) {
  switch (tf) {
  case Timeframe::MIN_1:
    return "1m";
  case Timeframe::MIN_5:
    return "5m";
  case Timeframe::MIN_15:
    return "15m";
  case Timeframe::HOUR_1:
    return "1h";
  case Timeframe::HOUR_4:
    return "4h";
  case Timeframe::DAY_1:
    return "1d";
  default:
    return "custom";
  }
}

Timeframe parse_timeframe(const std::string &label) {
  if (label == "1m") {
    return Timeframe::MIN_1;
  }
  if (label == "5m") {
    return Timeframe::MIN_5;
  }
  if (label == "15m") {
    return Timeframe::MIN_15;
  }
  if (label == "1h") {
    return Timeframe::HOUR_1;
  }
  if (label == "4h") {
    return Timeframe::HOUR_4;
  }
  if (label == "1d") {
    return Timeframe::DAY_1;
  }
  throw std::invalid_argument("unknown timeframe: " + label);
}

} // namespace liqmap
