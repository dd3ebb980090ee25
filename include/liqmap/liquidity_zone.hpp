#pragma once

#include "liqmap/candle_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace liqmap {

enum class ZoneKind : uint8_t {
  SUPPORT,
  RESISTANCE,
  ORDER_BLOCK,
  FAIR_VALUE_GAP,
  LIQUIDITY_LEVEL,
  STRUCTURE_BREAK,
  BREAKER_BLOCK,
  LIQUIDITY_SWEEP
};

enum class ZoneStrength : uint8_t { WEAK = 0, MODERATE = 1, STRONG = 2 };

enum class ZoneDirection : uint8_t { NONE, BULLISH, BEARISH };

std::string zone_kind_label(ZoneKind kind);
std::string zone_strength_label(ZoneStrength strength);

/// Ordering used for tie-breaks: strong > moderate > weak
constexpr int strength_rank(ZoneStrength strength) {
  return static_cast<int>(strength);
}

/// A price range identified as support/resistance or institutional interest
struct LiquidityZone {
  std::string id;
  Timeframe timeframe{Timeframe::MIN_1};
  ZoneKind kind{ZoneKind::SUPPORT};
  ZoneDirection direction{ZoneDirection::NONE};
  double price_low{0};
  double price_high{0};
  uint64_t created_ts{0};   // open_ts of the originating candle
  ZoneStrength strength{ZoneStrength::WEAK};
  uint32_t touch_count{0};
  double volume{0};
  bool is_mitigated{false}; // price has returned into the zone
  bool is_active{true};     // false once the pattern is consumed or broken
  double confluence_weight{0};
  uint32_t confluence_count{0};
  std::string source;       // plugin that produced the zone

  double midpoint() const { return (price_low + price_high) / 2.0; }
  double size() const { return price_high - price_low; }
  bool contains(double price) const {
    return price >= price_low && price <= price_high;
  }
};

/// Construct a zone, enforcing price_low <= price_high
/// @throws std::invalid_argument if the bounds are inverted or not finite
LiquidityZone make_zone(std::string id, Timeframe timeframe, ZoneKind kind,
                        ZoneDirection direction, double price_low,
                        double price_high, uint64_t created_ts, double volume,
                        ZoneStrength strength = ZoneStrength::WEAK);

/// Query filter shared by plugins and the map
struct ZoneFilter {
  std::optional<ZoneKind> kind;
  std::optional<ZoneDirection> direction;
  std::optional<ZoneStrength> min_strength;
  bool include_inactive{false};
  bool include_mitigated{true};

  bool matches(const LiquidityZone &zone) const;
};

} // namespace liqmap
