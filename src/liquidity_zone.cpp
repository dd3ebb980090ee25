#include "liqmap/liquidity_zone.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace liqmap {

std::string zone_kind_label(ZoneKind kind) {
  switch (kind) {
  case ZoneKind::SUPPORT:
    return "support";
  case ZoneKind::RESISTANCE:
    return "resistance";
  case ZoneKind::ORDER_BLOCK:
    return "order_block";
  case ZoneKind::FAIR_VALUE_GAP:
    return "fvg";
  case ZoneKind::LIQUIDITY_LEVEL:
    return "liquidity_level";
  case ZoneKind::STRUCTURE_BREAK:
    return "structure_break";
  case ZoneKind::BREAKER_BLOCK:
    return "breaker_block";
  case ZoneKind::LIQUIDITY_SWEEP:
    return "liquidity_sweep";
  }
  return "unknown";
}

std::string zone_strength_label(ZoneStrength strength) {
  switch (strength) {
  case ZoneStrength::WEAK:
    return "weak";
  case ZoneStrength::MODERATE:
    return "moderate";
  case ZoneStrength::STRONG:
    return "strong";
  }
  return "unknown";
}

LiquidityZone make_zone(std::string id, Timeframe timeframe, ZoneKind kind,
                        ZoneDirection direction, double price_low,
                        double price_high, uint64_t created_ts, double volume,
                        ZoneStrength strength) {
  if (!std::isfinite(price_low) || !std::isfinite(price_high)) {
    throw std::invalid_argument("zone " + id + " has non-finite bounds");
  }
  if (price_low > price_high) {
    throw std::invalid_argument("zone " + id + " has price_low > price_high");
  }

  LiquidityZone zone;
  zone.id = std::move(id);
  zone.timeframe = timeframe;
  zone.kind = kind;
  zone.direction = direction;
  zone.price_low = price_low;
  zone.price_high = price_high;
  zone.created_ts = created_ts;
  zone.volume = volume;
  zone.strength = strength;
  return zone;
}

bool ZoneFilter::matches(const LiquidityZone &zone) const {
  if (!include_inactive && !zone.is_active) {
    return false;
  }
  if (!include_mitigated && zone.is_mitigated) {
    return false;
  }
  if (kind && zone.kind != *kind) {
    return false;
  }
  if (direction && zone.direction != *direction) {
    return false;
  }
  if (min_strength && strength_rank(zone.strength) < strength_rank(*min_strength)) {
    return false;
  }
  return true;
}

} // namespace liqmap
