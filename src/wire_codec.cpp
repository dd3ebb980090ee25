#include "liqmap/publisher.hpp"
#include "liqmap/v1/zones.pb.h"

#include <stdexcept>

namespace liqmap {

namespace {

v1::ZoneKind to_proto(ZoneKind kind) {
  switch (kind) {
  case ZoneKind::SUPPORT:
    return v1::ZONE_KIND_SUPPORT;
  case ZoneKind::RESISTANCE:
    return v1::ZONE_KIND_RESISTANCE;
  case ZoneKind::ORDER_BLOCK:
    return v1::ZONE_KIND_ORDER_BLOCK;
  case ZoneKind::FAIR_VALUE_GAP:
    return v1::ZONE_KIND_FAIR_VALUE_GAP;
  case ZoneKind::LIQUIDITY_LEVEL:
    return v1::ZONE_KIND_LIQUIDITY_LEVEL;
  case ZoneKind::STRUCTURE_BREAK:
    return v1::ZONE_KIND_STRUCTURE_BREAK;
  case ZoneKind::BREAKER_BLOCK:
    return v1::ZONE_KIND_BREAKER_BLOCK;
  case ZoneKind::LIQUIDITY_SWEEP:
    return v1::ZONE_KIND_LIQUIDITY_SWEEP;
  }
  return v1::ZONE_KIND_UNSPECIFIED;
}

v1::ZoneStrength to_proto(ZoneStrength strength) {
  switch (strength) {
  case ZoneStrength::WEAK:
    return v1::ZONE_STRENGTH_WEAK;
  case ZoneStrength::MODERATE:
    return v1::ZONE_STRENGTH_MODERATE;
  case ZoneStrength::STRONG:
    return v1::ZONE_STRENGTH_STRONG;
  }
  return v1::ZONE_STRENGTH_UNSPECIFIED;
}

v1::ZoneDirection to_proto(ZoneDirection direction) {
  switch (direction) {
  case ZoneDirection::BULLISH:
    return v1::ZONE_DIRECTION_BULLISH;
  case ZoneDirection::BEARISH:
    return v1::ZONE_DIRECTION_BEARISH;
  case ZoneDirection::NONE:
    break;
  }
  return v1::ZONE_DIRECTION_NONE;
}

} // namespace

std::string encode_gap_event(const GapEvent &event) {
  v1::GapEvent proto;
  proto.set_symbol(event.symbol);
  proto.set_timeframe(timeframe_label(event.timeframe));
  proto.set_first_open_ts(event.range.first_open_ts);
  proto.set_last_open_ts(event.range.last_open_ts);
  proto.set_missing(event.range.missing);
  proto.set_trigger_open_ts(event.trigger_open_ts);

  std::string payload;
  if (!proto.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize gap event protobuf");
  }
  return payload;
}

std::string encode_zone_snapshot(const ZoneSnapshot &snapshot) {
  v1::ZoneSnapshot proto;
  proto.set_symbol(snapshot.symbol);
  proto.set_timeframe(timeframe_label(snapshot.timeframe));
  proto.set_as_of_ts(snapshot.as_of_ts);

  for (const auto &zone : snapshot.zones) {
    v1::Zone *z = proto.add_zones();
    z->set_id(zone.id);
    z->set_timeframe(timeframe_label(zone.timeframe));
    z->set_kind(to_proto(zone.kind));
    z->set_direction(to_proto(zone.direction));
    z->set_price_low(zone.price_low);
    z->set_price_high(zone.price_high);
    z->set_created_ts(zone.created_ts);
    z->set_strength(to_proto(zone.strength));
    z->set_touch_count(zone.touch_count);
    z->set_volume(zone.volume);
    z->set_is_mitigated(zone.is_mitigated);
    z->set_confluence_weight(zone.confluence_weight);
    z->set_confluence_count(zone.confluence_count);
    z->set_source(zone.source);
  }

  std::string payload;
  if (!proto.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize zone snapshot protobuf");
  }
  return payload;
}

} // namespace liqmap
