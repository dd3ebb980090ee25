#pragma once

#include "liqmap/liquidity_zone.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace liqmap {

/// Weighting inputs of one timeframe
struct TimeframeWeight {
  int weight{1};
  double merge_radius_pct{0.001};
};

/// Group zones across timeframes and score each group.
///
/// Zones are chained in price order; a zone joins the current group when
/// its gap to the group's range is within the merge radius of the
/// highest-weight timeframe involved, measured at the zone's midpoint.
/// A group's weight sums tf weights over its distinct timeframes. The
/// representative is the member with the highest (tf weight, strength,
/// touch_count, volume); it is returned with confluence_weight and
/// confluence_count set. Groups with fewer than `min_timeframes` distinct
/// timeframes are dropped. Output is sorted by (weight, count) descending.
///
/// Zones whose timeframe is missing from `weights` are ignored.
std::vector<LiquidityZone>
compute_confluence(std::vector<LiquidityZone> zones,
                   const std::map<Timeframe, TimeframeWeight> &weights,
                   std::size_t min_timeframes);

} // namespace liqmap
