#pragma once

#include "liqmap/liquidity_zone.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace liqmap {

struct MergeOutcome {
  std::size_t added{0};
  std::size_t merged{0};
};

/// Zone set of one timeframe. Not synchronized; the owning LiquidityMap slot
/// serializes access.
class ZoneBook {
public:
  explicit ZoneBook(Timeframe timeframe);

  /// Remove zones older than `max_age_candles` intervals at `now_ts`.
  /// Returns the number removed.
  std::size_t age_out(uint64_t now_ts, uint32_t max_age_candles);

  /// Fold candidates into the set. A candidate whose range lies within
  /// `radius_pct` x its midpoint of a stored zone of the same kind merges
  /// with it: the stronger zone (strength, then touch_count) survives and
  /// its touch_count is incremented. Otherwise the candidate is added.
  MergeOutcome merge(const std::vector<LiquidityZone> &candidates,
                     double radius_pct);

  /// Copy touch, strength, mitigation and activity from a plugin's view of
  /// the same zone id. Returns false when the id is not stored.
  bool refresh_from(const LiquidityZone &latest);

  /// Drop zones whose pattern was consumed. Returns the number removed.
  std::size_t remove_inactive();

  /// Write confluence results onto a stored zone
  void set_confluence(const std::string &id, double weight, uint32_t count);

  /// Zero confluence on every stored zone
  void clear_confluence();

  const std::vector<LiquidityZone> &zones() const { return zones_; }
  std::size_t size() const { return zones_.size(); }
  Timeframe timeframe() const { return timeframe_; }
  void clear() { zones_.clear(); }

private:
  Timeframe timeframe_;
  std::vector<LiquidityZone> zones_;
};

/// True when the two ranges overlap or sit within radius_pct of each other,
/// measured against the midpoint of `a`
bool within_radius(const LiquidityZone &a, const LiquidityZone &b,
                   double radius_pct);

} // namespace liqmap
