#include "liqmap/zone_book.hpp"

#include <algorithm>
#include <tuple>

namespace liqmap {

namespace {

bool outranks(const LiquidityZone &a, const LiquidityZone &b) {
  return std::make_tuple(strength_rank(a.strength), a.touch_count) >
         std::make_tuple(strength_rank(b.strength), b.touch_count);
}

} // namespace

bool within_radius(const LiquidityZone &a, const LiquidityZone &b,
                   double radius_pct) {
  const double gap =
      std::max(0.0, std::max(a.price_low, b.price_low) -
                        std::min(a.price_high, b.price_high));
  return gap <= radius_pct * a.midpoint();
}

ZoneBook::ZoneBook(Timeframe timeframe) : timeframe_(timeframe) {}

std::size_t ZoneBook::age_out(uint64_t now_ts, uint32_t max_age_candles) {
  const uint64_t interval = interval_seconds(timeframe_);
  const std::size_t before = zones_.size();
  zones_.erase(std::remove_if(zones_.begin(), zones_.end(),
                              [&](const LiquidityZone &z) {
                                if (now_ts <= z.created_ts) {
                                  return false;
                                }
                                return (now_ts - z.created_ts) / interval >
                                       max_age_candles;
                              }),
               zones_.end());
  return before - zones_.size();
}

MergeOutcome ZoneBook::merge(const std::vector<LiquidityZone> &candidates,
                             double radius_pct) {
  MergeOutcome outcome;
  for (const auto &candidate : candidates) {
    auto it = std::find_if(zones_.begin(), zones_.end(),
                           [&](const LiquidityZone &z) {
                             return z.kind == candidate.kind &&
                                    within_radius(candidate, z, radius_pct);
                           });
    if (it == zones_.end()) {
      zones_.push_back(candidate);
      ++outcome.added;
      continue;
    }

    if (outranks(candidate, *it)) {
      *it = candidate;
    }
    ++it->touch_count;
    ++outcome.merged;
  }
  return outcome;
}

bool ZoneBook::refresh_from(const LiquidityZone &latest) {
  auto it = std::find_if(zones_.begin(), zones_.end(),
                         [&](const LiquidityZone &z) { return z.id == latest.id; });
  if (it == zones_.end()) {
    return false;
  }
  // Merges may have bumped touch_count beyond the plugin's own count
  it->touch_count = std::max(it->touch_count, latest.touch_count);
  it->strength = latest.strength;
  it->is_mitigated = it->is_mitigated || latest.is_mitigated;
  it->is_active = latest.is_active;
  return true;
}

std::size_t ZoneBook::remove_inactive() {
  const std::size_t before = zones_.size();
  zones_.erase(std::remove_if(zones_.begin(), zones_.end(),
                              [](const LiquidityZone &z) { return !z.is_active; }),
               zones_.end());
  return before - zones_.size();
}

void ZoneBook::set_confluence(const std::string &id, double weight,
                              uint32_t count) {
  for (auto &z : zones_) {
    if (z.id == id) {
      z.confluence_weight = weight;
      z.confluence_count = count;
      return;
    }
  }
}

void ZoneBook::clear_confluence() {
  for (auto &z : zones_) {
    z.confluence_weight = 0;
    z.confluence_count = 0;
  }
}

} // namespace liqmap
