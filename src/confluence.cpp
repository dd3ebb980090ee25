#include "liqmap/confluence.hpp"

#include <algorithm>
#include <set>
#include <tuple>

namespace liqmap {

namespace {

struct Group {
  std::vector<const LiquidityZone *> members;
  std::set<Timeframe> timeframes;
  double low{0};
  double high{0};
  Timeframe anchor{Timeframe::MIN_1}; // highest-weight timeframe present
};

auto rank_key(const LiquidityZone &z, int weight) {
  return std::make_tuple(weight, strength_rank(z.strength), z.touch_count,
                         z.volume);
}

} // namespace

std::vector<LiquidityZone>
compute_confluence(std::vector<LiquidityZone> zones,
                   const std::map<Timeframe, TimeframeWeight> &weights,
                   std::size_t min_timeframes) {
  zones.erase(std::remove_if(zones.begin(), zones.end(),
                             [&](const LiquidityZone &z) {
                               return weights.find(z.timeframe) == weights.end();
                             }),
              zones.end());
  std::sort(zones.begin(), zones.end(),
            [](const LiquidityZone &a, const LiquidityZone &b) {
              return std::make_tuple(a.price_low, a.price_high) <
                     std::make_tuple(b.price_low, b.price_high);
            });

  auto heavier = [&](Timeframe a, Timeframe b) {
    const TimeframeWeight &wa = weights.at(a);
    const TimeframeWeight &wb = weights.at(b);
    return std::make_tuple(wa.weight, wa.merge_radius_pct) >
           std::make_tuple(wb.weight, wb.merge_radius_pct);
  };

  std::vector<Group> groups;
  for (const auto &z : zones) {
    if (!groups.empty()) {
      Group &g = groups.back();
      const Timeframe anchor = heavier(z.timeframe, g.anchor) ? z.timeframe : g.anchor;
      const double radius = weights.at(anchor).merge_radius_pct * z.midpoint();
      const double gap = std::max(0.0, z.price_low - g.high);
      if (gap <= radius) {
        g.members.push_back(&z);
        g.timeframes.insert(z.timeframe);
        g.high = std::max(g.high, z.price_high);
        g.anchor = anchor;
        continue;
      }
    }

    Group g;
    g.members.push_back(&z);
    g.timeframes.insert(z.timeframe);
    g.low = z.price_low;
    g.high = z.price_high;
    g.anchor = z.timeframe;
    groups.push_back(std::move(g));
  }

  std::vector<LiquidityZone> result;
  for (const auto &g : groups) {
    if (g.timeframes.size() < min_timeframes) {
      continue;
    }

    double weight = 0;
    for (Timeframe tf : g.timeframes) {
      weight += weights.at(tf).weight;
    }

    const LiquidityZone *best = g.members.front();
    for (const LiquidityZone *m : g.members) {
      if (rank_key(*m, weights.at(m->timeframe).weight) >
          rank_key(*best, weights.at(best->timeframe).weight)) {
        best = m;
      }
    }

    LiquidityZone rep = *best;
    rep.confluence_weight = weight;
    rep.confluence_count = static_cast<uint32_t>(g.timeframes.size());
    result.push_back(rep);
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const LiquidityZone &a, const LiquidityZone &b) {
                     return std::make_tuple(a.confluence_weight,
                                            a.confluence_count) >
                            std::make_tuple(b.confluence_weight,
                                            b.confluence_count);
                   });
  return result;
}

} // namespace liqmap
