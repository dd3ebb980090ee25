#include "liqmap/liquidity_map.hpp"

#include "liqmap/confluence.hpp"
#include "liqmap/indicators.hpp"
#include "liqmap/plugins/breaker_block.hpp"
#include "liqmap/plugins/fair_value_gap.hpp"
#include "liqmap/plugins/liquidity_level.hpp"
#include "liqmap/plugins/liquidity_sweep.hpp"
#include "liqmap/plugins/order_block.hpp"
#include "liqmap/plugins/structure_break.hpp"
#include "liqmap/plugins/support_resistance.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace liqmap {

struct LiquidityMap::Slot {
  Slot(const TimeframeConfig &cfg, const LiquidityMapOptions &options)
      : config(cfg), book(cfg.timeframe) {
    const Timeframe tf = cfg.timeframe;

    auto order_blocks = std::make_unique<OrderBlockPlugin>(tf);
    auto levels = std::make_unique<LiquidityLevelPlugin>(tf);
    auto breakers = std::make_unique<BreakerBlockPlugin>(tf, *order_blocks);
    auto sweeps = std::make_unique<LiquiditySweepPlugin>(tf, *levels);

    add(std::make_unique<SupportResistancePlugin>(tf),
        options.enable_support_resistance);
    add(std::move(order_blocks), options.enable_order_blocks);
    add(std::make_unique<FairValueGapPlugin>(tf), options.enable_fair_value_gaps);
    add(std::move(levels), options.enable_liquidity_levels);
    add(std::make_unique<StructureBreakPlugin>(tf),
        options.enable_structure_breaks);
    // Dependents after their sources so they see this refresh's updates
    add(std::move(breakers), options.enable_breaker_blocks);
    add(std::move(sweeps), options.enable_liquidity_sweeps);
  }

  void add(std::unique_ptr<PatternPlugin> plugin, bool enabled) {
    plugin->set_enabled(enabled);
    plugins.push_back(std::move(plugin));
  }

  PatternPlugin *find(const std::string &name) const {
    for (const auto &p : plugins) {
      if (p->name() == name) {
        return p.get();
      }
    }
    return nullptr;
  }

  const TimeframeConfig config;
  ZoneBook book;
  // Dependents hold references into earlier entries; never reorder or erase
  std::vector<std::unique_ptr<PatternPlugin>> plugins;
  std::vector<Displacement> displacements; // latest refresh window only
  uint64_t last_refresh_ts{0};
  mutable std::mutex mutex;
};

LiquidityMap::LiquidityMap(LiquidityMapOptions options)
    : symbol_(std::move(options.symbol)), publisher_(options.publisher),
      displacement_config_(options.displacement) {
  const DisplacementConfig &dc = displacement_config_;
  if (dc.min_candles == 0 || dc.volume_lookback == 0 ||
      dc.min_volume_ratio <= 0 || dc.min_body_pct <= 0 || dc.min_body_pct > 1) {
    throw std::invalid_argument(
        "displacement config: min_candles and volume_lookback must be "
        "positive, min_volume_ratio > 0, min_body_pct in (0, 1]");
  }

  if (options.timeframes.empty()) {
    for (Timeframe tf : {Timeframe::MIN_1, Timeframe::MIN_5, Timeframe::MIN_15,
                         Timeframe::HOUR_1}) {
      options.timeframes.push_back(default_timeframe_config(tf));
    }
  }

  for (const auto &cfg : options.timeframes) {
    cfg.validate();
    if (slots_.count(cfg.timeframe)) {
      throw std::invalid_argument("duplicate timeframe config: " +
                                  timeframe_label(cfg.timeframe));
    }
    slots_.emplace(cfg.timeframe, std::make_unique<Slot>(cfg, options));
  }

  std::cout << "[LIQMAP] initialized symbol=" << symbol_
            << " timeframes=" << slots_.size() << "\n";
}

LiquidityMap::~LiquidityMap() = default;

LiquidityMap::Slot &LiquidityMap::slot(Timeframe timeframe) {
  auto it = slots_.find(timeframe);
  if (it == slots_.end()) {
    throw std::invalid_argument("timeframe not configured: " +
                                timeframe_label(timeframe));
  }
  return *it->second;
}

const LiquidityMap::Slot &LiquidityMap::slot(Timeframe timeframe) const {
  auto it = slots_.find(timeframe);
  if (it == slots_.end()) {
    throw std::invalid_argument("timeframe not configured: " +
                                timeframe_label(timeframe));
  }
  return *it->second;
}

RefreshReport LiquidityMap::on_candle_close(Timeframe timeframe,
                                            const std::vector<Candle> &candles,
                                            double current_price,
                                            const std::optional<TrendState> &trend) {
  if (!std::isfinite(current_price) || current_price <= 0) {
    throw std::invalid_argument("current_price must be positive");
  }

  Slot &s = slot(timeframe);
  RefreshReport report;
  if (candles.empty()) {
    return report;
  }

  ZoneSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(s.mutex);

    const TimeframeConfig cfg = trend ? adapt_for_trend(s.config, *trend) : s.config;
    const std::size_t keep = std::min(candles.size(), s.config.lookback_candles);
    const std::vector<Candle> window(candles.end() - keep, candles.end());
    const uint64_t now_ts = window.back().open_ts;
    ++refreshes_;

    const std::size_t min_window =
        static_cast<std::size_t>(cfg.pivot_left + cfg.pivot_right + 1);
    report.insufficient = window.size() < min_window;
    s.displacements = detect_displacements(window, timeframe, displacement_config_);

    if (!report.insufficient) {
      auto volatility = classify_volatility(window, cfg);
      if (volatility && volatility_gate_blocks(*volatility, cfg)) {
        report.gated = true;
        ++atr_filtered_;
        std::cout << "[LIQMAP] " << timeframe_label(timeframe)
                  << " volatility gate atr=" << volatility->current_atr
                  << " baseline=" << volatility->baseline_atr
                  << ", skipping detection\n";
      }
    }

    std::vector<LiquidityZone> accepted;
    if (!report.insufficient && !report.gated) {
      for (auto &plugin : s.plugins) {
        if (!plugin->enabled()) {
          continue;
        }
        auto found = plugin->detect(window, cfg);
        report.candidates += found.size();

        for (auto &zone : found) {
          auto origin = std::find_if(window.begin(), window.end(),
                                     [&](const Candle &c) {
                                       return c.open_ts == zone.created_ts;
                                     });
          if (origin != window.end() && origin != window.begin()) {
            const auto idx = static_cast<std::size_t>(origin - window.begin());
            auto ratio = volume_spike_ratio(window, idx, cfg.volume_lookback);
            if (!ratio || *ratio < cfg.volume_spike_multiplier) {
              ++volume_filtered_;
              continue;
            }
          }

          const double distance =
              std::fabs(zone.midpoint() - current_price) / current_price;
          if (distance < cfg.min_zone_distance_pct) {
            ++distance_filtered_;
            continue;
          }
          accepted.push_back(std::move(zone));
        }
      }
    }

    report.aged_out = s.book.age_out(now_ts, cfg.max_zone_age_candles);
    age_filtered_ += report.aged_out;

    const MergeOutcome merged = s.book.merge(accepted, cfg.merge_radius_pct);
    report.added = merged.added;
    report.merged = merged.merged;
    zones_created_ += merged.added;
    zones_merged_ += merged.merged;

    for (auto &plugin : s.plugins) {
      if (plugin->enabled()) {
        plugin->update(window, current_price, cfg);
      }
    }

    ZoneFilter everything;
    everything.include_inactive = true;
    for (const auto &plugin : s.plugins) {
      for (const auto &latest : plugin->get(everything)) {
        s.book.refresh_from(latest);
      }
    }
    report.deactivated = s.book.remove_inactive();
    s.last_refresh_ts = now_ts;

    snapshot.symbol = symbol_;
    snapshot.timeframe = timeframe;
    snapshot.as_of_ts = now_ts;
    snapshot.zones = s.book.zones();
  }

  if (report.added || report.merged || report.aged_out || report.deactivated) {
    std::cout << "[LIQMAP] " << timeframe_label(timeframe)
              << " ts=" << snapshot.as_of_ts << " added=" << report.added
              << " merged=" << report.merged << " aged=" << report.aged_out
              << " consumed=" << report.deactivated
              << " zones=" << snapshot.zones.size() << "\n";
  }

  publish_snapshot(std::move(snapshot));
  return report;
}

void LiquidityMap::publish_snapshot(ZoneSnapshot snapshot) {
  if (!publisher_) {
    return;
  }
  try {
    publisher_->publish_zones(snapshot);
  } catch (const std::exception &ex) {
    std::cerr << "[EMIT] zone snapshot publish failed symbol=" << symbol_
              << " tf=" << timeframe_label(snapshot.timeframe) << ": "
              << ex.what() << "\n";
  }
}

std::vector<LiquidityZone> LiquidityMap::get_zones(Timeframe timeframe,
                                                   const ZoneFilter &filter) const {
  const Slot &s = slot(timeframe);
  std::vector<LiquidityZone> out;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &z : s.book.zones()) {
      if (filter.matches(z)) {
        out.push_back(z);
      }
    }
  }
  std::sort(out.begin(), out.end(),
            [](const LiquidityZone &a, const LiquidityZone &b) {
              return a.price_low < b.price_low;
            });
  return out;
}

std::vector<LiquidityZone>
LiquidityMap::get_confluence_zones(std::size_t min_timeframes) {
  // Slots are locked in timeframe order, the only multi-lock path
  std::vector<std::unique_lock<std::mutex>> locks;
  locks.reserve(slots_.size());
  for (auto &entry : slots_) {
    locks.emplace_back(entry.second->mutex);
  }

  std::vector<LiquidityZone> zones;
  std::map<Timeframe, TimeframeWeight> weights;
  for (const auto &entry : slots_) {
    const Slot &s = *entry.second;
    weights[entry.first] =
        TimeframeWeight{s.config.tf_weight, s.config.merge_radius_pct};
    for (const auto &z : s.book.zones()) {
      if (z.is_active) {
        zones.push_back(z);
      }
    }
  }

  auto result = compute_confluence(std::move(zones), weights, min_timeframes);
  // Earlier representatives may have lost their group
  for (auto &entry : slots_) {
    entry.second->book.clear_confluence();
  }
  for (const auto &rep : result) {
    slots_.at(rep.timeframe)
        ->book.set_confluence(rep.id, rep.confluence_weight, rep.confluence_count);
  }
  return result;
}

std::optional<LiquidityZone>
LiquidityMap::get_nearest_support(double price) const {
  std::optional<LiquidityZone> best;
  for (const auto &entry : slots_) {
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &z : s.book.zones()) {
      if (!z.is_active || z.price_high > price) {
        continue;
      }
      if (!best || z.price_high > best->price_high) {
        best = z;
      }
    }
  }
  return best;
}

std::optional<LiquidityZone>
LiquidityMap::get_nearest_resistance(double price) const {
  std::optional<LiquidityZone> best;
  for (const auto &entry : slots_) {
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &z : s.book.zones()) {
      if (!z.is_active || z.price_low < price) {
        continue;
      }
      if (!best || z.price_low < best->price_low) {
        best = z;
      }
    }
  }
  return best;
}

std::vector<LiquidityZone>
LiquidityMap::get_fvgs(std::optional<Timeframe> timeframe, bool only_unfilled,
                       std::optional<ZoneDirection> direction) const {
  if (timeframe) {
    slot(*timeframe); // throws on an unconfigured timeframe
  }

  ZoneFilter filter;
  filter.include_inactive = !only_unfilled;
  filter.direction = direction;

  std::vector<LiquidityZone> out;
  for (const auto &entry : slots_) {
    if (timeframe && entry.first != *timeframe) {
      continue;
    }
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    for (auto &z : s.find("fair_value_gap")->get(filter)) {
      out.push_back(std::move(z));
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const LiquidityZone &a, const LiquidityZone &b) {
                     return a.created_ts > b.created_ts;
                   });
  return out;
}

std::optional<LiquidityZone>
LiquidityMap::get_nearest_fvg(double price, PriceSide side,
                              bool only_unfilled) const {
  std::optional<LiquidityZone> best;
  for (const auto &z : get_fvgs(std::nullopt, only_unfilled)) {
    switch (side) {
    case PriceSide::ABOVE:
      if (z.price_low > price && (!best || z.price_low < best->price_low)) {
        best = z;
      }
      break;
    case PriceSide::BELOW:
      if (z.price_high < price && (!best || z.price_high > best->price_high)) {
        best = z;
      }
      break;
    case PriceSide::EITHER:
      if (!best || std::fabs(z.midpoint() - price) <
                       std::fabs(best->midpoint() - price)) {
        best = z;
      }
      break;
    }
  }
  return best;
}

std::vector<Displacement>
LiquidityMap::get_displacements(std::optional<Timeframe> timeframe,
                                std::optional<ZoneDirection> direction,
                                uint32_t min_candles) const {
  if (timeframe) {
    slot(*timeframe); // throws on an unconfigured timeframe
  }

  std::vector<Displacement> out;
  for (const auto &entry : slots_) {
    if (timeframe && entry.first != *timeframe) {
      continue;
    }
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &d : s.displacements) {
      if (direction && d.direction != *direction) {
        continue;
      }
      if (d.num_candles < min_candles) {
        continue;
      }
      out.push_back(d);
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Displacement &a, const Displacement &b) {
                     return a.end_ts > b.end_ts;
                   });
  return out;
}

std::vector<Displacement>
LiquidityMap::get_recent_displacements(std::optional<Timeframe> timeframe,
                                       std::size_t count) const {
  auto all = get_displacements(timeframe);
  if (all.size() > count) {
    all.resize(count);
  }
  return all;
}

std::optional<Displacement>
LiquidityMap::get_strongest_displacement(std::optional<Timeframe> timeframe,
                                         DisplacementMetric metric) const {
  return strongest_displacement(get_displacements(timeframe), metric);
}

std::vector<LiquidityZone>
LiquidityMap::get_patterns(Timeframe timeframe, const std::string &plugin,
                           const ZoneFilter &filter) const {
  const Slot &s = slot(timeframe);
  std::lock_guard<std::mutex> lock(s.mutex);
  const PatternPlugin *p = s.find(plugin);
  if (!p) {
    throw std::invalid_argument("unknown plugin: " + plugin);
  }
  return p->get(filter);
}

bool LiquidityMap::set_plugin_enabled(const std::string &plugin, bool enabled) {
  bool found = false;
  for (auto &entry : slots_) {
    Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (PatternPlugin *p = s.find(plugin)) {
      p->set_enabled(enabled);
      found = true;
    }
  }
  if (found) {
    std::cout << "[LIQMAP] plugin " << plugin
              << (enabled ? " enabled" : " disabled") << "\n";
  }
  return found;
}

bool LiquidityMap::enable_plugin(const std::string &plugin) {
  return set_plugin_enabled(plugin, true);
}

bool LiquidityMap::disable_plugin(const std::string &plugin) {
  return set_plugin_enabled(plugin, false);
}

std::vector<PluginStatus> LiquidityMap::plugin_status() const {
  std::vector<PluginStatus> out;
  for (const auto &entry : slots_) {
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &p : s.plugins) {
      out.push_back(PluginStatus{p->name(), entry.first, p->enabled(), p->size()});
    }
  }
  return out;
}

LiquidityMapStats LiquidityMap::statistics() const {
  LiquidityMapStats stats;
  stats.filters.refreshes = refreshes_.load();
  stats.filters.atr_filtered = atr_filtered_.load();
  stats.filters.volume_filtered = volume_filtered_.load();
  stats.filters.distance_filtered = distance_filtered_.load();
  stats.filters.age_filtered = age_filtered_.load();
  stats.filters.zones_created = zones_created_.load();
  stats.filters.zones_merged = zones_merged_.load();

  for (const auto &entry : slots_) {
    const Slot &s = *entry.second;
    std::lock_guard<std::mutex> lock(s.mutex);
    stats.timeframes.push_back(TimeframeStats{entry.first, s.book.size(),
                                              s.displacements.size(),
                                              s.last_refresh_ts});
  }
  return stats;
}

void LiquidityMap::reset_statistics() {
  refreshes_ = 0;
  atr_filtered_ = 0;
  volume_filtered_ = 0;
  distance_filtered_ = 0;
  age_filtered_ = 0;
  zones_created_ = 0;
  zones_merged_ = 0;
}

std::vector<Timeframe> LiquidityMap::timeframes() const {
  std::vector<Timeframe> out;
  for (const auto &entry : slots_) {
    out.push_back(entry.first);
  }
  return out;
}

const TimeframeConfig &LiquidityMap::config(Timeframe timeframe) const {
  return slot(timeframe).config;
}

} // namespace liqmap
