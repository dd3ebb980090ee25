#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/liquidity_zone.hpp"
#include "liqmap/timeframe_config.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace liqmap {

/// Abstract pattern detector owned by one LiquidityMap timeframe slot.
///
/// detect() returns only patterns it has not reported before and keeps them
/// in its own store; update() advances touch, mitigation and invalidation
/// state; get() returns copies. Calls are serialized by the owning slot.
class PatternPlugin {
public:
  PatternPlugin(std::string name, Timeframe timeframe)
      : name_(std::move(name)), timeframe_(timeframe) {}
  virtual ~PatternPlugin() = default;

  PatternPlugin(const PatternPlugin &) = delete;
  PatternPlugin &operator=(const PatternPlugin &) = delete;

  const std::string &name() const { return name_; }
  Timeframe timeframe() const { return timeframe_; }

  bool enabled() const { return enabled_; }
  void set_enabled(bool enabled) { enabled_ = enabled; }

  virtual std::vector<LiquidityZone>
  detect(const std::vector<Candle> &candles, const TimeframeConfig &config) = 0;

  virtual void update(const std::vector<Candle> &candles, double current_price,
                      const TimeframeConfig &config) = 0;

  virtual std::vector<LiquidityZone> get(const ZoneFilter &filter) const = 0;

  /// Number of stored patterns, active or not
  virtual std::size_t size() const = 0;

  virtual void clear() = 0;

protected:
  /// "<tag>:<tf>:<ts>" - unique per plugin for a pattern anchored at ts
  std::string make_id(const std::string &tag, uint64_t ts) const {
    return tag + ":" + timeframe_label(timeframe_) + ":" + std::to_string(ts);
  }

private:
  std::string name_;
  Timeframe timeframe_;
  bool enabled_{true};
};

namespace detail {

template <typename Record>
std::vector<LiquidityZone> collect_zones(const std::vector<Record> &records,
                                         const ZoneFilter &filter) {
  std::vector<LiquidityZone> out;
  for (const auto &r : records) {
    if (filter.matches(r.zone)) {
      out.push_back(r.zone);
    }
  }
  return out;
}

template <typename Record>
bool contains_id(const std::vector<Record> &records, const std::string &id) {
  return std::any_of(records.begin(), records.end(),
                     [&](const Record &r) { return r.zone.id == id; });
}

/// Drop records that can no longer be re-detected (anchored before the
/// candle window) and are either inactive or past the age limit.
/// `pinned(record, window_start)` keeps a record a dependent plugin has yet
/// to read.
template <typename Record, typename Pinned>
void prune_records(std::vector<Record> &records,
                   const std::vector<Candle> &candles,
                   const TimeframeConfig &config, Pinned pinned) {
  if (candles.empty()) {
    return;
  }
  const uint64_t window_start = candles.front().open_ts;
  const uint64_t now = candles.back().open_ts;
  const uint64_t interval = interval_seconds(config.timeframe);
  records.erase(
      std::remove_if(records.begin(), records.end(),
                     [&](const Record &r) {
                       if (r.zone.created_ts >= window_start ||
                           pinned(r, window_start)) {
                         return false;
                       }
                       const uint64_t age =
                           now > r.zone.created_ts
                               ? (now - r.zone.created_ts) / interval
                               : 0;
                       return !r.zone.is_active ||
                              age > config.max_zone_age_candles;
                     }),
      records.end());
}

template <typename Record>
void prune_records(std::vector<Record> &records,
                   const std::vector<Candle> &candles,
                   const TimeframeConfig &config) {
  prune_records(records, candles, config,
                [](const Record &, uint64_t) { return false; });
}

/// Index of the first candle strictly after `ts`
inline std::size_t first_after(const std::vector<Candle> &candles,
                               uint64_t ts) {
  auto it = std::upper_bound(
      candles.begin(), candles.end(), ts,
      [](uint64_t value, const Candle &c) { return value < c.open_ts; });
  return static_cast<std::size_t>(it - candles.begin());
}

} // namespace detail

} // namespace liqmap
