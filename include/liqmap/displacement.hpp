#pragma once

#include "liqmap/candle_types.hpp"
#include "liqmap/liquidity_zone.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace liqmap {

/// Run of consecutive same-direction candles with large bodies on surging
/// volume
struct Displacement {
  Timeframe timeframe{Timeframe::MIN_1};
  ZoneDirection direction{ZoneDirection::NONE};
  double start_price{0}; // open of the first candle
  double end_price{0};   // close of the last candle
  uint64_t start_ts{0};
  uint64_t end_ts{0};
  uint32_t num_candles{0};
  double move_pct{0}; // |end - start| / start
  double avg_volume{0};
  double volume_surge_ratio{0}; // avg_volume / baseline volume

  bool is_bullish() const { return direction == ZoneDirection::BULLISH; }
};

struct DisplacementConfig {
  uint32_t min_candles{3};
  double min_volume_ratio{1.5}; // candle volume vs baseline
  double min_body_pct{0.6};     // body / range
  std::size_t volume_lookback{20};
};

enum class DisplacementMetric { MOVE_PCT, VOLUME_SURGE, NUM_CANDLES };

/// Scan `candles` for displacement runs. The baseline is the mean volume of
/// the last volume_lookback candles; scanning starts at index
/// volume_lookback and resumes after each run, so runs never overlap.
/// Returns nothing for fewer than min_candles + volume_lookback candles.
std::vector<Displacement>
detect_displacements(const std::vector<Candle> &candles, Timeframe timeframe,
                     const DisplacementConfig &config = {});

/// Largest displacement by `metric`; the first one wins ties
std::optional<Displacement>
strongest_displacement(const std::vector<Displacement> &displacements,
                       DisplacementMetric metric = DisplacementMetric::MOVE_PCT);

} // namespace liqmap
