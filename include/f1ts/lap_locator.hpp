#pragma once
#include <cstddef>
#include <vector>
#include <f1ts/sample.hpp>

namespace f1ts {

struct LapContext {
  int lap_number = 1;
  double progress_pct = 0.0;  // [0, 100]
  double lap_duration_s = 0.0;
};

// Project raw lap boundaries into uniform index space using scale = uniform_count / raw_count.
// Integer arithmetic keeps consecutive laps contiguous and the last lap ending at
// uniform_count - 1.
std::vector<ScaledLapBoundary> scale_lap_boundaries(const std::vector<LapBoundary>& laps,
                                                    std::size_t uniform_count);

// Maps a uniform-sequence index back to its lap.
class LapLocator {
public:
  LapLocator(const std::vector<LapBoundary>& laps, std::size_t uniform_count);

  // First scaled lap containing `index`; indices past the table (rounding drift at the tail)
  // are reported as the last lap at 100 %.
  LapContext locate(std::size_t index) const;

  const std::vector<ScaledLapBoundary>& scaled() const { return scaled_; }
  std::size_t total_laps() const { return scaled_.size(); }

private:
  std::vector<ScaledLapBoundary> scaled_;
};

} // namespace f1ts
