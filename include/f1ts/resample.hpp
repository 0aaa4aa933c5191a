#pragma once
#include <cstddef>
#include <vector>
#include <f1ts/sample.hpp>

namespace f1ts {

// Fixed-rate series produced from the raw samples of one session.
struct UniformSeries {
  double rate_hz = 0.0;
  std::vector<UniformSample> samples;

  std::size_t size() const { return samples.size(); }
  bool empty() const { return samples.empty(); }
  double duration_s() const { return rate_hz > 0.0 ? double(samples.size()) / rate_hz : 0.0; }
};

// Converts irregular raw samples (time already cumulative across laps) into a series covering
// [first_time, last_time] at exactly 1/rate spacing.
// - duplicate timestamps keep the first occurrence; out-of-order input is sorted
// - continuous channels interpolate linearly between the bracketing raw samples
// - gear takes the nearest raw sample (hold on ties)
// - anything without a bracket fills with 0
// Degenerate input (empty, or fewer than one output tick) yields an empty series.
class Resampler {
public:
  explicit Resampler(double target_rate_hz) : rate_hz_(target_rate_hz) {}

  UniformSeries run(const std::vector<RawSample>& raw) const;

  // floor(duration * rate), guarded against representation error.
  static std::size_t target_count(double duration_s, double rate_hz);

  double rate_hz() const { return rate_hz_; }

private:
  double rate_hz_;
};

} // namespace f1ts
