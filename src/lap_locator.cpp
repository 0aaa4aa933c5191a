#include <f1ts/lap_locator.hpp>
#include <algorithm>
#include <cstdint>

namespace f1ts {

static std::size_t raw_total(const std::vector<LapBoundary>& laps) {
  std::size_t n = 0;
  for (const auto& lb : laps) n += lb.sample_count();
  return n;
}

std::vector<ScaledLapBoundary> scale_lap_boundaries(const std::vector<LapBoundary>& laps,
                                                    std::size_t uniform_count) {
  std::vector<ScaledLapBoundary> out;
  out.reserve(laps.size());
  const std::size_t raw = raw_total(laps);

  // floor(i * scale) with scale = N / R, or 1.0 when there is no raw data
  auto project = [&](std::size_t i) -> std::size_t {
    if (raw == 0) return i;
    return static_cast<std::size_t>(
      (static_cast<std::uint64_t>(i) * static_cast<std::uint64_t>(uniform_count)) / raw);
  };

  for (const auto& lb : laps) {
    ScaledLapBoundary s{};
    s.start = project(lb.start_index);
    const std::size_t end_excl = project(lb.end_index + 1);
    if (end_excl > s.start) {
      s.end = end_excl - 1;
    } else {
      // lap shorter than one uniform tick: owns no index
      s.start = end_excl + 1;
      s.end = end_excl;
    }
    s.lap_number = lb.lap_number;
    s.lap_duration_s = lb.lap_duration_s;
    out.push_back(s);
  }
  return out;
}

LapLocator::LapLocator(const std::vector<LapBoundary>& laps, std::size_t uniform_count)
  : scaled_(scale_lap_boundaries(laps, uniform_count)) {}

LapContext LapLocator::locate(std::size_t index) const {
  if (scaled_.empty()) return LapContext{1, 0.0, 0.0};

  for (const auto& s : scaled_) {
    if (s.empty() || index < s.start || index > s.end) continue;
    const double len = static_cast<double>(s.length());
    const double pct = (static_cast<double>(index - s.start) / len) * 100.0;
    return LapContext{s.lap_number, std::clamp(pct, 0.0, 100.0), s.lap_duration_s};
  }

  const auto& tail = scaled_.back();
  return LapContext{tail.lap_number, 100.0, tail.lap_duration_s};
}

} // namespace f1ts
