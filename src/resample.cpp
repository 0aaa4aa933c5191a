#include <f1ts/resample.hpp>
#include <f1ts/coerce.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace f1ts {

namespace {

double lerp(double a, double b, double t) { return a + (b - a) * t; }

double extra_at(const RawSample& s, std::size_t k) {
  return k < s.extra.size() ? finite_or(s.extra[k]) : 0.0;
}

// Deduplicated (first occurrence wins), time-ordered view of the raw rows.
std::vector<const RawSample*> ordered_unique(const std::vector<RawSample>& raw) {
  std::vector<const RawSample*> pts;
  pts.reserve(raw.size());
  for (const auto& s : raw) {
    if (std::isfinite(s.time_s)) pts.push_back(&s);
  }
  std::stable_sort(pts.begin(), pts.end(), [](const RawSample* a, const RawSample* b){
    return a->time_s < b->time_s;
  });
  pts.erase(std::unique(pts.begin(), pts.end(), [](const RawSample* a, const RawSample* b){
    return a->time_s == b->time_s;
  }), pts.end());
  return pts;
}

} // namespace

std::size_t Resampler::target_count(double duration_s, double rate_hz) {
  if (!(duration_s > 0.0) || !(rate_hz > 0.0)) return 0;
  const double n = std::floor(duration_s * rate_hz + 1e-9);
  return n > 0.0 ? static_cast<std::size_t>(n) : 0;
}

UniformSeries Resampler::run(const std::vector<RawSample>& raw) const {
  UniformSeries out;
  out.rate_hz = rate_hz_;

  const auto pts = ordered_unique(raw);
  if (pts.empty()) {
    spdlog::warn("[resample] empty input");
    return out;
  }

  const double first = pts.front()->time_s;
  const double last  = pts.back()->time_s;
  const std::size_t count = target_count(last - first, rate_hz_);
  if (count == 0) {
    spdlog::warn("[resample] degenerate input: {:.3f} s at {:.0f} Hz gives no samples",
                 last - first, rate_hz_);
    return out;
  }

  if (pts.size() < raw.size()) {
    spdlog::debug("[resample] dropped {} duplicate/invalid timestamps", raw.size() - pts.size());
  }
  spdlog::info("[resample] {:.1f} s of data, {} raw -> {} samples at {:.0f} Hz",
               last - first, pts.size(), count, rate_hz_);

  std::size_t width = 0;
  for (const auto* p : pts) width = std::max(width, p->extra.size());

  out.samples.resize(count);
  std::size_t hi = 1;
  for (std::size_t i = 0; i < count; ++i) {
    const double t_now = first + static_cast<double>(i) / rate_hz_;
    auto& u = out.samples[i];
    u.time_s = t_now;
    u.extra.assign(width, 0.0);

    // Advance bracket [hi-1, hi] so that A.t <= t_now <= B.t (grid is monotonic)
    while (hi < pts.size() && pts[hi]->time_s < t_now) ++hi;
    if (hi >= pts.size() || t_now < pts[hi-1]->time_s) continue;  // no bracket -> zeros

    const auto& A = *pts[hi-1];
    const auto& B = *pts[hi];
    const double dt = B.time_s - A.time_s;
    const double t  = dt > 0.0 ? (t_now - A.time_s) / dt : 0.0;

    u.speed_kmh    = lerp(finite_or(A.speed_kmh), finite_or(B.speed_kmh), t);
    u.throttle_pct = lerp(finite_or(A.throttle_pct), finite_or(B.throttle_pct), t);
    u.brake        = lerp(finite_or(A.brake), finite_or(B.brake), t);
    u.engine_rpm   = lerp(finite_or(A.engine_rpm), finite_or(B.engine_rpm), t);
    u.drs          = lerp(finite_or(A.drs), finite_or(B.drs), t);
    for (std::size_t k = 0; k < width; ++k) u.extra[k] = lerp(extra_at(A, k), extra_at(B, k), t);

    // Discrete: nearest, earlier sample wins ties
    u.gear = (t <= 0.5) ? A.gear : B.gear;
  }

  return out;
}

} // namespace f1ts
