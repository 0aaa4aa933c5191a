#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace f1ts {

// One raw telemetry row as recorded (irregular timing).
struct RawSample {
  double time_s = 0.0;        // cumulative time offset across laps (s)
  double speed_kmh = 0.0;
  double throttle_pct = 0.0;  // 0..100
  double brake = 0.0;         // 0..1
  int gear = 0;
  double engine_rpm = 0.0;
  double drs = 0.0;           // wing-assist code, > 0 means open
  std::vector<double> extra;  // unclassified numeric channels (see SampleStore::extra_names)
};

// One row of the fixed-rate series.
struct UniformSample {
  double time_s = 0.0;
  double speed_kmh = 0.0;
  double throttle_pct = 0.0;
  double brake = 0.0;
  int gear = 0;
  double engine_rpm = 0.0;
  double drs = 0.0;
  std::vector<double> extra;

  bool drs_active() const { return drs > 0.0; }
};

// Inclusive index range of one lap inside the concatenated raw sequence.
struct LapBoundary {
  std::size_t start_index = 0;
  std::size_t end_index = 0;
  int lap_number = 0;
  double lap_duration_s = 0.0;  // recorded lap time

  std::size_t sample_count() const { return end_index - start_index + 1; }
};

// LapBoundary projected into uniform index space.
struct ScaledLapBoundary {
  std::size_t start = 0;
  std::size_t end = 0;          // inclusive
  int lap_number = 0;
  double lap_duration_s = 0.0;

  bool empty() const { return end < start; }
  std::size_t length() const { return empty() ? 0 : end - start + 1; }
};

} // namespace f1ts
