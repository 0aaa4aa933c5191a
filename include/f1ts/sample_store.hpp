#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <f1ts/sample.hpp>

namespace f1ts {

// Concatenated multi-lap raw samples plus the lap boundary table.
// Filled once at load time, read-only afterwards.
class SampleStore {
public:
  // Appends one lap. `samples` carry lap-relative time offsets; they are shifted so the
  // concatenated sequence is cumulative (lap n starts where lap n-1 ended).
  // A negative `lap_duration_s` means "not recorded": the sample span is used instead.
  // Returns false (and stores nothing) for an empty lap.
  bool append_lap(int lap_number, double lap_duration_s, std::vector<RawSample> samples);

  void set_extra_names(std::vector<std::string> names) { extra_names_ = std::move(names); }

  const std::vector<RawSample>&   samples() const { return samples_; }
  const std::vector<LapBoundary>& laps() const { return laps_; }
  const std::vector<std::string>& extra_names() const { return extra_names_; }

  std::size_t size() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }
  std::size_t lap_count() const { return laps_.size(); }

  // Cumulative time covered (s).
  double covered_time_s() const;
  // Raw samples per second over the covered span (0 when degenerate).
  double recorded_rate_hz() const;

private:
  std::vector<RawSample> samples_;
  std::vector<LapBoundary> laps_;
  std::vector<std::string> extra_names_;
  double cumulative_time_s_ = 0.0;
};

// Stream-based CSV loader (test-friendly; no filesystem required).
// Samples header must name at least `lap` and `time` (or `time_s`); other recognised columns:
// speed, throttle, brake, ngear/gear, rpm, drs. Unknown numeric columns become extra channels,
// non-numeric ones are skipped. Blank lines and lines starting with '#' are ignored.
// `laps_in` (optional) holds `lap,lap_time_s` rows with the recorded lap times.
// `max_laps` > 0 keeps only the first N laps.
// Returns nullopt when no lap with samples could be read.
std::optional<SampleStore> sample_store_from_csv_stream(std::istream& samples_in,
                                                        std::istream* laps_in = nullptr,
                                                        std::size_t max_laps = 0);

// Filesystem wrapper; returns nullopt if a file cannot be opened or holds no usable laps.
// An empty `laps_path` means no lap-time file.
std::optional<SampleStore> load_sample_store_csv(const std::string& samples_path,
                                                 const std::string& laps_path = {},
                                                 std::size_t max_laps = 0);

// Logs sample/lap counts, channel ranges and a low-variation warning.
void log_store_diagnostics(const SampleStore& store);

} // namespace f1ts
