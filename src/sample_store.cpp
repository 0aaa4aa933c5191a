#include <f1ts/sample_store.hpp>
#include <f1ts/coerce.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <spdlog/spdlog.h>

namespace f1ts {

bool SampleStore::append_lap(int lap_number, double lap_duration_s, std::vector<RawSample> samples) {
  if (samples.empty()) return false;

  const double offset = cumulative_time_s_;
  for (auto& s : samples) s.time_s += offset;

  const double span = samples.back().time_s - samples.front().time_s;
  LapBoundary lb{};
  lb.start_index = samples_.size();
  lb.end_index = samples_.size() + samples.size() - 1;
  lb.lap_number = lap_number;
  lb.lap_duration_s = lap_duration_s >= 0.0 ? lap_duration_s : std::max(0.0, span);

  cumulative_time_s_ = samples.back().time_s;
  samples_.insert(samples_.end(),
                  std::make_move_iterator(samples.begin()),
                  std::make_move_iterator(samples.end()));
  laps_.push_back(lb);
  return true;
}

double SampleStore::covered_time_s() const {
  if (samples_.size() < 2) return 0.0;
  return samples_.back().time_s - samples_.front().time_s;
}

double SampleStore::recorded_rate_hz() const {
  const double span = covered_time_s();
  return span > 0.0 ? static_cast<double>(samples_.size()) / span : 0.0;
}

// ---- CSV loading ----

namespace {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Simple CSV: no quoted fields.
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

// Reads non-blank, non-comment lines. First row is the header.
std::vector<std::vector<std::string>> read_rows(std::istream& in) {
  std::vector<std::vector<std::string>> rows;
  std::string line;
  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    rows.push_back(split_csv_line(raw));
  }
  return rows;
}

enum class Column { Lap, Time, Speed, Throttle, Brake, Gear, Rpm, Drs, Extra, Skip };

Column classify_header(const std::string& name) {
  const auto n = lower(name);
  if (n == "lap" || n == "lapnumber" || n == "lap_number") return Column::Lap;
  if (n == "time" || n == "time_s")                        return Column::Time;
  if (n == "speed" || n == "speed_kmh")                    return Column::Speed;
  if (n == "throttle" || n == "throttle_pct")              return Column::Throttle;
  if (n == "brake")                                        return Column::Brake;
  if (n == "ngear" || n == "gear")                         return Column::Gear;
  if (n == "rpm" || n == "engine_rpm")                     return Column::Rpm;
  if (n == "drs")                                          return Column::Drs;
  if (n == "date" || n == "driver" || n.empty())           return Column::Skip;
  return Column::Extra;
}

const std::string& cell(const std::vector<std::string>& row, std::size_t i) {
  static const std::string kEmpty;
  return i < row.size() ? row[i] : kEmpty;
}

struct CoerceTally {
  std::size_t missing = 0;
  std::size_t non_numeric = 0;
  std::size_t out_of_range = 0;

  template <class T>
  T take(const Coerced<T>& c) {
    if (c.error) {
      switch (*c.error) {
        case CoerceError::Missing:    ++missing; break;
        case CoerceError::NonNumeric: ++non_numeric; break;
        case CoerceError::OutOfRange: ++out_of_range; break;
      }
    }
    return c.value;
  }
};

std::map<int, double> read_lap_times(std::istream& in) {
  std::map<int, double> out;
  for (const auto& cols : read_rows(in)) {
    if (cols.size() < 2) continue;
    const auto lap = coerce_int(cols[0]);
    const auto t = coerce_double(cols[1]);
    if (!lap.ok() || !t.ok() || t.value <= 0.0) continue;  // header and unrecorded laps
    out[lap.value] = t.value;
  }
  return out;
}

} // namespace

std::optional<SampleStore> sample_store_from_csv_stream(std::istream& samples_in,
                                                        std::istream* laps_in,
                                                        std::size_t max_laps) {
  const auto rows = read_rows(samples_in);
  if (rows.size() < 2) {
    spdlog::error("[load] samples table has no data rows");
    return std::nullopt;
  }

  const auto& header = rows.front();
  std::vector<Column> kinds;
  kinds.reserve(header.size());
  for (const auto& h : header) kinds.push_back(classify_header(h));

  const auto lap_col  = std::find(kinds.begin(), kinds.end(), Column::Lap);
  const auto time_col = std::find(kinds.begin(), kinds.end(), Column::Time);
  if (lap_col == kinds.end() || time_col == kinds.end()) {
    spdlog::error("[load] samples header needs 'lap' and 'time' columns");
    return std::nullopt;
  }

  // Extra columns survive only if at least one value is numeric.
  std::vector<std::size_t> extra_cols;
  std::vector<std::string> extra_names;
  for (std::size_t c = 0; c < kinds.size(); ++c) {
    if (kinds[c] != Column::Extra) continue;
    const bool numeric = std::any_of(rows.begin() + 1, rows.end(), [&](const auto& r){
      return coerce_double(cell(r, c)).ok();
    });
    if (numeric) {
      extra_cols.push_back(c);
      extra_names.push_back(header[c]);
    } else {
      kinds[c] = Column::Skip;
    }
  }

  CoerceTally tally;
  std::map<int, std::vector<RawSample>> by_lap;
  std::size_t rejected = 0;

  for (std::size_t r = 1; r < rows.size(); ++r) {
    const auto& row = rows[r];
    const auto lap = coerce_int(cell(row, static_cast<std::size_t>(lap_col - kinds.begin())));
    const auto t = coerce_double(cell(row, static_cast<std::size_t>(time_col - kinds.begin())));
    if (!lap.ok() || !t.ok()) { ++rejected; continue; }  // no lap identity or time

    RawSample s{};
    s.time_s = t.value;
    for (std::size_t c = 0; c < kinds.size(); ++c) {
      const auto& v = cell(row, c);
      switch (kinds[c]) {
        case Column::Speed:    s.speed_kmh = tally.take(coerce_double(v)); break;
        case Column::Throttle: s.throttle_pct = tally.take(coerce_double(v)); break;
        case Column::Brake: {
          // recorded either as 0..1 or as a boolean flag
          const auto d = coerce_double(v);
          s.brake = d.ok() ? d.value : (tally.take(coerce_bool(v)) ? 1.0 : 0.0);
          break;
        }
        case Column::Gear:     s.gear = tally.take(coerce_int(v)); break;
        case Column::Rpm:      s.engine_rpm = tally.take(coerce_double(v)); break;
        case Column::Drs:      s.drs = tally.take(coerce_double(v)); break;
        default: break;
      }
    }
    s.extra.reserve(extra_cols.size());
    for (std::size_t c : extra_cols) s.extra.push_back(tally.take(coerce_double(cell(row, c))));

    by_lap[lap.value].push_back(std::move(s));
  }

  std::map<int, double> lap_times;
  if (laps_in) lap_times = read_lap_times(*laps_in);

  SampleStore store;
  store.set_extra_names(std::move(extra_names));
  for (auto& [lap, samples] : by_lap) {
    if (max_laps > 0 && store.lap_count() >= max_laps) break;
    const auto it = lap_times.find(lap);
    const double duration = (it != lap_times.end()) ? it->second : -1.0;
    if (!store.append_lap(lap, duration, std::move(samples))) {
      spdlog::warn("[load] lap {} has no samples, skipped", lap);
    }
  }

  if (rejected > 0) {
    spdlog::warn("[load] {} rows without a usable lap number or time were skipped", rejected);
  }
  if (tally.missing + tally.non_numeric + tally.out_of_range > 0) {
    spdlog::debug("[load] coerced to default: {} missing, {} non-numeric, {} out-of-range",
                  tally.missing, tally.non_numeric, tally.out_of_range);
  }

  if (store.empty()) {
    spdlog::error("[load] no laps with samples");
    return std::nullopt;
  }
  return store;
}

std::optional<SampleStore> load_sample_store_csv(const std::string& samples_path,
                                                 const std::string& laps_path,
                                                 std::size_t max_laps) {
  std::ifstream f(samples_path);
  if (!f) {
    spdlog::error("[load] cannot open samples file '{}'", samples_path);
    return std::nullopt;
  }
  if (laps_path.empty()) return sample_store_from_csv_stream(f, nullptr, max_laps);

  std::ifstream lf(laps_path);
  if (!lf) {
    spdlog::error("[load] cannot open lap times file '{}'", laps_path);
    return std::nullopt;
  }
  return sample_store_from_csv_stream(f, &lf, max_laps);
}

void log_store_diagnostics(const SampleStore& store) {
  const auto& s = store.samples();
  if (s.empty()) return;

  spdlog::info("[load] {} samples across {} lap(s), {:.1f} s covered",
               store.size(), store.lap_count(), store.covered_time_s());
  spdlog::info("[load] recorded sample rate ~{:.0f} Hz", store.recorded_rate_hz());

  auto range = [&](auto proj) {
    const auto [lo, hi] = std::minmax_element(s.begin(), s.end(), [&](const auto& a, const auto& b){
      return proj(a) < proj(b);
    });
    return std::pair<double, double>{static_cast<double>(proj(*lo)), static_cast<double>(proj(*hi))};
  };
  const auto spd = range([](const RawSample& r){ return r.speed_kmh; });
  const auto thr = range([](const RawSample& r){ return r.throttle_pct; });
  const auto brk = range([](const RawSample& r){ return r.brake; });
  const auto gr  = range([](const RawSample& r){ return r.gear; });
  const auto rpm = range([](const RawSample& r){ return r.engine_rpm; });
  spdlog::info("[load] speed {:.0f}-{:.0f} km/h, throttle {:.0f}-{:.0f}%, brake {:.1f}-{:.1f}",
               spd.first, spd.second, thr.first, thr.second, brk.first, brk.second);
  spdlog::info("[load] gear {:.0f}-{:.0f}, rpm {:.0f}-{:.0f}", gr.first, gr.second, rpm.first, rpm.second);

  double speed_changes = 0.0;
  for (std::size_t i = 1; i < s.size(); ++i) speed_changes += std::fabs(s[i].speed_kmh - s[i-1].speed_kmh);
  if (speed_changes < 1000.0) {
    spdlog::warn("[load] low variation in data ({:.0f} km/h total speed change), stream may look static",
                 speed_changes);
  }
}

} // namespace f1ts
