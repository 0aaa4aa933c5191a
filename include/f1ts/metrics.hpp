#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <f1ts/errors.hpp>

namespace f1ts {

// Per-run counters, owned by one Pacer::run.
struct StreamCounters {
  std::uint64_t processed = 0;          // packets pulled from the stream
  std::uint64_t sent = 0;               // handed to the transport (includes budget overruns)
  std::uint64_t dropped = 0;            // every per-packet condition below except lag
  std::uint64_t backpressure = 0;
  std::uint64_t budget_violations = 0;
  std::uint64_t oversize = 0;
  std::uint64_t send_errors = 0;
  std::uint64_t lag_packets = 0;        // packets emitted while behind schedule
  std::uint64_t bytes_sent = 0;
};

// Counts one occurrence of a per-packet condition. Session-level conditions
// (EmptyInput, LoadFailure, TransportUnavailable, MalformedDatagram) have no counter here.
void count(StreamCounters& c, StreamError e);

// Fixed-capacity ring of the most recent send latencies (microseconds).
class LatencyWindow {
public:
  explicit LatencyWindow(std::size_t capacity = 1000);

  void push(double latency_us);
  void clear();

  std::size_t size() const { return count_; }
  std::size_t capacity() const { return buf_.size(); }
  bool empty() const { return count_ == 0; }

  // Oldest first.
  std::vector<double> values() const;

private:
  std::vector<double> buf_;
  std::size_t head_ = 0;   // next write slot
  std::size_t count_ = 0;
};

struct MetricsSnapshot {
  std::uint64_t packets_sent = 0;
  std::uint64_t packets_dropped = 0;
  std::uint64_t backpressure = 0;
  std::uint64_t budget_violations = 0;
  std::uint64_t lag_packets = 0;
  double elapsed_s = 0.0;
  double packets_per_sec = 0.0;
  double throughput_mbps = 0.0;
  double mean_latency_ms = 0.0;
  double p99_latency_ms = 0.0;
  double loss_pct = 0.0;
};

// p99 over `sorted`: element min(floor(n*0.99), n-1); 0 when empty.
double percentile_99(const std::vector<double>& sorted);

class MetricsAggregator {
public:
  explicit MetricsAggregator(std::size_t window_capacity = 1000, double max_latency_ms = 10.0)
    : window_(window_capacity), max_latency_ms_(max_latency_ms) {}

  void record_latency(double latency_us) { window_.push(latency_us); }

  MetricsSnapshot snapshot(const StreamCounters& c, double elapsed_s) const;

  // Logs one line at info, plus warnings when p99 exceeds the budget or loss exceeds 0.1 %.
  void report(const MetricsSnapshot& s) const;

  const LatencyWindow& window() const { return window_; }
  double max_latency_ms() const { return max_latency_ms_; }

private:
  LatencyWindow window_;
  double max_latency_ms_;
};

inline constexpr double kLossWarnPct = 0.1;

} // namespace f1ts
