#include <f1ts/metrics.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>

namespace f1ts {

void count(StreamCounters& c, StreamError e) {
  switch (e) {
    case StreamError::TransportBackpressure: ++c.dropped; ++c.backpressure; break;
    case StreamError::LatencyBudgetExceeded: ++c.dropped; ++c.budget_violations; break;
    case StreamError::OversizeDatagram:      ++c.dropped; ++c.oversize; break;
    case StreamError::SendFailed:            ++c.dropped; ++c.send_errors; break;
    case StreamError::StreamLag:             ++c.lag_packets; break;
    default: break;
  }
}

LatencyWindow::LatencyWindow(std::size_t capacity)
  : buf_(std::max<std::size_t>(capacity, 1), 0.0) {}

void LatencyWindow::push(double latency_us) {
  buf_[head_] = latency_us;
  head_ = (head_ + 1) % buf_.size();
  if (count_ < buf_.size()) ++count_;
}

void LatencyWindow::clear() {
  head_ = 0;
  count_ = 0;
}

std::vector<double> LatencyWindow::values() const {
  std::vector<double> out;
  out.reserve(count_);
  const std::size_t cap = buf_.size();
  const std::size_t oldest = (head_ + cap - count_) % cap;
  for (std::size_t k = 0; k < count_; ++k) out.push_back(buf_[(oldest + k) % cap]);
  return out;
}

double percentile_99(const std::vector<double>& sorted) {
  if (sorted.empty()) return 0.0;
  const std::size_t n = sorted.size();
  const auto idx = static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.99));
  return sorted[std::min(idx, n - 1)];
}

MetricsSnapshot MetricsAggregator::snapshot(const StreamCounters& c, double elapsed_s) const {
  MetricsSnapshot s{};
  s.packets_sent = c.sent;
  s.packets_dropped = c.dropped;
  s.backpressure = c.backpressure;
  s.budget_violations = c.budget_violations;
  s.lag_packets = c.lag_packets;
  s.elapsed_s = elapsed_s;

  if (elapsed_s > 0.0) {
    s.packets_per_sec = static_cast<double>(c.sent) / elapsed_s;
    s.throughput_mbps = static_cast<double>(c.bytes_sent) * 8.0 / elapsed_s / 1e6;
  }

  auto lat = window_.values();
  if (!lat.empty()) {
    std::sort(lat.begin(), lat.end());
    const double sum = std::accumulate(lat.begin(), lat.end(), 0.0);
    s.mean_latency_ms = sum / static_cast<double>(lat.size()) / 1000.0;
    s.p99_latency_ms = percentile_99(lat) / 1000.0;
  }

  s.loss_pct = static_cast<double>(c.dropped) / static_cast<double>(std::max<std::uint64_t>(c.sent, 1)) * 100.0;
  return s;
}

void MetricsAggregator::report(const MetricsSnapshot& s) const {
  spdlog::info("metrics: sent={} dropped={} rate={:.1f} pps throughput={:.3f} Mbps "
               "latency mean={:.3f} ms p99={:.3f} ms loss={:.2f}%",
               s.packets_sent, s.packets_dropped, s.packets_per_sec, s.throughput_mbps,
               s.mean_latency_ms, s.p99_latency_ms, s.loss_pct);
  if (s.p99_latency_ms > max_latency_ms_) {
    spdlog::warn("p99 latency {:.3f} ms exceeds budget {:.3f} ms", s.p99_latency_ms, max_latency_ms_);
  }
  if (s.loss_pct > kLossWarnPct) {
    spdlog::warn("packet loss {:.2f}% (backpressure={} over_budget={})",
                 s.loss_pct, s.backpressure, s.budget_violations);
  }
}

} // namespace f1ts
