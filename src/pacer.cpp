#include <f1ts/pacer.hpp>
#include <f1ts/wire.hpp>
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

namespace f1ts {

const char* to_string(PacerState s) {
  switch (s) {
    case PacerState::WarmingUp: return "warming-up";
    case PacerState::Streaming: return "streaming";
    case PacerState::Draining:  return "draining";
    case PacerState::Closed:    return "closed";
  }
  return "unknown";
}

Pacer::Pacer(PacerParams p) : p_(p) {
  if (p_.rate_hz < 1.0) p_.rate_hz = 1.0;
  if (p_.metrics_interval == 0) {
    p_.metrics_interval = static_cast<std::size_t>(std::max(1.0, p_.rate_hz));
  }
}

void Pacer::finish_lap_() {
  if (current_lap_ == 0) return;
  spdlog::info("lap {} complete: {} packets", current_lap_, lap_packets_);
}

void Pacer::on_lap_change_(const StreamItem& item, StreamSummary& summary) {
  const int lap = item.lap.lap_number;
  if (lap == current_lap_) return;
  finish_lap_();
  current_lap_ = lap;
  lap_packets_ = 0;
  ++summary.laps_started;
  spdlog::info("lap {} start (recorded lap time {:.3f} s)", lap, item.lap.lap_duration_s);
}

void Pacer::count_drop_(StreamError why, std::uint64_t packet_id, double measured, StreamCounters& c) const {
  count(c, why);
  switch (why) {
    case StreamError::OversizeDatagram:
      spdlog::error("{}: packet {} encodes to {:.0f} bytes, over the {} byte limit",
                    to_string(why), packet_id, measured, p_.max_datagram_bytes);
      break;
    case StreamError::LatencyBudgetExceeded:
      spdlog::warn("{}: packet {} took {:.3f} ms, over the {:.1f} ms budget",
                   to_string(why), packet_id, measured, p_.max_latency_ms);
      break;
    default:
      spdlog::warn("{}: packet {} dropped", to_string(why), packet_id);
      break;
  }
}

namespace {

// Closes the sink when the run leaves scope, whatever the exit path.
struct SinkCloser {
  DatagramSink& sink;
  PacerState& state;
  ~SinkCloser() {
    sink.close();
    state = PacerState::Closed;
  }
};

} // namespace

StreamSummary Pacer::run(PacketStream& stream, DatagramSink& sink, const std::atomic<bool>* cancel) {
  using clock = std::chrono::steady_clock;

  StreamSummary summary{};
  StreamCounters& c = summary.counters;
  MetricsAggregator metrics(p_.window_capacity, p_.max_latency_ms);

  state_ = PacerState::WarmingUp;
  current_lap_ = 0;
  lap_packets_ = 0;
  SinkCloser closer{sink, state_};

  const auto interval = std::chrono::duration_cast<clock::duration>(
    std::chrono::duration<double>(1.0 / p_.rate_hz));
  const auto budget = std::chrono::duration_cast<clock::duration>(
    std::chrono::duration<double, std::milli>(p_.max_latency_ms));

  clock::time_point start{};
  clock::time_point target{};
  bool lagging = false;
  std::vector<std::uint8_t> buf;
  buf.reserve(p_.max_datagram_bytes);

  auto elapsed_s = [&](clock::time_point now) {
    return state_ == PacerState::WarmingUp ? 0.0 : std::chrono::duration<double>(now - start).count();
  };

  spdlog::info("streaming {} packets at {:.0f} Hz (budget {:.1f} ms, {})",
               stream.total(), p_.rate_hz, p_.max_latency_ms, p_.realtime ? "realtime" : "bulk");

  while (true) {
    if (cancel && cancel->load(std::memory_order_relaxed)) {
      summary.interrupted = true;
      spdlog::warn("stream cancelled after {} packets", c.processed);
      break;
    }
    auto item = stream.next();
    if (!item) break;
    ++c.processed;

    // Cadence
    if (state_ == PacerState::Streaming) {
      target += interval;
      if (p_.realtime) {
        const auto now = clock::now();
        if (now < target) {
          std::this_thread::sleep_until(target);
          if (lagging) {
            lagging = false;
            spdlog::info("stream caught up with schedule at packet {}", item->packet.packet_id);
          }
        } else if (now - target > budget) {
          count(c, StreamError::StreamLag);
          if (!lagging) {
            lagging = true;
            spdlog::critical("{}: {:.3f} ms behind schedule at packet {}", to_string(StreamError::StreamLag),
                             std::chrono::duration<double, std::milli>(now - target).count(),
                             item->packet.packet_id);
          }
        }
      }
    }

    on_lap_change_(*item, summary);
    ++lap_packets_;

    // Serialize + send, timed together. An oversize packet is never handed to the sink.
    const auto t0 = clock::now();
    wire::encode(item->packet, buf);
    const bool oversize = buf.size() > p_.max_datagram_bytes;
    const SendStatus st = oversize ? SendStatus::Error : sink.send(buf);
    const auto t1 = clock::now();

    if (state_ == PacerState::WarmingUp) {
      start = t0;
      target = t0;
      state_ = PacerState::Streaming;
    }

    const double latency_us = std::chrono::duration<double, std::micro>(t1 - t0).count();
    if (oversize) {
      count_drop_(StreamError::OversizeDatagram, item->packet.packet_id, double(buf.size()), c);
    } else {
      metrics.record_latency(latency_us);
      if (st == SendStatus::Backpressure) {
        count_drop_(StreamError::TransportBackpressure, item->packet.packet_id, 0.0, c);
      } else if (st == SendStatus::Error) {
        count_drop_(StreamError::SendFailed, item->packet.packet_id, 0.0, c);
      } else {
        ++c.sent;
        c.bytes_sent += buf.size();
        if (latency_us / 1000.0 > p_.max_latency_ms) {
          count_drop_(StreamError::LatencyBudgetExceeded, item->packet.packet_id, latency_us / 1000.0, c);
        }
      }
    }

    if (c.processed % p_.metrics_interval == 0) {
      metrics.report(metrics.snapshot(c, elapsed_s(t1)));
      ++summary.snapshots;
    }

    if (p_.progress_every > 0 && c.processed % p_.progress_every == 0) {
      const double overall = stream.total() ? 100.0 * double(stream.position()) / double(stream.total()) : 0.0;
      const double el = elapsed_s(t1);
      spdlog::debug("packet {}: speed={:.0f} km/h throttle={:.0f}% brake={:.2f} gear={} | "
                    "lap {} {:.1f}% | overall {:.1f}% | {:.0f} pps",
                    item->packet.packet_id, item->speed_kmh, item->throttle_pct,
                    item->packet.brake, item->packet.gear, item->lap.lap_number,
                    item->lap.progress_pct, overall, el > 0.0 ? double(c.sent) / el : 0.0);
    }
  }

  const bool was_streaming = state_ == PacerState::Streaming;
  state_ = PacerState::Draining;
  if (!summary.interrupted) finish_lap_();

  const auto end = clock::now();
  summary.duration_s = was_streaming ? std::chrono::duration<double>(end - start).count() : 0.0;
  summary.metrics = metrics.snapshot(c, summary.duration_s);

  spdlog::info("stream {}: sent={} dropped={} (backpressure={} over_budget={} oversize={} send_errors={} "
               "lagging={}) in {:.2f} s",
               summary.interrupted ? "interrupted" : "complete", c.sent, c.dropped, c.backpressure,
               c.budget_violations, c.oversize, c.send_errors, c.lag_packets, summary.duration_s);
  metrics.report(summary.metrics);
  return summary;
}

} // namespace f1ts
