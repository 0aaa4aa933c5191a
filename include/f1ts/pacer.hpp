#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <f1ts/errors.hpp>
#include <f1ts/metrics.hpp>
#include <f1ts/packet_stream.hpp>
#include <f1ts/transport.hpp>

namespace f1ts {

enum class PacerState {
  WarmingUp,  // first packet: sent unpaced, anchors the schedule and the metrics clock
  Streaming,
  Draining,   // sequence exhausted or cancelled; final summary pending
  Closed,     // transport closed
};

const char* to_string(PacerState s);

struct PacerParams {
  double rate_hz = 500.0;
  double max_latency_ms = 10.0;       // per-packet serialize+send budget, also the lag tolerance
  bool realtime = true;               // false: no cadence sleeping
  std::size_t metrics_interval = 0;   // packets between snapshots; 0 = one nominal second
  std::size_t window_capacity = 1000;
  std::size_t max_datagram_bytes = 512;
  std::size_t progress_every = 1000;  // debug progress line cadence, 0 = off
};

struct StreamSummary {
  StreamCounters counters;
  MetricsSnapshot metrics;         // final snapshot
  std::size_t snapshots = 0;       // periodic snapshots emitted
  std::size_t laps_started = 0;
  double duration_s = 0.0;         // wall time from the first send
  bool interrupted = false;
};

// Drives a PacketStream onto a DatagramSink at a fixed cadence. One run per Pacer.
class Pacer {
public:
  explicit Pacer(PacerParams p = {});

  // Streams until the sequence is exhausted or *cancel becomes true (checked between packets).
  // The sink is closed on every exit path.
  StreamSummary run(PacketStream& stream, DatagramSink& sink,
                    const std::atomic<bool>* cancel = nullptr);

  PacerState state() const { return state_; }
  const PacerParams& params() const { return p_; }

private:
  void on_lap_change_(const StreamItem& item, StreamSummary& summary);
  void finish_lap_();
  // Counts a dropped packet under its cause and logs it; `measured` is bytes or ms.
  void count_drop_(StreamError why, std::uint64_t packet_id, double measured, StreamCounters& c) const;

  PacerParams p_;
  PacerState state_ = PacerState::WarmingUp;

  int current_lap_ = 0;
  std::uint64_t lap_packets_ = 0;
};

} // namespace f1ts
