#pragma once
#include <atomic>
#include <bitset>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <thread>
#include <f1ts/latest_buffer.hpp>
#include <f1ts/packet.hpp>
#include <f1ts/transport.hpp>

namespace f1ts {

struct ReceiverStats {
  std::uint64_t received = 0;      // decoded packets
  std::uint64_t bytes = 0;
  std::uint64_t malformed = 0;
  std::uint64_t lost = 0;          // ids skipped over and not seen since
  std::uint64_t out_of_order = 0;  // arrived after a higher id
  std::uint64_t duplicates = 0;

  double loss_pct() const {
    const auto expected = received + lost;
    return expected ? 100.0 * double(lost) / double(expected) : 0.0;
  }
};

// Infers loss and reordering from packet ids (which start at 0 and step by 1).
// Arrivals are remembered for the last kWindow ids; an id older than that is counted
// out of order but no longer settles a gap.
class SequenceTracker {
public:
  static constexpr std::size_t kWindow = 1024;

  void observe(std::uint64_t id, ReceiverStats& stats);
  void reset() { started_ = false; first_ = 0; highest_ = 0; seen_.reset(); }

private:
  bool started_ = false;
  std::uint64_t first_ = 0;
  std::uint64_t highest_ = 0;
  std::bitset<kWindow> seen_;  // bit k: id highest_ - k arrived
};

struct DashboardFrame {
  bool has_packet = false;
  TelemetryPacket packet;
  ReceiverStats stats;
  double packets_per_sec = 0.0;
  bool idle = false;  // nothing received within the inactivity timeout
};

struct ReceiverParams {
  std::chrono::milliseconds inactivity_timeout{5000};
  std::chrono::milliseconds poll_interval{100};
};

// Decodes datagrams on its own thread and publishes the latest DashboardFrame.
class TelemetryReceiver {
public:
  explicit TelemetryReceiver(std::unique_ptr<DatagramSource> source, ReceiverParams p = {});
  ~TelemetryReceiver() { stop(); }
  TelemetryReceiver(const TelemetryReceiver&) = delete;
  TelemetryReceiver& operator=(const TelemetryReceiver&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One datagram, as the receive thread handles it. Returns false when it does not decode.
  // Not for use while the thread is running.
  bool handle_datagram(std::span<const std::uint8_t> bytes);

  LatestBuffer<DashboardFrame>& buffer() { return buffer_; }
  const ReceiverStats& stats() const { return frame_.stats; }
  std::uint16_t port() const { return source_ ? source_->port() : 0; }

private:
  void thread_main_();
  void publish_(std::chrono::steady_clock::time_point now);

  std::unique_ptr<DatagramSource> source_;
  ReceiverParams p_;
  std::thread th_;
  std::atomic<bool> running_{false};

  LatestBuffer<DashboardFrame> buffer_;
  DashboardFrame frame_{};
  SequenceTracker seq_;

  // packets-per-second over one-second buckets
  std::chrono::steady_clock::time_point rate_start_{};
  std::uint64_t rate_count_ = 0;
};

} // namespace f1ts
