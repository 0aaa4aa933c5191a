#include <f1ts/receiver.hpp>
#include <f1ts/errors.hpp>
#include <f1ts/wire.hpp>
#include <array>
#include <spdlog/spdlog.h>

namespace f1ts {

void SequenceTracker::observe(std::uint64_t id, ReceiverStats& stats) {
  if (!started_) {
    started_ = true;
    first_ = highest_ = id;
    seen_.reset();
    seen_.set(0);
    return;
  }
  if (id > highest_) {
    const std::uint64_t step = id - highest_;
    stats.lost += step - 1;
    if (step >= kWindow) seen_.reset();
    else seen_ <<= static_cast<std::size_t>(step);
    seen_.set(0);
    highest_ = id;
    return;
  }

  const std::uint64_t age = highest_ - id;
  if (age >= kWindow || id < first_) {
    // too old to tell apart, or before the first id this tracker saw
    ++stats.out_of_order;
    return;
  }
  const auto bit = static_cast<std::size_t>(age);
  if (seen_.test(bit)) {
    ++stats.duplicates;
    return;
  }
  // fills a gap counted as lost when a higher id arrived
  seen_.set(bit);
  ++stats.out_of_order;
  if (stats.lost > 0) --stats.lost;
}

TelemetryReceiver::TelemetryReceiver(std::unique_ptr<DatagramSource> source, ReceiverParams p)
  : source_(std::move(source)), p_(p) {}

void TelemetryReceiver::start() {
  if (running_.load() || !source_) return;
  running_.store(true);
  th_ = std::thread(&TelemetryReceiver::thread_main_, this);
}

void TelemetryReceiver::stop() {
  running_.store(false);
  if (th_.joinable()) th_.join();
  if (source_) source_->close();
}

bool TelemetryReceiver::handle_datagram(std::span<const std::uint8_t> bytes) {
  frame_.stats.bytes += bytes.size();
  const auto pkt = wire::decode(bytes);
  if (!pkt) {
    ++frame_.stats.malformed;
    return false;
  }
  ++frame_.stats.received;
  seq_.observe(pkt->packet_id, frame_.stats);
  frame_.packet = *pkt;
  frame_.has_packet = true;
  frame_.idle = false;
  ++rate_count_;
  return true;
}

void TelemetryReceiver::publish_(std::chrono::steady_clock::time_point now) {
  const double window = std::chrono::duration<double>(now - rate_start_).count();
  if (window >= 1.0) {
    frame_.packets_per_sec = double(rate_count_) / window;
    rate_count_ = 0;
    rate_start_ = now;
  }
  buffer_.publish(frame_);
}

void TelemetryReceiver::thread_main_() {
  using clock = std::chrono::steady_clock;
  std::array<std::uint8_t, 2048> buf{};
  auto last_rx = clock::now();
  rate_start_ = last_rx;

  spdlog::info("listening for telemetry on UDP port {}", source_->port());

  while (running_.load(std::memory_order_relaxed)) {
    std::size_t n = 0;
    const bool got = source_->receive(buf, n, p_.poll_interval);
    const auto now = clock::now();

    if (got) {
      if (frame_.idle) spdlog::info("telemetry resumed");
      if (!handle_datagram(std::span<const std::uint8_t>(buf.data(), n))) {
        spdlog::warn("{}: {} bytes, total {}", to_string(StreamError::MalformedDatagram), n,
                     frame_.stats.malformed);
      }
      last_rx = now;
      publish_(now);
      continue;
    }

    if (!frame_.idle && now - last_rx > p_.inactivity_timeout) {
      frame_.idle = true;
      frame_.packets_per_sec = 0.0;
      spdlog::warn("no telemetry for {} ms", p_.inactivity_timeout.count());
      buffer_.publish(frame_);
    }
  }
}

} // namespace f1ts
