#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <f1ts/lap_locator.hpp>
#include <f1ts/pacer.hpp>
#include <f1ts/packet_stream.hpp>
#include <f1ts/wire.hpp>

using Catch::Approx;
using namespace f1ts;

namespace {

// In-memory sink; `on_send` may override the status for a given packet id.
struct FakeSink : DatagramSink {
  std::vector<std::uint64_t> sent_ids;
  std::vector<SendStatus> statuses;
  int close_calls = 0;
  bool open = true;
  std::function<SendStatus(std::uint64_t)> on_send;

  SendStatus send(std::span<const std::uint8_t> datagram) override {
    const auto pkt = wire::decode(datagram);
    REQUIRE(pkt.has_value());
    SendStatus st = on_send ? on_send(pkt->packet_id) : SendStatus::Sent;
    sent_ids.push_back(pkt->packet_id);
    statuses.push_back(st);
    return st;
  }
  void close() override {
    ++close_calls;
    open = false;
  }
  bool is_open() const override { return open; }
};

UniformSeries series_of(std::size_t n, double rate) {
  UniformSeries s;
  s.rate_hz = rate;
  for (std::size_t i = 0; i < n; ++i) {
    UniformSample u{};
    u.time_s = double(i) / rate;
    u.speed_kmh = 200.0;
    u.throttle_pct = 80.0;
    u.gear = 7;
    u.engine_rpm = 11000.0;
    s.samples.push_back(u);
  }
  return s;
}

PacerParams bulk() {
  PacerParams p{};
  p.realtime = false;
  p.progress_every = 0;
  return p;
}

} // namespace

TEST_CASE("backpressure drops one packet and the stream continues") {
  const auto series = series_of(100, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  FakeSink sink;
  sink.on_send = [](std::uint64_t id){ return id == 42 ? SendStatus::Backpressure : SendStatus::Sent; };

  Pacer pacer(bulk());
  const auto s = pacer.run(stream, sink);

  REQUIRE(s.counters.processed == 100);
  REQUIRE(s.counters.dropped == 1);
  REQUIRE(s.counters.backpressure == 1);
  REQUIRE(s.counters.sent == 99);
  REQUIRE(sink.sent_ids.size() == 100);
  REQUIRE(sink.sent_ids[43] == 43);
  REQUIRE(sink.statuses[43] == SendStatus::Sent);
  REQUIRE(sink.close_calls == 1);
  REQUIRE(pacer.state() == PacerState::Closed);
}

TEST_CASE("1000 packets at 500 Hz stream at about 500 pps with no loss") {
  const auto series = series_of(1000, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);
  FakeSink sink;

  PacerParams p{};
  p.rate_hz = 500.0;
  p.max_latency_ms = 10.0;
  p.progress_every = 0;
  Pacer pacer(p);
  const auto s = pacer.run(stream, sink);

  REQUIRE(s.counters.sent == 1000);
  REQUIRE(s.metrics.loss_pct == 0.0);
  REQUIRE(s.metrics.packets_per_sec > 450.0);
  REQUIRE(s.metrics.packets_per_sec < 550.0);
  REQUIRE(s.duration_s == Approx(2.0).margin(0.2));
  REQUIRE(s.snapshots == 2);
  // ids strictly consecutive on the wire
  for (std::size_t i = 0; i < sink.sent_ids.size(); ++i) REQUIRE(sink.sent_ids[i] == i);
}

TEST_CASE("a send slower than the budget counts as a violation but is still sent") {
  const auto series = series_of(10, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  FakeSink sink;
  sink.on_send = [](std::uint64_t id){
    if (id == 5) std::this_thread::sleep_for(std::chrono::milliseconds(15));
    return SendStatus::Sent;
  };

  auto p = bulk();
  p.max_latency_ms = 10.0;
  Pacer pacer(p);
  const auto s = pacer.run(stream, sink);

  REQUIRE(s.counters.sent == 10);
  REQUIRE(s.counters.budget_violations == 1);
  REQUIRE(s.counters.dropped == 1);
  REQUIRE(s.metrics.p99_latency_ms >= 10.0);
}

TEST_CASE("cancellation is observed between packets and still closes the sink") {
  const auto series = series_of(100, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  std::atomic<bool> cancel{false};
  FakeSink sink;
  sink.on_send = [&](std::uint64_t id){
    if (id == 9) cancel.store(true);
    return SendStatus::Sent;
  };

  Pacer pacer(bulk());
  const auto s = pacer.run(stream, sink, &cancel);

  REQUIRE(s.interrupted);
  REQUIRE(s.counters.processed == 10);
  REQUIRE(sink.sent_ids.size() == 10);
  REQUIRE(sink.close_calls == 1);
  REQUIRE(pacer.state() == PacerState::Closed);
}

TEST_CASE("an exception from the sink still closes it") {
  const auto series = series_of(20, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  FakeSink sink;
  sink.on_send = [](std::uint64_t id) -> SendStatus {
    if (id == 3) throw std::runtime_error("link down");
    return SendStatus::Sent;
  };

  Pacer pacer(bulk());
  REQUIRE_THROWS_AS(pacer.run(stream, sink), std::runtime_error);
  REQUIRE(sink.close_calls == 1);
  REQUIRE(pacer.state() == PacerState::Closed);
}

TEST_CASE("an empty stream finishes immediately") {
  UniformSeries empty;
  LapLocator loc({}, 0);
  PacketStream stream(empty, loc);
  FakeSink sink;

  Pacer pacer(bulk());
  const auto s = pacer.run(stream, sink);
  REQUIRE(s.counters.processed == 0);
  REQUIRE(s.duration_s == 0.0);
  REQUIRE(s.metrics.loss_pct == 0.0);
  REQUIRE(sink.close_calls == 1);
}

TEST_CASE("snapshots follow the metrics interval and laps are tracked") {
  const auto series = series_of(50, 500.0);
  const std::vector<LapBoundary> laps{{0, 24, 1, 90.0}, {25, 49, 2, 91.0}};
  LapLocator loc(laps, series.size());
  PacketStream stream(series, loc);
  FakeSink sink;

  auto p = bulk();
  p.metrics_interval = 10;
  Pacer pacer(p);
  const auto s = pacer.run(stream, sink);
  REQUIRE(s.snapshots == 5);
  REQUIRE(s.laps_started == 2);
}

TEST_CASE("oversize packets are dropped but still anchor the schedule and report") {
  const auto series = series_of(20, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);
  FakeSink sink;

  auto p = bulk();
  p.max_datagram_bytes = 16;
  p.metrics_interval = 1;
  Pacer pacer(p);
  const auto s = pacer.run(stream, sink);

  REQUIRE(s.counters.processed == 20);
  REQUIRE(s.counters.dropped == 20);
  REQUIRE(s.counters.oversize == 20);
  REQUIRE(s.counters.sent == 0);
  REQUIRE(s.snapshots == 20);
  REQUIRE(s.duration_s > 0.0);
  REQUIRE(sink.sent_ids.empty());
  REQUIRE(sink.close_calls == 1);
}

TEST_CASE("a stalled send puts the stream behind schedule without skipping packets") {
  const auto series = series_of(30, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  FakeSink sink;
  sink.on_send = [](std::uint64_t id){
    if (id == 5) std::this_thread::sleep_for(std::chrono::milliseconds(40));
    return SendStatus::Sent;
  };

  PacerParams p{};
  p.rate_hz = 500.0;
  p.max_latency_ms = 10.0;
  p.progress_every = 0;
  Pacer pacer(p);
  const auto s = pacer.run(stream, sink);

  REQUIRE(s.counters.lag_packets > 0);
  REQUIRE(s.counters.lag_packets < 24);  // back on schedule before the end
  REQUIRE(s.counters.budget_violations == 1);
  REQUIRE(s.counters.sent == 30);
  REQUIRE(sink.sent_ids.size() == 30);
  for (std::size_t i = 0; i < sink.sent_ids.size(); ++i) REQUIRE(sink.sent_ids[i] == i);
  // 29 intervals of 2 ms after the anchor
  REQUIRE(s.duration_s >= 0.055);
}

TEST_CASE("send errors other than backpressure are counted separately") {
  const auto series = series_of(10, 500.0);
  LapLocator loc({}, series.size());
  PacketStream stream(series, loc);

  FakeSink sink;
  sink.on_send = [](std::uint64_t id){ return id == 2 ? SendStatus::Error : SendStatus::Sent; };

  Pacer pacer(bulk());
  const auto s = pacer.run(stream, sink);
  REQUIRE(s.counters.send_errors == 1);
  REQUIRE(s.counters.backpressure == 0);
  REQUIRE(s.counters.dropped == 1);
  REQUIRE(s.counters.sent == 9);
}
