#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <thread>
#include <vector>

#include <f1ts/packet.hpp>
#include <f1ts/receiver.hpp>
#include <f1ts/transport.hpp>
#include <f1ts/wire.hpp>

using namespace f1ts;
using namespace std::chrono_literals;

static std::vector<std::uint8_t> datagram(std::uint64_t id) {
  TelemetryPacket p{};
  p.packet_id = id;
  p.timestamp_ms = 1000 + 2 * id;
  p.car_number = 44;
  p.speed_kmh = 250;
  return wire::encode(p);
}

TEST_CASE("sequence tracker counts gaps, late arrivals and duplicates") {
  ReceiverStats st{};
  SequenceTracker seq;
  for (std::uint64_t id : {0u, 1u, 4u}) seq.observe(id, st);
  REQUIRE(st.lost == 2);

  seq.observe(2, st);  // late
  REQUIRE(st.out_of_order == 1);
  REQUIRE(st.lost == 1);

  seq.observe(4, st);
  REQUIRE(st.duplicates == 1);
}

TEST_CASE("a repeated late id is a duplicate and leaves its gap open") {
  ReceiverStats st{};
  SequenceTracker seq;
  for (std::uint64_t id : {0u, 3u, 1u, 1u}) seq.observe(id, st);
  REQUIRE(st.lost == 1);  // 2 never arrived
  REQUIRE(st.out_of_order == 1);
  REQUIRE(st.duplicates == 1);
}

TEST_CASE("ids older than the tracking window do not settle gaps") {
  ReceiverStats st{};
  SequenceTracker seq;
  seq.observe(0, st);
  seq.observe(2, st);
  seq.observe(2 + SequenceTracker::kWindow, st);
  const auto lost = st.lost;

  seq.observe(1, st);
  REQUIRE(st.out_of_order == 1);
  REQUIRE(st.lost == lost);
  REQUIRE(st.duplicates == 0);
}

TEST_CASE("ids below the first one seen are not counted as recovered") {
  ReceiverStats st{};
  SequenceTracker seq;
  seq.observe(10, st);
  seq.observe(11, st);
  seq.observe(7, st);
  REQUIRE(st.lost == 0);
  REQUIRE(st.out_of_order == 1);
  REQUIRE(st.duplicates == 0);
}

namespace {

struct IdleSource : DatagramSource {
  bool* closed;
  explicit IdleSource(bool* c) : closed(c) {}
  bool receive(std::span<std::uint8_t>, std::size_t&, std::chrono::milliseconds) override { return false; }
  void close() override { *closed = true; }
  std::uint16_t port() const override { return 0; }
};

} // namespace

TEST_CASE("stop closes the source even if the receiver never started") {
  bool closed = false;
  TelemetryReceiver rx(std::make_unique<IdleSource>(&closed));
  rx.stop();
  REQUIRE(closed);
  REQUIRE_FALSE(rx.running());
}

TEST_CASE("receiver decodes datagrams and tracks stats") {
  TelemetryReceiver rx(nullptr);
  REQUIRE(rx.handle_datagram(datagram(0)));
  REQUIRE(rx.handle_datagram(datagram(1)));
  REQUIRE(rx.handle_datagram(datagram(3)));

  const std::vector<std::uint8_t> junk{0xc1, 0x00, 0x01};
  REQUIRE_FALSE(rx.handle_datagram(junk));

  const auto& st = rx.stats();
  REQUIRE(st.received == 3);
  REQUIRE(st.malformed == 1);
  REQUIRE(st.lost == 1);
  REQUIRE(st.loss_pct() == 25.0);
  REQUIRE(st.bytes > 0);
}

TEST_CASE("receiver thread publishes frames from the network") {
  auto source = make_udp_source(0, "127.0.0.1");
  REQUIRE(source);
  const std::uint16_t port = source->port();

  ReceiverParams rp{};
  rp.poll_interval = 10ms;
  TelemetryReceiver rx(std::move(source), rp);
  rx.start();
  REQUIRE(rx.running());

  auto sink = make_udp_sink("127.0.0.1", port);
  REQUIRE(sink);
  for (std::uint64_t id = 0; id < 5; ++id) REQUIRE(sink->send(datagram(id)) == SendStatus::Sent);

  std::uint64_t cursor = 0;
  DashboardFrame frame{};
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (rx.buffer().try_consume_latest(cursor, frame) && frame.packet.packet_id == 4) break;
    std::this_thread::sleep_for(5ms);
  }
  rx.stop();

  REQUIRE(frame.has_packet);
  REQUIRE(frame.packet.packet_id == 4);
  REQUIRE(frame.packet.speed_kmh == 250);
  REQUIRE(frame.stats.received == 5);
  REQUIRE_FALSE(rx.running());
}
