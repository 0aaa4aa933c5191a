#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <f1ts/metrics.hpp>

using Catch::Approx;
using namespace f1ts;

TEST_CASE("LatencyWindow keeps only the most recent values") {
  LatencyWindow w(3);
  REQUIRE(w.empty());
  w.push(1.0);
  w.push(2.0);
  REQUIRE(w.values() == std::vector<double>{1.0, 2.0});
  w.push(3.0);
  w.push(4.0);
  REQUIRE(w.size() == 3);
  REQUIRE(w.values() == std::vector<double>{2.0, 3.0, 4.0});
  w.clear();
  REQUIRE(w.empty());
}

TEST_CASE("p99 picks element min(floor(n*0.99), n-1)") {
  std::vector<double> v;
  for (int i = 0; i < 1000; ++i) v.push_back(double(i));
  REQUIRE(percentile_99(v) == 990.0);

  REQUIRE(percentile_99({5.0}) == 5.0);
  REQUIRE(percentile_99({1.0, 2.0}) == 2.0);
  REQUIRE(percentile_99({}) == 0.0);
}

TEST_CASE("snapshot derives rates, latency and loss") {
  MetricsAggregator m(1000, 10.0);
  for (int i = 1; i <= 100; ++i) m.record_latency(double(i) * 10.0);  // 10..1000 us

  StreamCounters c{};
  c.sent = 500;
  c.dropped = 5;
  c.backpressure = 3;
  c.budget_violations = 2;
  c.bytes_sent = 500 * 250;

  const auto s = m.snapshot(c, 2.0);
  REQUIRE(s.packets_per_sec == Approx(250.0));
  REQUIRE(s.throughput_mbps == Approx(500.0 * 250.0 * 8.0 / 2.0 / 1e6));
  REQUIRE(s.mean_latency_ms == Approx(0.505));
  REQUIRE(s.p99_latency_ms == Approx(1.0));
  REQUIRE(s.loss_pct == Approx(1.0));
  REQUIRE(s.backpressure == 3);
  REQUIRE(s.budget_violations == 2);
}

TEST_CASE("snapshot with nothing sent avoids dividing by zero") {
  MetricsAggregator m;
  StreamCounters c{};
  c.dropped = 2;
  const auto s = m.snapshot(c, 0.0);
  REQUIRE(s.packets_per_sec == 0.0);
  REQUIRE(s.mean_latency_ms == 0.0);
  REQUIRE(s.loss_pct == Approx(200.0));
}

TEST_CASE("per-packet conditions land in their own counters") {
  StreamCounters c{};
  count(c, StreamError::TransportBackpressure);
  count(c, StreamError::LatencyBudgetExceeded);
  count(c, StreamError::OversizeDatagram);
  count(c, StreamError::SendFailed);
  count(c, StreamError::StreamLag);
  count(c, StreamError::LoadFailure);

  REQUIRE(c.dropped == 4);
  REQUIRE(c.backpressure == 1);
  REQUIRE(c.budget_violations == 1);
  REQUIRE(c.oversize == 1);
  REQUIRE(c.send_errors == 1);
  REQUIRE(c.lag_packets == 1);
  REQUIRE(c.sent == 0);
}
