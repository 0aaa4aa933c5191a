#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <string>

#include <f1ts/config.hpp>

using Catch::Approx;
using namespace f1ts;

TEST_CASE("defaults apply when the document is empty") {
  const auto cfg = parse_stream_config("{}");
  REQUIRE(cfg.rate_hz == Approx(500.0));
  REQUIRE(cfg.max_latency_ms == Approx(10.0));
  REQUIRE(cfg.host == "127.0.0.1");
  REQUIRE(cfg.port == 20777);
  REQUIRE(cfg.car_number == 44);
  REQUIRE(cfg.event == "Silverstone");
  REQUIRE(cfg.session == "R");
  REQUIRE(cfg.realtime);
  REQUIRE(cfg.latency_window == 1000);
  REQUIRE(cfg.max_datagram_bytes == 512);
  REQUIRE(cfg.log_level == "info");
}

TEST_CASE("sections override the defaults") {
  const auto cfg = parse_stream_config(R"(
stream:
  rate_hz: 250
  max_latency_ms: 5.5
  realtime: false
  metrics_interval: 100
transport:
  host: 10.0.0.7
  port: 9999
target:
  car_number: 1
  year: 2023
  event: Monza
  session: Q
data:
  samples_csv: data/ver_monza.csv
  laps_csv: data/ver_monza_laps.csv
  max_laps: 3
sensors:
  temp_noise_sigma_c: 1.5
  seed: 7
logging:
  level: debug
)");
  REQUIRE(cfg.rate_hz == Approx(250.0));
  REQUIRE(cfg.max_latency_ms == Approx(5.5));
  REQUIRE_FALSE(cfg.realtime);
  REQUIRE(cfg.metrics_interval == 100);
  REQUIRE(cfg.host == "10.0.0.7");
  REQUIRE(cfg.port == 9999);
  REQUIRE(cfg.car_number == 1);
  REQUIRE(cfg.year == 2023);
  REQUIRE(cfg.event == "Monza");
  REQUIRE(cfg.session == "Q");
  REQUIRE(cfg.samples_csv == "data/ver_monza.csv");
  REQUIRE(cfg.laps_csv == "data/ver_monza_laps.csv");
  REQUIRE(cfg.max_laps == 3);
  REQUIRE(cfg.sensor_noise_c == Approx(1.5));
  REQUIRE(cfg.seed == 7);
  REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("rate is clamped, invalid budget and port are rejected") {
  REQUIRE(parse_stream_config("stream: {rate_hz: 0.2}").rate_hz == Approx(1.0));
  REQUIRE_THROWS_AS(parse_stream_config("stream: {max_latency_ms: 0}"), std::runtime_error);
  REQUIRE_THROWS_AS(parse_stream_config("transport: {port: 70000}"), std::runtime_error);
  REQUIRE_THROWS_AS(parse_stream_config("transport: {port: 0}"), std::runtime_error);
}

TEST_CASE("malformed or missing files raise runtime_error naming the source") {
  REQUIRE_THROWS_AS(parse_stream_config("stream: {rate_hz: fast}"), std::runtime_error);
  REQUIRE_THROWS_AS(parse_stream_config("stream: [unclosed"), std::runtime_error);
  try {
    load_stream_config("/nonexistent/f1ts.yaml");
    FAIL("expected an exception");
  } catch (const std::runtime_error& ex) {
    REQUIRE(std::string(ex.what()).find("/nonexistent/f1ts.yaml") != std::string::npos);
  }
}
