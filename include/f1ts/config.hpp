#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace f1ts {

struct StreamConfig {
  // stream
  double rate_hz = 500.0;
  double max_latency_ms = 10.0;
  bool realtime = true;
  std::size_t metrics_interval = 0;   // 0 = rate_hz packets
  std::size_t latency_window = 1000;
  std::size_t max_datagram_bytes = 512;

  // transport
  std::string host = "127.0.0.1";
  int port = 20777;

  // target
  int car_number = 44;
  int year = 2024;
  std::string event = "Silverstone";
  std::string session = "R";

  // data
  std::string samples_csv;
  std::string laps_csv;
  std::size_t max_laps = 0;           // 0 = all

  // sensors
  double sensor_noise_c = 0.0;
  std::uint32_t seed = 1;

  // logging
  std::string log_level = "info";
};

// Reads YAML sections stream/transport/target/data/sensors/logging on top of the defaults.
// Throws std::runtime_error naming the path when the file is unreadable, malformed or invalid.
StreamConfig load_stream_config(const std::string& path);

// Same, from YAML text; `origin` names the source in error messages.
StreamConfig parse_stream_config(const std::string& yaml_text, const std::string& origin = "<string>");

// Clamps rate to >= 1 Hz; throws std::runtime_error for a non-positive latency budget or a
// port outside 1..65535.
void validate(StreamConfig& cfg);

} // namespace f1ts
