#include <f1ts/config.hpp>
#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace f1ts {

namespace {

template <class T>
T read_scalar(const YAML::Node& node, const char* key, T def) {
  if (!node || !node[key]) return def;
  return node[key].as<T>();
}

std::string read_string(const YAML::Node& node, const char* key, const std::string& def) {
  if (!node || !node[key]) return def;
  return node[key].as<std::string>();
}

StreamConfig from_root(const YAML::Node& root) {
  StreamConfig cfg;

  const YAML::Node stream = root["stream"];
  cfg.rate_hz            = read_scalar(stream, "rate_hz", cfg.rate_hz);
  cfg.max_latency_ms     = read_scalar(stream, "max_latency_ms", cfg.max_latency_ms);
  cfg.realtime           = read_scalar(stream, "realtime", cfg.realtime);
  cfg.metrics_interval   = read_scalar(stream, "metrics_interval", cfg.metrics_interval);
  cfg.latency_window     = std::max<std::size_t>(1, read_scalar(stream, "latency_window", cfg.latency_window));
  cfg.max_datagram_bytes = read_scalar(stream, "max_datagram_bytes", cfg.max_datagram_bytes);

  const YAML::Node transport = root["transport"];
  cfg.host = read_string(transport, "host", cfg.host);
  cfg.port = read_scalar(transport, "port", cfg.port);

  const YAML::Node target = root["target"];
  cfg.car_number = read_scalar(target, "car_number", cfg.car_number);
  cfg.year       = read_scalar(target, "year", cfg.year);
  cfg.event      = read_string(target, "event", cfg.event);
  cfg.session    = read_string(target, "session", cfg.session);

  const YAML::Node data = root["data"];
  cfg.samples_csv = read_string(data, "samples_csv", cfg.samples_csv);
  cfg.laps_csv    = read_string(data, "laps_csv", cfg.laps_csv);
  cfg.max_laps    = read_scalar(data, "max_laps", cfg.max_laps);

  const YAML::Node sensors = root["sensors"];
  cfg.sensor_noise_c = std::max(0.0, read_scalar(sensors, "temp_noise_sigma_c", cfg.sensor_noise_c));
  cfg.seed           = read_scalar(sensors, "seed", cfg.seed);

  const YAML::Node logging = root["logging"];
  cfg.log_level = read_string(logging, "level", cfg.log_level);

  validate(cfg);
  return cfg;
}

} // namespace

void validate(StreamConfig& cfg) {
  cfg.rate_hz = std::max(1.0, cfg.rate_hz);
  if (!(cfg.max_latency_ms > 0.0)) {
    throw std::runtime_error("max_latency_ms must be positive");
  }
  if (cfg.port < 1 || cfg.port > 65535) {
    throw std::runtime_error("port " + std::to_string(cfg.port) + " outside 1..65535");
  }
}

StreamConfig load_stream_config(const std::string& path) {
  try {
    return from_root(YAML::LoadFile(path));
  } catch (const std::exception& ex) {
    throw std::runtime_error(std::string("Failed to load stream config from ") + path + ": " + ex.what());
  }
}

StreamConfig parse_stream_config(const std::string& yaml_text, const std::string& origin) {
  try {
    return from_root(YAML::Load(yaml_text));
  } catch (const std::exception& ex) {
    throw std::runtime_error(std::string("Failed to load stream config from ") + origin + ": " + ex.what());
  }
}

} // namespace f1ts
