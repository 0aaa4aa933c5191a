#include <f1ts/coerce.hpp>
#include <f1ts/config.hpp>
#include <f1ts/errors.hpp>
#include <f1ts/log.hpp>
#include <f1ts/session.hpp>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

using namespace f1ts;

namespace {

std::atomic<bool> g_cancel{false};

void on_sigint(int) { g_cancel.store(true); }

void usage() {
  std::puts(
    "Usage: f1ts_streamer [--config file.yaml] [--samples samples.csv] [--laps laps.csv]\n"
    "                     [--host ip] [--port p] [--rate hz] [--max-latency-ms ms]\n"
    "                     [--max-laps n] [--car n] [--no-realtime] [--log-level level]");
}

bool parse_number(const std::string& flag, const char* text, double& out) {
  const auto v = coerce_double(text);
  if (!v.ok()) {
    spdlog::error("{} expects a number, got '{}' ({})", flag, text, to_string(*v.error));
    return false;
  }
  out = v.value;
  return true;
}

bool parse_int(const std::string& flag, const char* text, int& out) {
  const auto v = coerce_int(text);
  if (!v.ok()) {
    spdlog::error("{} expects an integer, got '{}' ({})", flag, text, to_string(*v.error));
    return false;
  }
  out = v.value;
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  init_logging("info");

  // Config file first so flags override it.
  StreamConfig cfg;
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      try {
        cfg = load_stream_config(argv[i + 1]);
      } catch (const std::runtime_error& ex) {
        spdlog::error("{}", ex.what());
        return EXIT_FAILURE;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    int iv = 0;
    if (arg == "--config" && has_value) {
      ++i;
    } else if (arg == "--samples" && has_value) {
      cfg.samples_csv = argv[++i];
    } else if (arg == "--laps" && has_value) {
      cfg.laps_csv = argv[++i];
    } else if (arg == "--host" && has_value) {
      cfg.host = argv[++i];
    } else if (arg == "--port" && has_value) {
      if (!parse_int(arg, argv[++i], cfg.port)) return EXIT_FAILURE;
    } else if (arg == "--rate" && has_value) {
      if (!parse_number(arg, argv[++i], cfg.rate_hz)) return EXIT_FAILURE;
    } else if (arg == "--max-latency-ms" && has_value) {
      if (!parse_number(arg, argv[++i], cfg.max_latency_ms)) return EXIT_FAILURE;
    } else if (arg == "--max-laps" && has_value) {
      if (!parse_int(arg, argv[++i], iv)) return EXIT_FAILURE;
      cfg.max_laps = iv > 0 ? static_cast<std::size_t>(iv) : 0;
    } else if (arg == "--car" && has_value) {
      if (!parse_int(arg, argv[++i], cfg.car_number)) return EXIT_FAILURE;
    } else if (arg == "--no-realtime") {
      cfg.realtime = false;
    } else if (arg == "--log-level" && has_value) {
      cfg.log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      usage();
      return EXIT_SUCCESS;
    } else {
      spdlog::warn("ignoring unrecognized argument '{}'", arg);
    }
  }

  init_logging(cfg.log_level);
  try {
    validate(cfg);
  } catch (const std::runtime_error& ex) {
    spdlog::error("invalid configuration: {}", ex.what());
    return EXIT_FAILURE;
  }

  std::signal(SIGINT, on_sigint);

  spdlog::info("F1 telemetry streamer: {} Hz to {}:{}, budget {:.1f} ms",
               cfg.rate_hz, cfg.host, cfg.port, cfg.max_latency_ms);

  ReplaySession session(cfg);
  const SessionResult r = session.run(&g_cancel);
  if (r.status != SessionStatus::Completed) {
    spdlog::warn("session ended: {}", to_string(r.status));
  }
  return exit_code(r.status);
}
