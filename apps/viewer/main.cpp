#include <f1ts/coerce.hpp>
#include <f1ts/log.hpp>
#include <f1ts/receiver.hpp>
#include <f1ts/transport.hpp>
#include <f1ts/viewer/app.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>

using namespace f1ts;

int main(int argc, char* argv[]) {
  init_logging("info");

  int port = 20777;
  double timeout_s = 5.0;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--port" && i + 1 < argc) {
      const auto v = coerce_int(argv[++i]);
      if (!v.ok() || v.value < 1 || v.value > 65535) {
        spdlog::error("--port expects 1..65535, got '{}'", argv[i]);
        return EXIT_FAILURE;
      }
      port = v.value;
    } else if (arg == "--timeout" && i + 1 < argc) {
      const auto v = coerce_double(argv[++i]);
      if (!v.ok() || v.value <= 0.0) {
        spdlog::error("--timeout expects positive seconds, got '{}'", argv[i]);
        return EXIT_FAILURE;
      }
      timeout_s = v.value;
    } else if (arg == "--help" || arg == "-h") {
      std::puts("Usage: f1ts_viewer [--port p] [--timeout seconds]");
      return EXIT_SUCCESS;
    } else {
      spdlog::warn("ignoring unrecognized argument '{}'", arg);
    }
  }

  auto source = make_udp_source(static_cast<std::uint16_t>(port));
  if (!source) return EXIT_FAILURE;

  ReceiverParams rp{};
  rp.inactivity_timeout = std::chrono::milliseconds(static_cast<long long>(timeout_s * 1000.0));

  TelemetryReceiver rx(std::move(source), rp);
  rx.start();

  ViewerApp app(rx);
  const int code = app.run();

  rx.stop();
  return code;
}
