#include <f1ts/session.hpp>
#include <f1ts/lap_locator.hpp>
#include <f1ts/packet_stream.hpp>
#include <f1ts/resample.hpp>
#include <chrono>
#include <spdlog/spdlog.h>

namespace f1ts {

ReplaySession::ReplaySession(StreamConfig cfg)
  : cfg_(std::move(cfg)), sink_factory_(&make_udp_sink) {}

SessionResult ReplaySession::run(const std::atomic<bool>* cancel) {
  spdlog::info("loading {} {} {} car #{} from '{}'",
               cfg_.year, cfg_.event, cfg_.session, cfg_.car_number, cfg_.samples_csv);
  if (cfg_.samples_csv.empty()) {
    spdlog::error("{}: no samples CSV configured", to_string(StreamError::LoadFailure));
    return SessionResult{session_status(StreamError::LoadFailure)};
  }
  const auto store = load_sample_store_csv(cfg_.samples_csv, cfg_.laps_csv, cfg_.max_laps);
  if (!store) {
    spdlog::error("{}: cannot load telemetry for car #{}", to_string(StreamError::LoadFailure), cfg_.car_number);
    return SessionResult{session_status(StreamError::LoadFailure)};
  }
  return run(*store, cancel);
}

SessionResult ReplaySession::run(const SampleStore& store, const std::atomic<bool>* cancel) {
  SessionResult result{};
  result.raw_samples = store.size();
  result.laps = store.lap_count();

  if (store.empty()) {
    spdlog::error("{}: no samples available for car #{}", to_string(StreamError::LoadFailure), cfg_.car_number);
    result.status = session_status(StreamError::LoadFailure);
    return result;
  }
  log_store_diagnostics(store);

  std::unique_ptr<DatagramSink> sink = sink_factory_(cfg_.host, static_cast<std::uint16_t>(cfg_.port));
  if (!sink) {
    spdlog::error("{}: {}:{}", to_string(StreamError::TransportUnavailable), cfg_.host, cfg_.port);
    result.status = session_status(StreamError::TransportUnavailable);
    return result;
  }

  const UniformSeries series = Resampler(cfg_.rate_hz).run(store.samples());
  result.uniform_samples = series.size();
  if (series.empty()) {
    spdlog::error("{}: resampling produced no samples", to_string(StreamError::EmptyInput));
    sink->close();
    result.status = session_status(StreamError::EmptyInput);
    return result;
  }

  const LapLocator locator(store.laps(), series.size());

  SensorModelParams sp{};
  sp.temp_noise_sigma_c = cfg_.sensor_noise_c;
  sp.seed = cfg_.seed;

  PacketBuilderParams bp{};
  bp.car_number = cfg_.car_number;
  bp.interval_ms = 1000.0 / cfg_.rate_hz;
  bp.base_timestamp_ms = static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());

  PacerParams pp{};
  pp.rate_hz = cfg_.rate_hz;
  pp.max_latency_ms = cfg_.max_latency_ms;
  pp.realtime = cfg_.realtime;
  pp.metrics_interval = cfg_.metrics_interval;
  pp.window_capacity = cfg_.latency_window;
  pp.max_datagram_bytes = cfg_.max_datagram_bytes;

  PacketStream stream(series, locator, sp, bp);
  Pacer pacer(pp);
  result.summary = pacer.run(stream, *sink, cancel);
  result.status = result.summary.interrupted ? SessionStatus::Interrupted : SessionStatus::Completed;
  return result;
}

} // namespace f1ts
