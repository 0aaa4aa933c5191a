#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <f1ts/config.hpp>
#include <f1ts/errors.hpp>
#include <f1ts/pacer.hpp>
#include <f1ts/sample_store.hpp>
#include <f1ts/transport.hpp>

namespace f1ts {

struct SessionResult {
  SessionStatus status = SessionStatus::Completed;
  StreamSummary summary;
  std::size_t raw_samples = 0;
  std::size_t uniform_samples = 0;
  std::size_t laps = 0;
};

// One replay: load -> open transport -> resample -> stream -> close.
// Owns the transport for the whole run; it is released exactly once on every path after it
// was acquired.
class ReplaySession {
public:
  using SinkFactory = std::function<std::unique_ptr<DatagramSink>(const std::string& host,
                                                                  std::uint16_t port)>;

  explicit ReplaySession(StreamConfig cfg);

  // Replaces the UDP sink (tests inject in-memory sinks).
  void set_sink_factory(SinkFactory f) { sink_factory_ = std::move(f); }

  // Loads the recording named by the config.
  SessionResult run(const std::atomic<bool>* cancel = nullptr);
  // Streams an already loaded recording.
  SessionResult run(const SampleStore& store, const std::atomic<bool>* cancel = nullptr);

  const StreamConfig& config() const { return cfg_; }

private:
  StreamConfig cfg_;
  SinkFactory sink_factory_;
};

} // namespace f1ts
