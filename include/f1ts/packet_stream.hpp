#pragma once
#include <cstddef>
#include <optional>
#include <f1ts/lap_locator.hpp>
#include <f1ts/packet.hpp>
#include <f1ts/resample.hpp>
#include <f1ts/sensors.hpp>

namespace f1ts {

struct StreamItem {
  TelemetryPacket packet;
  LapContext lap;
  std::size_t index = 0;  // position in the uniform series
  double speed_kmh = 0.0;
  double throttle_pct = 0.0;
};

// Finite, single-pass sequence of packets over a uniform series. To replay, construct a new
// stream. The series and locator must outlive the stream.
class PacketStream {
public:
  PacketStream(const UniformSeries& series, const LapLocator& locator,
               SensorModelParams sensors = {}, PacketBuilderParams builder = {});

  // nullopt once exhausted.
  std::optional<StreamItem> next();

  std::size_t total() const { return series_.size(); }
  std::size_t position() const { return pos_; }
  std::size_t remaining() const { return series_.size() - pos_; }
  bool done() const { return pos_ >= series_.size(); }

  const LapLocator& locator() const { return locator_; }

private:
  const UniformSeries& series_;
  const LapLocator& locator_;
  SensorModel sensors_;
  PacketBuilder builder_;
  std::size_t pos_ = 0;
};

} // namespace f1ts
