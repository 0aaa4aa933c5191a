#include <f1ts/packet_stream.hpp>

namespace f1ts {

PacketStream::PacketStream(const UniformSeries& series, const LapLocator& locator,
                           SensorModelParams sensors, PacketBuilderParams builder)
  : series_(series), locator_(locator), sensors_(sensors), builder_(builder) {}

std::optional<StreamItem> PacketStream::next() {
  if (done()) return std::nullopt;

  const std::size_t i = pos_++;
  const UniformSample& s = series_.samples[i];

  StreamItem item{};
  item.index = i;
  item.lap = locator_.locate(i);
  const SensorReadings r = sensors_.derive(s, builder_.next_id());
  item.packet = builder_.build(s, r, item.lap.lap_number);
  item.speed_kmh = s.speed_kmh;
  item.throttle_pct = s.throttle_pct;
  return item;
}

} // namespace f1ts
