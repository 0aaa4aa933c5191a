#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include <f1ts/packet.hpp>

namespace f1ts::wire {

// One packet per datagram, no fragmentation.
inline constexpr std::size_t kMaxDatagramBytes = 512;

// MessagePack map with short keys:
//   t id p car lap spd thr brk str g rpm drs oilp oilt h2ot ext tp tt ers mguk fuel fuelr
// Rounding: thr/brk/fuel/fuelr 2 dp, str 3 dp, oilp/tp 1 dp, ers/mguk whole numbers.
// `out` is cleared first so callers can reuse one buffer per stream.
void encode(const TelemetryPacket& pkt, std::vector<std::uint8_t>& out);
std::vector<std::uint8_t> encode(const TelemetryPacket& pkt);

// nullopt for malformed bytes or a missing required key. A missing `p` decodes as HIGH;
// missing car/lap/ext/fuelr decode as 0. Unknown keys are skipped.
std::optional<TelemetryPacket> decode(std::span<const std::uint8_t> bytes);

double round_to(double v, int decimals);

} // namespace f1ts::wire
