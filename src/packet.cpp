#include <f1ts/packet.hpp>
#include <f1ts/coerce.hpp>
#include <cmath>
#include <limits>

namespace f1ts {

const char* to_string(Priority p) {
  switch (p) {
    case Priority::Critical: return "CRITICAL";
    case Priority::High:     return "HIGH";
    case Priority::Medium:   return "MEDIUM";
    case Priority::Low:      return "LOW";
  }
  return "UNKNOWN";
}

Priority classify_priority(const SensorReadings& sensors, bool drs_active) {
  if (sensors.water_temp_c > kCriticalWaterTempC) return Priority::Critical;
  if (drs_active) return Priority::High;
  // Nothing assigns MEDIUM/LOW yet.
  return Priority::High;
}

// Out-of-range or non-finite -> 0.
static int to_int_or_zero(double v) {
  const auto i = coerce_int64(v, 0);
  if (!i.ok()) return 0;
  if (i.value < std::numeric_limits<int>::min() || i.value > std::numeric_limits<int>::max()) return 0;
  return static_cast<int>(i.value);
}

TelemetryPacket PacketBuilder::build(const UniformSample& s, const SensorReadings& sensors, int lap_number) {
  TelemetryPacket pkt{};
  const std::uint64_t id = next_id_++;

  pkt.packet_id = id;
  pkt.timestamp_ms = p_.base_timestamp_ms +
    static_cast<std::uint64_t>(static_cast<double>(id) * finite_or(p_.interval_ms));
  pkt.car_number = p_.car_number;
  pkt.lap_number = lap_number;

  pkt.speed_kmh  = to_int_or_zero(s.speed_kmh);
  pkt.throttle   = finite_or(s.throttle_pct) / 100.0;
  pkt.brake      = finite_or(s.brake);
  pkt.steering   = 0.0;  // not in the recordings
  pkt.gear       = s.gear;
  pkt.engine_rpm = to_int_or_zero(s.engine_rpm);
  pkt.drs_active = finite_or(s.drs) > 0.0;

  pkt.oil_pressure_bar = finite_or(sensors.oil_pressure_bar);
  pkt.oil_temp_c       = sensors.oil_temp_c;
  pkt.water_temp_c     = sensors.water_temp_c;
  pkt.exhaust_temp_c   = sensors.exhaust_temp_c;

  for (std::size_t i = 0; i < 4; ++i) pkt.tyre_pressure_psi[i] = finite_or(sensors.tyre_pressure_psi[i]);
  pkt.tyre_temp_surface_c = sensors.tyre_temp_surface_c;
  pkt.tyre_temp_core_c    = sensors.tyre_temp_core_c;

  pkt.ers_store_j    = finite_or(sensors.ers_store_j);
  pkt.mguk_power_w   = finite_or(sensors.mguk_power_w);
  pkt.fuel_flow_kg_h = finite_or(sensors.fuel_flow_kg_h);
  pkt.fuel_remaining_kg = finite_or(sensors.fuel_remaining_kg);

  pkt.priority = classify_priority(sensors, pkt.drs_active);
  return pkt;
}

} // namespace f1ts
