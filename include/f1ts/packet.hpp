#pragma once
#include <array>
#include <cstdint>
#include <f1ts/sample.hpp>
#include <f1ts/sensors.hpp>

namespace f1ts {

// Wire values are fixed. Only Critical and High are assigned by classify_priority();
// Medium and Low are kept so decoders of the full schema stay compatible.
enum class Priority : std::uint8_t {
  Critical = 0,
  High = 1,
  Medium = 2,
  Low = 3,
};

const char* to_string(Priority p);

// Cooling temperature above which a packet is CRITICAL.
inline constexpr int kCriticalWaterTempC = 120;

Priority classify_priority(const SensorReadings& sensors, bool drs_active);

struct TelemetryPacket {
  // metadata
  std::uint64_t timestamp_ms = 0;
  int car_number = 0;
  std::uint64_t packet_id = 0;
  Priority priority = Priority::High;
  int lap_number = 0;

  // core telemetry
  int speed_kmh = 0;
  double throttle = 0.0;       // fraction 0..1
  double brake = 0.0;          // 0..1
  double steering = 0.0;       // -1..1
  int gear = 0;
  int engine_rpm = 0;
  bool drs_active = false;

  // engine
  double oil_pressure_bar = 0.0;
  int oil_temp_c = 0;
  int water_temp_c = 0;
  int exhaust_temp_c = 0;

  // tyres FL FR RL RR
  std::array<double, 4> tyre_pressure_psi{23.0, 23.0, 21.0, 21.0};
  std::array<int, 4> tyre_temp_surface_c{90, 90, 85, 85};
  std::array<int, 4> tyre_temp_core_c{95, 95, 90, 90};

  // energy recovery
  double ers_store_j = 0.0;
  int ers_deploy_mode = 0;
  double mguk_power_w = 0.0;
  double mguh_power_w = 0.0;

  // fuel
  double fuel_flow_kg_h = 0.0;
  double fuel_remaining_kg = 0.0;
};

struct PacketBuilderParams {
  int car_number = 44;
  std::uint64_t base_timestamp_ms = 0;
  double interval_ms = 2.0;  // nominal spacing between packet timestamps
};

// Assigns monotonically increasing ids starting at 0 and a priority label.
class PacketBuilder {
public:
  explicit PacketBuilder(PacketBuilderParams p = {}) : p_(p) {}

  TelemetryPacket build(const UniformSample& s, const SensorReadings& sensors, int lap_number);

  // id the next build() will use
  std::uint64_t next_id() const { return next_id_; }

private:
  PacketBuilderParams p_;
  std::uint64_t next_id_ = 0;
};

} // namespace f1ts
