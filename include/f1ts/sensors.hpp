#pragma once
#include <array>
#include <cstdint>
#include <random>
#include <f1ts/sample.hpp>

namespace f1ts {

// Channels the recordings do not carry, derived from the primary ones.
struct SensorReadings {
  double oil_pressure_bar = 0.0;
  int oil_temp_c = 0;
  int water_temp_c = 0;           // cooling temperature, drives CRITICAL priority
  int exhaust_temp_c = 0;
  double ers_store_j = 0.0;
  double mguk_power_w = 0.0;
  double fuel_flow_kg_h = 0.0;
  double fuel_remaining_kg = 0.0;
  std::array<double, 4> tyre_pressure_psi{23.0, 23.0, 21.0, 21.0};  // FL FR RL RR
  std::array<int, 4> tyre_temp_surface_c{};
  std::array<int, 4> tyre_temp_core_c{};
};

struct SensorModelParams {
  double temp_noise_sigma_c = 0.0;  // Gaussian noise on oil/water temps; 0 = deterministic
  std::uint32_t seed = 1;
  double fuel_start_kg = 110.0;
  double fuel_per_packet_kg = 0.0001;
};

// Deterministic for a given seed; the noise stream advances once per call.
class SensorModel {
public:
  explicit SensorModel(SensorModelParams p = {}) : p_(p), rng_(p.seed) {}

  SensorReadings derive(const UniformSample& s, std::uint64_t packet_id);

private:
  double noise_();

  SensorModelParams p_;
  std::mt19937 rng_;
};

} // namespace f1ts
