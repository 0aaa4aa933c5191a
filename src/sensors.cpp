#include <f1ts/sensors.hpp>
#include <f1ts/coerce.hpp>
#include <algorithm>
#include <cmath>

namespace f1ts {

double SensorModel::noise_() {
  if (p_.temp_noise_sigma_c <= 0.0) return 0.0;
  std::normal_distribution<double> N(0.0, p_.temp_noise_sigma_c);
  return N(rng_);
}

SensorReadings SensorModel::derive(const UniformSample& s, std::uint64_t packet_id) {
  const double rpm      = finite_or(s.engine_rpm);
  const double throttle = finite_or(s.throttle_pct) / 100.0;
  const double speed    = finite_or(s.speed_kmh);
  const double brake    = finite_or(s.brake);

  SensorReadings r{};
  r.oil_pressure_bar = 4.0 + (rpm / 15000.0) * 2.0;
  r.oil_temp_c     = static_cast<int>(90.0 + throttle * 20.0 + noise_());
  r.water_temp_c   = static_cast<int>(85.0 + throttle * 25.0 + noise_());
  r.exhaust_temp_c = static_cast<int>(600.0 + throttle * 300.0);

  r.ers_store_j  = 4000000.0 * (0.5 + 0.5 * std::sin(static_cast<double>(packet_id) / 100.0));
  r.mguk_power_w = s.drs_active() ? throttle * 120000.0 : 0.0;

  r.fuel_flow_kg_h = throttle * 100.0;  // 100 kg/h regulation ceiling at full throttle
  r.fuel_remaining_kg = std::max(0.0, p_.fuel_start_kg - static_cast<double>(packet_id) * p_.fuel_per_packet_kg);

  // Fronts heat with speed and braking, rears with speed only
  const double speed_factor = speed > 0.0 ? speed / 350.0 : 0.0;
  const int front = static_cast<int>(80.0 + speed_factor * 20.0 + brake * 30.0);
  const int rear  = static_cast<int>(80.0 + speed_factor * 15.0);
  r.tyre_temp_surface_c = {front, front, rear, rear};
  for (std::size_t i = 0; i < 4; ++i) r.tyre_temp_core_c[i] = r.tyre_temp_surface_c[i] + 5;

  return r;
}

} // namespace f1ts
