#include <f1ts/wire.hpp>
#include <f1ts/coerce.hpp>
#include <array>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace f1ts::wire {

double round_to(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(finite_or(v) * scale) / scale;
}

namespace {

// Numeric fields accept any int/float width the sender chose.
std::optional<double> as_double(const json& v) {
  if (!v.is_number()) return std::nullopt;
  return v.get<double>();
}

std::optional<std::int64_t> as_int64(const json& v) {
  if (v.is_number_unsigned()) {
    const auto u = v.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
    return static_cast<std::int64_t>(u);
  }
  if (v.is_number_integer()) return v.get<std::int64_t>();
  if (v.is_number_float()) {
    const auto c = coerce_int64(v.get<double>());
    return c.ok() ? std::optional<std::int64_t>(c.value) : std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> as_uint64(const json& v) {
  if (v.is_number_unsigned()) return v.get<std::uint64_t>();
  const auto i = as_int64(v);
  if (!i || *i < 0) return std::nullopt;
  return static_cast<std::uint64_t>(*i);
}

std::optional<int> as_int(const json& v) {
  const auto i = as_int64(v);
  if (!i || *i < std::numeric_limits<int>::min() || *i > std::numeric_limits<int>::max()) return std::nullopt;
  return static_cast<int>(*i);
}

std::optional<bool> as_bool(const json& v) {
  if (v.is_boolean()) return v.get<bool>();
  if (const auto d = as_double(v)) return *d != 0.0;
  return std::nullopt;
}

template <class T, std::size_t N, class Conv>
bool read_quad(const json& v, std::array<T, N>& out, Conv conv) {
  if (!v.is_array() || v.size() != N) return false;
  for (std::size_t k = 0; k < N; ++k) {
    const auto x = conv(v[k]);
    if (!x) return false;
    out[k] = static_cast<T>(*x);
  }
  return true;
}

// Looks up `key`; a missing key leaves `dst` untouched and reports `required == false`.
template <class T, class Conv>
bool read_field(const json& obj, const char* key, T& dst, Conv conv, bool required) {
  const auto it = obj.find(key);
  if (it == obj.end()) return !required;
  const auto x = conv(*it);
  if (!x) return false;
  dst = static_cast<T>(*x);
  return true;
}

json to_object(const TelemetryPacket& pkt) {
  json tp = json::array();
  for (double p : pkt.tyre_pressure_psi) tp.push_back(round_to(p, 1));
  json tt = json::array();
  for (int t : pkt.tyre_temp_surface_c) tt.push_back(t);

  return json{
    {"t",     pkt.timestamp_ms},
    {"id",    pkt.packet_id},
    {"p",     static_cast<std::uint8_t>(pkt.priority)},
    {"car",   pkt.car_number},
    {"lap",   pkt.lap_number},
    {"spd",   pkt.speed_kmh},
    {"thr",   round_to(pkt.throttle, 2)},
    {"brk",   round_to(pkt.brake, 2)},
    {"str",   round_to(pkt.steering, 3)},
    {"g",     pkt.gear},
    {"rpm",   pkt.engine_rpm},
    {"drs",   pkt.drs_active},
    {"oilp",  round_to(pkt.oil_pressure_bar, 1)},
    {"oilt",  pkt.oil_temp_c},
    {"h2ot",  pkt.water_temp_c},
    {"ext",   pkt.exhaust_temp_c},
    {"tp",    std::move(tp)},
    {"tt",    std::move(tt)},
    {"ers",   round_to(pkt.ers_store_j, 0)},
    {"mguk",  round_to(pkt.mguk_power_w, 0)},
    {"fuel",  round_to(pkt.fuel_flow_kg_h, 2)},
    {"fuelr", round_to(pkt.fuel_remaining_kg, 2)},
  };
}

} // namespace

void encode(const TelemetryPacket& pkt, std::vector<std::uint8_t>& out) {
  out.clear();
  json::to_msgpack(to_object(pkt), out);
}

std::vector<std::uint8_t> encode(const TelemetryPacket& pkt) {
  return json::to_msgpack(to_object(pkt));
}

std::optional<TelemetryPacket> decode(std::span<const std::uint8_t> bytes) {
  // strict: trailing bytes are an error. No exceptions: malformed input is discarded.
  const json obj = json::from_msgpack(bytes.begin(), bytes.end(), true, false);
  if (obj.is_discarded() || !obj.is_object()) return std::nullopt;

  TelemetryPacket pkt{};
  bool ok = read_field(obj, "t", pkt.timestamp_ms, as_uint64, true)
         && read_field(obj, "id", pkt.packet_id, as_uint64, true)
         && read_field(obj, "car", pkt.car_number, as_int, false)
         && read_field(obj, "lap", pkt.lap_number, as_int, false)
         && read_field(obj, "spd", pkt.speed_kmh, as_int, true)
         && read_field(obj, "thr", pkt.throttle, as_double, true)
         && read_field(obj, "brk", pkt.brake, as_double, true)
         && read_field(obj, "str", pkt.steering, as_double, true)
         && read_field(obj, "g", pkt.gear, as_int, true)
         && read_field(obj, "rpm", pkt.engine_rpm, as_int, true)
         && read_field(obj, "drs", pkt.drs_active, as_bool, true)
         && read_field(obj, "oilp", pkt.oil_pressure_bar, as_double, true)
         && read_field(obj, "oilt", pkt.oil_temp_c, as_int, true)
         && read_field(obj, "h2ot", pkt.water_temp_c, as_int, true)
         && read_field(obj, "ext", pkt.exhaust_temp_c, as_int, false)
         && read_field(obj, "ers", pkt.ers_store_j, as_double, true)
         && read_field(obj, "mguk", pkt.mguk_power_w, as_double, true)
         && read_field(obj, "fuel", pkt.fuel_flow_kg_h, as_double, true)
         && read_field(obj, "fuelr", pkt.fuel_remaining_kg, as_double, false);
  if (!ok) return std::nullopt;

  const auto tp = obj.find("tp");
  const auto tt = obj.find("tt");
  if (tp == obj.end() || !read_quad(*tp, pkt.tyre_pressure_psi, as_double)) return std::nullopt;
  if (tt == obj.end() || !read_quad(*tt, pkt.tyre_temp_surface_c, as_int)) return std::nullopt;

  // A missing or nil priority decodes as HIGH.
  const auto p = obj.find("p");
  if (p != obj.end() && !p->is_null()) {
    const auto x = as_int64(*p);
    if (!x || *x < 0 || *x > 3) return std::nullopt;
    pkt.priority = static_cast<Priority>(*x);
  }

  // Core temps are not on the wire; reconstruct the sender's +5 offset.
  for (std::size_t i = 0; i < 4; ++i) pkt.tyre_temp_core_c[i] = pkt.tyre_temp_surface_c[i] + 5;
  return pkt;
}

} // namespace f1ts::wire
