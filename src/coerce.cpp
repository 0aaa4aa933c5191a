#include <f1ts/coerce.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

namespace f1ts {

static std::string_view trim_view(std::string_view s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  const auto b = std::find_if(s.begin(), s.end(), not_space);
  const auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return s.substr(static_cast<std::size_t>(b - s.begin()), static_cast<std::size_t>(e - b));
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static bool is_missing_token(std::string_view s) {
  if (s.empty()) return true;
  const auto l = lower(s);
  return l == "nan" || l == "null" || l == "none" || l == "nat" || l == "na";
}

const char* to_string(CoerceError e) {
  switch (e) {
    case CoerceError::Missing:    return "missing";
    case CoerceError::NonNumeric: return "non-numeric";
    case CoerceError::OutOfRange: return "out-of-range";
  }
  return "unknown";
}

Coerced<double> coerce_double(std::string_view text, double fallback) {
  const auto s = trim_view(text);
  if (is_missing_token(s)) return {fallback, CoerceError::Missing};

  // from_chars rejects a leading '+'
  const char* first = s.data();
  const char* last  = s.data() + s.size();
  if (*first == '+') ++first;

  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec == std::errc::result_out_of_range) return {fallback, CoerceError::OutOfRange};
  if (ec != std::errc{} || ptr != last)     return {fallback, CoerceError::NonNumeric};
  return coerce_finite(v, fallback);
}

Coerced<int> coerce_int(std::string_view text, int fallback) {
  // Recorded gear columns are often written as floats ("6.0").
  const auto d = coerce_double(text, 0.0);
  if (!d.ok()) return {fallback, d.error};
  const auto i = coerce_int64(d.value, fallback);
  if (!i.ok()) return {fallback, i.error};
  if (i.value < std::numeric_limits<int>::min() || i.value > std::numeric_limits<int>::max()) {
    return {fallback, CoerceError::OutOfRange};
  }
  return {static_cast<int>(i.value), std::nullopt};
}

Coerced<bool> coerce_bool(std::string_view text, bool fallback) {
  const auto s = trim_view(text);
  if (is_missing_token(s)) return {fallback, CoerceError::Missing};
  const auto l = lower(s);
  if (l == "true" || l == "yes")  return {true, std::nullopt};
  if (l == "false" || l == "no")  return {false, std::nullopt};
  const auto d = coerce_double(s, 0.0);
  if (!d.ok()) return {fallback, d.error};
  return {d.value != 0.0, std::nullopt};
}

Coerced<double> coerce_finite(double v, double fallback) {
  if (std::isnan(v)) return {fallback, CoerceError::Missing};
  if (std::isinf(v)) return {fallback, CoerceError::OutOfRange};
  return {v, std::nullopt};
}

Coerced<std::int64_t> coerce_int64(double v, std::int64_t fallback) {
  const auto f = coerce_finite(v, 0.0);
  if (!f.ok()) return {fallback, f.error};
  // 2^63 is exactly representable; anything at or beyond it overflows
  constexpr double kLimit = 9223372036854775808.0;
  const double t = std::trunc(f.value);
  if (t >= kLimit || t < -kLimit) return {fallback, CoerceError::OutOfRange};
  return {static_cast<std::int64_t>(t), std::nullopt};
}

} // namespace f1ts
