#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace f1ts {

// Why a value could not be used as-is.
enum class CoerceError : std::uint8_t {
  Missing,     // empty field, NaN, "nan", "null"
  NonNumeric,  // text that is not a number
  OutOfRange,  // infinite, or does not fit the target type
};

const char* to_string(CoerceError e);

template <class T>
struct Coerced {
  T value{};
  std::optional<CoerceError> error;  // set when value is the default

  bool ok() const { return !error.has_value(); }
};

// Parse text fields from recorded data. Leading/trailing whitespace is ignored.
Coerced<double> coerce_double(std::string_view text, double fallback = 0.0);
Coerced<int>    coerce_int(std::string_view text, int fallback = 0);

// Accepts true/false/yes/no as well as any number (non-zero -> true).
Coerced<bool>   coerce_bool(std::string_view text, bool fallback = false);

// Sanitize numbers already in memory before they reach the wire.
Coerced<double> coerce_finite(double v, double fallback = 0.0);
Coerced<std::int64_t> coerce_int64(double v, std::int64_t fallback = 0);

inline double finite_or(double v, double fallback = 0.0) {
  return coerce_finite(v, fallback).value;
}

} // namespace f1ts
