#pragma once

#include <optional>
#include <string_view>

namespace yapb {

// A value rescaled for display next to a unit prefix.
struct PrefixResult {
  double mantissa = 0.0;
  std::optional<std::string_view> prefix;

  bool operator==(const PrefixResult& other) const {
    return mantissa == other.mantissa && prefix == other.prefix;
  }
  bool operator!=(const PrefixResult& other) const { return !(*this == other); }
};

// Scales `x` by the largest power of 1024 not exceeding it (Ki .. Yi).
// Values below 1024, negatives included, are returned unscaled. Anything
// beyond the Yi range still reports Yi.
PrefixResult binary(double x);

// Scales `x` to the SI prefix that leaves 1 <= |mantissa| < 1000 (y .. Y).
// Only the magnitude picks the prefix; the sign is carried through. Values
// outside the table saturate at y or Y.
PrefixResult si(double x);

}  // namespace yapb
