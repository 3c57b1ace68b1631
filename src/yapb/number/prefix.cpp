#include <yapb/number/prefix.h>

#include <array>
#include <cmath>

namespace yapb {

namespace {

struct Scale {
  std::string_view prefix;
  double factor;
};

// Decimal factors are spelled out: repeated multiplication by 1e-3 drifts
// off the exact powers (1e-3^4 != 1e-12).
constexpr std::array<Scale, 8> kSiLarge = {{
    {"k", 1e3},
    {"M", 1e6},
    {"G", 1e9},
    {"T", 1e12},
    {"P", 1e15},
    {"E", 1e18},
    {"Z", 1e21},
    {"Y", 1e24},
}};

constexpr std::array<Scale, 8> kSiSmall = {{
    {"m", 1e-3},
    {"µ", 1e-6},
    {"n", 1e-9},
    {"p", 1e-12},
    {"f", 1e-15},
    {"a", 1e-18},
    {"z", 1e-21},
    {"y", 1e-24},
}};

constexpr std::array<std::string_view, 8> kBinaryPrefixes = {{
    "Ki", "Mi", "Gi", "Ti", "Pi", "Ei", "Zi", "Yi",
}};

}  // namespace

PrefixResult binary(double x) {
  double divisor = 1024.0;
  if (x < divisor) return {x, std::nullopt};

  for (std::size_t i = 0; i + 1 < kBinaryPrefixes.size(); ++i) {
    const double next = divisor * 1024.0;
    if (next > x) return {x / divisor, kBinaryPrefixes[i]};
    divisor = next;
  }
  return {x / divisor, kBinaryPrefixes.back()};
}

PrefixResult si(double x) {
  const double magnitude = std::fabs(x);

  if (magnitude < 1.0) {
    // First (largest) prefix that brings the mantissa back to >= 1.
    for (std::size_t i = 0; i + 1 < kSiSmall.size(); ++i) {
      if (kSiSmall[i].factor <= magnitude) return {x / kSiSmall[i].factor, kSiSmall[i].prefix};
    }
    return {x / kSiSmall.back().factor, kSiSmall.back().prefix};
  }

  if (magnitude < 1e3) return {x, std::nullopt};

  for (std::size_t i = 0; i + 1 < kSiLarge.size(); ++i) {
    if (kSiLarge[i + 1].factor > magnitude) return {x / kSiLarge[i].factor, kSiLarge[i].prefix};
  }
  return {x / kSiLarge.back().factor, kSiLarge.back().prefix};
}

}  // namespace yapb
