#pragma once

#include <yapb/indicator/spinner.h>

#include <cstdint>
#include <string>

namespace yapb {

// Settings for the yapb-demo driver. The library itself takes no config.
struct Config {
  // Indicators shown, left to right.
  bool showSpinner4 = true;
  bool showSpinner8 = true;
  bool showCounter16 = true;
  bool showCounter256 = true;
  bool showSnake = true;
  bool showBar = true;
  // Simulated throughput line (smoothed, binary and SI prefixes).
  bool showRate = true;

  // Animation
  std::uint32_t refreshMs = 50;
  std::uint32_t frames = 1000;

  // Columns left for the spinners and brackets beside the bar.
  std::uint32_t barMargin = 12;
  char fill = ' ';

  // Smoothing factor for the throughput moving average.
  double rateAlpha = 0.1;

  bool shows(SpinnerKind kind) const;

  static Config load();
  static std::string path();
  void save() const;
};

}  // namespace yapb
