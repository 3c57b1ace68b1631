#pragma once

#include <yapb/config/config.h>
#include <yapb/indicator/bar.h>
#include <yapb/indicator/spinner.h>
#include <yapb/number/moving_average.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace yapb {

struct DemoState {
  struct Slot {
    SpinnerKind kind;
    std::unique_ptr<Spinner> spinner;
  };

  // Enabled spinners in display order.
  std::vector<Slot> spinners;
  Bar bar;

  // Simulated throughput in bytes/s, raw and smoothed.
  double rateSample = 0.0;
  MovingAverage rate{0.1};

  std::uint32_t frame = 0;
  bool paused = false;
};

DemoState makeDemoState(const Config& cfg);

// Counter value a spinner is driven with at `frame`. Slower spinners are
// fed frame >> 1 or frame >> 2 so every shape turns at a readable pace.
std::uint32_t spinnerStateForFrame(SpinnerKind kind, std::uint32_t frame);

// Deterministic fake transfer rate, bytes/s.
double simulatedRate(std::uint32_t frame);

// Moves every indicator to `frame` and folds one rate sample into the
// moving average.
void applyFrame(DemoState& state, const Config& cfg, std::uint32_t frame);

// Bar width that leaves cfg.barMargin columns for everything else.
std::size_t barWidthFor(const Config& cfg, int cols);

// Lines for a terminal `cols` wide (UTF-8).
std::vector<std::string> renderLines(const DemoState& state, const Config& cfg, int cols);

}  // namespace yapb
