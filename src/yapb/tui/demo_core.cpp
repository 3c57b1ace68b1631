#include <yapb/tui/demo_core.h>

#include <yapb/number/compact.h>
#include <yapb/number/sigfigs.h>

#include <algorithm>
#include <cmath>

namespace yapb {

DemoState makeDemoState(const Config& cfg) {
  DemoState state;
  for (const SpinnerKind kind : kAllSpinnerKinds) {
    if (!cfg.shows(kind)) continue;
    state.spinners.push_back(DemoState::Slot{kind, makeSpinner(kind)});
  }
  state.rate = MovingAverage(cfg.rateAlpha);
  return state;
}

std::uint32_t spinnerStateForFrame(SpinnerKind kind, std::uint32_t frame) {
  switch (kind) {
    case SpinnerKind::Spinner4:
    case SpinnerKind::Counter16:
      return frame >> 2;
    case SpinnerKind::Spinner8:
    case SpinnerKind::Counter256:
      return frame >> 1;
    case SpinnerKind::Snake:
      return frame;
  }
  return frame;
}

double simulatedRate(std::uint32_t frame) {
  // Around 4 MiB/s with a slow swell and a faster ripple.
  const double t = static_cast<double>(frame);
  return 4.0 * 1024.0 * 1024.0 * (1.0 + 0.6 * std::sin(t / 37.0) + 0.25 * std::sin(t / 5.0));
}

void applyFrame(DemoState& state, const Config& cfg, std::uint32_t frame) {
  state.frame = frame;
  for (auto& slot : state.spinners) {
    slot.spinner->set(spinnerStateForFrame(slot.kind, frame));
  }

  const std::uint32_t frames = std::max<std::uint32_t>(cfg.frames, 1);
  state.bar.set(static_cast<float>(static_cast<double>(frame) / static_cast<double>(frames)));

  state.rateSample = simulatedRate(frame);
  state.rate.update(state.rateSample);
}

std::size_t barWidthFor(const Config& cfg, int cols) {
  const long long width = static_cast<long long>(cols) - static_cast<long long>(cfg.barMargin);
  return width > 0 ? static_cast<std::size_t>(width) : 0;
}

std::vector<std::string> renderLines(const DemoState& state, const Config& cfg, int cols) {
  std::vector<std::string> lines;

  std::string line;
  RenderOptions opts;
  for (const auto& slot : state.spinners) {
    if (!line.empty()) line.push_back(' ');
    slot.spinner->write(line, opts);
  }
  if (cfg.showBar) {
    if (!line.empty()) line.push_back(' ');
    opts.width = barWidthFor(cfg, cols);
    opts.fill = static_cast<char32_t>(static_cast<unsigned char>(cfg.fill));
    line.push_back('[');
    state.bar.write(line, opts);
    line.push_back(']');
  }
  if (!line.empty()) lines.push_back(std::move(line));

  if (cfg.showRate) {
    std::string rate = "progress ";
    appendSigFigs(rate, std::clamp(static_cast<double>(state.bar.get()), 0.0, 1.0) * 100.0, 3);
    rate += "%  rate ";
    appendBinary(rate, state.rate.get());
    rate += "B/s (";
    appendScientific(rate, state.rate.get() * 8.0);
    rate += "bit/s)";
    lines.push_back(std::move(rate));
  }

  return lines;
}

}  // namespace yapb
