// SPDX-License-Identifier: MIT
// Snapshot - every demo indicator rendered at one frame, as JSON

#pragma once

#include <yapb/config/config.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yapb {

/// One spinner as rendered. All values are pre-formatted for JSON output.
struct SpinnerSnapshot {
  std::string kind;   // "spinner4", "spinner8", "counter16", "counter256", "snake"
  std::uint32_t state = 0;
  std::string glyph;
};

struct DemoSnapshot {
  std::uint32_t frame = 0;
  std::uint32_t frames = 0;
  std::vector<SpinnerSnapshot> spinners;

  std::optional<std::string> bar;
  std::optional<std::string> progress;
  std::optional<std::string> rate_binary;
  std::optional<std::string> rate_si;
};

/// Replays frames 0..frame so the smoothed rate matches what the live demo
/// shows at that point, then captures every enabled indicator.
DemoSnapshot captureSnapshot(const Config& cfg, std::uint32_t frame, std::size_t barWidth);

std::string snapshotToJson(const DemoSnapshot& snapshot);

}  // namespace yapb
