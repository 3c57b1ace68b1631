// SPDX-License-Identifier: MIT
// Snapshot implementation - replays the demo to a frame and serializes it

#include <yapb/snapshot/snapshot.h>
#include <yapb/snapshot/json_writer.h>
#include <yapb/glyph/utf8.h>
#include <yapb/number/compact.h>
#include <yapb/number/sigfigs.h>
#include <yapb/tui/demo_core.h>

#include <algorithm>

namespace yapb {

DemoSnapshot captureSnapshot(const Config& cfg, std::uint32_t frame, std::size_t barWidth) {
  DemoState state = makeDemoState(cfg);
  for (std::uint32_t i = 0;; ++i) {
    applyFrame(state, cfg, i);
    if (i == frame) break;
  }

  DemoSnapshot snapshot;
  snapshot.frame = frame;
  snapshot.frames = cfg.frames;

  for (const auto& slot : state.spinners) {
    SpinnerSnapshot s;
    s.kind = std::string(spinnerKindName(slot.kind));
    s.state = spinnerStateForFrame(slot.kind, frame);
    s.glyph = utf8(slot.spinner->glyph());
    snapshot.spinners.push_back(std::move(s));
  }

  if (cfg.showBar) {
    RenderOptions opts;
    opts.width = barWidth;
    opts.fill = static_cast<char32_t>(static_cast<unsigned char>(cfg.fill));
    snapshot.bar = state.bar.str(opts);
    snapshot.progress =
        formatSigFigs(std::clamp(static_cast<double>(state.bar.get()), 0.0, 1.0) * 100.0, 3) + "%";
  }

  if (cfg.showRate) {
    snapshot.rate_binary = toString(Binary{state.rate.get()}) + "B/s";
    snapshot.rate_si = toString(Scientific{state.rate.get() * 8.0}) + "bit/s";
  }

  return snapshot;
}

std::string snapshotToJson(const DemoSnapshot& snapshot) {
  json::ObjectBuilder root;
  root.addUnsigned("frame", snapshot.frame);
  root.addUnsigned("frames", snapshot.frames);

  json::ArrayBuilder spinnersArray;
  for (const auto& s : snapshot.spinners) {
    json::ObjectBuilder obj;
    obj.addString("kind", s.kind);
    obj.addUnsigned("state", s.state);
    obj.addString("glyph", s.glyph);
    spinnersArray.addRaw(obj.build());
  }
  root.addRaw("spinners", spinnersArray.build());

  root.addOptionalString("bar", snapshot.bar);
  root.addOptionalString("progress", snapshot.progress);
  root.addOptionalString("rate_binary", snapshot.rate_binary);
  root.addOptionalString("rate_si", snapshot.rate_si);
  return root.build();
}

}  // namespace yapb
