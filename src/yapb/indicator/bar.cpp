#include <yapb/indicator/bar.h>

#include <yapb/glyph/tables.h>
#include <yapb/glyph/utf8.h>

#include <algorithm>
#include <cmath>

namespace yapb {

static float clampedProgress(float progress) {
  if (std::isnan(progress)) return 0.0f;
  return std::clamp(progress, 0.0f, 1.0f);
}

void Bar::write(std::string& out, const RenderOptions& opts) const {
  const std::size_t width = opts.width.value_or(kDefaultWidth);
  // Counted in float, the type progress is stored in.
  const float count = static_cast<float>(width) * clampedProgress(progress_);
  const std::size_t whole = std::min(width, static_cast<std::size_t>(std::floor(count)));

  for (std::size_t i = 0; i < whole; ++i) {
    appendUtf8(out, kFullBlock);
  }
  if (whole == width) return;

  const auto eighths = static_cast<std::size_t>(std::floor((count - static_cast<float>(whole)) * 8.0f));
  if (eighths == 0) {
    appendUtf8(out, opts.fill);
  } else {
    appendUtf8(out, kBlockEighths[std::min<std::size_t>(eighths, kBlockEighths.size() - 1)]);
  }

  for (std::size_t i = whole + 1; i < width; ++i) {
    appendUtf8(out, opts.fill);
  }
}

}  // namespace yapb
