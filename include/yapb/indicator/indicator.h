#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

namespace yapb {

struct RenderOptions {
  // Target width in columns. Indicators that have a natural width ignore it.
  std::optional<std::size_t> width;
  char32_t fill = U' ';
};

// Anything that can be written into a character sink.
//
// Rendering never mutates the indicator and never fails on its own; the
// caller owns the sink and any I/O error it reports.
class Indicator {
public:
  virtual ~Indicator() = default;

  // Appends UTF-8 output to `out`. Reusing `out` across frames avoids
  // allocating once its capacity has grown to fit a line.
  virtual void write(std::string& out, const RenderOptions& opts) const = 0;

  std::string str(const RenderOptions& opts = {}) const;
};

// Honours the stream's width() and fill(). Like the standard inserters the
// width is reset to 0 afterwards. Write failures are left in the stream state.
std::ostream& operator<<(std::ostream& os, const Indicator& indicator);

}  // namespace yapb
