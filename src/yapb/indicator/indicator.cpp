#include <yapb/indicator/indicator.h>

#include <ostream>

namespace yapb {

std::string Indicator::str(const RenderOptions& opts) const {
  std::string out;
  write(out, opts);
  return out;
}

std::ostream& operator<<(std::ostream& os, const Indicator& indicator) {
  const std::ostream::sentry guard(os);
  if (!guard) return os;

  RenderOptions opts;
  if (os.width() > 0) opts.width = static_cast<std::size_t>(os.width());
  opts.fill = static_cast<char32_t>(static_cast<unsigned char>(os.fill()));
  os.width(0);

  std::string buf;
  indicator.write(buf, opts);
  os.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  return os;
}

}  // namespace yapb
