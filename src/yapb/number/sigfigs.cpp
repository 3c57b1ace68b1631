#include <yapb/number/sigfigs.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ostream>

namespace yapb {

// Keeps the printf precision within int range.
static constexpr std::size_t kMaxFigures = 512;

static void appendPrintf(std::string& out, const char* fmt, int precision, double value) {
  const int len = std::snprintf(nullptr, 0, fmt, precision, value);
  if (len <= 0) return;
  const std::size_t start = out.size();
  out.resize(start + static_cast<std::size_t>(len) + 1);
  std::snprintf(&out[start], static_cast<std::size_t>(len) + 1, fmt, precision, value);
  out.resize(start + static_cast<std::size_t>(len));
}

// printf writes "1.00e-03" / "1.0e+01"; we want "1.00e-3" / "1.0e1".
static void appendExponential(std::string& out, double value, int fractionDigits) {
  std::string buf;
  appendPrintf(buf, "%.*e", fractionDigits, value);

  const auto e = buf.find('e');
  if (e == std::string::npos) {
    out += buf;
    return;
  }

  out.append(buf, 0, e + 1);
  std::size_t i = e + 1;
  if (i < buf.size() && (buf[i] == '+' || buf[i] == '-')) {
    if (buf[i] == '-') out.push_back('-');
    ++i;
  }
  while (i + 1 < buf.size() && buf[i] == '0') ++i;
  out.append(buf, i, std::string::npos);
}

void appendSigFigs(std::string& out, double value, std::size_t figures) {
  figures = std::clamp<std::size_t>(figures, 1, kMaxFigures);
  const int digits = static_cast<int>(figures);

  if (std::isnan(value)) {
    out += "NaN";
    return;
  }
  if (std::isinf(value)) {
    out += value < 0 ? "-inf" : "inf";
    return;
  }
  if (value == 0.0) {
    appendPrintf(out, "%.*f", digits - 1, 0.0);
    return;
  }

  const double log = std::floor(std::log10(std::fabs(value)));
  if (log < 0.0 || log >= static_cast<double>(figures)) {
    appendExponential(out, value, digits - 1);
  } else {
    appendPrintf(out, "%.*f", digits - (static_cast<int>(log) + 1), value);
  }
}

std::string formatSigFigs(double value, std::size_t figures) {
  std::string out;
  appendSigFigs(out, value, figures);
  return out;
}

std::ostream& operator<<(std::ostream& os, const SigFigs& v) {
  return os << formatSigFigs(v.value, v.figures);
}

}  // namespace yapb
