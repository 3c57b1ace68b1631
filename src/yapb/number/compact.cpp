#include <yapb/number/compact.h>

#include <yapb/number/prefix.h>
#include <yapb/number/sigfigs.h>

#include <cstdio>
#include <ostream>

namespace yapb {

static void appendPrefix(std::string& out, const PrefixResult& scaled, std::size_t figures) {
  appendSigFigs(out, scaled.mantissa, figures);
  out.push_back(' ');
  if (scaled.prefix) out.append(scaled.prefix->data(), scaled.prefix->size());
}

void appendBinary(std::string& out, double x) {
  // Sub-unit values that still read well as two decimals skip exponent form.
  if (x < 1.0 && x >= 1e-2) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2f ", x);
    out += buf;
    return;
  }

  const PrefixResult scaled = binary(x);
  // 1000..1023 of a unit needs the fourth digit.
  appendPrefix(out, scaled, scaled.mantissa >= 1000.0 ? 4 : 3);
}

void appendScientific(std::string& out, double x) {
  appendPrefix(out, si(x), 3);
}

std::string toString(const Binary& v) {
  std::string out;
  appendBinary(out, v.value);
  return out;
}

std::string toString(const Scientific& v) {
  std::string out;
  appendScientific(out, v.value);
  return out;
}

std::ostream& operator<<(std::ostream& os, const Binary& v) {
  return os << toString(v);
}

std::ostream& operator<<(std::ostream& os, const Scientific& v) {
  return os << toString(v);
}

}  // namespace yapb
