#pragma once

#include <iosfwd>
#include <string>

namespace yapb {

// Compact rendering of a quantity with a binary prefix, followed by a space
// and the prefix, ready for a unit to be appended: 12345 -> "12.1 Ki".
// Zero and values in [1e-2, 1e28) take at most 7 ASCII characters.
void appendBinary(std::string& out, double x);

// Same with SI prefixes: 0.001 -> "1.00 m". Values in [1e-24, 1e28) take at
// most 6 characters (the micro sign is two bytes).
void appendScientific(std::string& out, double x);

struct Binary {
  double value = 0.0;
};

struct Scientific {
  double value = 0.0;
};

std::string toString(const Binary& v);
std::string toString(const Scientific& v);

std::ostream& operator<<(std::ostream& os, const Binary& v);
std::ostream& operator<<(std::ostream& os, const Scientific& v);

}  // namespace yapb
