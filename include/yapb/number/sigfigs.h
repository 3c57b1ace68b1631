#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace yapb {

// Appends `value` with exactly `figures` significant digits.
//
// Fixed notation is used while the integer part fits in the digit budget
// (0 <= floor(log10|value|) < figures); anything else is written as
// mantissa `e` exponent with no '+' and no zero padding ("1e-1", "1.00e-3").
// Zero is written in fixed notation ("0.00" for 3 figures). Non-finite input
// is written as "inf", "-inf" or "NaN". A budget of 0 is treated as 1.
void appendSigFigs(std::string& out, double value, std::size_t figures);

std::string formatSigFigs(double value, std::size_t figures);

// Stream adapter: `os << SigFigs{v, 3}`.
struct SigFigs {
  double value = 0.0;
  std::size_t figures = 1;
};

std::ostream& operator<<(std::ostream& os, const SigFigs& v);

}  // namespace yapb
