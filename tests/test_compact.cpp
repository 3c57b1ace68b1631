#include <yapb/number/compact.h>

#include "test_framework.h"

#include <cmath>
#include <sstream>
#include <string>

using yapb::Binary;
using yapb::Scientific;
using yapb::toString;

TEST_CASE("Binary formatting of sub-unit values") {
  REQUIRE(toString(Binary{0.0}) == "0.00 ");
  REQUIRE(toString(Binary{0.001}) == "1.00e-3 ");
  REQUIRE(toString(Binary{0.01}) == "0.01 ");
  REQUIRE(toString(Binary{0.5}) == "0.50 ");
}

TEST_CASE("Binary formatting with prefixes") {
  REQUIRE(toString(Binary{1023.0}) == "1023 ");
  REQUIRE(toString(Binary{2048.0}) == "2.00 Ki");
  REQUIRE(toString(Binary{1023.0 * 1024.0}) == "1023 Ki");
  REQUIRE(toString(Binary{12345.0}) == "12.1 Ki");
  REQUIRE(toString(Binary{1.5 * std::pow(1024.0, 8)}) == "1.50 Yi");
  REQUIRE(toString(Binary{std::pow(1024.0, 9)}) == "1024 Yi");
}

TEST_CASE("Binary formatting of negative values falls back to exponent form") {
  REQUIRE(toString(Binary{-5000.0}) == "-5.00e3 ");
}

TEST_CASE("Binary output stays within seven characters in range") {
  for (double x = 1e-2; x < 1e28; x *= 3.7) {
    INFO("x = " << x);
    REQUIRE(toString(Binary{x}).size() <= 7);
  }
}

TEST_CASE("Scientific formatting") {
  REQUIRE(toString(Scientific{0.001}) == "1.00 m");
  REQUIRE(toString(Scientific{0.01}) == "10.0 m");
  REQUIRE(toString(Scientific{0.5}) == "500 m");
  REQUIRE(toString(Scientific{1.0}) == "1.00 ");
  REQUIRE(toString(Scientific{999.0}) == "999 ");
  REQUIRE(toString(Scientific{2000.0}) == "2.00 k");
  REQUIRE(toString(Scientific{999e3}) == "999 k");
  REQUIRE(toString(Scientific{-2500.0}) == "-2.50 k");
  REQUIRE(toString(Scientific{1e-12}) == "1.00 p");
}

TEST_CASE("Scientific formatting with the micro sign") {
  REQUIRE(toString(Scientific{1e-6}) == "1.00 \xC2\xB5");
  REQUIRE(toString(Scientific{1e-5}) == "10.0 \xC2\xB5");
  REQUIRE(toString(Scientific{0.0009}) == "900 \xC2\xB5");
}

TEST_CASE("Scientific formatting saturates at the table ends") {
  REQUIRE(toString(Scientific{0.0}) == "0.00 y");
  REQUIRE(toString(Scientific{1e30}) == "1.00e6 Y");
  REQUIRE(toString(Scientific{5e-30}) == "5.00e-6 y");
}

TEST_CASE("Compact values stream and append") {
  std::ostringstream os;
  os << Binary{2048.0} << "B " << Scientific{2000.0} << "bit";
  REQUIRE(os.str() == "2.00 KiB 2.00 kbit");

  std::string out = "rate ";
  yapb::appendScientific(out, 0.001);
  REQUIRE(out == "rate 1.00 m");
}
