#include <yapb/number/sigfigs.h>

#include "test_framework.h"

#include <limits>
#include <sstream>

using yapb::formatSigFigs;

TEST_CASE("Fixed notation while the integer part fits") {
  REQUIRE(formatSigFigs(1.0, 1) == "1");
  REQUIRE(formatSigFigs(1.0, 2) == "1.0");
  REQUIRE(formatSigFigs(10.0, 2) == "10");
  REQUIRE(formatSigFigs(123.456, 3) == "123");
  REQUIRE(formatSigFigs(123.456, 5) == "123.46");
  REQUIRE(formatSigFigs(-2.5, 2) == "-2.5");
}

TEST_CASE("Exponent notation below one and past the digit budget") {
  REQUIRE(formatSigFigs(0.1, 1) == "1e-1");
  REQUIRE(formatSigFigs(0.1, 2) == "1.0e-1");
  REQUIRE(formatSigFigs(0.5, 3) == "5.00e-1");
  REQUIRE(formatSigFigs(10.0, 1) == "1e1");
  REQUIRE(formatSigFigs(1234.5, 3) == "1.23e3");
  REQUIRE(formatSigFigs(1e100, 3) == "1.00e100");
  REQUIRE(formatSigFigs(-0.00123, 2) == "-1.2e-3");
}

TEST_CASE("Zero is written in fixed notation") {
  REQUIRE(formatSigFigs(0.0, 3) == "0.00");
  REQUIRE(formatSigFigs(0.0, 1) == "0");
  REQUIRE(formatSigFigs(-0.0, 1) == "0");
}

TEST_CASE("Rounding up may add a digit") {
  REQUIRE(formatSigFigs(99.95, 3) == "100.0");
  REQUIRE(formatSigFigs(9.96, 2) == "10.0");
}

TEST_CASE("A budget of zero figures behaves like one") {
  REQUIRE(formatSigFigs(7.0, 0) == formatSigFigs(7.0, 1));
}

TEST_CASE("Non-finite values") {
  REQUIRE(formatSigFigs(std::numeric_limits<double>::infinity(), 3) == "inf");
  REQUIRE(formatSigFigs(-std::numeric_limits<double>::infinity(), 3) == "-inf");
  REQUIRE(formatSigFigs(std::numeric_limits<double>::quiet_NaN(), 3) == "NaN");
}

TEST_CASE("appendSigFigs appends and SigFigs streams") {
  std::string out = "x=";
  yapb::appendSigFigs(out, 123.456, 3);
  REQUIRE(out == "x=123");

  std::ostringstream os;
  os << yapb::SigFigs{0.1, 2} << "s";
  REQUIRE(os.str() == "1.0e-1s");
}
