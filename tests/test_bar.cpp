#include <yapb/indicator/bar.h>

#include "test_framework.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace {

std::string render(float progress, std::size_t width, char32_t fill = U' ') {
  yapb::Bar bar;
  bar.set(progress);
  yapb::RenderOptions opts;
  opts.width = width;
  opts.fill = fill;
  return bar.str(opts);
}

std::string repeat(const std::string& s, std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) out += s;
  return out;
}

const std::string kFull = "\xE2\x96\x88";

}  // namespace

TEST_CASE("Bar draws whole blocks then one partial block") {
  REQUIRE(render(0.55f, 10) == repeat(kFull, 5) + "\xE2\x96\x8C" + "    ");
}

TEST_CASE("Bar fills whole columns for exact tenths") {
  REQUIRE(render(0.1f, 10) == repeat(kFull, 1) + std::string(9, ' '));
  REQUIRE(render(0.3f, 10) == repeat(kFull, 3) + std::string(7, ' '));
  REQUIRE(render(0.7f, 10) == repeat(kFull, 7) + std::string(3, ' '));
  REQUIRE(render(0.9f, 10) == repeat(kFull, 9) + " ");
}

TEST_CASE("Bar endpoints") {
  REQUIRE(render(0.0f, 6) == "      ");
  REQUIRE(render(1.0f, 6) == repeat(kFull, 6));
}

TEST_CASE("Bar clamps out-of-range progress at render time") {
  REQUIRE(render(1.5f, 4) == repeat(kFull, 4));
  REQUIRE(render(-1.0f, 4) == "    ");
  REQUIRE(render(std::numeric_limits<float>::infinity(), 3) == repeat(kFull, 3));
  REQUIRE(render(-std::numeric_limits<float>::infinity(), 3) == "   ");
  REQUIRE(render(std::numeric_limits<float>::quiet_NaN(), 3) == "   ");
}

TEST_CASE("Bar keeps the raw value") {
  yapb::Bar bar;
  bar.set(0.25f);
  bar.step(1.0f);
  REQUIRE(bar.get() == 1.25f);
}

TEST_CASE("Bar picks the eighth block by truncation") {
  REQUIRE(render(0.0625f, 1) == " ");
  REQUIRE(render(0.125f, 1) == "\xE2\x96\x8F");
  REQUIRE(render(0.999f, 1) == "\xE2\x96\x89");
}

TEST_CASE("Bar uses the fill character for empty columns") {
  REQUIRE(render(0.5f, 4, U'-') == repeat(kFull, 2) + "--");
  REQUIRE(render(0.0f, 2, 0x00B7) == "\xC2\xB7\xC2\xB7");
}

TEST_CASE("Bar width is honoured exactly") {
  REQUIRE(render(0.3f, 0).empty());
  yapb::Bar bar;
  bar.set(0.42f);
  REQUIRE(bar.str() == render(0.42f, yapb::Bar::kDefaultWidth));
}

TEST_CASE("Bar streams with width and fill from the stream") {
  yapb::Bar bar;
  bar.set(0.5f);
  std::ostringstream os;
  os << std::setw(4) << std::setfill('.') << bar << '|';
  REQUIRE(os.str() == repeat(kFull, 2) + "..|");
}
