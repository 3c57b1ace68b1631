#include <yapb/glyph/braille.h>
#include <yapb/glyph/tables.h>
#include <yapb/glyph/utf8.h>

#include "test_framework.h"

#include <string>

TEST_CASE("utf8 encodes every length class") {
  REQUIRE(yapb::utf8(U'A') == "A");
  REQUIRE(yapb::utf8(0x00B5) == "\xC2\xB5");
  REQUIRE(yapb::utf8(0x2588) == "\xE2\x96\x88");
  REQUIRE(yapb::utf8(0x1F600) == "\xF0\x9F\x98\x80");
}

TEST_CASE("utf8 replaces surrogates and out-of-range code points") {
  const std::string replacement = yapb::utf8(yapb::kReplacementChar);
  REQUIRE(yapb::utf8(0xD800) == replacement);
  REQUIRE(yapb::utf8(0x110000) == replacement);
}

TEST_CASE("appendUtf8 appends without clearing") {
  std::string out = "x";
  yapb::appendUtf8(out, 0x2801);
  REQUIRE(out == "x\xE2\xA0\x81");
}

TEST_CASE("brailleBinary fills the left column first") {
  REQUIRE(yapb::brailleBinary(0x00) == 0x2800);
  REQUIRE(yapb::brailleBinary(0x01) == 0x2801);
  REQUIRE(yapb::brailleBinary(0x08) == 0x2840);
  REQUIRE(yapb::brailleBinary(0x0F) == 0x2847);
  REQUIRE(yapb::brailleBinary(0x10) == 0x2808);
  REQUIRE(yapb::brailleBinary(0x80) == 0x2880);
  REQUIRE(yapb::brailleBinary(0xFF) == 0x28FF);
}

TEST_CASE("brailleBinary is a bijection onto the braille block") {
  bool seen[256] = {};
  for (unsigned v = 0; v < 256; ++v) {
    const char32_t cp = yapb::brailleBinary(static_cast<std::uint8_t>(v));
    REQUIRE(cp >= 0x2800);
    REQUIRE(cp <= 0x28FF);
    REQUIRE_FALSE(seen[cp - 0x2800]);
    seen[cp - 0x2800] = true;
  }
}

TEST_CASE("Glyph tables have the documented sizes") {
  REQUIRE(yapb::kSpinner4Glyphs.size() == 4);
  REQUIRE(yapb::kSpinner8Glyphs.size() == 8);
  REQUIRE(yapb::kCounter16Glyphs.size() == 16);
  REQUIRE(yapb::kBlockEighths.size() == 8);
  REQUIRE(yapb::kCounter16Glyphs[15] == yapb::kFullBlock);
}
