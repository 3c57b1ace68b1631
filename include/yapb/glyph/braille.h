#pragma once

#include <cstdint>

namespace yapb {

constexpr char32_t kBrailleBase = 0x2800;

// Maps a natural little-endian 8-dot bitmap onto a braille cell.
//
// Unicode assigns braille bits by dot number:
//   1 4        0x01 0x08
//   2 5   ->   0x02 0x10
//   3 6        0x04 0x20
//   7 8        0x40 0x80
// The input instead counts the left column top to bottom (bits 0-2), then
// bit 3 for the bottom-left dot, bits 4-6 for the right column and bit 7 for
// the bottom-right dot, so that counting upwards fills the left column first.
constexpr char32_t brailleBinary(std::uint8_t value) {
  const unsigned v = value;
  const unsigned cell = (v & 0x87u) | ((v & 0x08u) << 3) | ((v & 0x70u) >> 1);
  return kBrailleBase + static_cast<char32_t>(cell);
}

}  // namespace yapb
