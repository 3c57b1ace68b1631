#pragma once

#include <array>

namespace yapb {

inline constexpr char32_t kFullBlock = 0x2588;  // █

// Left-aligned partial blocks by eighths. Index 0 has no glyph of its own;
// the bar writes its fill character there instead.
inline constexpr std::array<char32_t, 8> kBlockEighths = {{
    0x0020,
    0x258F,  // ▏
    0x258E,  // ▎
    0x258D,  // ▍
    0x258C,  // ▌
    0x258B,  // ▋
    0x258A,  // ▊
    0x2589,  // ▉
}};

// A single quadrant rotating clockwise from the lower left.
inline constexpr std::array<char32_t, 4> kSpinner4Glyphs = {{
    0x2596,  // ▖
    0x2598,  // ▘
    0x259D,  // ▝
    0x2597,  // ▗
}};

// A single braille dot walking around the cell.
inline constexpr std::array<char32_t, 8> kSpinner8Glyphs = {{
    0x2840,  // ⡀
    0x2804,  // ⠄
    0x2802,  // ⠂
    0x2801,  // ⠁
    0x2808,  // ⠈
    0x2810,  // ⠐
    0x2820,  // ⠠
    0x2880,  // ⢀
}};

// Quadrants counting in binary: bit 0 upper left, bit 1 lower left,
// bit 2 upper right, bit 3 lower right.
inline constexpr std::array<char32_t, 16> kCounter16Glyphs = {{
    0x0020,
    0x2598,  // ▘
    0x2596,  // ▖
    0x258C,  // ▌
    0x259D,  // ▝
    0x2580,  // ▀
    0x259E,  // ▞
    0x259B,  // ▛
    0x2597,  // ▗
    0x259A,  // ▚
    0x2584,  // ▄
    0x2599,  // ▙
    0x2590,  // ▐
    0x259C,  // ▜
    0x259F,  // ▟
    0x2588,  // █
}};

}  // namespace yapb
