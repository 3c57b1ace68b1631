#pragma once

#include <string>

namespace yapb {

constexpr char32_t kReplacementChar = 0xFFFD;

// Appends the UTF-8 encoding of `cp`. Surrogates and values past U+10FFFF
// are written as U+FFFD.
void appendUtf8(std::string& out, char32_t cp);

std::string utf8(char32_t cp);

}  // namespace yapb
