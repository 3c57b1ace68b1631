#pragma once

#include <yapb/glyph/tables.h>
#include <yapb/indicator/indicator.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace yapb {

// A cyclic indicator driven by an unsigned counter.
//
// set() and step() are a handful of instructions; all the work is deferred
// to glyph(). Out-of-range input wraps or truncates, it is never rejected.
class Spinner : public Indicator {
public:
  // Sets the counter to an absolute value.
  virtual void set(std::uint32_t value) = 0;
  // Advances the counter `count` times, wrapping around.
  virtual void step(std::uint32_t count) = 0;

  virtual char32_t glyph() const = 0;

  // Always exactly one glyph; width is ignored.
  void write(std::string& out, const RenderOptions& opts) const override;
};

// Fixed-state spinner over an immutable glyph table.
template <std::size_t N, const std::array<char32_t, N>& Glyphs>
class TableSpinner final : public Spinner {
  static_assert(N > 0 && 256 % N == 0, "cycle length must divide the 8-bit counter range");

public:
  static constexpr std::size_t kCycleLength = N;

  // Truncating to 8 bits first is harmless since N divides 256.
  void set(std::uint32_t value) override {
    state_ = static_cast<std::uint8_t>(static_cast<std::uint8_t>(value) % N);
  }

  void step(std::uint32_t count) override {
    const auto sum = static_cast<std::uint8_t>(state_ + static_cast<std::uint8_t>(count));
    state_ = static_cast<std::uint8_t>(sum % N);
  }

  // state_ < N holds after every mutation.
  char32_t glyph() const override { return Glyphs[state_]; }

  std::uint8_t state() const { return state_; }

private:
  std::uint8_t state_ = 0;
};

// One quadrant turning clockwise.
using Spinner4 = TableSpinner<kSpinner4Glyphs.size(), kSpinner4Glyphs>;
// One braille dot turning around the cell.
using Spinner8 = TableSpinner<kSpinner8Glyphs.size(), kSpinner8Glyphs>;
// Quadrant blocks counting in binary.
using Counter16 = TableSpinner<kCounter16Glyphs.size(), kCounter16Glyphs>;

// 256 states: the counter itself is drawn as an 8-dot braille bitmap.
class Counter256 final : public Spinner {
public:
  void set(std::uint32_t value) override { state_ = static_cast<std::uint8_t>(value); }
  void step(std::uint32_t count) override {
    state_ = static_cast<std::uint8_t>(state_ + static_cast<std::uint8_t>(count));
  }

  char32_t glyph() const override;

  std::uint8_t state() const { return state_; }

private:
  std::uint8_t state_ = 0;
};

// A run of 1-6 braille dots travelling around the cell, growing and
// shrinking as it turns.
class Snake final : public Spinner {
public:
  // Half of the period over which the run length sweeps 6..1..6.
  static constexpr std::uint32_t kWobble = 5;

  void set(std::uint32_t value) override { state_ = value; }
  void step(std::uint32_t count) override { state_ += count; }

  char32_t glyph() const override;

  std::uint32_t state() const { return state_; }

private:
  std::uint32_t state_ = 0;
};

enum class SpinnerKind {
  Spinner4,
  Spinner8,
  Counter16,
  Counter256,
  Snake,
};

inline constexpr std::array<SpinnerKind, 5> kAllSpinnerKinds = {{
    SpinnerKind::Spinner4,
    SpinnerKind::Spinner8,
    SpinnerKind::Counter16,
    SpinnerKind::Counter256,
    SpinnerKind::Snake,
}};

// nullptr for a value outside SpinnerKind.
std::unique_ptr<Spinner> makeSpinner(SpinnerKind kind);

// Stable lowercase identifier ("spinner4", "snake", ...), "unknown" for a
// value outside SpinnerKind.
std::string_view spinnerKindName(SpinnerKind kind);

}  // namespace yapb
