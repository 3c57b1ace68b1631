#include <yapb/indicator/spinner.h>

#include <yapb/glyph/braille.h>
#include <yapb/glyph/utf8.h>

namespace yapb {

void Spinner::write(std::string& out, const RenderOptions&) const {
  appendUtf8(out, glyph());
}

char32_t Counter256::glyph() const {
  return brailleBinary(state_);
}

char32_t Snake::glyph() const {
  constexpr std::uint32_t period = 2 * kWobble;
  const std::uint32_t phase = state_ % period;

  // Run length sweeps 6,5,4,3,2,1,2,3,4,5 over one period.
  const std::uint32_t length = (phase >= kWobble ? phase - kWobble : kWobble - phase) + 1;
  const auto bits = static_cast<std::uint8_t>(~(0xFFu << length));

  // The head advances kWobble dots per period; within a period the tail only
  // catches up while the run is shrinking.
  const std::uint32_t position = kWobble * (state_ / period) + (phase > kWobble ? phase - kWobble : 0);
  const unsigned r = position % 8;
  const auto snake = static_cast<std::uint8_t>((bits >> r) | (bits << ((8 - r) % 8)));

  // The right column runs bottom to top so the run wraps around the cell.
  const auto value = static_cast<std::uint8_t>((snake & 0x0F) |
                                               ((snake & 0x80) >> 3) |
                                               ((snake & 0x40) >> 1) |
                                               ((snake & 0x20) << 1) |
                                               ((snake & 0x10) << 3));
  return brailleBinary(value);
}

std::unique_ptr<Spinner> makeSpinner(SpinnerKind kind) {
  switch (kind) {
    case SpinnerKind::Spinner4:
      return std::make_unique<Spinner4>();
    case SpinnerKind::Spinner8:
      return std::make_unique<Spinner8>();
    case SpinnerKind::Counter16:
      return std::make_unique<Counter16>();
    case SpinnerKind::Counter256:
      return std::make_unique<Counter256>();
    case SpinnerKind::Snake:
      return std::make_unique<Snake>();
  }
  return nullptr;
}

std::string_view spinnerKindName(SpinnerKind kind) {
  switch (kind) {
    case SpinnerKind::Spinner4:
      return "spinner4";
    case SpinnerKind::Spinner8:
      return "spinner8";
    case SpinnerKind::Counter16:
      return "counter16";
    case SpinnerKind::Counter256:
      return "counter256";
    case SpinnerKind::Snake:
      return "snake";
  }
  return "unknown";
}

}  // namespace yapb
