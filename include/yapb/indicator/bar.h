#pragma once

#include <yapb/indicator/indicator.h>

#include <cstddef>

namespace yapb {

// High-resolution progress bar using block elements.
//
// The stored value is unrestricted; rendering clamps it to [0, 1] (NaN draws
// as empty). Width and fill are render-time options, so one Bar can be drawn
// at any width. Each rendered column is either a full block, one of seven
// eighth blocks for the single partial column, or the fill character.
class Bar final : public Indicator {
public:
  static constexpr std::size_t kDefaultWidth = 80;

  void set(float progress) { progress_ = progress; }
  void step(float delta) { progress_ += delta; }
  float get() const { return progress_; }

  void write(std::string& out, const RenderOptions& opts) const override;

private:
  float progress_ = 0.0f;
};

}  // namespace yapb
