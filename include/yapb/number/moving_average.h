#pragma once

namespace yapb {

// Exponential moving average for smoothing rates before display.
class MovingAverage {
public:
  // `alpha` in (0, 1] weights the newest sample. It is kept as given.
  explicit MovingAverage(double alpha, double initial = 0.0) : alpha_(alpha), value_(initial) {}

  void update(double sample) { value_ = alpha_ * sample + (1.0 - alpha_) * value_; }

  double get() const { return value_; }
  double alpha() const { return alpha_; }

private:
  double alpha_;
  double value_;
};

}  // namespace yapb
