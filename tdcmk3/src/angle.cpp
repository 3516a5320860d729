// TU header --------------------------------------------
#include "tdcmk3/angle.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <numbers>

// external headers -------------------------------------
#include "raylib.h"

namespace tdcmk3 {

Angle Angle::FromDeg(float deg) {
  return Angle(deg * DEG2RAD);
}
Angle Angle::RightAngle() {
  return Angle(std::numbers::pi_v<float> * 0.5f);
}
Angle Angle::Pi() {
  return Angle(std::numbers::pi_v<float>);
}

Angle Angle::Abs() const {
  return Angle(std::abs(rad_));
}
float Angle::Sign() const {
  return (rad_ > 0.0f) ? 1.0f : ((rad_ < 0.0f) ? -1.0f : 0.0f);
}

Angle Angle::WrapAround() const {
  constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
  float r = std::fmod(rad_, kTwoPi);
  if (r < 0.0f) r += kTwoPi;
  // A tiny negative remainder rounds up to exactly 2π.
  if (r >= kTwoPi) r = 0.0f;
  return Angle(r);
}

Angle Angle::WrapSigned() const {
  return Angle(std::remainder(rad_, 2.0f * std::numbers::pi_v<float>));
}

float Angle::ToDeg() const {
  return rad_ * RAD2DEG;
}

float Angle::Sin() const { return std::sin(rad_); }
float Angle::Cos() const { return std::cos(rad_); }
float Angle::Tan() const { return std::tan(rad_); }

} // namespace tdcmk3
