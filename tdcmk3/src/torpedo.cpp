// TU header --------------------------------------------
#include "tdcmk3/torpedo.h"

// c++ headers ------------------------------------------
#include <cmath>

namespace tdcmk3 {

namespace {

/// Turn radius actually flown for `gyro_angle`; zero when the torpedo is fired straight.
float EffectiveTurnRadius(TorpedoSpec const& torpedo, float speed_kn, Angle gyro_angle) {
  if (gyro_angle.Abs() < Angle::FromDeg(torpedo.min_turn_deg)) {
    return 0.0f;
  }
  return torpedo.ComputeTurnRadius(speed_kn);
}

} // namespace

float TorpedoSpec::ComputeTurnRadius(float speed_kn) const {
  float const omega_rad_s = Angle::FromDeg(this->turn_rate_deg_s).AsRad();
  return KnotsToYardsPerSecond(speed_kn) / omega_rad_s;
}

float TorpedoSpec::ComputeTurnTime(Angle gyro_angle) const {
  if (gyro_angle.Abs() < Angle::FromDeg(this->min_turn_deg)) {
    return 0.0f;
  }
  return gyro_angle.Abs().ToDeg() / this->turn_rate_deg_s;
}

// In the frame of own course (x forward, y starboard) the turn ends at
//   (P + r sin|G|, sgn(G) r (1 - cos|G|)).
// Projecting onto the final heading gives the advance and the (negated) lateral offset.

float TorpedoSpec::ComputeReachAdvance(float speed_kn, Angle gyro_angle) const {
  float const r = EffectiveTurnRadius(*this, speed_kn, gyro_angle);
  return this->initial_run_yd * gyro_angle.Cos() + r * gyro_angle.Abs().Sin();
}

float TorpedoSpec::ComputeTransfer(float speed_kn, Angle gyro_angle) const {
  float const r = EffectiveTurnRadius(*this, speed_kn, gyro_angle);
  return this->initial_run_yd * gyro_angle.Sin() + gyro_angle.Sign() * r * (1.0f - gyro_angle.Abs().Cos());
}

float TorpedoSpec::ComputeTurnArc(float speed_kn, Angle gyro_angle) const {
  float const r = EffectiveTurnRadius(*this, speed_kn, gyro_angle);
  return gyro_angle.Abs().AsRad() * r;
}

} // namespace tdcmk3
