#pragma once

// project headers --------------------------------------
#include "tdcmk3/angle.h"

namespace tdcmk3 {

// The TDC Mark III works in yards; 2025.4 yards per nautical mile.
inline constexpr float kYardsPerNauticalMile = 2025.4f;
inline constexpr float kSecondsPerHour = 3600.0f;

/// Mark 14, high speed setting.
inline constexpr float kMark14HighSpeedKn = 46.0f;
/// Mark 14, low speed setting.
inline constexpr float kMark14LowSpeedKn = 31.5f;
/// Mark 18 electric torpedo.
inline constexpr float kMark18SpeedKn = 29.0f;

constexpr float KnotsToYardsPerSecond(float speed_kn) {
  return speed_kn * kYardsPerNauticalMile / kSecondsPerHour;
}

/// Turn characteristics of a gyro-steered torpedo. Defaults are those of the Mark 14.
struct TorpedoSpec final {
  /// Initial straight run in yards; distance run along own course before the gyro engages.
  float initial_run_yd = 75.0f;
  /// Rate of turn in degrees per second while the gyro steers the torpedo onto its new course.
  float turn_rate_deg_s = 4.0f;
  /// Gyro angles below this magnitude, in degrees, are fired straight without a turn.
  float min_turn_deg = 0.1f;

  /// Turn radius in yards; r = v / ω. About 370 yards at 46 knots and 4°/s.
  float ComputeTurnRadius(float speed_kn) const;

  /// Time in seconds to turn through `gyro_angle`.
  float ComputeTurnTime(Angle gyro_angle) const;

  /// Distance, measured along the final torpedo track, from the point of fire to the end of the turn.
  ///
  /// Positive is forward along the final track. This is the reach profile the angle solver's cam follows.
  float ComputeReachAdvance(float speed_kn, Angle gyro_angle) const;

  /// Lateral offset of the final torpedo track from the point of fire, or transfer.
  ///
  /// Positive when the final track lies to port of the point of fire, seen along the final track, which
  /// is the case for starboard gyro angles.
  float ComputeTransfer(float speed_kn, Angle gyro_angle) const;

  /// Arc length of the turn in yards.
  float ComputeTurnArc(float speed_kn, Angle gyro_angle) const;
};

} // namespace tdcmk3
