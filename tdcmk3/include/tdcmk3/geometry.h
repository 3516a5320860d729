#pragma once

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "tdcmk3/angle.h"

namespace tdcmk3 {

enum class Side {
  kPort,
  kStarboard,
};

/// Single letter used on attack sheets: 'P' or 'S'.
char GetSideLetter(Side side);
char const* GetSideName(Side side);

/// Unsigned angle in [0°, 180°] with the side it lies on.
struct SidedAngle final {
  Angle angle = Angle(0.0f);
  Side side = Side::kStarboard;
};

/// Map any degree value into [0, 360).
float NormalizeAngle(float deg);

/// Map any degree value into [-180, 180].
float NormalizeSigned(float deg);

/// Compass heading (0 = north, clockwise) to a unit vector; x is east, y is north.
raylib::Vector2 HeadingToVector(Angle heading);

/// Inverse of `HeadingToVector`, for any non-zero vector. Result is in [0, 2π).
Angle VectorToHeading(raylib::Vector2 const& v);

/// Rotate `v` clockwise (compass sense) by `angle`.
raylib::Vector2 RotateCompass(raylib::Vector2 const& v, Angle angle);

/// Compute the angle on bow: the angle at which the target sees own ship, relative to the target's bow.
///
/// * `own_course`: Not needed for the geometry; kept so the call reads like the TDC dial inputs.
/// * `target_bearing`: True bearing from own ship to the target.
/// * `target_course`: True course of the target.
///
/// ## Returns
/// Angle in [0°, 180°]; starboard when own ship is on the target's starboard side (relative bearing >= 0).
SidedAngle ComputeAngleOnBow(
  Angle own_course,
  Angle target_bearing,
  Angle target_course
);

} // namespace tdcmk3
