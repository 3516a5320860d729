// TU header --------------------------------------------
#include "tdcmk3/geometry.h"

// c++ headers ------------------------------------------
#include <cmath>

namespace tdcmk3 {

char GetSideLetter(Side side) {
  return (side == Side::kPort) ? 'P' : 'S';
}

char const* GetSideName(Side side) {
  return (side == Side::kPort) ? "Port" : "Starboard";
}

float NormalizeAngle(float deg) {
  float r = std::fmod(deg, 360.0f);
  if (r < 0.0f) r += 360.0f;
  if (r >= 360.0f) r = 0.0f;
  return r;
}

float NormalizeSigned(float deg) {
  return std::remainder(deg, 360.0f); // [-180, 180]
}

raylib::Vector2 HeadingToVector(Angle heading) {
  return { heading.Sin(), heading.Cos() };
}

Angle VectorToHeading(raylib::Vector2 const& v) {
  return Angle(std::atan2(v.x, v.y)).WrapAround();
}

raylib::Vector2 RotateCompass(raylib::Vector2 const& v, Angle angle) {
  // raymath rotates counter-clockwise in the (east, north) plane.
  return v.Rotate(-angle.AsRad());
}

SidedAngle ComputeAngleOnBow(
  [[maybe_unused]] Angle own_course,
  Angle target_bearing,
  Angle target_course
) {
  // Bearing from the target to own ship.
  Angle const reciprocal_bearing = (target_bearing + Angle::Pi()).WrapAround();

  Angle const relative = (reciprocal_bearing - target_course).WrapSigned();

  return SidedAngle {
    .angle = relative.Abs(),
    .side = (relative.AsRad() >= 0.0f) ? Side::kStarboard : Side::kPort,
  };
}

} // namespace tdcmk3
