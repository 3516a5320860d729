// TU header --------------------------------------------
#include "tdcmk3/trajectory.h"

// c++ headers ------------------------------------------
#include <cassert>
#include <cmath>
#include <cstdint>

#include <algorithm>

// project headers --------------------------------------
#include "tdcmk3/geometry.h"

namespace tdcmk3 {

namespace {

/// Number of equal steps needed so that no step exceeds `spacing`; at least one.
uint32_t ComputeStepCount(float distance, float spacing) {
  return std::max(1u, static_cast<uint32_t>(std::ceil(distance / spacing)));
}

} // namespace

TurnGeometry ComputeTurnGeometry(
  raylib::Vector2 const& start,
  Angle initial_heading,
  Angle gyro_angle,
  float turn_radius_yd,
  Angle min_turn
) {
  if (gyro_angle.Abs() < min_turn) {
    // No turn; straight shot.
    return TurnGeometry {
      .center = { 0.0f, 0.0f },
      .end = start,
      .arc_length_yd = 0.0f,
    };
  }

  bool const turn_right = gyro_angle.AsRad() > 0.0f;

  // The center is a right angle off the initial heading, on the side of the turn.
  Angle const perpendicular = turn_right
    ? initial_heading + Angle::RightAngle()
    : initial_heading - Angle::RightAngle();

  raylib::Vector2 const center = start + HeadingToVector(perpendicular) * turn_radius_yd;

  // Swing the start point about the center by the gyro angle, clockwise for starboard turns.
  raylib::Vector2 const end = center + RotateCompass(start - center, gyro_angle);

  return TurnGeometry {
    .center = center,
    .end = end,
    .arc_length_yd = gyro_angle.Abs().AsRad() * turn_radius_yd,
  };
}

Trajectory ComputeCurvedTrajectory(
  Angle own_course,
  Angle gyro_angle,
  float torpedo_speed_kn,
  raylib::Vector2 const& intercept,
  TorpedoSpec const& torpedo_spec,
  float sample_spacing_yd
) {
  assert(torpedo_speed_kn > 0.0f);
  assert(sample_spacing_yd > 0.0f);

  float const torpedo_speed_yps = KnotsToYardsPerSecond(torpedo_speed_kn);

  Trajectory traj;

  raylib::Vector2 const start = { 0.0f, 0.0f };
  traj.points.push_back(start);

  // Phase 1: Initial straight run.
  {
    raylib::Vector2 const forward = HeadingToVector(own_course);

    traj.initial_run_distance_yd = torpedo_spec.initial_run_yd;
    traj.initial_run_time_s = torpedo_spec.initial_run_yd / torpedo_speed_yps;
    traj.initial_run_end = start + forward * torpedo_spec.initial_run_yd;

    for (float d = sample_spacing_yd; d < torpedo_spec.initial_run_yd; d += sample_spacing_yd) {
      traj.points.push_back(start + forward * d);
    }
    traj.points.push_back(traj.initial_run_end);
  }

  // Phase 2: Turn.
  traj.turn_angle = gyro_angle;
  {
    Angle const min_turn = Angle::FromDeg(torpedo_spec.min_turn_deg);

    if (gyro_angle.Abs() < min_turn) {
      traj.turn_end = traj.initial_run_end;
    }
    else {
      traj.turn_radius_yd = torpedo_spec.ComputeTurnRadius(torpedo_speed_kn);

      TurnGeometry const turn = ComputeTurnGeometry(
        traj.initial_run_end,
        own_course,
        gyro_angle,
        traj.turn_radius_yd,
        min_turn
      );

      traj.turn_center = turn.center;
      traj.turn_end = turn.end;
      traj.turn_arc_length_yd = turn.arc_length_yd;
      traj.turn_time_s = torpedo_spec.ComputeTurnTime(gyro_angle);

      raylib::Vector2 const radial = traj.initial_run_end - traj.turn_center;

      uint32_t const steps = ComputeStepCount(traj.turn_arc_length_yd, sample_spacing_yd);
      for (uint32_t i = 1; i < steps; ++i) {
        float const fraction = static_cast<float>(i) / static_cast<float>(steps);
        traj.points.push_back(traj.turn_center + RotateCompass(radial, gyro_angle * fraction));
      }
      traj.points.push_back(traj.turn_end);
    }
  }

  // Phase 3: Final straight run.
  {
    traj.final_heading = (own_course + gyro_angle).WrapAround();

    raylib::Vector2 const to_intercept = intercept - traj.turn_end;
    traj.final_run_distance_yd = to_intercept.Length();
    traj.final_run_time_s = traj.final_run_distance_yd / torpedo_speed_yps;

    // Sampled along the final heading; this is the path actually run, which reaches the intercept point
    // only once the gyro angle is solved.
    raylib::Vector2 const forward = HeadingToVector(traj.final_heading);

    uint32_t const steps = ComputeStepCount(traj.final_run_distance_yd, sample_spacing_yd);
    for (uint32_t i = 1; i <= steps; ++i) {
      float const fraction = static_cast<float>(i) / static_cast<float>(steps);
      traj.points.push_back(traj.turn_end + forward * (traj.final_run_distance_yd * fraction));
    }
  }

  traj.total_distance_yd = traj.initial_run_distance_yd + traj.turn_arc_length_yd + traj.final_run_distance_yd;
  traj.total_time_s = traj.initial_run_time_s + traj.turn_time_s + traj.final_run_time_s;

  return traj;
}

} // namespace tdcmk3
