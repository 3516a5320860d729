#pragma once

// c++ headers ------------------------------------------
#include <vector>

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/torpedo.h"

namespace tdcmk3 {

/// Default spacing, in yards along the path, between trajectory samples.
inline constexpr float kDefaultSampleSpacingYd = 10.0f;

/// Torpedo path from the point of fire to the intercept point.
///
/// All positions are in yards in a frame centered on the point of fire: x is east, y is north.
struct Trajectory final {
  // Phase 1: initial straight run along own course.
  float initial_run_distance_yd = 0.0f;
  float initial_run_time_s = 0.0f;
  raylib::Vector2 initial_run_end = { 0.0f, 0.0f };

  // Phase 2: gyro turn. Radius, arc and time are zero when no turn is made.
  Angle turn_angle = Angle(0.0f); // Signed: Positive is starboard, negative is port.
  float turn_radius_yd = 0.0f;
  float turn_arc_length_yd = 0.0f;
  float turn_time_s = 0.0f;
  raylib::Vector2 turn_center = { 0.0f, 0.0f };
  raylib::Vector2 turn_end = { 0.0f, 0.0f };

  // Phase 3: final straight run to the intercept point.
  Angle final_heading = Angle(0.0f);
  float final_run_distance_yd = 0.0f;
  float final_run_time_s = 0.0f;

  float total_distance_yd = 0.0f;
  float total_time_s = 0.0f;

  /// Path samples for plotting, starting at the point of fire. Every phase end point is included.
  std::vector<raylib::Vector2> points;

  bool HasTurn() const { return this->turn_radius_yd > 0.0f; }
};

struct TurnGeometry final {
  raylib::Vector2 center = { 0.0f, 0.0f };
  raylib::Vector2 end = { 0.0f, 0.0f };
  float arc_length_yd = 0.0f;
};

/// Compute the constant-radius turn that starts at `start` on `initial_heading` and ends on
/// `initial_heading + gyro_angle`.
///
/// The turn center lies `turn_radius_yd` off the initial heading, to starboard for positive gyro angles
/// and to port for negative ones. Gyro angles below `min_turn` give no turn: the end is `start`, the
/// center is the origin and the arc length is zero.
TurnGeometry ComputeTurnGeometry(
  raylib::Vector2 const& start,
  Angle initial_heading,
  Angle gyro_angle,
  float turn_radius_yd,
  Angle min_turn
);

/// Compute the three-phase curved trajectory of a torpedo fired with `gyro_angle` toward `intercept`.
///
/// * `own_course`: Course of own ship, and of the torpedo during the initial run.
/// * `gyro_angle`: Signed gyro angle. Positive is starboard, negative is port.
/// * `torpedo_speed_kn`: Torpedo speed, must be positive.
/// * `intercept`: Intercept point relative to the point of fire (yards, x east, y north).
/// * `sample_spacing_yd`: Maximum path distance between consecutive samples, must be positive.
Trajectory ComputeCurvedTrajectory(
  Angle own_course,
  Angle gyro_angle,
  float torpedo_speed_kn,
  raylib::Vector2 const& intercept,
  TorpedoSpec const& torpedo_spec = TorpedoSpec(),
  float sample_spacing_yd = kDefaultSampleSpacingYd
);

} // namespace tdcmk3
