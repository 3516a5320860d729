#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <optional>
#include <string>

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/geometry.h"
#include "tdcmk3/torpedo.h"
#include "tdcmk3/trajectory.h"

namespace tdcmk3 {

/// Inputs to the TDC, as set on its dials.
struct FiringProblem final {
  Angle own_course = Angle(0.0f);
  float own_speed_kn = 0.0f;
  /// True bearing from own ship to the target.
  Angle target_bearing = Angle(0.0f);
  float target_range_yd = 0.0f;
  Angle target_course = Angle(0.0f);
  float target_speed_kn = 0.0f;
  float torpedo_speed_kn = kMark14HighSpeedKn;
};

struct SolverConfig final {
  TorpedoSpec torpedo;
  /// Fixed number of intercept refinements.
  uint32_t iterations = 10;
  /// Weight of the new gyro estimate in the damped update; the previous estimate gets the rest.
  float blend = 0.7f;
  /// The solution is reported converged when the last correction is below this, in degrees.
  float convergence_tolerance_deg = 0.05f;
  float sample_spacing_yd = kDefaultSampleSpacingYd;
};

struct FiringSolution final {
  Angle gyro_angle = Angle(0.0f);     // Signed, [-180°, 180°]: Positive is starboard, negative is port.
  Angle gyro_angle_360 = Angle(0.0f); // Same angle in [0°, 360°).
  SidedAngle track_angle;
  SidedAngle angle_on_bow;
  Angle lead_angle = Angle(0.0f);
  Angle target_bearing_relative = Angle(0.0f); // Signed, relative to own bow.
  Angle torpedo_heading = Angle(0.0f);
  float torpedo_run_yd = 0.0f;
  float torpedo_run_time_s = 0.0f;

  /// Magnitude of the last gyro correction made by the solver.
  Angle residual = Angle(0.0f);
  bool converged = false;

  /// When false, only `angle_on_bow`, `target_bearing_relative` and `message` carry meaning.
  bool valid = false;
  std::string message;

  std::optional<Trajectory> trajectory;
};

/// Compute the lead (deflection) angle from the torpedo triangle:
/// sin(lead) = target_speed / torpedo_speed * sin(track_angle).
///
/// ## Returns
/// `std::nullopt` when |sin(lead)| > 1, i.e. the target cannot be led at this geometry and speed.
std::optional<Angle> ComputeLeadAngle(
  float target_speed_kn,
  float torpedo_speed_kn,
  Angle track_angle
);

/// Torpedo run from the torpedo triangle, by the sine rule. Returns the range for a zero lead angle.
float ComputeTorpedoRun(
  float target_range_yd,
  Angle track_angle,
  Angle lead_angle
);

/// Compute the firing solution for `problem`.
///
/// The intercept point is refined a fixed number of times. With `want_trajectory` the curved torpedo
/// path is modeled and returned with the solution; otherwise the torpedo is assumed to run straight from
/// the point of fire.
///
/// Never throws: a problem without a solution, or with invalid numeric inputs or `config`, gives
/// `valid == false`.
FiringSolution ComputeFiringSolution(
  FiringProblem const& problem,
  bool want_trajectory = true,
  SolverConfig const& config = SolverConfig()
);

} // namespace tdcmk3
