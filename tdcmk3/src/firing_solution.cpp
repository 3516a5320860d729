// TU header --------------------------------------------
#include "tdcmk3/firing_solution.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <format>
#include <utility>

// project headers --------------------------------------
#include "tdcmk3/log.h"

// Bureau of Ordnance OP 1631: Torpedo Data Computer Mark III.

namespace tdcmk3 {

namespace {

/// Returns an empty string when `problem` can be solved numerically with `config`, otherwise the reason
/// it cannot.
std::string ValidateProblem(FiringProblem const& problem, SolverConfig const& config) {
  bool const finite =
    std::isfinite(problem.own_course.AsRad()) &&
    std::isfinite(problem.own_speed_kn) &&
    std::isfinite(problem.target_bearing.AsRad()) &&
    std::isfinite(problem.target_range_yd) &&
    std::isfinite(problem.target_course.AsRad()) &&
    std::isfinite(problem.target_speed_kn) &&
    std::isfinite(problem.torpedo_speed_kn);
  if (!finite) {
    return "Invalid input - all values must be finite";
  }
  if (problem.own_speed_kn < 0.0f || problem.target_speed_kn < 0.0f || problem.target_range_yd < 0.0f) {
    return "Invalid input - speeds and range must not be negative";
  }
  if (problem.torpedo_speed_kn <= 0.0f) {
    return "Invalid input - torpedo speed must be positive";
  }

  TorpedoSpec const& torpedo = config.torpedo;
  if (!(config.sample_spacing_yd > 0.0f) || !std::isfinite(config.sample_spacing_yd)) {
    return std::format("Invalid configuration - sample spacing must be positive; spacing:{}", config.sample_spacing_yd);
  }
  if (!(config.blend > 0.0f && config.blend <= 1.0f)) {
    return std::format("Invalid configuration - blend weight must be in (0, 1]; blend:{}", config.blend);
  }
  if (!(torpedo.turn_rate_deg_s > 0.0f) || !std::isfinite(torpedo.turn_rate_deg_s)) {
    return std::format("Invalid configuration - turn rate must be positive; rate:{}", torpedo.turn_rate_deg_s);
  }
  if (!(torpedo.initial_run_yd >= 0.0f) || !std::isfinite(torpedo.initial_run_yd)) {
    return std::format("Invalid configuration - initial run must not be negative; run:{}", torpedo.initial_run_yd);
  }
  return {};
}

FiringSolution MakeInvalidSolution(
  SidedAngle const& angle_on_bow,
  Angle target_bearing_relative,
  std::string message
) {
  FiringSolution solution;
  solution.angle_on_bow = angle_on_bow;
  solution.target_bearing_relative = target_bearing_relative;
  solution.valid = false;
  solution.message = std::move(message);
  return solution;
}

} // namespace

std::optional<Angle> ComputeLeadAngle(
  float target_speed_kn,
  float torpedo_speed_kn,
  Angle track_angle
) {
  float const sin_lead = (target_speed_kn / torpedo_speed_kn) * track_angle.Sin();
  if (!(std::abs(sin_lead) <= 1.0f)) {
    // No solution; target is too fast leaving no valid lead angle for given torpedo speed and track.
    return std::nullopt;
  }
  return Angle(std::asin(sin_lead));
}

float ComputeTorpedoRun(
  float target_range_yd,
  Angle track_angle,
  Angle lead_angle
) {
  float const sin_track = track_angle.Sin();
  if (lead_angle.AsRad() == 0.0f || sin_track == 0.0f) {
    // Direct shot.
    return target_range_yd;
  }

  // Angle at the target's present position.
  Angle const target_vertex = Angle::Pi() - track_angle - lead_angle;

  return std::abs(target_range_yd * target_vertex.Sin() / sin_track);
}

FiringSolution ComputeFiringSolution(
  FiringProblem const& problem,
  bool want_trajectory,
  SolverConfig const& config
) {
  Angle const own_course = problem.own_course.WrapAround();
  Angle const target_bearing = problem.target_bearing.WrapAround();
  Angle const target_course = problem.target_course.WrapAround();

  SidedAngle const angle_on_bow = ComputeAngleOnBow(own_course, target_bearing, target_course);
  Angle const target_bearing_relative = (target_bearing - own_course).WrapSigned();

  if (std::string reason = ValidateProblem(problem, config); !reason.empty()) {
    TDCMK3_LOG_WARN("firing problem rejected: {}", reason);
    return MakeInvalidSolution(angle_on_bow, target_bearing_relative, std::move(reason));
  }

  TorpedoSpec const& torpedo = config.torpedo;
  Angle const min_turn = Angle::FromDeg(torpedo.min_turn_deg);

  float const torpedo_speed_yps = KnotsToYardsPerSecond(problem.torpedo_speed_kn);
  float const target_speed_yps = KnotsToYardsPerSecond(problem.target_speed_kn);

  // Present target position and velocity relative to own ship.
  raylib::Vector2 const target_position = HeadingToVector(target_bearing) * problem.target_range_yd;
  raylib::Vector2 const target_velocity = HeadingToVector(target_course) * target_speed_yps;

  // Initial estimate: straight run at torpedo speed to the present range.
  float run_time_s = problem.target_range_yd / torpedo_speed_yps;

  Angle gyro_angle = Angle(0.0f);
  Angle torpedo_heading = own_course;
  Angle residual = Angle(0.0f);
  raylib::Vector2 intercept = target_position;

  for (uint32_t iteration = 0; iteration < config.iterations; ++iteration) {
    // Where will the target be after the run?
    intercept = target_position + target_velocity * run_time_s;

    if (want_trajectory && iteration > 0) {
      Trajectory const traj = ComputeCurvedTrajectory(
        own_course,
        gyro_angle,
        problem.torpedo_speed_kn,
        intercept,
        torpedo,
        config.sample_spacing_yd
      );
      if (traj.total_time_s > 0.0f) {
        run_time_s = traj.total_time_s;
      }
    }

    Angle const previous_gyro_angle = gyro_angle;
    Angle new_gyro_angle = Angle(0.0f);

    if (want_trajectory && gyro_angle.Abs() > min_turn) {
      // Aim from where the turn ends rather than from the point of fire.
      TurnGeometry const turn = ComputeTurnGeometry(
        HeadingToVector(own_course) * torpedo.initial_run_yd,
        own_course,
        gyro_angle,
        torpedo.ComputeTurnRadius(problem.torpedo_speed_kn),
        min_turn
      );

      Angle const required_heading = VectorToHeading(intercept - turn.end);
      new_gyro_angle = (required_heading - own_course).WrapSigned();

      // Damped update keeps the fixed-point iteration stable.
      gyro_angle = new_gyro_angle * config.blend + gyro_angle * (1.0f - config.blend);
    }
    else {
      Angle const intercept_bearing = VectorToHeading(intercept);
      new_gyro_angle = (intercept_bearing - own_course).WrapSigned();
      gyro_angle = new_gyro_angle;
    }

    residual = (new_gyro_angle - previous_gyro_angle).WrapSigned().Abs();
    torpedo_heading = (own_course + gyro_angle).WrapAround();
  }

  FiringSolution solution;
  solution.angle_on_bow = angle_on_bow;
  solution.target_bearing_relative = target_bearing_relative;
  solution.residual = residual;
  solution.converged = residual.ToDeg() < config.convergence_tolerance_deg;

  if (!solution.converged) {
    TDCMK3_LOG_WARN("gyro angle did not converge; last correction:{:.3f} deg", residual.ToDeg());
  }

  // Track angle: torpedo heading against the target's reciprocal course.
  {
    Angle const track_raw = (torpedo_heading - target_course + Angle::Pi()).WrapSigned();
    solution.track_angle = SidedAngle {
      .angle = track_raw.Abs(),
      .side = (track_raw.AsRad() >= 0.0f) ? Side::kStarboard : Side::kPort,
    };
  }

  std::optional<Angle> const lead_angle = ComputeLeadAngle(
    problem.target_speed_kn,
    problem.torpedo_speed_kn,
    solution.track_angle.angle
  );
  if (!lead_angle.has_value()) {
    return MakeInvalidSolution(
      angle_on_bow,
      target_bearing_relative,
      "No solution - target speed exceeds torpedo capability at this angle"
    );
  }

  solution.lead_angle = lead_angle.value();
  solution.gyro_angle = gyro_angle.WrapSigned();
  solution.gyro_angle_360 = gyro_angle.WrapAround();
  solution.torpedo_heading = torpedo_heading;

  if (want_trajectory) {
    solution.trajectory = ComputeCurvedTrajectory(
      own_course,
      gyro_angle,
      problem.torpedo_speed_kn,
      intercept,
      torpedo,
      config.sample_spacing_yd
    );
    solution.torpedo_run_yd = solution.trajectory->total_distance_yd;
    solution.torpedo_run_time_s = solution.trajectory->total_time_s;
  }
  else {
    solution.torpedo_run_yd = intercept.Length();
    solution.torpedo_run_time_s = solution.torpedo_run_yd / torpedo_speed_yps;
  }

  solution.valid = true;
  solution.message = solution.converged
    ? "Solution computed"
    : std::format("Solution computed; gyro angle still moving {:.2f} deg per iteration", residual.ToDeg());

  return solution;
}

} // namespace tdcmk3
