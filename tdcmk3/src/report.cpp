// TU header --------------------------------------------
#include "tdcmk3/report.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <format>
#include <iterator>
#include <string_view>

// project headers --------------------------------------
#include "tdcmk3/geometry.h"

namespace tdcmk3 {

namespace {

constexpr std::string_view kRule = "======================================================================";

void AppendSection(std::string& out, std::string_view title) {
  std::format_to(std::back_inserter(out), "\n-- {} --\n", title);
}

} // namespace

std::string FormatMinutesSeconds(float seconds) {
  int const total = static_cast<int>(std::lround(seconds));
  return std::format("{}:{:02}", total / 60, total % 60);
}

std::string FormatSolutionReport(
  FiringProblem const& problem,
  FiringSolution const& solution
) {
  std::string out;
  auto it = std::back_inserter(out);

  std::format_to(it, "{}\n  TDC MARK III - TORPEDO FIRE CONTROL SOLUTION\n{}\n", kRule, kRule);

  AppendSection(out, "INPUTS");
  std::format_to(it, "  Own course:       {:6.1f} deg\n", problem.own_course.WrapAround().ToDeg());
  std::format_to(it, "  Own speed:        {:6.1f} kn\n", problem.own_speed_kn);
  std::format_to(it, "  Target bearing:   {:6.1f} deg\n", problem.target_bearing.WrapAround().ToDeg());
  std::format_to(it, "  Target range:     {:6.0f} yd\n", problem.target_range_yd);
  std::format_to(it, "  Target course:    {:6.1f} deg\n", problem.target_course.WrapAround().ToDeg());
  std::format_to(it, "  Target speed:     {:6.1f} kn\n", problem.target_speed_kn);
  std::format_to(it, "  Torpedo speed:    {:6.1f} kn\n", problem.torpedo_speed_kn);

  if (!solution.valid) {
    std::format_to(it, "\nNO SOLUTION: {}\n", solution.message);
    return out;
  }

  AppendSection(out, "FIRING SOLUTION");
  std::format_to(
    it, "  Gyro angle:       {:+7.1f} deg ({:.1f} deg)\n",
    solution.gyro_angle.ToDeg(), solution.gyro_angle_360.ToDeg()
  );
  std::format_to(it, "  Torpedo heading:  {:7.1f} deg\n", solution.torpedo_heading.ToDeg());
  std::format_to(it, "  Lead angle:       {:7.1f} deg\n", solution.lead_angle.ToDeg());
  if (!solution.converged) {
    std::format_to(it, "  Not converged; last correction {:.3f} deg\n", solution.residual.ToDeg());
  }

  AppendSection(out, "GEOMETRY");
  std::format_to(
    it, "  Angle on bow:     {:7.1f} deg {}\n",
    solution.angle_on_bow.angle.ToDeg(), GetSideName(solution.angle_on_bow.side)
  );
  std::format_to(
    it, "  Track angle:      {:7.1f} deg {}\n",
    solution.track_angle.angle.ToDeg(), GetSideName(solution.track_angle.side)
  );
  std::format_to(
    it, "  Relative bearing: {:+7.1f} deg {}\n",
    solution.target_bearing_relative.ToDeg(),
    (solution.target_bearing_relative.AsRad() >= 0.0f) ? "to starboard" : "to port"
  );

  if (solution.trajectory.has_value()) {
    Trajectory const& traj = solution.trajectory.value();

    AppendSection(out, "TORPEDO TRAJECTORY (CURVED PATH)");
    std::format_to(it, "  Phase 1: initial run along own course\n");
    std::format_to(it, "    Distance:  {:6.0f} yd\n", traj.initial_run_distance_yd);
    std::format_to(it, "    Time:      {:6.1f} s\n", traj.initial_run_time_s);

    if (traj.HasTurn()) {
      std::format_to(
        it, "  Phase 2: gyro turn to {}\n",
        (traj.turn_angle.AsRad() > 0.0f) ? "starboard" : "port"
      );
      std::format_to(it, "    Turn angle:  {:5.1f} deg\n", traj.turn_angle.Abs().ToDeg());
      std::format_to(it, "    Turn radius: {:5.0f} yd\n", traj.turn_radius_yd);
      std::format_to(it, "    Arc length:  {:5.0f} yd\n", traj.turn_arc_length_yd);
      std::format_to(it, "    Turn time:   {:5.1f} s\n", traj.turn_time_s);
    }
    else {
      std::format_to(it, "  Phase 2: no turn\n");
    }

    std::format_to(it, "  Phase 3: final run to intercept\n");
    std::format_to(it, "    Heading:   {:6.1f} deg\n", traj.final_heading.ToDeg());
    std::format_to(it, "    Distance:  {:6.0f} yd\n", traj.final_run_distance_yd);
    std::format_to(it, "    Time:      {:6.1f} s\n", traj.final_run_time_s);
  }
  else {
    AppendSection(out, "TORPEDO RUN (STRAIGHT)");
  }

  std::format_to(it, "  Total run:  {:6.0f} yd\n", solution.torpedo_run_yd);
  std::format_to(
    it, "  Total time: {:6.1f} s ({})\n",
    solution.torpedo_run_time_s, FormatMinutesSeconds(solution.torpedo_run_time_s)
  );

  return out;
}

std::string FormatAttackComparison(
  RecordedAttack const& attack,
  FiringSolution const& solution
) {
  std::string out;
  auto it = std::back_inserter(out);

  std::format_to(it, "{}\nVERIFYING {}\n{}\n", kRule, attack.label.empty() ? "attack" : attack.label, kRule);

  std::format_to(it, "Recorded:\n");
  std::format_to(it, "  Own course:    {:.1f} deg\n", attack.own_course.WrapAround().ToDeg());
  if (attack.target_bearing.has_value()) {
    std::format_to(it, "  Target bearing: {:.1f} deg\n", attack.target_bearing->WrapAround().ToDeg());
  }
  else {
    std::format_to(
      it, "  Target bearing: {:.1f} deg (estimated from gyro angle)\n",
      (attack.own_course + attack.gyro_angle).WrapAround().ToDeg()
    );
  }
  std::format_to(it, "  Target course: {:.1f} deg\n", attack.target_course.WrapAround().ToDeg());
  std::format_to(it, "  Target speed:  {:.1f} kn\n", attack.target_speed_kn);
  std::format_to(it, "  Range:         {:.0f} yd\n", attack.target_range_yd);
  std::format_to(it, "  Gyro angle:    {:+.1f} deg\n", attack.gyro_angle.ToDeg());
  std::format_to(
    it, "  Track angle:   {:.1f} deg {}\n",
    attack.track_angle.angle.ToDeg(), GetSideLetter(attack.track_angle.side)
  );

  std::optional<AttackDeviation> const deviation = CompareWithRecord(attack, solution);
  if (!deviation.has_value()) {
    std::format_to(it, "\nNO SOLUTION: {}\n", solution.message);
    return out;
  }

  std::format_to(it, "Computed:\n");
  std::format_to(
    it, "  Gyro angle:    {:+.1f} deg (diff {:+.1f})\n",
    solution.gyro_angle.ToDeg(), deviation->gyro_angle_diff.ToDeg()
  );
  std::format_to(
    it, "  Track angle:   {:.1f} deg {} (diff {:+.1f}, side {})\n",
    solution.track_angle.angle.ToDeg(), GetSideLetter(solution.track_angle.side),
    deviation->track_angle_diff.ToDeg(), deviation->track_side_matches ? "agrees" : "differs"
  );
  std::format_to(
    it, "  Angle on bow:  {:.1f} deg {}",
    solution.angle_on_bow.angle.ToDeg(), GetSideLetter(solution.angle_on_bow.side)
  );
  if (deviation->angle_on_bow_diff.has_value()) {
    std::format_to(
      it, " (diff {:+.1f}, side {})",
      deviation->angle_on_bow_diff->ToDeg(), deviation->angle_on_bow_side_matches.value() ? "agrees" : "differs"
    );
  }
  std::format_to(it, "\n");

  return out;
}

} // namespace tdcmk3
