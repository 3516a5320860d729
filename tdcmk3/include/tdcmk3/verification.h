#pragma once

// c++ headers ------------------------------------------
#include <optional>
#include <string>

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/firing_solution.h"
#include "tdcmk3/geometry.h"

namespace tdcmk3 {

/// Own speed assumed when a patrol report does not give one; typical submerged approach speed.
inline constexpr float kTypicalAttackSpeedKn = 3.0f;

/// Attack parameters as recorded in a patrol report, for the first torpedo of a salvo.
struct RecordedAttack final {
  std::string label; // e.g. "P1A4" for patrol 1, attack 4.

  Angle own_course = Angle(0.0f);
  /// Often missing from the reports.
  std::optional<Angle> target_bearing;
  float target_range_yd = 0.0f;
  Angle target_course = Angle(0.0f);
  float target_speed_kn = 0.0f;

  Angle gyro_angle = Angle(0.0f); // Signed: Positive is starboard, negative is port.
  SidedAngle track_angle;
  std::optional<SidedAngle> angle_on_bow;
};

/// Computed solution against the record. Differences are computed minus recorded.
struct AttackDeviation final {
  Angle gyro_angle_diff = Angle(0.0f);  // Signed, [-180°, 180°].
  Angle track_angle_diff = Angle(0.0f); // Of the unsigned track angles.
  bool track_side_matches = false;
  std::optional<Angle> angle_on_bow_diff;
  std::optional<bool> angle_on_bow_side_matches;
};

/// Firing problem for `attack`. A missing target bearing is estimated as own course plus the recorded
/// gyro angle; own speed is `kTypicalAttackSpeedKn` and the torpedo a Mark 14 at high speed.
FiringProblem MakeFiringProblem(RecordedAttack const& attack);

/// ## Returns
/// `std::nullopt` when `solution` is not valid.
std::optional<AttackDeviation> CompareWithRecord(
  RecordedAttack const& attack,
  FiringSolution const& solution
);

} // namespace tdcmk3
