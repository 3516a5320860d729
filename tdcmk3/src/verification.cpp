// TU header --------------------------------------------
#include "tdcmk3/verification.h"

// project headers --------------------------------------
#include "tdcmk3/torpedo.h"

namespace tdcmk3 {

FiringProblem MakeFiringProblem(RecordedAttack const& attack) {
  Angle const target_bearing = attack.target_bearing.has_value()
    ? attack.target_bearing.value()
    : attack.own_course + attack.gyro_angle;

  return FiringProblem {
    .own_course = attack.own_course.WrapAround(),
    .own_speed_kn = kTypicalAttackSpeedKn,
    .target_bearing = target_bearing.WrapAround(),
    .target_range_yd = attack.target_range_yd,
    .target_course = attack.target_course.WrapAround(),
    .target_speed_kn = attack.target_speed_kn,
    .torpedo_speed_kn = kMark14HighSpeedKn,
  };
}

std::optional<AttackDeviation> CompareWithRecord(
  RecordedAttack const& attack,
  FiringSolution const& solution
) {
  if (!solution.valid) {
    return std::nullopt;
  }

  AttackDeviation deviation {
    .gyro_angle_diff = (solution.gyro_angle - attack.gyro_angle).WrapSigned(),
    .track_angle_diff = solution.track_angle.angle - attack.track_angle.angle,
    .track_side_matches = solution.track_angle.side == attack.track_angle.side,
  };

  if (attack.angle_on_bow.has_value()) {
    deviation.angle_on_bow_diff = solution.angle_on_bow.angle - attack.angle_on_bow->angle;
    deviation.angle_on_bow_side_matches = solution.angle_on_bow.side == attack.angle_on_bow->side;
  }

  return deviation;
}

} // namespace tdcmk3
