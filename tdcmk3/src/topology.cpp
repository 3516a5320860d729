// TU header --------------------------------------------
#include "tdcmk3/topology.h"

// c++ headers ------------------------------------------
#include <iterator>
#include <string>
#include <utility>

// Component numbers follow the TDC Mark III instruction book (OP 1631) where it numbers them.

namespace tdcmk3 {

namespace {

namespace id = topology_id;

// Position keeper internals.
constexpr std::string_view kOne = "pk.one";
constexpr std::string_view kHalfTurn = "pk.half_turn";
constexpr std::string_view kPkRelativeBearing = "pk.diff_7";
constexpr std::string_view kPkReciprocalBearing = "pk.diff_32";
constexpr std::string_view kPkTargetAngle = "pk.diff_33";
constexpr std::string_view kPkRelativeBearingResolver = "pk.resolver_13";
constexpr std::string_view kPkTargetAngleResolver = "pk.resolver_34";
constexpr std::string_view kPkOwnAcross = "pk.int_14";
constexpr std::string_view kPkOwnAlong = "pk.int_15";
constexpr std::string_view kPkTargetAcross = "pk.int_35";
constexpr std::string_view kPkTargetAlong = "pk.int_36";
constexpr std::string_view kPkBearingTravel = "pk.diff_28";
constexpr std::string_view kPkRangeClosed = "pk.diff_29";

// Angle solver internals.
constexpr std::string_view kAsRange = "as.synchro_range";
constexpr std::string_view kAsRelativeBearing = "as.synchro_relative_bearing";
constexpr std::string_view kAsTargetAngle = "as.synchro_target_angle";
constexpr std::string_view kAsZero = "as.zero";
constexpr std::string_view kAsGyroServo = "as.int_gyro";
constexpr std::string_view kAsGyroWrap = "as.diff_gyro_wrap";
constexpr std::string_view kAsGyro = "as.synchro_gyro";
constexpr std::string_view kAsTrackToSight = "as.diff_gyro_minus_bearing";
constexpr std::string_view kAsSightResolver = "as.resolver_2FA";
constexpr std::string_view kAsImpactAngle = "as.diff_19FA";
constexpr std::string_view kAsTargetTravelResolver = "as.resolver_16FA";
constexpr std::string_view kAsReachCam = "as.cam_reach";
constexpr std::string_view kAsTransferCam = "as.cam_transfer";
constexpr std::string_view kAsTurnArcCam = "as.cam_turn_arc";
constexpr std::string_view kAsAlongTrack = "as.diff_3FA";
constexpr std::string_view kAsFinalRun = "as.diff_17FA";
constexpr std::string_view kAsAcrossTrack = "as.diff_18a";
constexpr std::string_view kAsLateralError = "as.diff_18FA";
constexpr std::string_view kAsRunToTurnEnd = "as.diff_run_to_turn_end";
constexpr std::string_view kAsTorpedoRun = "as.diff_torpedo_run";

InputRef Ref(std::string_view source, Port port = Port::kValue) {
  return InputRef {
    .id = std::string(source),
    .port = port,
    .feedback = false,
  };
}

InputRef FeedbackRef(std::string_view source) {
  return InputRef {
    .id = std::string(source),
    .port = Port::kValue,
    .feedback = true,
  };
}

Component MakeInput(std::string_view component_id, std::string name, float value = 0.0f) {
  Component input(std::string(component_id), std::move(name), Input {});
  input.SetValue(value);
  return input;
}

Component MakeDifferential(
  std::string_view component_id,
  std::string name,
  Differential::Op op,
  AngleWrap wrap,
  InputRef a,
  InputRef b
) {
  return Component(
    std::string(component_id),
    std::move(name),
    Differential { .op = op, .wrap = wrap },
    { std::move(a), std::move(b) }
  );
}

Component MakeIntegrator(std::string_view component_id, std::string name, InputRef roller, InputRef disc) {
  return Component(std::string(component_id), std::move(name), Integrator {}, { std::move(roller), std::move(disc) });
}

Component MakeSingleInput(std::string_view component_id, std::string name, ComponentVariant variant, InputRef input) {
  return Component(std::string(component_id), std::move(name), std::move(variant), { std::move(input) });
}

} // namespace

std::vector<Component> BuildPositionKeeper() {
  using Op = Differential::Op;

  std::vector<Component> c;

  // Dials and constant shafts.
  c.push_back(MakeInput(id::kOwnSpeed, "Own speed So"));
  c.push_back(MakeInput(id::kOwnCourse, "Own course Co"));
  c.push_back(MakeInput(id::kTargetSpeed, "Target speed S"));
  c.push_back(MakeInput(id::kTargetCourse, "Target course C"));
  c.push_back(MakeInput(id::kTargetBearing, "Target bearing B"));
  c.push_back(MakeInput(id::kTargetRange, "Target range R"));
  c.push_back(MakeInput(kOne, "Unit shaft", 1.0f));
  c.push_back(MakeInput(kHalfTurn, "180 degree shaft", 180.0f));

  // Br = B - Co
  c.push_back(MakeDifferential(
    kPkRelativeBearing, "Relative bearing Br", Op::kSubtract, AngleWrap::kSigned,
    Ref(id::kTargetBearing), Ref(id::kOwnCourse)
  ));

  // A = B + 180 - C
  c.push_back(MakeDifferential(
    kPkReciprocalBearing, "Reciprocal bearing B + 180", Op::kAdd, AngleWrap::kUnsigned,
    Ref(id::kTargetBearing), Ref(kHalfTurn)
  ));
  c.push_back(MakeDifferential(
    kPkTargetAngle, "Target angle A", Op::kSubtract, AngleWrap::kSigned,
    Ref(kPkReciprocalBearing), Ref(id::kTargetCourse)
  ));

  c.push_back(MakeSingleInput(kPkRelativeBearingResolver, "Br resolver", Resolver {}, Ref(kPkRelativeBearing)));
  c.push_back(MakeSingleInput(kPkTargetAngleResolver, "A resolver", Resolver {}, Ref(kPkTargetAngle)));

  // Own and target travel.
  c.push_back(MakeIntegrator(id::kOwnTravel, "Own travel", Ref(kOne), Ref(id::kOwnSpeed)));
  c.push_back(MakeIntegrator(id::kTargetTravel, "Target travel", Ref(kOne), Ref(id::kTargetSpeed)));

  // Travel components across and along the line of sight.
  c.push_back(MakeIntegrator(
    kPkOwnAcross, "Own travel across line of sight", Ref(kPkRelativeBearingResolver, Port::kSin), Ref(id::kOwnSpeed)
  ));
  c.push_back(MakeIntegrator(
    kPkOwnAlong, "Own travel along line of sight", Ref(kPkRelativeBearingResolver, Port::kCos), Ref(id::kOwnSpeed)
  ));
  c.push_back(MakeIntegrator(
    kPkTargetAcross, "Target travel across line of sight", Ref(kPkTargetAngleResolver, Port::kSin), Ref(id::kTargetSpeed)
  ));
  c.push_back(MakeIntegrator(
    kPkTargetAlong, "Target travel along line of sight", Ref(kPkTargetAngleResolver, Port::kCos), Ref(id::kTargetSpeed)
  ));

  c.push_back(MakeDifferential(
    kPkBearingTravel, "Bearing travel R dB", Op::kAdd, AngleWrap::kNone,
    Ref(kPkOwnAcross), Ref(kPkTargetAcross)
  ));
  c.push_back(MakeDifferential(
    kPkRangeClosed, "Range closed -dR", Op::kAdd, AngleWrap::kNone,
    Ref(kPkOwnAlong), Ref(kPkTargetAlong)
  ));

  // Dials.
  c.push_back(MakeSingleInput(id::kRelativeBearing, "Relative bearing Br", Output {}, Ref(kPkRelativeBearing)));
  c.push_back(MakeSingleInput(id::kTargetAngle, "Target angle A", Output {}, Ref(kPkTargetAngle)));
  c.push_back(MakeSingleInput(id::kBearingTravel, "Bearing travel R dB", Output {}, Ref(kPkBearingTravel)));
  c.push_back(MakeSingleInput(id::kRangeClosed, "Range closed", Output {}, Ref(kPkRangeClosed)));

  return c;
}

std::vector<Component> BuildAngleSolver(
  TorpedoSpec const& torpedo,
  float torpedo_speed_kn,
  float servo_gain
) {
  using Op = Differential::Op;

  auto const make_cam = [&](CamProfile profile) {
    return Cam {
      .profile = profile,
      .torpedo = torpedo,
      .torpedo_speed_kn = torpedo_speed_kn,
    };
  };

  std::vector<Component> c;

  // From the position keeper.
  c.push_back(MakeSingleInput(kAsRange, "Range R", Synchro {}, Ref(id::kTargetRange)));
  c.push_back(MakeSingleInput(kAsRelativeBearing, "Relative bearing Br", Synchro {}, Ref(id::kRelativeBearing)));
  c.push_back(MakeSingleInput(kAsTargetAngle, "Target angle A", Synchro {}, Ref(id::kTargetAngle)));

  c.push_back(MakeInput(id::kTargetTravelDuringRun, "Target travel during run H"));
  c.push_back(MakeInput(id::kInitialRun, "Initial run P", torpedo.initial_run_yd));
  c.push_back(MakeInput(id::kServoGain, "Gyro servo gain", servo_gain));
  c.push_back(MakeInput(kAsZero, "Zero shaft"));

  // Gyro servo: dG/dt = gain × lateral error of the previous step. The servo total is unbounded;
  // G is taken off it through a differential that keeps it in [-180, 180].
  c.push_back(MakeIntegrator(kAsGyroServo, "Gyro servo", FeedbackRef(kAsLateralError), Ref(id::kServoGain)));
  c.push_back(MakeDifferential(
    kAsGyroWrap, "Gyro servo wrap", Op::kAdd, AngleWrap::kSigned,
    Ref(kAsGyroServo), Ref(kAsZero)
  ));
  c.push_back(MakeSingleInput(kAsGyro, "Gyro angle G", Synchro {}, Ref(kAsGyroWrap)));

  // G - Br: angle from the line of sight to the final torpedo track.
  c.push_back(MakeDifferential(
    kAsTrackToSight, "G - Br", Op::kSubtract, AngleWrap::kSigned,
    Ref(kAsGyro), Ref(kAsRelativeBearing)
  ));
  c.push_back(Component(
    std::string(kAsSightResolver), "R resolver on G - Br", Resolver {}, { Ref(kAsTrackToSight), Ref(kAsRange) }
  ));

  // I = A + (G - Br)
  c.push_back(MakeDifferential(
    kAsImpactAngle, "Impact angle I", Op::kAdd, AngleWrap::kSigned,
    Ref(kAsTargetAngle), Ref(kAsTrackToSight)
  ));
  c.push_back(Component(
    std::string(kAsTargetTravelResolver), "H resolver on I", Resolver {},
    { Ref(kAsImpactAngle), Ref(id::kTargetTravelDuringRun) }
  ));

  c.push_back(MakeSingleInput(kAsReachCam, "Reach cam", make_cam(CamProfile::kReach), Ref(kAsGyro)));
  c.push_back(MakeSingleInput(kAsTransferCam, "Transfer cam", make_cam(CamProfile::kTransfer), Ref(kAsGyro)));
  c.push_back(MakeSingleInput(kAsTurnArcCam, "Turn arc cam", make_cam(CamProfile::kTurnArc), Ref(kAsGyro)));

  // Range balance: R cos(G - Br) - H cos I - reach = final run.
  c.push_back(MakeDifferential(
    kAsAlongTrack, "R cos(G - Br) - H cos I", Op::kSubtract, AngleWrap::kNone,
    Ref(kAsSightResolver, Port::kCos), Ref(kAsTargetTravelResolver, Port::kCos)
  ));
  c.push_back(MakeDifferential(
    kAsFinalRun, "Final run", Op::kSubtract, AngleWrap::kNone,
    Ref(kAsAlongTrack), Ref(kAsReachCam)
  ));

  // Lateral balance: R sin(G - Br) - H sin I - transfer = 0.
  c.push_back(MakeDifferential(
    kAsAcrossTrack, "R sin(G - Br) - H sin I", Op::kSubtract, AngleWrap::kNone,
    Ref(kAsSightResolver, Port::kSin), Ref(kAsTargetTravelResolver, Port::kSin)
  ));
  c.push_back(MakeDifferential(
    kAsLateralError, "Lateral error", Op::kSubtract, AngleWrap::kNone,
    Ref(kAsAcrossTrack), Ref(kAsTransferCam)
  ));

  // U = P + turn arc + final run
  c.push_back(MakeDifferential(
    kAsRunToTurnEnd, "P + turn arc", Op::kAdd, AngleWrap::kNone,
    Ref(id::kInitialRun), Ref(kAsTurnArcCam)
  ));
  c.push_back(MakeDifferential(
    kAsTorpedoRun, "Torpedo run U", Op::kAdd, AngleWrap::kNone,
    Ref(kAsRunToTurnEnd), Ref(kAsFinalRun)
  ));

  // Dials.
  c.push_back(MakeSingleInput(id::kGyroAngle, "Gyro angle G", Output {}, Ref(kAsGyro)));
  c.push_back(MakeSingleInput(id::kImpactAngle, "Impact angle I", Output {}, Ref(kAsImpactAngle)));
  c.push_back(MakeSingleInput(id::kTorpedoRun, "Torpedo run U", Output {}, Ref(kAsTorpedoRun)));
  c.push_back(MakeSingleInput(id::kFinalRun, "Final run", Output {}, Ref(kAsFinalRun)));
  c.push_back(MakeSingleInput(id::kLateralError, "Lateral error", Output {}, Ref(kAsLateralError)));

  return c;
}

ComponentGraph BuildTdcTopology(
  TorpedoSpec const& torpedo,
  float torpedo_speed_kn,
  float servo_gain
) {
  std::vector<Component> components = BuildPositionKeeper();
  std::vector<Component> angle_solver = BuildAngleSolver(torpedo, torpedo_speed_kn, servo_gain);
  components.insert(
    components.end(),
    std::make_move_iterator(angle_solver.begin()),
    std::make_move_iterator(angle_solver.end())
  );
  return ComponentGraph(std::move(components));
}

} // namespace tdcmk3
