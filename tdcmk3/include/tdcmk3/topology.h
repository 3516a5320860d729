#pragma once

// c++ headers ------------------------------------------
#include <string_view>
#include <vector>

// project headers --------------------------------------
#include "tdcmk3/component.h"
#include "tdcmk3/component_graph.h"
#include "tdcmk3/torpedo.h"

namespace tdcmk3 {

/// Ids of the components other code reads or sets.
namespace topology_id {

// Position keeper inputs. Speeds are in yards per second, angles in degrees, range in yards.
inline constexpr std::string_view kOwnSpeed = "pk.own_speed";
inline constexpr std::string_view kOwnCourse = "pk.own_course";
inline constexpr std::string_view kTargetSpeed = "pk.target_speed";
inline constexpr std::string_view kTargetCourse = "pk.target_course";
inline constexpr std::string_view kTargetBearing = "pk.target_bearing";
inline constexpr std::string_view kTargetRange = "pk.target_range";

// Position keeper outputs.
inline constexpr std::string_view kRelativeBearing = "pk.out_relative_bearing";
inline constexpr std::string_view kTargetAngle = "pk.out_target_angle";
inline constexpr std::string_view kBearingTravel = "pk.out_bearing_travel"; // R dB, yards
inline constexpr std::string_view kRangeClosed = "pk.out_range_closed";     // -dR, yards
inline constexpr std::string_view kOwnTravel = "pk.own_travel";
inline constexpr std::string_view kTargetTravel = "pk.target_travel";

// Angle solver inputs.
inline constexpr std::string_view kTargetTravelDuringRun = "as.target_travel_during_run"; // H, yards
inline constexpr std::string_view kInitialRun = "as.initial_run";
inline constexpr std::string_view kServoGain = "as.servo_gain";

// Angle solver outputs.
inline constexpr std::string_view kGyroAngle = "as.out_gyro_angle";
inline constexpr std::string_view kImpactAngle = "as.out_impact_angle";
inline constexpr std::string_view kTorpedoRun = "as.out_torpedo_run";
inline constexpr std::string_view kFinalRun = "as.out_final_run";
inline constexpr std::string_view kLateralError = "as.out_lateral_error";

} // namespace topology_id

/// Default gain of the gyro servo, in degrees per second per yard of lateral error.
inline constexpr float kDefaultServoGain = -0.02f;

/// Components of the position keeper.
///
/// Generates, from own and target motion, the relative bearing Br = B - Co, the target angle
/// A = B + 180 - C, and the integrated bearing travel R dB = ∫(So sin Br + S sin A) dt and range closed
/// ∫(So cos Br + S cos A) dt.
std::vector<Component> BuildPositionKeeper();

/// Components of the angle solver, wired to the position keeper outputs through synchros.
///
/// Solves the range balance R cos(G - Br) - H cos I - reach = final run and the lateral balance
/// R sin(G - Br) - H sin I - transfer = 0, with I = A + (G - Br). The gyro angle G is the output of a
/// servo integrator that drives the lateral error to zero, wrapped into [-180°, 180°].
/// The reach, transfer and turn arc cams are cut for `torpedo` at `torpedo_speed_kn`.
std::vector<Component> BuildAngleSolver(
  TorpedoSpec const& torpedo,
  float torpedo_speed_kn,
  float servo_gain = kDefaultServoGain
);

/// Position keeper and angle solver in one graph.
ComponentGraph BuildTdcTopology(
  TorpedoSpec const& torpedo,
  float torpedo_speed_kn,
  float servo_gain = kDefaultServoGain
);

} // namespace tdcmk3
