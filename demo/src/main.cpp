// c++ headers ------------------------------------------
#include <cstdint>

#include <print>

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/firing_solution.h"
#include "tdcmk3/report.h"
#include "tdcmk3/simulator.h"
#include "tdcmk3/torpedo.h"

//----------------------------------------------------------------------------------
// Global Variables Definition
//----------------------------------------------------------------------------------

// Patrol 1, attack 4 setup.
constexpr float kOwnCourseDeg = 281.0f;
constexpr float kOwnSpeedKn = 3.0f;
constexpr float kTargetBearingDeg = 291.0f;
constexpr float kTargetRangeYd = 1300.0f;
constexpr float kTargetCourseDeg = 115.0f;
constexpr float kTargetSpeedKn = 10.0f;

constexpr float kTimeStepS = 0.1f;
constexpr uint32_t kStepCount = 600;
constexpr uint32_t kStepsPerPrint = 50;

//----------------------------------------------------------------------------------
// Module Functions Declaration
//----------------------------------------------------------------------------------
void PrintComponentSnapshots(tdcmk3::Simulator const& simulator);

//----------------------------------------------------------------------------------
// Main Entry Point
//----------------------------------------------------------------------------------
int main() {
  using namespace tdcmk3;

  FiringProblem const problem {
    .own_course = Angle::FromDeg(kOwnCourseDeg),
    .own_speed_kn = kOwnSpeedKn,
    .target_bearing = Angle::FromDeg(kTargetBearingDeg),
    .target_range_yd = kTargetRangeYd,
    .target_course = Angle::FromDeg(kTargetCourseDeg),
    .target_speed_kn = kTargetSpeedKn,
    .torpedo_speed_kn = kMark14HighSpeedKn,
  };

  // Solver
  //--------------------------------------------------------------------------------
  FiringSolution const solution = ComputeFiringSolution(problem);
  std::print("{}", FormatSolutionReport(problem, solution));

  // Component simulation; the position keeper keeps generating range and bearing.
  //--------------------------------------------------------------------------------
  Simulator simulator;
  simulator.SetInputs(problem);

  std::println("\nTDC Mark III component simulation, dt = {} s", kTimeStepS);
  std::println("{:>6} {:>8} {:>8} {:>8} {:>8} {:>9} {:>9} {:>7}", "t(s)", "R(yd)", "Br", "A", "G", "U(yd)", "lat(yd)", "solved");

  for (uint32_t i = 1; i <= kStepCount; ++i) {
    SimulatorReadout const& r = simulator.Step(kTimeStepS);
    if (i % kStepsPerPrint == 0) {
      std::println(
        "{:6.1f} {:8.0f} {:8.1f} {:8.1f} {:8.1f} {:9.0f} {:9.1f} {:>7}",
        r.time_s, r.target_range_yd, r.relative_bearing_deg, r.target_angle_deg,
        r.gyro_angle_deg, r.torpedo_run_yd, r.lateral_error_yd, r.solved ? "yes" : "no"
      );
    }
  }

  PrintComponentSnapshots(simulator);

  return 0;
}

//----------------------------------------------------------------------------------
// Module Functions Definition
//----------------------------------------------------------------------------------

void PrintComponentSnapshots(tdcmk3::Simulator const& simulator) {
  std::println("\n{:<32} {:<40} {:<12} {:>10} {:>12}", "id", "name", "kind", "rotation", "value");
  for (tdcmk3::ComponentSnapshot const& snapshot : simulator.GetSnapshots()) {
    std::println(
      "{:<32} {:<40} {:<12} {:10.1f} {:12.3f}",
      snapshot.id, snapshot.name, tdcmk3::GetComponentKindName(snapshot.kind), snapshot.rotation_deg, snapshot.value
    );
  }
}
