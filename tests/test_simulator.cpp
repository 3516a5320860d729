#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <tdcmk3/angle.h>
#include <tdcmk3/firing_solution.h>
#include <tdcmk3/simulator.h>
#include <tdcmk3/topology.h>
#include <tdcmk3/torpedo.h>

using Catch::Approx;
using namespace tdcmk3;

namespace id = tdcmk3::topology_id;

namespace {

FiringProblem MakeProblem(
  float own_course,
  float own_speed,
  float target_bearing,
  float target_range,
  float target_course,
  float target_speed
) {
  return FiringProblem {
    .own_course = Angle::FromDeg(own_course),
    .own_speed_kn = own_speed,
    .target_bearing = Angle::FromDeg(target_bearing),
    .target_range_yd = target_range,
    .target_course = Angle::FromDeg(target_course),
    .target_speed_kn = target_speed,
    .torpedo_speed_kn = kMark14HighSpeedKn,
  };
}

void StepMany(Simulator& simulator, int count, float dt) {
  for (int i = 0; i < count; ++i) {
    simulator.Step(dt);
  }
}

} // namespace

TEST_CASE("TDC topology") {
  SECTION("builds") {
    REQUIRE_NOTHROW(BuildTdcTopology(TorpedoSpec(), kMark14HighSpeedKn));
  }

  SECTION("exposes the dials other code reads") {
    ComponentGraph const graph = BuildTdcTopology(TorpedoSpec(), kMark14HighSpeedKn);
    for (std::string_view component_id : {
      id::kOwnSpeed, id::kOwnCourse, id::kTargetSpeed, id::kTargetCourse, id::kTargetBearing, id::kTargetRange,
      id::kRelativeBearing, id::kTargetAngle, id::kBearingTravel, id::kRangeClosed,
      id::kTargetTravelDuringRun, id::kGyroAngle, id::kImpactAngle, id::kTorpedoRun, id::kLateralError,
    }) {
      REQUIRE(graph.FindIndex(component_id).has_value());
    }
  }

  SECTION("the angle solver alone is missing the position keeper") {
    REQUIRE_THROWS_AS(ComponentGraph(BuildAngleSolver(TorpedoSpec(), kMark14HighSpeedKn)), std::invalid_argument);
  }

  SECTION("the position keeper stands alone") {
    REQUIRE_NOTHROW(ComponentGraph(BuildPositionKeeper()));
  }
}

TEST_CASE("Position keeper") {
  SimulatorConfig config;
  config.generate_present_position = false;

  SECTION("own ship closing a stopped target dead ahead") {
    Simulator simulator(config);
    simulator.SetInputs(MakeProblem(0.0f, 10.0f, 0.0f, 2000.0f, 90.0f, 0.0f));
    StepMany(simulator, 100, 0.1f);

    float const expected = 10.0f * KnotsToYardsPerSecond(10.0f);
    REQUIRE(simulator.GetValue(id::kRangeClosed).value() == Approx(expected).margin(0.05f));
    REQUIRE(simulator.GetValue(id::kBearingTravel).value() == Approx(0.0f).margin(1e-3));
    REQUIRE(simulator.GetValue(id::kOwnTravel).value() == Approx(expected).margin(0.05f));
    REQUIRE(simulator.GetValue(id::kRelativeBearing).value() == Approx(0.0f).margin(1e-4));
    REQUIRE(simulator.GetValue(id::kTargetAngle).value() == Approx(90.0f).margin(1e-3));

    // Range and bearing dials stay where they were set.
    REQUIRE(simulator.GetReadout().target_range_yd == Approx(2000.0f));
    REQUIRE(simulator.GetReadout().range_rate_yps == Approx(-KnotsToYardsPerSecond(10.0f)).margin(1e-3));
  }

  SECTION("target crossing the line of sight") {
    // Target to the east, heading north: the bearing draws left.
    Simulator simulator(config);
    simulator.SetInputs(MakeProblem(0.0f, 0.0f, 90.0f, 1000.0f, 0.0f, 10.0f));
    SimulatorReadout const& r = simulator.Step(0.1f);

    float const expected_rate_deg_s = -KnotsToYardsPerSecond(10.0f) / 1000.0f * 57.29578f;
    REQUIRE(r.bearing_rate_deg_s == Approx(expected_rate_deg_s).margin(1e-3));
    REQUIRE(r.range_rate_yps == Approx(0.0f).margin(1e-3));
    REQUIRE(r.target_angle_deg == Approx(-90.0f).margin(1e-3));
    REQUIRE(r.relative_bearing_deg == Approx(90.0f).margin(1e-3));
  }
}

TEST_CASE("Present position generation") {
  Simulator simulator;
  simulator.SetInputs(MakeProblem(0.0f, 10.0f, 0.0f, 2000.0f, 90.0f, 0.0f));
  StepMany(simulator, 100, 0.1f);

  REQUIRE(simulator.GetReadout().target_range_yd == Approx(2000.0f - 10.0f * KnotsToYardsPerSecond(10.0f)).margin(0.1f));
  REQUIRE(simulator.GetReadout().target_bearing_deg == Approx(0.0f).margin(1e-3));
  REQUIRE(simulator.GetReadout().time_s == Approx(10.0f).margin(1e-3));
}

TEST_CASE("Angle solver gyro servo") {
  SECTION("settles on the solver's gyro angle for a stopped target") {
    FiringProblem const problem = MakeProblem(0.0f, 0.0f, 30.0f, 2000.0f, 0.0f, 0.0f);

    Simulator simulator;
    simulator.SetInputs(problem);
    StepMany(simulator, 300, 0.1f);

    FiringSolution const solution = ComputeFiringSolution(problem);
    REQUIRE(solution.valid);

    SimulatorReadout const& r = simulator.GetReadout();
    REQUIRE(r.gyro_angle_deg == Approx(solution.gyro_angle.ToDeg()).margin(0.5f));
    REQUIRE(r.solved);
    REQUIRE(r.torpedo_run_yd == Approx(solution.torpedo_run_yd).margin(5.0f));
  }

  SECTION("settles on the solver's gyro angle for a moving target") {
    FiringProblem const problem = MakeProblem(281.0f, 3.0f, 291.0f, 1300.0f, 115.0f, 10.0f);

    SimulatorConfig config;
    config.generate_present_position = false;
    Simulator simulator(config);
    simulator.SetInputs(problem);
    StepMany(simulator, 600, 0.1f);

    FiringSolution const solution = ComputeFiringSolution(problem);
    REQUIRE(solution.valid);

    SimulatorReadout const& r = simulator.GetReadout();
    REQUIRE(r.gyro_angle_deg == Approx(solution.gyro_angle.ToDeg()).margin(1.0f));
    REQUIRE(r.solved);
  }

  SECTION("starts unsolved") {
    Simulator simulator;
    simulator.SetInputs(MakeProblem(0.0f, 0.0f, 30.0f, 2000.0f, 0.0f, 0.0f));
    REQUIRE_FALSE(simulator.Step(0.1f).solved);
  }
}

TEST_CASE("Simulator lifecycle") {
  Simulator simulator;
  simulator.SetInputs(MakeProblem(0.0f, 0.0f, 30.0f, 2000.0f, 0.0f, 0.0f));
  StepMany(simulator, 20, 0.1f);

  SECTION("negative time step") {
    REQUIRE_THROWS_AS(simulator.Step(-0.1f), std::invalid_argument);
  }

  SECTION("reset clears the integrators and the clock") {
    REQUIRE(simulator.GetValue(id::kGyroAngle).value() != 0.0f);
    simulator.Reset();
    REQUIRE(simulator.GetReadout().time_s == 0.0f);
    REQUIRE(simulator.GetValue(id::kGyroAngle).value() == 0.0f);
    REQUIRE(simulator.GetReadout().target_range_yd == Approx(2000.0f));
  }

  SECTION("a new torpedo speed recuts the cams") {
    FiringProblem problem = MakeProblem(0.0f, 0.0f, 30.0f, 2000.0f, 0.0f, 0.0f);
    problem.torpedo_speed_kn = kMark14LowSpeedKn;
    simulator.SetInputs(problem);
    REQUIRE(simulator.GetConfig().torpedo_speed_kn == kMark14LowSpeedKn);
    REQUIRE(simulator.GetReadout().time_s == 0.0f);
  }

  SECTION("snapshots cover every component") {
    std::vector<ComponentSnapshot> const snapshots = simulator.GetSnapshots();
    REQUIRE(snapshots.size() == simulator.GetGraph().GetSize());
    for (ComponentSnapshot const& snapshot : snapshots) {
      REQUIRE(snapshot.rotation_deg >= 0.0f);
      REQUIRE(snapshot.rotation_deg < 360.0f);
    }
  }
}

TEST_CASE("Gyro angle dial stays signed for a target abaft the beam") {
  for (float bearing : { 180.0f, 200.0f }) {
    Simulator simulator;
    simulator.SetInputs(MakeProblem(0.0f, 0.0f, bearing, 2000.0f, 0.0f, 0.0f));

    float min_gyro = 0.0f;
    float max_gyro = 0.0f;
    float max_impact = 0.0f;
    for (int i = 0; i < 6000; ++i) {
      SimulatorReadout const& r = simulator.Step(0.1f);
      min_gyro = std::min(min_gyro, r.gyro_angle_deg);
      max_gyro = std::max(max_gyro, r.gyro_angle_deg);
      max_impact = std::max(max_impact, std::abs(r.impact_angle_deg));
    }

    INFO("bearing " << bearing);
    REQUIRE(min_gyro >= -180.0f);
    REQUIRE(max_gyro <= 180.0f);
    REQUIRE(max_impact <= 180.0f);
    REQUIRE(std::abs(simulator.GetValue(id::kGyroAngle).value()) <= 180.0f);
  }
}

TEST_CASE("Simulator rejects unusable dial settings") {
  Simulator simulator;
  FiringProblem const good = MakeProblem(0.0f, 0.0f, 30.0f, 2000.0f, 0.0f, 0.0f);
  simulator.SetInputs(good);
  StepMany(simulator, 10, 0.1f);
  float const gyro_before = simulator.GetReadout().gyro_angle_deg;

  SECTION("not a number") {
    FiringProblem bad = good;
    bad.target_range_yd = std::numeric_limits<float>::quiet_NaN();
    REQUIRE_THROWS_AS(simulator.SetInputs(bad), std::invalid_argument);

    bad = good;
    bad.target_course = Angle::FromDeg(std::numeric_limits<float>::infinity());
    REQUIRE_THROWS_AS(simulator.SetInputs(bad), std::invalid_argument);
  }

  SECTION("negative speed or range") {
    FiringProblem bad = good;
    bad.own_speed_kn = -1.0f;
    REQUIRE_THROWS_AS(simulator.SetInputs(bad), std::invalid_argument);

    bad = good;
    bad.target_range_yd = -100.0f;
    REQUIRE_THROWS_AS(simulator.SetInputs(bad), std::invalid_argument);
  }

  SECTION("stopped torpedo") {
    FiringProblem bad = good;
    bad.torpedo_speed_kn = 0.0f;
    REQUIRE_THROWS_AS(simulator.SetInputs(bad), std::invalid_argument);
  }

  // Rejected settings never reach the integrators.
  simulator.Step(0.1f);
  REQUIRE(std::isfinite(simulator.GetReadout().gyro_angle_deg));
  REQUIRE(std::isfinite(simulator.GetValue(id::kRangeClosed).value()));
  REQUIRE(simulator.GetReadout().target_range_yd == Approx(2000.0f));
  REQUIRE(simulator.GetReadout().gyro_angle_deg != gyro_before);
}
