#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <string>

#include <tdcmk3/angle.h>
#include <tdcmk3/firing_solution.h>
#include <tdcmk3/geometry.h>

using Catch::Approx;
using namespace tdcmk3;

namespace {

FiringProblem MakeProblem(
  float own_course,
  float target_bearing,
  float target_range,
  float target_course,
  float target_speed,
  float own_speed = 3.0f
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

} // namespace

TEST_CASE("ComputeLeadAngle") {
  SECTION("sine rule") {
    std::optional<Angle> const lead = ComputeLeadAngle(20.0f, 46.0f, Angle::FromDeg(30.0f));
    REQUIRE(lead.has_value());
    REQUIRE(lead->ToDeg() == Approx(std::asin(20.0f / 46.0f * 0.5f) * 180.0f / 3.14159265f).margin(1e-3));
  }

  SECTION("equal speeds at a 90 degree track give a 90 degree lead") {
    std::optional<Angle> const lead = ComputeLeadAngle(46.0f, 46.0f, Angle::FromDeg(90.0f));
    REQUIRE(lead.has_value());
    REQUIRE(lead->ToDeg() == Approx(90.0f).margin(1e-3));
  }

  SECTION("no solution when the target outruns the torpedo across its track") {
    REQUIRE_FALSE(ComputeLeadAngle(50.0f, 46.0f, Angle::FromDeg(90.0f)).has_value());
    REQUIRE_FALSE(ComputeLeadAngle(60.0f, 46.0f, Angle::FromDeg(70.0f)).has_value());
  }

  SECTION("a stopped target needs no lead") {
    std::optional<Angle> const lead = ComputeLeadAngle(0.0f, 46.0f, Angle::FromDeg(90.0f));
    REQUIRE(lead.has_value());
    REQUIRE(lead->ToDeg() == Approx(0.0f).margin(1e-6));
  }
}

TEST_CASE("ComputeTorpedoRun") {
  SECTION("zero lead runs the range") {
    REQUIRE(ComputeTorpedoRun(1000.0f, Angle::FromDeg(90.0f), Angle(0.0f)) == Approx(1000.0f));
  }

  SECTION("sine rule triangle") {
    // Track 90 puts the right angle at the intercept point; the run lies between it and the lead angle.
    float const run = ComputeTorpedoRun(1000.0f, Angle::FromDeg(90.0f), Angle::FromDeg(30.0f));
    REQUIRE(run == Approx(1000.0f * std::sin(60.0f * 3.14159265f / 180.0f)).margin(0.1f));
  }
}

TEST_CASE("ComputeFiringSolution broadside shot at a stopped target") {
  FiringProblem const problem = MakeProblem(0.0f, 0.0f, 1000.0f, 90.0f, 0.0f);

  SECTION("with trajectory") {
    FiringSolution const solution = ComputeFiringSolution(problem);
    REQUIRE(solution.valid);
    REQUIRE(solution.converged);
    REQUIRE(solution.gyro_angle.ToDeg() == Approx(0.0f).margin(1e-3));
    REQUIRE(solution.track_angle.angle.ToDeg() == Approx(90.0f).margin(1e-3));
    REQUIRE(solution.track_angle.side == Side::kStarboard);
    REQUIRE(solution.lead_angle.ToDeg() == Approx(0.0f).margin(1e-3));
    REQUIRE(solution.torpedo_run_yd == Approx(1000.0f).margin(0.1f));
    REQUIRE(solution.torpedo_run_time_s == Approx(1000.0f / KnotsToYardsPerSecond(46.0f)).margin(0.01f));
    REQUIRE(solution.angle_on_bow.angle.ToDeg() == Approx(90.0f).margin(1e-3));
    REQUIRE(solution.angle_on_bow.side == Side::kStarboard);

    REQUIRE(solution.trajectory.has_value());
    REQUIRE_FALSE(solution.trajectory->HasTurn());
  }

  SECTION("without trajectory") {
    FiringSolution const solution = ComputeFiringSolution(problem, false);
    REQUIRE(solution.valid);
    REQUIRE_FALSE(solution.trajectory.has_value());
    REQUIRE(solution.gyro_angle.ToDeg() == Approx(0.0f).margin(1e-3));
    REQUIRE(solution.torpedo_run_yd == Approx(1000.0f).margin(0.1f));
  }
}

TEST_CASE("ComputeFiringSolution patrol 1 attack 4") {
  FiringProblem const problem = MakeProblem(281.0f, 291.0f, 1300.0f, 115.0f, 10.0f);
  FiringSolution const solution = ComputeFiringSolution(problem);

  REQUIRE(solution.valid);
  REQUIRE(solution.gyro_angle.ToDeg() >= -60.0f);
  REQUIRE(solution.gyro_angle.ToDeg() <= 60.0f);
  REQUIRE(solution.torpedo_run_time_s > 0.0f);
  REQUIRE(solution.residual.ToDeg() < 0.5f);
  REQUIRE(solution.target_bearing_relative.ToDeg() == Approx(10.0f).margin(1e-3));

  SECTION("gyro angle in both conventions") {
    REQUIRE(solution.gyro_angle_360.ToDeg() == Approx(NormalizeAngle(solution.gyro_angle.ToDeg())).margin(1e-3));
    REQUIRE(solution.torpedo_heading.ToDeg() == Approx(NormalizeAngle(281.0f + solution.gyro_angle.ToDeg())).margin(1e-3));
  }

  SECTION("run comes from the trajectory totals") {
    REQUIRE(solution.trajectory.has_value());
    REQUIRE(solution.torpedo_run_yd == Approx(solution.trajectory->total_distance_yd));
    REQUIRE(solution.torpedo_run_time_s == Approx(solution.trajectory->total_time_s));
  }

  SECTION("angles given out of range are wrapped") {
    FiringProblem const wrapped = MakeProblem(281.0f - 360.0f, 291.0f + 360.0f, 1300.0f, 115.0f - 720.0f, 10.0f);
    FiringSolution const other = ComputeFiringSolution(wrapped);
    REQUIRE(other.valid);
    REQUIRE(other.gyro_angle.ToDeg() == Approx(solution.gyro_angle.ToDeg()).margin(0.01f));
  }
}

TEST_CASE("ComputeFiringSolution hits a stopped target off the bow") {
  FiringProblem const problem = MakeProblem(0.0f, 30.0f, 2000.0f, 0.0f, 0.0f);
  FiringSolution const solution = ComputeFiringSolution(problem);

  REQUIRE(solution.valid);
  REQUIRE(solution.converged);
  REQUIRE(solution.gyro_angle.ToDeg() > 0.0f);

  // The torpedo path ends on the target.
  raylib::Vector2 const target = HeadingToVector(Angle::FromDeg(30.0f)) * 2000.0f;
  raylib::Vector2 const end = solution.trajectory->points.back();
  REQUIRE((end - target).Length() < 5.0f);
}

TEST_CASE("ComputeFiringSolution mirrors port and starboard") {
  FiringSolution const starboard = ComputeFiringSolution(MakeProblem(0.0f, 30.0f, 1500.0f, 270.0f, 12.0f));
  FiringSolution const port = ComputeFiringSolution(MakeProblem(0.0f, 330.0f, 1500.0f, 90.0f, 12.0f));

  REQUIRE(starboard.valid);
  REQUIRE(port.valid);
  REQUIRE(port.gyro_angle.ToDeg() == Approx(-starboard.gyro_angle.ToDeg()).margin(0.05f));
  REQUIRE(port.track_angle.angle.ToDeg() == Approx(starboard.track_angle.angle.ToDeg()).margin(0.05f));
  REQUIRE(port.track_angle.side != starboard.track_angle.side);
  REQUIRE(port.angle_on_bow.side != starboard.angle_on_bow.side);
}

TEST_CASE("ComputeFiringSolution rejects invalid input") {
  SECTION("negative range") {
    FiringSolution const solution = ComputeFiringSolution(MakeProblem(0.0f, 0.0f, -100.0f, 90.0f, 10.0f));
    REQUIRE_FALSE(solution.valid);
    REQUIRE_FALSE(solution.message.empty());
  }

  SECTION("non-finite speed") {
    FiringSolution const solution = ComputeFiringSolution(
      MakeProblem(0.0f, 0.0f, 1000.0f, 90.0f, std::numeric_limits<float>::quiet_NaN())
    );
    REQUIRE_FALSE(solution.valid);
  }

  SECTION("stopped torpedo") {
    FiringProblem problem = MakeProblem(0.0f, 0.0f, 1000.0f, 90.0f, 10.0f);
    problem.torpedo_speed_kn = 0.0f;
    FiringSolution const solution = ComputeFiringSolution(problem);
    REQUIRE_FALSE(solution.valid);
    REQUIRE_FALSE(solution.trajectory.has_value());
  }
}

TEST_CASE("ComputeFiringSolution reports a target the torpedo cannot lead") {
  // Target dead ahead closing at 60 kn, faster than a 46 kn torpedo.
  FiringSolution const solution = ComputeFiringSolution(MakeProblem(0.0f, 0.0f, 1500.0f, 180.0f, 60.0f));

  REQUIRE_FALSE(solution.valid);
  REQUIRE(solution.message.find("No solution") != std::string::npos);
  REQUIRE_FALSE(solution.trajectory.has_value());
  REQUIRE(solution.target_bearing_relative.ToDeg() == Approx(0.0f).margin(1e-4));
}

TEST_CASE("ComputeFiringSolution rejects an unusable configuration") {
  FiringProblem const problem = MakeProblem(281.0f, 291.0f, 1300.0f, 115.0f, 10.0f);

  SECTION("sample spacing") {
    for (float spacing : { 0.0f, -10.0f, std::numeric_limits<float>::infinity() }) {
      SolverConfig config;
      config.sample_spacing_yd = spacing;
      FiringSolution const solution = ComputeFiringSolution(problem, true, config);
      REQUIRE_FALSE(solution.valid);
      REQUIRE_FALSE(solution.trajectory.has_value());
      REQUIRE_FALSE(solution.message.empty());
    }
  }

  SECTION("blend weight") {
    SolverConfig config;
    config.blend = 0.0f;
    REQUIRE_FALSE(ComputeFiringSolution(problem, true, config).valid);
  }

  SECTION("turn rate") {
    SolverConfig config;
    config.torpedo.turn_rate_deg_s = 0.0f;
    REQUIRE_FALSE(ComputeFiringSolution(problem, true, config).valid);
  }

  SECTION("the default configuration is usable") {
    REQUIRE(ComputeFiringSolution(problem, true, SolverConfig()).valid);
  }
}
