// TU header --------------------------------------------
#include "tdcmk3/simulator.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>
#include <format>
#include <stdexcept>

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/log.h"

namespace tdcmk3 {

namespace id = topology_id;

Simulator::Simulator(SimulatorConfig const& config)
  : config_(config)
  , graph_(BuildTdcTopology(config.torpedo, config.torpedo_speed_kn, config.servo_gain))
{
  this->problem_.torpedo_speed_kn = config.torpedo_speed_kn;
  this->ApplyInputs();
}

void Simulator::SetInputs(FiringProblem const& problem) {
  bool const finite =
    std::isfinite(problem.own_course.AsRad()) &&
    std::isfinite(problem.own_speed_kn) &&
    std::isfinite(problem.target_bearing.AsRad()) &&
    std::isfinite(problem.target_range_yd) &&
    std::isfinite(problem.target_course.AsRad()) &&
    std::isfinite(problem.target_speed_kn) &&
    std::isfinite(problem.torpedo_speed_kn);
  if (!finite) {
    throw std::invalid_argument("firing problem values must be finite");
  }
  if (problem.own_speed_kn < 0.0f || problem.target_speed_kn < 0.0f || problem.target_range_yd < 0.0f) {
    throw std::invalid_argument(std::format(
      "speeds and range must not be negative; own speed:{}, target speed:{}, range:{}",
      problem.own_speed_kn, problem.target_speed_kn, problem.target_range_yd
    ));
  }
  if (problem.torpedo_speed_kn <= 0.0f) {
    throw std::invalid_argument(std::format("torpedo speed must be positive, got {}", problem.torpedo_speed_kn));
  }

  this->problem_ = problem;
  this->problem_.own_course = problem.own_course.WrapAround();
  this->problem_.target_bearing = problem.target_bearing.WrapAround();
  this->problem_.target_course = problem.target_course.WrapAround();

  if (problem.torpedo_speed_kn != this->config_.torpedo_speed_kn) {
    TDCMK3_LOG_INFO(
      "torpedo speed changed from {} kn to {} kn; rebuilding the angle solver",
      this->config_.torpedo_speed_kn, problem.torpedo_speed_kn
    );
    this->config_.torpedo_speed_kn = problem.torpedo_speed_kn;
    this->Reset();
    return;
  }

  this->ApplyInputs();
}

SimulatorReadout const& Simulator::Step(float dt) {
  if (!std::isfinite(dt) || dt < 0.0f) {
    throw std::invalid_argument(std::format("time step must be finite and not negative, got {}", dt));
  }

  this->graph_.Step(dt);
  this->time_s_ += dt;

  SimulatorReadout& r = this->readout_;
  r.time_s = this->time_s_;

  // Position keeper increments over this step.
  float const range_closed = this->GetRequiredValue(id::kRangeClosed);
  float const bearing_travel = this->GetRequiredValue(id::kBearingTravel);
  float const delta_closed = range_closed - this->range_closed_yd_;
  float const delta_bearing_travel = bearing_travel - this->bearing_travel_yd_;
  this->range_closed_yd_ = range_closed;
  this->bearing_travel_yd_ = bearing_travel;

  float const range = this->problem_.target_range_yd;
  Angle const delta_bearing = (range > 0.0f) ? Angle(delta_bearing_travel / range) : Angle(0.0f);

  r.range_rate_yps = (dt > 0.0f) ? -delta_closed / dt : 0.0f;
  r.bearing_rate_deg_s = (dt > 0.0f) ? delta_bearing.ToDeg() / dt : 0.0f;

  if (this->config_.generate_present_position) {
    this->problem_.target_range_yd = std::max(0.0f, range - delta_closed);
    this->problem_.target_bearing = (this->problem_.target_bearing + delta_bearing).WrapAround();
    this->graph_.SetInput(id::kTargetRange, this->problem_.target_range_yd);
    this->graph_.SetInput(id::kTargetBearing, this->problem_.target_bearing.ToDeg());
  }

  r.target_range_yd = this->problem_.target_range_yd;
  r.target_bearing_deg = this->problem_.target_bearing.ToDeg();
  r.relative_bearing_deg = this->GetRequiredValue(id::kRelativeBearing);
  r.target_angle_deg = this->GetRequiredValue(id::kTargetAngle);

  r.gyro_angle_deg = this->GetRequiredValue(id::kGyroAngle);
  r.impact_angle_deg = this->GetRequiredValue(id::kImpactAngle);
  r.torpedo_run_yd = this->GetRequiredValue(id::kTorpedoRun);
  r.lateral_error_yd = this->GetRequiredValue(id::kLateralError);

  // Target travel during the run, H = S × U / Sz, goes back into the solver for the next step.
  float const target_travel_set = this->GetRequiredValue(id::kTargetTravelDuringRun);
  float const target_travel = std::max(0.0f, r.torpedo_run_yd)
    * this->problem_.target_speed_kn / this->config_.torpedo_speed_kn;
  r.range_balance_error_yd = target_travel_set - target_travel;
  r.target_travel_during_run_yd = target_travel;
  this->graph_.SetInput(id::kTargetTravelDuringRun, target_travel);

  float const threshold = std::max(
    this->config_.solved_min_error_yd,
    this->config_.solved_relative_error * r.target_range_yd
  );
  r.solved = std::abs(r.lateral_error_yd) < threshold && std::abs(r.range_balance_error_yd) < threshold;

  return r;
}

void Simulator::Reset() {
  this->graph_ = BuildTdcTopology(this->config_.torpedo, this->config_.torpedo_speed_kn, this->config_.servo_gain);
  this->time_s_ = 0.0f;
  this->range_closed_yd_ = 0.0f;
  this->bearing_travel_yd_ = 0.0f;
  this->readout_ = SimulatorReadout();
  this->ApplyInputs();
}

void Simulator::ApplyInputs() {
  FiringProblem const& p = this->problem_;

  this->graph_.SetInput(id::kOwnSpeed, KnotsToYardsPerSecond(p.own_speed_kn));
  this->graph_.SetInput(id::kOwnCourse, p.own_course.ToDeg());
  this->graph_.SetInput(id::kTargetSpeed, KnotsToYardsPerSecond(p.target_speed_kn));
  this->graph_.SetInput(id::kTargetCourse, p.target_course.ToDeg());
  this->graph_.SetInput(id::kTargetBearing, p.target_bearing.ToDeg());
  this->graph_.SetInput(id::kTargetRange, p.target_range_yd);

  this->readout_.target_range_yd = p.target_range_yd;
  this->readout_.target_bearing_deg = p.target_bearing.ToDeg();
}

float Simulator::GetRequiredValue(std::string_view component_id) const {
  // Every id read here is part of the topology built by BuildTdcTopology.
  return this->graph_.GetValue(component_id).value();
}

} // namespace tdcmk3
