#pragma once

// c++ headers ------------------------------------------
#include <optional>
#include <string_view>
#include <vector>

// project headers --------------------------------------
#include "tdcmk3/access.h"
#include "tdcmk3/component_graph.h"
#include "tdcmk3/firing_solution.h"
#include "tdcmk3/topology.h"
#include "tdcmk3/torpedo.h"

namespace tdcmk3 {

struct SimulatorConfig final {
  TorpedoSpec torpedo;
  /// Speed the angle solver cams are cut for.
  float torpedo_speed_kn = kMark14HighSpeedKn;
  float servo_gain = kDefaultServoGain;
  /// Update the range and bearing dials from the position keeper, as the TDC does between observations.
  bool generate_present_position = true;
  /// The problem is solved when both balance errors are below the larger of these two thresholds.
  float solved_min_error_yd = 5.0f;
  float solved_relative_error = 0.001f; // Fraction of the present range.
};

/// Dial readings after a step.
struct SimulatorReadout final {
  float time_s = 0.0f;

  // Position keeper.
  float target_range_yd = 0.0f;
  float target_bearing_deg = 0.0f;
  float relative_bearing_deg = 0.0f;
  float target_angle_deg = 0.0f;
  float range_rate_yps = 0.0f;    // dR/dt; negative while closing.
  float bearing_rate_deg_s = 0.0f;

  // Angle solver.
  float gyro_angle_deg = 0.0f;
  float impact_angle_deg = 0.0f;
  float torpedo_run_yd = 0.0f;
  float target_travel_during_run_yd = 0.0f;

  /// H - S × U / Sz: target travel set into the solver against the travel during the computed run.
  float range_balance_error_yd = 0.0f;
  float lateral_error_yd = 0.0f;
  bool solved = false;
};

/// Steps the position keeper and angle solver topology over simulated time.
class Simulator final {
public:
  explicit Simulator(SimulatorConfig const& config = SimulatorConfig());
  ~Simulator() = default;

  TDCMK3_DISALLOW_COPY_DEFAULT_MOVE(Simulator)

  /// Set the dials from `problem`. Angles are wrapped into [0°, 360°).
  ///
  /// Throws `std::invalid_argument`, leaving the dials as they were, for a non-finite value, a negative
  /// speed or range, or a torpedo speed that is not positive.
  ///
  /// A torpedo speed other than the one the cams are cut for rebuilds the topology, which resets every
  /// integrator and the gyro servo.
  void SetInputs(FiringProblem const& problem);

  /// Advance every component once by `dt` seconds. Throws `std::invalid_argument` for a negative or
  /// non-finite `dt`.
  SimulatorReadout const& Step(float dt);

  /// Rebuild the topology and restart the clock, keeping the dial settings.
  void Reset();

  SimulatorReadout const& GetReadout() const { return this->readout_; }
  std::vector<ComponentSnapshot> GetSnapshots() const { return this->graph_.GetSnapshots(); }
  ComponentGraph const& GetGraph() const { return this->graph_; }
  std::optional<float> GetValue(std::string_view id) const { return this->graph_.GetValue(id); }
  SimulatorConfig const& GetConfig() const { return this->config_; }

private:
  void ApplyInputs();
  float GetRequiredValue(std::string_view component_id) const;

  SimulatorConfig config_;
  ComponentGraph graph_;

  FiringProblem problem_;
  float time_s_ = 0.0f;
  float range_closed_yd_ = 0.0f;
  float bearing_travel_yd_ = 0.0f;

  SimulatorReadout readout_;
};

} // namespace tdcmk3
