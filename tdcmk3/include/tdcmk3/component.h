#pragma once

// c++ headers ------------------------------------------
#include <cstddef>

#include <span>
#include <string>
#include <variant>
#include <vector>

// project headers --------------------------------------
#include "tdcmk3/torpedo.h"

namespace tdcmk3 {

enum class ComponentKind {
  kDifferential,
  kIntegrator,
  kResolver,
  kCam,
  kSynchro,
  kInput,
  kOutput,
};

char const* GetComponentKindName(ComponentKind kind);

/// Output shaft of a component. Only resolvers have the sine and cosine ports.
enum class Port {
  kValue,
  kSin,
  kCos,
};

char const* GetPortName(Port port);

/// Optional wrapping of a shaft that carries an angle, in degrees.
enum class AngleWrap {
  kNone,
  kSigned,   // [-180, 180]
  kUnsigned, // [0, 360)
};

enum class CamProfile {
  kLinear,
  kSine,
  kCosine,
  kReach,
  kTransfer,
  kTurnArc,
};

char const* GetCamProfileName(CamProfile profile);

/// Reference from a component input to the output port of another component.
struct InputRef final {
  std::string id;
  Port port = Port::kValue;
  /// A feedback input reads the value the source had at the end of the previous step, and does not
  /// constrain the evaluation order. Servo loops close through feedback inputs.
  bool feedback = false;
};

/// Bevel gear differential: input 0 plus or minus input 1.
struct Differential final {
  enum class Op {
    kAdd,
    kSubtract,
  };

  Op op = Op::kAdd;
  AngleWrap wrap = AngleWrap::kNone;
};

/// Ball-and-disc integrator. Input 0 is the roller position, input 1 the disc rate; the output is the
/// running total of roller × disc × dt since the topology was built.
struct Integrator final {
  float accumulated = 0.0f;
  float disc_rotation_deg = 0.0f;
};

/// Input 0 is an angle in degrees, input 1 (optional, else 1) a magnitude. The primary output passes the
/// angle through; the sine and cosine ports carry magnitude × sin(angle) and magnitude × cos(angle).
struct Resolver final {
  float sin_value = 0.0f;
  float cos_value = 0.0f;
};

/// Shaped profile of one input, in degrees for the angular profiles. The torpedo profiles (reach,
/// transfer, turn arc) are cut for one torpedo and speed and take the gyro angle.
struct Cam final {
  CamProfile profile = CamProfile::kLinear;
  TorpedoSpec torpedo;
  float torpedo_speed_kn = kMark14HighSpeedKn;

  float Evaluate(float input) const;
};

/// Transmits one angle unchanged between sections of the computer.
struct Synchro final {};

/// Hand crank or dial: its value is set from outside.
struct Input final {};

/// Dial driven by one input.
struct Output final {};

using ComponentVariant = std::variant<
  Differential,
  Integrator,
  Resolver,
  Cam,
  Synchro,
  Input,
  Output
>;

struct InputArity final {
  size_t min = 0;
  size_t max = 0;
};

InputArity GetInputArity(ComponentKind kind);

class Component final {
public:
  Component(
    std::string id,
    std::string name,
    ComponentVariant variant,
    std::vector<InputRef> inputs = {}
  );

  std::string const& GetId() const { return this->id_; }
  std::string const& GetName() const { return this->name_; }
  ComponentKind GetKind() const;
  ComponentVariant const& GetVariant() const { return this->variant_; }
  std::vector<InputRef> const& GetInputs() const { return this->inputs_; }

  float GetOutputValue() const { return this->output_value_; }
  /// Shaft position for animation, in [0°, 360°).
  float GetRotationDeg() const { return this->rotation_deg_; }

  bool HasPort(Port port) const;
  /// Throws `std::invalid_argument` when this component has no such port.
  float GetPortValue(Port port) const;

  /// Advance by `dt` seconds with the current values of the inputs, in declaration order.
  ///
  /// ## Returns
  /// The new output value.
  float Update(float dt, std::span<float const> input_values);

  /// Set the value of an `Input` component. Throws `std::logic_error` for any other kind.
  void SetValue(float value);

private:
  std::string id_;
  std::string name_;
  ComponentVariant variant_;
  std::vector<InputRef> inputs_;

  float output_value_ = 0.0f;
  float rotation_deg_ = 0.0f;
};

} // namespace tdcmk3
