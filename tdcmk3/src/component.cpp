// TU header --------------------------------------------
#include "tdcmk3/component.h"

// c++ headers ------------------------------------------
#include <cassert>
#include <cmath>

#include <format>
#include <stdexcept>
#include <utility>

// project headers --------------------------------------
#include "tdcmk3/angle.h"
#include "tdcmk3/geometry.h"

namespace tdcmk3 {

// Alternatives of ComponentVariant are declared in ComponentKind order.
static_assert(std::variant_size_v<ComponentVariant> == static_cast<size_t>(ComponentKind::kOutput) + 1);

namespace {

/// Animation gearing of shafts driven by a rate (differential outputs, integrator discs).
constexpr float kRateShaftGearing = 10.0f;
/// Animation gearing of cam followers.
constexpr float kCamShaftGearing = 2.0f;

float ApplyWrap(AngleWrap wrap, float deg) {
  switch (wrap) {
  case AngleWrap::kNone: return deg;
  case AngleWrap::kSigned: return NormalizeSigned(deg);
  case AngleWrap::kUnsigned: return NormalizeAngle(deg);
  }
  return deg;
}

} // namespace

char const* GetComponentKindName(ComponentKind kind) {
  switch (kind) {
  case ComponentKind::kDifferential: return "differential";
  case ComponentKind::kIntegrator: return "integrator";
  case ComponentKind::kResolver: return "resolver";
  case ComponentKind::kCam: return "cam";
  case ComponentKind::kSynchro: return "synchro";
  case ComponentKind::kInput: return "input";
  case ComponentKind::kOutput: return "output";
  }
  return "unknown";
}

char const* GetPortName(Port port) {
  switch (port) {
  case Port::kValue: return "value";
  case Port::kSin: return "sin";
  case Port::kCos: return "cos";
  }
  return "unknown";
}

char const* GetCamProfileName(CamProfile profile) {
  switch (profile) {
  case CamProfile::kLinear: return "linear";
  case CamProfile::kSine: return "sine";
  case CamProfile::kCosine: return "cosine";
  case CamProfile::kReach: return "reach";
  case CamProfile::kTransfer: return "transfer";
  case CamProfile::kTurnArc: return "turn arc";
  }
  return "unknown";
}

InputArity GetInputArity(ComponentKind kind) {
  switch (kind) {
  case ComponentKind::kDifferential: return { .min = 2, .max = 2 };
  case ComponentKind::kIntegrator: return { .min = 2, .max = 2 };
  case ComponentKind::kResolver: return { .min = 1, .max = 2 };
  case ComponentKind::kCam: return { .min = 1, .max = 1 };
  case ComponentKind::kSynchro: return { .min = 1, .max = 1 };
  case ComponentKind::kInput: return { .min = 0, .max = 0 };
  case ComponentKind::kOutput: return { .min = 1, .max = 1 };
  }
  return {};
}

float Cam::Evaluate(float input) const {
  Angle const angle = Angle::FromDeg(input);

  switch (this->profile) {
  case CamProfile::kLinear: return input;
  case CamProfile::kSine: return angle.Sin();
  case CamProfile::kCosine: return angle.Cos();
  case CamProfile::kReach: return this->torpedo.ComputeReachAdvance(this->torpedo_speed_kn, angle);
  case CamProfile::kTransfer: return this->torpedo.ComputeTransfer(this->torpedo_speed_kn, angle);
  case CamProfile::kTurnArc: return this->torpedo.ComputeTurnArc(this->torpedo_speed_kn, angle);
  }
  return input;
}

Component::Component(
  std::string id,
  std::string name,
  ComponentVariant variant,
  std::vector<InputRef> inputs
)
  : id_(std::move(id))
  , name_(std::move(name))
  , variant_(std::move(variant))
  , inputs_(std::move(inputs))
{
}

ComponentKind Component::GetKind() const {
  return static_cast<ComponentKind>(this->variant_.index());
}

bool Component::HasPort(Port port) const {
  return (port == Port::kValue) || std::holds_alternative<Resolver>(this->variant_);
}

float Component::GetPortValue(Port port) const {
  if (port == Port::kValue) {
    return this->output_value_;
  }

  Resolver const* resolver = std::get_if<Resolver>(&this->variant_);
  if (resolver == nullptr) {
    throw std::invalid_argument(std::format(
      "component '{}' ({}) has no {} port", this->id_, GetComponentKindName(this->GetKind()), GetPortName(port)
    ));
  }
  return (port == Port::kSin) ? resolver->sin_value : resolver->cos_value;
}

float Component::Update(float dt, std::span<float const> input_values) {
  assert(input_values.size() >= GetInputArity(this->GetKind()).min);

  switch (this->GetKind()) {
  case ComponentKind::kDifferential: {
    Differential const& differential = std::get<Differential>(this->variant_);
    float const sum = (differential.op == Differential::Op::kAdd)
      ? input_values[0] + input_values[1]
      : input_values[0] - input_values[1];
    this->output_value_ = ApplyWrap(differential.wrap, sum);
    this->rotation_deg_ = NormalizeAngle(this->rotation_deg_ + this->output_value_ * dt * kRateShaftGearing);
    break;
  }

  case ComponentKind::kIntegrator: {
    Integrator& integrator = std::get<Integrator>(this->variant_);
    float const roller_position = input_values[0];
    float const disc_rate = input_values[1];
    integrator.accumulated += roller_position * disc_rate * dt;
    integrator.disc_rotation_deg = NormalizeAngle(integrator.disc_rotation_deg + disc_rate * dt * kRateShaftGearing);
    this->output_value_ = integrator.accumulated;
    this->rotation_deg_ = integrator.disc_rotation_deg;
    break;
  }

  case ComponentKind::kResolver: {
    Resolver& resolver = std::get<Resolver>(this->variant_);
    float const angle_deg = input_values[0];
    float const magnitude = (input_values.size() > 1) ? input_values[1] : 1.0f;
    Angle const angle = Angle::FromDeg(angle_deg);
    resolver.sin_value = magnitude * angle.Sin();
    resolver.cos_value = magnitude * angle.Cos();
    this->output_value_ = angle_deg;
    this->rotation_deg_ = NormalizeAngle(angle_deg);
    break;
  }

  case ComponentKind::kCam: {
    Cam const& cam = std::get<Cam>(this->variant_);
    this->output_value_ = cam.Evaluate(input_values[0]);
    this->rotation_deg_ = NormalizeAngle(input_values[0] * kCamShaftGearing);
    break;
  }

  case ComponentKind::kSynchro:
    this->output_value_ = input_values[0];
    this->rotation_deg_ = NormalizeAngle(this->output_value_);
    break;

  case ComponentKind::kInput:
    this->rotation_deg_ = NormalizeAngle(this->rotation_deg_ + this->output_value_ * dt);
    break;

  case ComponentKind::kOutput:
    this->output_value_ = input_values[0];
    this->rotation_deg_ = NormalizeAngle(this->rotation_deg_ + this->output_value_ * dt);
    break;
  }

  return this->output_value_;
}

void Component::SetValue(float value) {
  if (!std::holds_alternative<Input>(this->variant_)) {
    throw std::logic_error(std::format(
      "component '{}' is a {}, only inputs can be set", this->id_, GetComponentKindName(this->GetKind())
    ));
  }
  this->output_value_ = value;
}

} // namespace tdcmk3
