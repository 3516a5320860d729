// TU header --------------------------------------------
#include "tdcmk3/component_graph.h"

// c++ headers ------------------------------------------
#include <deque>
#include <format>
#include <stdexcept>
#include <utility>

// project headers --------------------------------------
#include "tdcmk3/log.h"

namespace tdcmk3 {

namespace {

[[noreturn]] void ThrowWiringError(std::string message) {
  TDCMK3_LOG_ERROR("component graph: {}", message);
  throw std::invalid_argument(std::move(message));
}

} // namespace

ComponentGraph::ComponentGraph(std::vector<Component> components)
  : components_(std::move(components))
{
  size_t const n = this->components_.size();

  for (size_t i = 0; i < n; ++i) {
    std::string const& id = this->components_[i].GetId();
    if (id.empty()) {
      ThrowWiringError(std::format("component #{} has an empty id", i));
    }
    if (!this->index_by_id_.emplace(id, i).second) {
      ThrowWiringError(std::format("duplicate component id '{}'", id));
    }
  }

  // Resolve references.
  this->resolved_inputs_.resize(n);
  for (size_t i = 0; i < n; ++i) {
    Component const& component = this->components_[i];
    std::vector<InputRef> const& inputs = component.GetInputs();

    InputArity const arity = GetInputArity(component.GetKind());
    if (inputs.size() < arity.min || inputs.size() > arity.max) {
      ThrowWiringError(std::format(
        "component '{}' ({}) takes {} to {} inputs, got {}",
        component.GetId(), GetComponentKindName(component.GetKind()), arity.min, arity.max, inputs.size()
      ));
    }

    for (InputRef const& ref : inputs) {
      std::optional<size_t> const source = this->FindIndex(ref.id);
      if (!source.has_value()) {
        ThrowWiringError(std::format("component '{}' references unknown component '{}'", component.GetId(), ref.id));
      }
      if (!this->components_[*source].HasPort(ref.port)) {
        ThrowWiringError(std::format(
          "component '{}' references port '{}' of '{}', which has none",
          component.GetId(), GetPortName(ref.port), ref.id
        ));
      }
      this->resolved_inputs_[i].push_back(ResolvedInput {
        .source = *source,
        .port = ref.port,
        .feedback = ref.feedback,
      });
    }
  }

  // Topological order over non-feedback inputs (Kahn). Ties go to declaration order.
  {
    std::vector<size_t> pending(n, 0);
    std::vector<std::vector<size_t>> dependents(n);
    for (size_t i = 0; i < n; ++i) {
      for (ResolvedInput const& input : this->resolved_inputs_[i]) {
        if (!input.feedback) {
          ++pending[i];
          dependents[input.source].push_back(i);
        }
      }
    }

    std::deque<size_t> ready;
    for (size_t i = 0; i < n; ++i) {
      if (pending[i] == 0) {
        ready.push_back(i);
      }
    }

    this->order_.reserve(n);
    while (!ready.empty()) {
      size_t const i = ready.front();
      ready.pop_front();
      this->order_.push_back(i);

      for (size_t dependent : dependents[i]) {
        if (--pending[dependent] == 0) {
          ready.push_back(dependent);
        }
      }
    }

    if (this->order_.size() != n) {
      std::string members;
      for (size_t i = 0; i < n; ++i) {
        if (pending[i] > 0) {
          members += members.empty() ? "" : ", ";
          members += this->components_[i].GetId();
        }
      }
      ThrowWiringError(std::format("cycle without a feedback input among: {}", members));
    }
  }
}

void ComponentGraph::Step(float dt) {
  // Feedback inputs see the previous step, whatever the evaluation order.
  std::vector<std::vector<float>> feedback_values(this->components_.size());
  for (size_t i = 0; i < this->components_.size(); ++i) {
    for (ResolvedInput const& input : this->resolved_inputs_[i]) {
      if (input.feedback) {
        feedback_values[i].push_back(this->components_[input.source].GetPortValue(input.port));
      }
    }
  }

  std::vector<float> input_values;
  for (size_t i : this->order_) {
    input_values.clear();

    size_t next_feedback = 0;
    for (ResolvedInput const& input : this->resolved_inputs_[i]) {
      if (input.feedback) {
        input_values.push_back(feedback_values[i][next_feedback++]);
      }
      else {
        input_values.push_back(this->components_[input.source].GetPortValue(input.port));
      }
    }

    this->components_[i].Update(dt, input_values);
  }
}

Component const& ComponentGraph::GetComponent(size_t index) const {
  return this->components_.at(index);
}

std::optional<size_t> ComponentGraph::FindIndex(std::string_view id) const {
  auto const it = this->index_by_id_.find(id);
  if (it == this->index_by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<float> ComponentGraph::GetValue(std::string_view id, Port port) const {
  std::optional<size_t> const index = this->FindIndex(id);
  if (!index.has_value()) {
    return std::nullopt;
  }
  Component const& component = this->components_[*index];
  if (!component.HasPort(port)) {
    return std::nullopt;
  }
  return component.GetPortValue(port);
}

void ComponentGraph::SetInput(std::string_view id, float value) {
  std::optional<size_t> const index = this->FindIndex(id);
  if (!index.has_value() || this->components_[*index].GetKind() != ComponentKind::kInput) {
    throw std::invalid_argument(std::format("no input component '{}'", id));
  }
  this->components_[*index].SetValue(value);
}

std::vector<ComponentSnapshot> ComponentGraph::GetSnapshots() const {
  std::vector<ComponentSnapshot> snapshots;
  snapshots.reserve(this->components_.size());

  for (Component const& component : this->components_) {
    snapshots.push_back(ComponentSnapshot {
      .id = component.GetId(),
      .name = component.GetName(),
      .kind = component.GetKind(),
      .rotation_deg = component.GetRotationDeg(),
      .value = component.GetOutputValue(),
    });
  }
  return snapshots;
}

} // namespace tdcmk3
