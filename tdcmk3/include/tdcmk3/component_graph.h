#pragma once

// c++ headers ------------------------------------------
#include <cstddef>

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// project headers --------------------------------------
#include "tdcmk3/access.h"
#include "tdcmk3/component.h"

namespace tdcmk3 {

/// State of one component after a step, for whatever draws the computer.
struct ComponentSnapshot final {
  std::string id;
  std::string name;
  ComponentKind kind = ComponentKind::kInput;
  float rotation_deg = 0.0f;
  float value = 0.0f;
};

/// Dataflow graph of mechanical components.
///
/// Input references are resolved to component indices once, when the graph is built, and every step
/// evaluates the components in a fixed topological order of their non-feedback inputs.
class ComponentGraph final {
public:
  /// Build the graph from `components`.
  ///
  /// Throws `std::invalid_argument` for an empty or duplicate id, a reference to an unknown id, a wrong
  /// number of inputs, a reference to a port the source does not have, or a cycle of non-feedback inputs.
  explicit ComponentGraph(std::vector<Component> components);
  ~ComponentGraph() = default;

  TDCMK3_DISALLOW_COPY_DEFAULT_MOVE(ComponentGraph)

  /// Update every component once, in evaluation order, with a shared `dt` in seconds.
  void Step(float dt);

  size_t GetSize() const { return this->components_.size(); }

  /// Throws `std::out_of_range` for an index past the end.
  Component const& GetComponent(size_t index) const;

  std::optional<size_t> FindIndex(std::string_view id) const;

  /// ## Returns
  /// `std::nullopt` when there is no component with `id`.
  std::optional<float> GetValue(std::string_view id, Port port = Port::kValue) const;

  /// Set the value of the `Input` component `id`. Throws `std::invalid_argument` when there is no such
  /// input.
  void SetInput(std::string_view id, float value);

  std::vector<ComponentSnapshot> GetSnapshots() const;

  /// Component indices in the order they are updated.
  std::span<size_t const> GetEvaluationOrder() const { return this->order_; }

private:
  struct ResolvedInput final {
    size_t source = 0;
    Port port = Port::kValue;
    bool feedback = false;
  };

  std::vector<Component> components_;
  std::vector<std::vector<ResolvedInput>> resolved_inputs_;
  std::vector<size_t> order_;
  std::map<std::string, size_t, std::less<>> index_by_id_;
};

} // namespace tdcmk3
