#pragma once

#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stockflow::v1 {

// =============================================================================
// Model Schema
// =============================================================================
// Declarative description of a stock-flow-auxiliary model as produced by the
// upstream generator. Plain data; see validate_model() for the structural
// rules the engine relies on.
// =============================================================================

/// Number with a unit label (parameters, time settings, scope values)
struct Quantity {
    Real value = 0.0;
    std::string unit;
};

struct StockDef {
    std::string name;
    Real initial_value = 0.0;
    std::string unit;
    std::string description;
};

struct ParameterDef {
    Real value = 0.0;
    std::string unit;
    std::string description;
};

struct AuxiliaryDef {
    std::string name;
    std::string formula;
    std::string unit;
    std::string description;
};

struct FlowDef {
    std::string name;
    std::string formula;
    std::string unit;
    std::string description;
};

struct FlowConnection {
    std::string flow_name;
    std::string stock_name;
    FlowDirection direction = FlowDirection::Inflow;
};

struct TimeSetting {
    Real value = 0.0;
    std::string unit = "time_unit";
};

struct SimulationSettings {
    TimeSetting end_time{100.0, "time_unit"};
    TimeSetting dt{1.0, "time_unit"};
};

using ParameterMap = std::map<std::string, ParameterDef>;

struct ModelConfig {
    std::vector<StockDef> stocks;
    ParameterMap parameters;
    std::vector<AuxiliaryDef> auxiliaries;
    std::vector<FlowDef> flows;
    std::vector<FlowConnection> flow_connections;
    SimulationSettings simulation_settings;
    std::string problem_description;
};

// =============================================================================
// Validation
// =============================================================================

struct ValidationIssue {
    ErrorCode code = ErrorCode::None;
    std::string subject;
    std::string message;
};

/// Names that cannot be used for entities (scope builtins and keywords)
[[nodiscard]] bool is_reserved_name(std::string_view name) noexcept;

/// True for [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool is_identifier(std::string_view name) noexcept;

/// Collect every structural problem: names, uniqueness, connections, time
/// settings. An empty result means the model can be simulated.
[[nodiscard]] std::vector<ValidationIssue> validate_model(const ModelConfig& model);

/// Throws ConfigError describing the first issue found
void require_valid(const ModelConfig& model);

/// Upper bound on end_time / dt accepted by validate_model
inline constexpr std::size_t kMaxStepCount = 100'000'000;

/// Number of recorded rows for the given settings: floor(end_time / dt) + 1.
/// Throws ConfigError when the ratio is negative, not finite or not below
/// kMaxStepCount.
[[nodiscard]] std::size_t expected_step_count(const SimulationSettings& settings);

/// Unit label of every stock, auxiliary, flow and parameter
[[nodiscard]] std::map<std::string, std::string> component_units(const ModelConfig& model);

// =============================================================================
// Scenario variants
// =============================================================================

/// A parameter-only variation of a base model
struct ParameterVariation {
    std::string scenario_description;
    ParameterMap parameters;
};

/// Copy `base` and replace its parameter values with those in `variation`.
/// Parameters absent from the variation keep their base value. Unknown
/// parameter names or changed units raise ConfigError
/// (ErrorCode::ParameterVariantMismatch).
[[nodiscard]] ModelConfig make_variant(const ModelConfig& base, const ParameterVariation& variation);

}  // namespace stockflow::v1
