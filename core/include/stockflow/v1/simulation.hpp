#pragma once

#include "stockflow/simulation_control.hpp"
#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/expression.hpp"
#include "stockflow/v1/model.hpp"
#include "stockflow/v1/resolver.hpp"
#include "stockflow/v1/time_series.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace stockflow::v1 {

using ::stockflow::ProgressCallbackConfig;
using ::stockflow::SimulationControl;
using ::stockflow::SimulationProgress;

// =============================================================================
// Run configuration
// =============================================================================

struct SimulationOptions {
    ResolverOptions resolver;
    std::optional<Real> end_time;          // overrides simulation_settings.end_time
    std::optional<Real> dt;                // overrides simulation_settings.dt
    double wall_clock_limit_seconds = 0.0; // 0 = unlimited
};

enum class SimulationState : std::uint8_t {
    Initialized,
    Stepping,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(SimulationState state) noexcept {
    switch (state) {
        case SimulationState::Initialized: return "initialized";
        case SimulationState::Stepping: return "stepping";
        case SimulationState::Completed: return "completed";
        case SimulationState::Failed: return "failed";
    }
    return "unknown";
}

// Called once per recorded row (time first, then the remaining columns)
using SimulationCallback = std::function<void(Real time, std::span<const Real> row)>;

// =============================================================================
// Runtime entities
// =============================================================================

struct Stock {
    std::string name;
    Real value = 0.0;
    std::string unit;
    std::vector<std::string> inflows;   // flow names, not owned
    std::vector<std::string> outflows;
};

struct Flow {
    std::string name;
    CompiledFormula formula;
    std::string unit;
    Real rate = 0.0;
};

struct Auxiliary {
    std::string name;
    CompiledFormula formula;
    std::string unit;
    Real value = 0.0;
};

// =============================================================================
// Simulator
// =============================================================================
// Explicit Euler integration of one model. Each step records the pre-step
// state, resolves auxiliaries, evaluates flows (clamped >= 0) and updates the
// stocks (clamped >= 0). Instances own all their state; nothing is shared
// between simulators.
// =============================================================================

class Simulator {
public:
    /// Validates the model and compiles every formula. Throws ConfigError on
    /// structural problems or formulas that do not parse.
    explicit Simulator(const ModelConfig& model, const SimulationOptions& options = {});

    /// Step until end_time. Throws SimulationError (with the partial series)
    /// on the first failing step or when stopped through `control`.
    [[nodiscard]] TimeSeries run(SimulationCallback callback = nullptr,
                                 SimulationControl* control = nullptr);

    [[nodiscard]] TimeSeries run_with_progress(SimulationCallback callback,
                                               SimulationControl* control,
                                               const ProgressCallbackConfig& progress_config);

    /// Perform one step. Returns false when every row was already recorded.
    bool step();

    [[nodiscard]] SimulationState state() const { return state_; }
    [[nodiscard]] Real current_time() const { return time_at(step_index_); }
    [[nodiscard]] std::size_t steps_completed() const { return step_index_; }
    [[nodiscard]] std::size_t total_steps() const { return total_steps_; }
    [[nodiscard]] Real end_time() const { return end_time_; }
    [[nodiscard]] Real dt() const { return dt_; }

    [[nodiscard]] const std::vector<Stock>& stocks() const { return stocks_; }
    [[nodiscard]] const std::vector<Flow>& flows() const { return flows_; }
    [[nodiscard]] const std::vector<Auxiliary>& auxiliaries() const { return auxiliaries_; }
    [[nodiscard]] const ResolverReport& last_resolver_report() const { return last_report_; }

    /// Column order of the recorded series, "time" first
    [[nodiscard]] std::vector<std::string> entity_names() const;
    [[nodiscard]] const std::map<std::string, std::string>& component_units() const { return units_; }
    [[nodiscard]] const TimeSeries& series() const { return series_; }

private:
    [[nodiscard]] Real time_at(std::size_t step) const { return static_cast<Real>(step) * dt_; }
    void record_row();
    void load_scope();
    [[noreturn]] void fail(ErrorCode code,
                           std::string entity,
                           std::optional<EntityKind> kind,
                           std::string formula,
                           const std::string& cause);

    std::vector<Stock> stocks_;
    std::vector<Flow> flows_;
    std::vector<Auxiliary> auxiliaries_;
    std::map<std::string, std::string> units_;

    // Flow indices per stock, resolved once from the names in Stock
    std::vector<std::vector<std::size_t>> inflow_index_;
    std::vector<std::vector<std::size_t>> outflow_index_;

    DependencyResolver resolver_;
    ResolverReport last_report_;
    Scope scope_;
    TimeSeries series_;
    std::vector<Real> row_buffer_;

    SimulationOptions options_;
    Real end_time_ = 0.0;
    Real dt_ = 1.0;
    std::size_t total_steps_ = 0;
    std::size_t step_index_ = 0;
    SimulationState state_ = SimulationState::Initialized;
    std::chrono::steady_clock::time_point started_{};
};

/// Build a simulator and run it to completion
[[nodiscard]] TimeSeries simulate(const ModelConfig& model, const SimulationOptions& options = {});

/// A formula name that is neither an entity, a parameter nor `time`
struct UnresolvedReference {
    std::string entity;
    EntityKind kind = EntityKind::Auxiliary;
    std::string name;
};

/// Names each formula reads that the model does not define. Formulas that do
/// not compile are skipped (the simulator reports them). Useful for `validate`
/// since an unresolved name only fails at the first step.
[[nodiscard]] std::vector<UnresolvedReference> find_unresolved_references(const ModelConfig& model);

struct FormulaDependencies {
    std::string entity;
    EntityKind kind = EntityKind::Auxiliary;
    std::vector<std::string> reads;
    std::optional<ErrorDetail> error;  // set when the formula does not compile
};

/// Free names read by every auxiliary and flow formula, auxiliaries first.
/// A formula that does not compile gets an error entry instead of aborting.
[[nodiscard]] std::vector<FormulaDependencies> formula_dependencies(const ModelConfig& model);

}  // namespace stockflow::v1
