#pragma once

// =============================================================================
// stockflow - Scenario batches
// =============================================================================
// Runs independent model variants on a bounded pool of worker threads. Every
// scenario builds its own Simulator, so no entity state crosses scenario
// boundaries. A failing scenario becomes a failure record; it never aborts or
// delays its siblings. Outcomes come back in input order.
// =============================================================================

#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/model.hpp"
#include "stockflow/v1/simulation.hpp"
#include "stockflow/v1/time_series.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stockflow::v1 {

inline constexpr std::string_view kBaseScenarioLabel = "Base Case Scenario";

/// One entry of a batch. `model` is empty when the variant could not be
/// prepared (bad variation); `preparation_error` then says why.
struct Scenario {
    std::string label;
    std::optional<ModelConfig> model;
    ErrorDetail preparation_error;
};

enum class ScenarioStatus : std::uint8_t {
    Success,
    Failure
};

[[nodiscard]] constexpr std::string_view to_string(ScenarioStatus status) noexcept {
    switch (status) {
        case ScenarioStatus::Success: return "success";
        case ScenarioStatus::Failure: return "failure";
    }
    return "unknown";
}

struct ScenarioOutcome {
    std::string label;
    ScenarioStatus status = ScenarioStatus::Failure;
    TimeSeries series;                       // full on success, partial (or empty) on failure
    std::optional<ErrorDetail> error;
    std::map<std::string, std::string> units;
    double wall_time_seconds = 0.0;

    [[nodiscard]] bool ok() const { return status == ScenarioStatus::Success; }
};

struct RunnerOptions {
    unsigned int max_workers = 0;  // 0 = STOCKFLOW_THREADS or hardware concurrency
    SimulationOptions simulation;
};

/// Invoked as each scenario finishes (any order, never concurrently)
using ScenarioCallback = std::function<void(std::size_t index, const ScenarioOutcome& outcome)>;

class ScenarioRunner {
public:
    explicit ScenarioRunner(RunnerOptions options = {});

    /// Run every scenario. The result has exactly scenarios.size() entries.
    /// A cancel() applies to the current (or next) run only; the runner is
    /// reusable once run() returns.
    [[nodiscard]] std::vector<ScenarioOutcome> run(const std::vector<Scenario>& scenarios,
                                                   ScenarioCallback callback = nullptr);

    /// Ask running scenarios to stop at their next step; pending ones fail
    /// immediately with `cancelled`
    void cancel() { control_->request_stop(); }

    [[nodiscard]] const RunnerOptions& options() const { return options_; }

private:
    [[nodiscard]] ScenarioOutcome run_one(const Scenario& scenario) const;

    RunnerOptions options_;
    std::shared_ptr<SimulationControl> control_;
};

/// Worker count for `scenario_count` jobs: `requested`, else the
/// STOCKFLOW_THREADS environment variable, else hardware concurrency; never
/// more than the number of jobs and never less than one
[[nodiscard]] unsigned int resolve_worker_count(unsigned int requested, std::size_t scenario_count);

/// Base case first, then one scenario per variation. Variations that do not
/// fit the base model become scenarios without a model.
[[nodiscard]] std::vector<Scenario> make_scenarios(const ModelConfig& base,
                                                   const std::vector<ParameterVariation>& variations);

/// Convenience wrapper around ScenarioRunner
[[nodiscard]] std::vector<ScenarioOutcome> run_scenarios(const std::vector<Scenario>& scenarios,
                                                         const RunnerOptions& options = {});

}  // namespace stockflow::v1
