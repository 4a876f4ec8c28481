#include "stockflow/v1/scenario_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <thread>

namespace stockflow::v1 {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}  // namespace

unsigned int resolve_worker_count(unsigned int requested, std::size_t scenario_count) {
    if (scenario_count == 0) return 1;

    unsigned int workers = requested;
    if (workers == 0) {
        if (const char* env = std::getenv("STOCKFLOW_THREADS")) {
            try {
                const unsigned long parsed = std::stoul(env);
                workers = static_cast<unsigned int>(std::max<unsigned long>(1UL, parsed));
            } catch (const std::exception&) {
                workers = 0;
            }
        }
    }

    if (workers == 0) workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    return std::min<unsigned int>(workers, static_cast<unsigned int>(scenario_count));
}

ScenarioRunner::ScenarioRunner(RunnerOptions options)
    : options_(std::move(options)), control_(std::make_shared<SimulationControl>()) {}

ScenarioOutcome ScenarioRunner::run_one(const Scenario& scenario) const {
    ScenarioOutcome outcome;
    outcome.label = scenario.label;
    const auto start = Clock::now();

    if (!scenario.model) {
        outcome.error = scenario.preparation_error;
        return outcome;
    }
    outcome.units = component_units(*scenario.model);

    if (control_->should_stop()) {
        ErrorDetail detail;
        detail.code = ErrorCode::Cancelled;
        detail.message = "Scenario '" + scenario.label + "' cancelled before it started";
        outcome.error = std::move(detail);
        return outcome;
    }

    try {
        Simulator simulator(*scenario.model, options_.simulation);
        outcome.series = simulator.run(nullptr, control_.get());
        outcome.status = ScenarioStatus::Success;
    } catch (const SimulationError& e) {
        outcome.series = e.partial();
        outcome.error = describe_error(e);
    } catch (const ModelError& e) {
        outcome.error = describe_error(e);
    } catch (const std::exception& e) {
        outcome.error = describe_error(e);
    }

    outcome.wall_time_seconds = seconds_since(start);
    return outcome;
}

std::vector<ScenarioOutcome> ScenarioRunner::run(const std::vector<Scenario>& scenarios,
                                                 ScenarioCallback callback) {
    std::vector<ScenarioOutcome> outcomes(scenarios.size());
    if (scenarios.empty()) {
        control_->reset();
        return outcomes;
    }

    std::mutex callback_mutex;
    auto finish = [&](std::size_t index) {
        if (!callback) return;
        std::lock_guard<std::mutex> lock(callback_mutex);
        callback(index, outcomes[index]);
    };

    const unsigned int workers = resolve_worker_count(options_.max_workers, scenarios.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < scenarios.size(); ++i) {
            outcomes[i] = run_one(scenarios[i]);
            finish(i);
        }
        control_->reset();
        return outcomes;
    }

    // Each worker writes only its own slots; join() publishes them
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned int w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            while (true) {
                const std::size_t index = next.fetch_add(1);
                if (index >= scenarios.size()) break;
                outcomes[index] = run_one(scenarios[index]);
                finish(index);
            }
        });
    }
    for (auto& worker : pool) worker.join();
    control_->reset();
    return outcomes;
}

std::vector<Scenario> make_scenarios(const ModelConfig& base,
                                     const std::vector<ParameterVariation>& variations) {
    std::vector<Scenario> scenarios;
    scenarios.reserve(variations.size() + 1);
    scenarios.push_back({std::string(kBaseScenarioLabel), base, {}});

    for (const auto& variation : variations) {
        Scenario scenario;
        scenario.label = variation.scenario_description;
        try {
            scenario.model = make_variant(base, variation);
        } catch (const ConfigError& e) {
            scenario.preparation_error = describe_error(e);
        }
        scenarios.push_back(std::move(scenario));
    }
    return scenarios;
}

std::vector<ScenarioOutcome> run_scenarios(const std::vector<Scenario>& scenarios,
                                           const RunnerOptions& options) {
    ScenarioRunner runner(options);
    return runner.run(scenarios);
}

}  // namespace stockflow::v1
