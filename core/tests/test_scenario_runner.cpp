#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stockflow/v1/scenario_runner.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace stockflow::v1;
using Catch::Approx;

namespace {

ModelConfig make_savings_model(Real deposit) {
    ModelConfig model;
    model.stocks.push_back({"Savings", 100.0, "USD", ""});
    model.parameters["Deposit"] = {deposit, "USD/month", ""};
    model.flows.push_back({"Deposits", "Deposit.value", "USD/month", ""});
    model.flow_connections.push_back({"Deposits", "Savings", FlowDirection::Inflow});
    model.simulation_settings.end_time = {3.0, "month"};
    model.simulation_settings.dt = {1.0, "month"};
    return model;
}

ParameterVariation make_variation(const std::string& label, const std::string& name, Real value) {
    ParameterVariation variation;
    variation.scenario_description = label;
    variation.parameters[name] = {value, "", ""};
    return variation;
}

// Four good scenarios with a malformed one in the middle
std::vector<Scenario> make_batch() {
    std::vector<Scenario> scenarios;
    for (int i = 0; i < 5; ++i) {
        auto model = make_savings_model(10.0 * (i + 1));
        if (i == 2) {
            model.flows.front().formula = "Deposit.value *";
        }
        scenarios.push_back({"scenario-" + std::to_string(i), model, {}});
    }
    return scenarios;
}

}  // namespace

TEST_CASE("failing scenarios do not affect their siblings", "[v1][scenario]") {
    RunnerOptions options;
    options.max_workers = 3;
    const auto outcomes = run_scenarios(make_batch(), options);

    REQUIRE(outcomes.size() == 5);
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        CHECK(outcomes[i].label == "scenario-" + std::to_string(i));
    }

    const auto failures = std::count_if(outcomes.begin(), outcomes.end(),
                                        [](const ScenarioOutcome& o) { return !o.ok(); });
    CHECK(failures == 1);

    const auto& broken = outcomes[2];
    CHECK(broken.status == ScenarioStatus::Failure);
    REQUIRE(broken.error.has_value());
    CHECK(broken.error->code == ErrorCode::InvalidFormula);
    CHECK(broken.series.empty());

    CHECK(outcomes[0].series.value(3, "Savings") == Approx(130.0));
    CHECK(outcomes[4].series.value(3, "Savings") == Approx(250.0));
    CHECK(outcomes[4].units.at("Deposit") == "USD/month");
}

TEST_CASE("an oversized formula fails only its own scenario", "[v1][scenario]") {
    auto oversized = make_savings_model(10.0);
    std::string formula = "Deposit.value";
    for (int i = 0; i < 300000; ++i) formula += "+1";
    oversized.flows.front().formula = formula;

    RunnerOptions options;
    options.max_workers = 2;
    const auto outcomes = run_scenarios({{"oversized", oversized, {}}, {"plain", make_savings_model(10.0), {}}},
                                        options);

    REQUIRE(outcomes.size() == 2);
    CHECK_FALSE(outcomes[0].ok());
    REQUIRE(outcomes[0].error.has_value());
    CHECK(outcomes[0].error->code == ErrorCode::InvalidFormula);
    CHECK(outcomes[1].ok());
    CHECK(outcomes[1].series.value(3, "Savings") == Approx(130.0));
}

TEST_CASE("sequential and parallel runs agree", "[v1][scenario]") {
    RunnerOptions sequential;
    sequential.max_workers = 1;
    RunnerOptions parallel;
    parallel.max_workers = 4;

    const auto a = run_scenarios(make_batch(), sequential);
    const auto b = run_scenarios(make_batch(), parallel);
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].status == b[i].status);
        if (a[i].ok()) {
            CHECK(a[i].series.column("Savings") == b[i].series.column("Savings"));
        }
    }
}

TEST_CASE("parallel batches take about as long as the slowest scenario", "[v1][scenario][parallel]") {
    const unsigned int cores = std::thread::hardware_concurrency();
    if (cores < 2) {
        SUCCEED("single core machine, nothing runs in parallel");
        return;
    }
    const unsigned int workers = std::min(4u, cores);

    std::vector<Scenario> scenarios;
    for (unsigned int i = 0; i < workers; ++i) {
        auto model = make_savings_model(1.0 + i);
        model.auxiliaries.push_back({"Interest", "Savings * 0.0001 + max(0, 5 - Savings)", "USD/month", ""});
        model.flows.front().formula = "Deposit.value + Interest";
        model.simulation_settings.end_time.value = 200000.0;
        scenarios.push_back({"long-" + std::to_string(i), model, {}});
    }

    RunnerOptions options;
    options.max_workers = workers;
    const auto start = std::chrono::steady_clock::now();
    const auto outcomes = run_scenarios(scenarios, options);
    const double batch_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    double summed_seconds = 0.0;
    double slowest_seconds = 0.0;
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.ok());
        summed_seconds += outcome.wall_time_seconds;
        slowest_seconds = std::max(slowest_seconds, outcome.wall_time_seconds);
    }
    INFO("batch=" << batch_seconds << "s sum=" << summed_seconds << "s slowest=" << slowest_seconds << "s");
    CHECK(batch_seconds < 0.8 * summed_seconds);
    CHECK(batch_seconds >= slowest_seconds);
}

TEST_CASE("runtime failures keep the partial series", "[v1][scenario]") {
    auto model = make_savings_model(10.0);
    model.flows.front().formula = "Deposit.value / (2 - time)";
    const auto outcomes = run_scenarios({{"fragile", model, {}}});

    REQUIRE(outcomes.size() == 1);
    const auto& outcome = outcomes.front();
    CHECK_FALSE(outcome.ok());
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == ErrorCode::DivisionByZero);
    CHECK(outcome.error->entity == "Deposits");
    REQUIRE(outcome.error->time.has_value());
    CHECK(*outcome.error->time == Approx(2.0));
    CHECK(outcome.series.num_rows() == 3);
    CHECK_FALSE(outcome.series.complete());
}

TEST_CASE("callback sees every scenario exactly once", "[v1][scenario]") {
    RunnerOptions options;
    options.max_workers = 2;
    ScenarioRunner runner(options);

    std::multiset<std::size_t> seen;
    const auto outcomes = runner.run(make_batch(), [&](std::size_t index, const ScenarioOutcome& outcome) {
        seen.insert(index);
        CHECK(outcome.label == "scenario-" + std::to_string(index));
    });

    CHECK(outcomes.size() == 5);
    CHECK(seen == std::multiset<std::size_t>{0, 1, 2, 3, 4});
}

TEST_CASE("cancelled runners fail pending scenarios", "[v1][scenario]") {
    ScenarioRunner runner;
    runner.cancel();
    const auto outcomes = runner.run(make_batch());

    REQUIRE(outcomes.size() == 5);
    for (const auto& outcome : outcomes) {
        CHECK_FALSE(outcome.ok());
        REQUIRE(outcome.error.has_value());
        // the malformed model is still reported as cancelled, it never starts
        CHECK(outcome.error->code == ErrorCode::Cancelled);
    }

    // the cancellation is spent, a second batch on the same runner runs normally
    const auto again = runner.run(make_batch());
    REQUIRE(again.size() == 5);
    CHECK(again[0].ok());
    CHECK(again[0].series.value(3, "Savings") == Approx(130.0));
    CHECK_FALSE(again[2].ok());
    CHECK(again[2].error->code == ErrorCode::InvalidFormula);
}

TEST_CASE("variations become labelled scenarios", "[v1][scenario]") {
    const auto base = make_savings_model(10.0);
    const std::vector<ParameterVariation> variations{
        make_variation("High deposit", "Deposit", 20.0),
        make_variation("Typo", "Deposti", 20.0),
    };

    const auto scenarios = make_scenarios(base, variations);
    REQUIRE(scenarios.size() == 3);
    CHECK(scenarios[0].label == kBaseScenarioLabel);
    CHECK(scenarios[1].label == "High deposit");
    CHECK(scenarios[2].label == "Typo");
    REQUIRE(scenarios[1].model.has_value());
    CHECK_FALSE(scenarios[2].model.has_value());
    CHECK(scenarios[2].preparation_error.code == ErrorCode::ParameterVariantMismatch);

    const auto outcomes = run_scenarios(scenarios);
    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].series.value(3, "Savings") == Approx(130.0));
    CHECK(outcomes[1].series.value(3, "Savings") == Approx(160.0));
    CHECK_FALSE(outcomes[2].ok());
    CHECK(outcomes[2].error->code == ErrorCode::ParameterVariantMismatch);
}

TEST_CASE("worker count is bounded by the job count", "[v1][scenario]") {
    CHECK(resolve_worker_count(3, 10) == 3);
    CHECK(resolve_worker_count(8, 2) == 2);
    CHECK(resolve_worker_count(0, 0) == 1);
    CHECK(resolve_worker_count(0, 1) == 1);
    CHECK(resolve_worker_count(0, 64) >= 1);
}
