#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stockflow/v1/results_io.hpp"
#include "stockflow/v1/scenario_runner.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stockflow::v1;
using Catch::Approx;

namespace {

ModelConfig make_capital_model(const std::string& inflow_formula = "10") {
    ModelConfig model;
    model.stocks.push_back({"Capital", 100.0, "USD", ""});
    model.flows.push_back({"Inflow", inflow_formula, "USD/year", ""});
    model.flow_connections.push_back({"Inflow", "Capital", FlowDirection::Inflow});
    model.simulation_settings.end_time = {3.0, "year"};
    model.simulation_settings.dt = {1.0, "year"};
    return model;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}  // namespace

TEST_CASE("CSV output has a header and one line per row", "[v1][results]") {
    const auto series = simulate(make_capital_model());
    std::ostringstream out;
    write_csv(series, out);

    const auto lines = split_lines(out.str());
    REQUIRE(lines.size() == 5);
    CHECK(lines[0] == "time,Capital,Inflow");
    CHECK(lines[1] == "0,100,0");
    CHECK(lines[4] == "3,130,10");
}

TEST_CASE("CSV output to an unwritable path throws", "[v1][results]") {
    const auto series = simulate(make_capital_model());
    CHECK_THROWS_AS(write_csv(series, "/nonexistent-dir/out.csv"), std::runtime_error);
}

TEST_CASE("time series JSON carries columns, rows and units", "[v1][results]") {
    Simulator sim(make_capital_model());
    const auto series = sim.run();
    const auto j = to_json(series, sim.component_units());

    CHECK(j["columns"] == nlohmann::json({"time", "Capital", "Inflow"}));
    REQUIRE(j["rows"].size() == 4);
    CHECK(j["rows"][3][1].get<double>() == Approx(130.0));
    CHECK(j["complete"].get<bool>());
    CHECK(j["units"]["Capital"] == "USD");
}

TEST_CASE("error details serialize a missing time as null", "[v1][results]") {
    ErrorDetail detail;
    detail.code = ErrorCode::UnknownName;
    detail.entity = "Ghost";
    detail.message = "Flow 'Ghost' in connections config not found in defined flows.";

    auto j = to_json(detail);
    CHECK(j["code"] == "unknown_name");
    CHECK(j["entity"] == "Ghost");
    CHECK(j["time"].is_null());

    detail.time = 2.5;
    j = to_json(detail);
    CHECK(j["time"].get<double>() == Approx(2.5));
}

TEST_CASE("scenario outcomes serialize success and failure", "[v1][results][scenario]") {
    const std::vector<Scenario> scenarios{
        {"steady", make_capital_model(), {}},
        {"broken", make_capital_model("Capital / 0"), {}},
    };
    RunnerOptions options;
    options.max_workers = 1;
    const auto j = to_json(run_scenarios(scenarios, options));

    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["scenario_label"] == "steady");
    CHECK(j[0]["status"] == "success");
    CHECK(j[0]["time_series"]["rows"].size() == 4);
    CHECK_FALSE(j[0].contains("error"));

    CHECK(j[1]["status"] == "failure");
    CHECK(j[1]["error"]["code"] == "division_by_zero");
    CHECK(j[1]["error"]["entity"] == "Inflow");
    CHECK(j[1]["time_series"]["complete"] == false);
    CHECK(j[1]["time_series"]["rows"].size() == 1);
}

TEST_CASE("column summaries report initial, final and extremes", "[v1][results]") {
    const auto series = simulate(make_capital_model());

    const auto all = summarize(series);
    REQUIRE(all.size() == 2);
    CHECK(all[0].name == "Capital");
    CHECK(all[0].initial == Approx(100.0));
    CHECK(all[0].final == Approx(130.0));
    CHECK(all[1].minimum == Approx(0.0));
    CHECK(all[1].maximum == Approx(10.0));

    const auto j = to_json(summarize(series, {"Inflow"}));
    CHECK(j.size() == 1);
    CHECK(j["Inflow"]["max"].get<double>() == Approx(10.0));

    CHECK_THROWS_AS((void)summarize(series, {"Nope"}), std::out_of_range);
}
