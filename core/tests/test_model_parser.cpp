#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stockflow/v1/parser/model_parser.hpp"
#include "stockflow/v1/scenario_runner.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace stockflow::v1;
using stockflow::v1::parser::ModelParser;
using stockflow::v1::parser::ModelParserOptions;
using Catch::Approx;

namespace {

bool contains_diagnostic(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& message) {
        return message.find("[" + code + "]") != std::string::npos;
    });
}

const char* const kInventoryYaml = R"(
problem_description: Single warehouse
stocks:
  - name: Inventory
    initial_value: 50
    unit: units
parameters:
  ProductionRate:
    value: 5
    unit: units/day
  DemandRate: 3
auxiliaries:
  - name: Coverage
    formula: Inventory / DemandRate.value
    unit: days
flows:
  - name: Production
    formula: ProductionRate.value
    unit: units/day
  - name: Shipments
    formula: min(Inventory, DemandRate.value)
    unit: units/day
flow_connections:
  - flow_name: Production
    stock_name: Inventory
    direction: inflow
  - [Shipments, Inventory, outflow]
simulation_settings:
  end_time:
    value: 10
    unit: days
  dt: 1
)";

const char* const kBatchYaml = R"(
base:
  stocks:
    - {name: Savings, initial_value: 100, unit: USD}
  parameters:
    Deposit: {value: 10, unit: USD/month}
  flows:
    - {name: Deposits, formula: Deposit.value, unit: USD/month}
  flow_connections:
    - [Deposits, Savings, inflow]
  simulation_settings:
    end_time: 3
    dt: 1
variations:
  - scenario_description: Double deposit
    parameters:
      Deposit: 20
  - scenario_description: Typo
    parameters:
      Deposti: 20
  - parameters:
      Deposit: lots
)";

}  // namespace

TEST_CASE("YAML models load with both connection forms", "[v1][parser]") {
    ModelParser parser;
    const auto model = parser.load_string(kInventoryYaml);

    INFO(parser.errors().empty() ? "" : parser.errors().front());
    REQUIRE(parser.errors().empty());
    CHECK(model.problem_description == "Single warehouse");
    REQUIRE(model.stocks.size() == 1);
    CHECK(model.stocks[0].initial_value == Approx(50.0));
    CHECK(model.flows.size() == 2);
    REQUIRE(model.flow_connections.size() == 2);
    CHECK(model.flow_connections[1].flow_name == "Shipments");
    CHECK(model.flow_connections[1].direction == FlowDirection::Outflow);
    CHECK(model.simulation_settings.end_time.value == Approx(10.0));
    CHECK(model.simulation_settings.end_time.unit == "days");
    CHECK(model.simulation_settings.dt.value == Approx(1.0));

    // bare parameters are accepted with a warning
    CHECK(model.parameters.at("DemandRate").unit == "dimensionless");
    CHECK(contains_diagnostic(parser.warnings(), "STOCKFLOW_MODEL_W_PARAMETER_BARE_VALUE"));
}

TEST_CASE("JSON documents are accepted", "[v1][parser]") {
    const std::string json = R"({
        "stocks": [{"name": "Tank", "initial_value": 2, "unit": "l"}],
        "flows": [{"name": "Fill", "formula": "1", "unit": "l/s"}],
        "flow_connections": [{"flow_name": "Fill", "stock_name": "Tank", "direction": "inflow"}],
        "simulation_settings": {"end_time": {"value": 4, "unit": "s"}, "dt": {"value": 0.5, "unit": "s"}}
    })";

    ModelParser parser;
    const auto model = parser.load_string_or_throw(json);
    CHECK(model.stocks.front().name == "Tank");
    CHECK(model.simulation_settings.dt.value == Approx(0.5));
    CHECK(parser.warnings().empty());
}

TEST_CASE("missing simulation settings fall back to defaults", "[v1][parser]") {
    ModelParser parser;
    const auto model = parser.load_string("stocks:\n  - {name: S, initial_value: 1}\n");
    REQUIRE(parser.errors().empty());
    CHECK(model.simulation_settings.end_time.value == Approx(100.0));
    CHECK(model.simulation_settings.dt.value == Approx(1.0));
    CHECK(contains_diagnostic(parser.warnings(), "STOCKFLOW_MODEL_W_DEFAULT_SETTINGS"));
}

TEST_CASE("connection directions are validated when loading", "[v1][parser]") {
    const std::string yaml = R"(
stocks:
  - {name: S, initial_value: 1}
flows:
  - {name: F, formula: '1'}
flow_connections:
  - [F, S, sideways]
)";

    ModelParser parser;
    (void)parser.load_string(yaml);
    CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_DIRECTION_INVALID"));

    try {
        (void)parser.load_string_or_throw(yaml);
        FAIL("invalid direction accepted");
    } catch (const ConfigError& e) {
        CHECK(e.code() == ErrorCode::InvalidDirection);
        CHECK(std::string(e.what()).find("sideways") != std::string::npos);
    }
}

TEST_CASE("unknown fields fail only in strict mode", "[v1][parser]") {
    const std::string yaml = "stocks:\n  - {name: S, initial_value: 1, colour: red}\n";

    ModelParser strict;
    (void)strict.load_string(yaml);
    CHECK(contains_diagnostic(strict.errors(), "STOCKFLOW_MODEL_E_UNKNOWN_FIELD"));

    ModelParserOptions options;
    options.strict = false;
    ModelParser lenient(options);
    const auto model = lenient.load_string(yaml);
    CHECK(lenient.errors().empty());
    CHECK(model.stocks.size() == 1);
}

TEST_CASE("structural problems are reported as diagnostics", "[v1][parser]") {
    ModelParser parser;

    SECTION("duplicate names") {
        (void)parser.load_string(
            "stocks:\n  - {name: X, initial_value: 1}\nauxiliaries:\n  - {name: X, formula: '2'}\n");
        CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_DUPLICATE_NAME"));
    }

    SECTION("missing stocks") {
        (void)parser.load_string("flows:\n  - {name: F, formula: '1'}\n");
        CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_MISSING_FIELD"));
    }

    SECTION("wrong value type") {
        (void)parser.load_string("stocks:\n  - {name: S, initial_value: many}\n");
        CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_TYPE_MISMATCH"));
    }

    SECTION("malformed YAML") {
        (void)parser.load_string("stocks: [unclosed\n");
        CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_SYNTAX"));
        CHECK_THROWS_AS((void)parser.load_string_or_throw("stocks: [unclosed\n"), ConfigError);
    }

    SECTION("missing file") {
        (void)parser.load("/nonexistent/model.yaml");
        CHECK(contains_diagnostic(parser.errors(), "STOCKFLOW_MODEL_E_IO"));
    }
}

TEST_CASE("batch documents expand into scenarios", "[v1][parser][scenario]") {
    ModelParser parser;
    const auto scenarios = parser.load_batch_string(kBatchYaml);

    REQUIRE(parser.errors().empty());
    REQUIRE(scenarios.size() == 4);
    CHECK(scenarios[0].label == kBaseScenarioLabel);
    CHECK(scenarios[1].label == "Double deposit");
    CHECK(scenarios[2].label == "Typo");
    CHECK(scenarios[3].label == "Variation 3");

    REQUIRE(scenarios[1].model.has_value());
    CHECK(scenarios[1].model->parameters.at("Deposit").value == Approx(20.0));
    CHECK(scenarios[1].model->parameters.at("Deposit").unit == "USD/month");

    CHECK_FALSE(scenarios[2].model.has_value());
    CHECK(scenarios[2].preparation_error.code == ErrorCode::ParameterVariantMismatch);
    CHECK_FALSE(scenarios[3].model.has_value());
    CHECK(contains_diagnostic(parser.warnings(), "STOCKFLOW_MODEL_W_VARIATION_INVALID"));

    RunnerOptions options;
    options.max_workers = 2;
    const auto outcomes = run_scenarios(scenarios, options);
    REQUIRE(outcomes.size() == 4);
    CHECK(outcomes[0].ok());
    CHECK(outcomes[0].series.value(3, "Savings") == Approx(130.0));
    CHECK(outcomes[1].ok());
    CHECK(outcomes[1].series.value(3, "Savings") == Approx(160.0));
    CHECK_FALSE(outcomes[2].ok());
    CHECK_FALSE(outcomes[3].ok());
}

TEST_CASE("a broken base model yields no scenarios", "[v1][parser][scenario]") {
    ModelParser parser;
    const auto scenarios = parser.load_batch_string("base:\n  stocks: 3\nvariations: []\n");
    CHECK(scenarios.empty());
    CHECK_FALSE(parser.errors().empty());
}
