#include <catch2/catch_test_macros.hpp>

#include "stockflow/v1/model.hpp"

#include <algorithm>
#include <string>

using namespace stockflow::v1;

namespace {

ModelConfig make_inventory_model() {
    ModelConfig model;
    model.stocks.push_back({"Inventory", 50.0, "units", ""});
    model.parameters["ProductionRate"] = {5.0, "units/day", ""};
    model.parameters["DemandRate"] = {3.0, "units/day", ""};
    model.auxiliaries.push_back({"Coverage", "Inventory / DemandRate.value", "days", ""});
    model.flows.push_back({"Production", "ProductionRate.value", "units/day", ""});
    model.flows.push_back({"Shipments", "min(Inventory, DemandRate.value)", "units/day", ""});
    model.flow_connections.push_back({"Production", "Inventory", FlowDirection::Inflow});
    model.flow_connections.push_back({"Shipments", "Inventory", FlowDirection::Outflow});
    model.simulation_settings.end_time = {10.0, "days"};
    model.simulation_settings.dt = {1.0, "days"};
    return model;
}

bool has_issue(const std::vector<ValidationIssue>& issues, ErrorCode code, const std::string& subject) {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& issue) {
        return issue.code == code && issue.subject == subject;
    });
}

}  // namespace

TEST_CASE("well formed model has no validation issues", "[v1][model]") {
    const auto model = make_inventory_model();
    CHECK(validate_model(model).empty());
    CHECK_NOTHROW(require_valid(model));
}

TEST_CASE("names must be unique across every entity kind", "[v1][model]") {
    auto model = make_inventory_model();
    model.auxiliaries.push_back({"Inventory", "1", "units", ""});
    model.parameters["Production"] = {1.0, "x", ""};

    const auto issues = validate_model(model);
    CHECK(has_issue(issues, ErrorCode::DuplicateName, "Inventory"));
    CHECK(has_issue(issues, ErrorCode::DuplicateName, "Production"));

    try {
        require_valid(model);
        FAIL("require_valid accepted duplicate names");
    } catch (const ConfigError& e) {
        CHECK(e.code() == ErrorCode::DuplicateName);
        CHECK(is_config_error(e.code()));
    }
}

TEST_CASE("names must be identifiers and not reserved", "[v1][model]") {
    auto model = make_inventory_model();
    model.auxiliaries.push_back({"time", "1", "", ""});
    model.auxiliaries.push_back({"Bad Name", "1", "", ""});
    model.auxiliaries.push_back({"", "1", "", ""});

    const auto issues = validate_model(model);
    CHECK(has_issue(issues, ErrorCode::InvalidName, "time"));
    CHECK(has_issue(issues, ErrorCode::InvalidName, "Bad Name"));
    CHECK(has_issue(issues, ErrorCode::InvalidName, ""));

    CHECK(is_identifier("Net_Income2"));
    CHECK_FALSE(is_identifier("2fast"));
    CHECK(is_reserved_name("and"));
    CHECK_FALSE(is_reserved_name("Andes"));
}

TEST_CASE("connections must reference existing flows and stocks", "[v1][model]") {
    auto model = make_inventory_model();
    model.flow_connections.push_back({"Ghost", "Inventory", FlowDirection::Inflow});
    model.flow_connections.push_back({"Production", "Warehouse", FlowDirection::Outflow});
    model.flow_connections.push_back({"Coverage", "Inventory", FlowDirection::Inflow});

    const auto issues = validate_model(model);
    CHECK(has_issue(issues, ErrorCode::UnknownName, "Ghost"));
    CHECK(has_issue(issues, ErrorCode::UnknownName, "Warehouse"));
    // an auxiliary is not a flow
    CHECK(has_issue(issues, ErrorCode::UnknownName, "Coverage"));

    const auto it = std::find_if(issues.begin(), issues.end(),
                                 [](const ValidationIssue& i) { return i.subject == "Ghost"; });
    REQUIRE(it != issues.end());
    CHECK(it->message == "Flow 'Ghost' in connections config not found in defined flows.");
}

TEST_CASE("time settings are validated", "[v1][model]") {
    auto model = make_inventory_model();
    model.simulation_settings.dt.value = 0.0;
    CHECK(has_issue(validate_model(model), ErrorCode::InvalidTimeSettings, "dt"));

    model = make_inventory_model();
    model.simulation_settings.end_time.value = -1.0;
    CHECK(has_issue(validate_model(model), ErrorCode::InvalidTimeSettings, "end_time"));

    model = make_inventory_model();
    model.simulation_settings.end_time.value = 0.0;
    CHECK(validate_model(model).empty());
}

TEST_CASE("step count is floor(end_time / dt) + 1", "[v1][model]") {
    SimulationSettings settings;
    settings.end_time.value = 3.0;
    settings.dt.value = 1.0;
    CHECK(expected_step_count(settings) == 4);

    settings.end_time.value = 1.0;
    settings.dt.value = 0.1;
    CHECK(expected_step_count(settings) == 11);

    settings.end_time.value = 2.5;
    settings.dt.value = 1.0;
    CHECK(expected_step_count(settings) == 3);

    settings.end_time.value = 0.0;
    CHECK(expected_step_count(settings) == 1);
}

TEST_CASE("time settings with an unusable step count are rejected", "[v1][model]") {
    struct Case {
        Real end_time;
        Real dt;
    };
    for (const auto& c : {Case{1e20, 1.0}, Case{1e300, 1e-300}, Case{1e308, 1e-10}}) {
        auto model = make_inventory_model();
        model.simulation_settings.end_time.value = c.end_time;
        model.simulation_settings.dt.value = c.dt;
        INFO("end_time=" << c.end_time << " dt=" << c.dt);
        CHECK(has_issue(validate_model(model), ErrorCode::InvalidTimeSettings, "dt"));
        CHECK_THROWS_AS(require_valid(model), ConfigError);
        CHECK_THROWS_AS((void)expected_step_count(model.simulation_settings), ConfigError);
    }

    auto model = make_inventory_model();
    model.simulation_settings.end_time.value = 1e6;
    model.simulation_settings.dt.value = 0.5;
    CHECK(validate_model(model).empty());
    CHECK(expected_step_count(model.simulation_settings) == 2'000'001);
}

TEST_CASE("component units cover every entity and parameter", "[v1][model]") {
    const auto units = component_units(make_inventory_model());
    CHECK(units.size() == 6);
    CHECK(units.at("Inventory") == "units");
    CHECK(units.at("Coverage") == "days");
    CHECK(units.at("Shipments") == "units/day");
    CHECK(units.at("DemandRate") == "units/day");
}

TEST_CASE("variants only replace parameter values", "[v1][model][scenario]") {
    const auto base = make_inventory_model();

    ParameterVariation variation;
    variation.scenario_description = "High demand";
    variation.parameters["DemandRate"] = {6.0, "", ""};

    const auto variant = make_variant(base, variation);
    CHECK(variant.parameters.at("DemandRate").value == 6.0);
    CHECK(variant.parameters.at("DemandRate").unit == "units/day");
    CHECK(variant.parameters.at("ProductionRate").value == 5.0);
    CHECK(base.parameters.at("DemandRate").value == 3.0);
    CHECK(variant.flows.size() == base.flows.size());

    SECTION("unknown parameters are rejected") {
        ParameterVariation bad;
        bad.scenario_description = "Typo";
        bad.parameters["DemandRat"] = {6.0, "", ""};
        try {
            (void)make_variant(base, bad);
            FAIL("make_variant accepted an unknown parameter");
        } catch (const ConfigError& e) {
            CHECK(e.code() == ErrorCode::ParameterVariantMismatch);
            CHECK(e.subject() == "DemandRat");
        }
    }

    SECTION("unit changes are rejected") {
        ParameterVariation bad;
        bad.scenario_description = "Units";
        bad.parameters["DemandRate"] = {6.0, "units/week", ""};
        CHECK_THROWS_AS((void)make_variant(base, bad), ConfigError);
    }
}
