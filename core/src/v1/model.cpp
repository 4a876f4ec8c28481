#include "stockflow/v1/model.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace stockflow::v1 {

namespace {

constexpr Real kStepCountSlack = 1e-9;

constexpr std::array<std::string_view, 6> kReservedNames = {
    kTimeName, "and", "or", "not", "if", "else"
};

void check_name(std::string_view kind,
                const std::string& name,
                EntityKind entity_kind,
                std::unordered_map<std::string, EntityKind>& seen,
                std::vector<ValidationIssue>& issues) {
    if (name.empty()) {
        issues.push_back({ErrorCode::InvalidName, name,
                          "A " + std::string(kind) + " has an empty name"});
        return;
    }
    if (!is_identifier(name)) {
        issues.push_back({ErrorCode::InvalidName, name,
                          "Name '" + name + "' of " + std::string(kind) +
                              " is not a valid identifier"});
        return;
    }
    if (is_reserved_name(name)) {
        issues.push_back({ErrorCode::InvalidName, name,
                          "Name '" + name + "' of " + std::string(kind) + " is reserved"});
        return;
    }
    const auto [it, inserted] = seen.emplace(name, entity_kind);
    if (!inserted) {
        issues.push_back({ErrorCode::DuplicateName, name,
                          "Name '" + name + "' is used by both a " +
                              std::string(to_string(it->second)) + " and a " +
                              std::string(kind)});
    }
}

void check_time_setting(const char* key, const TimeSetting& setting, bool allow_zero,
                        std::vector<ValidationIssue>& issues) {
    const Real v = setting.value;
    const bool bad = !std::isfinite(v) || (allow_zero ? v < 0.0 : v <= 0.0);
    if (bad) {
        issues.push_back({ErrorCode::InvalidTimeSettings, key,
                          std::string("simulation_settings.") + key + " must be " +
                              (allow_zero ? ">= 0" : "> 0") + " and finite (got " +
                              std::to_string(v) + ")"});
    }
}

}  // namespace

bool is_reserved_name(std::string_view name) noexcept {
    for (const auto reserved : kReservedNames) {
        if (name == reserved) return true;
    }
    return false;
}

bool is_identifier(std::string_view name) noexcept {
    if (name.empty()) return false;
    const auto first = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(first) || first == '_')) return false;
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || uc == '_')) return false;
    }
    return true;
}

std::vector<ValidationIssue> validate_model(const ModelConfig& model) {
    std::vector<ValidationIssue> issues;
    std::unordered_map<std::string, EntityKind> seen;

    for (const auto& stock : model.stocks) {
        check_name("stock", stock.name, EntityKind::Stock, seen, issues);
        if (!std::isfinite(stock.initial_value)) {
            issues.push_back({ErrorCode::InvalidOption, stock.name,
                              "Initial value of stock '" + stock.name + "' is not finite"});
        }
    }
    for (const auto& [name, parameter] : model.parameters) {
        check_name("parameter", name, EntityKind::Parameter, seen, issues);
        if (!std::isfinite(parameter.value)) {
            issues.push_back({ErrorCode::InvalidOption, name,
                              "Value of parameter '" + name + "' is not finite"});
        }
    }
    for (const auto& aux : model.auxiliaries) {
        check_name("auxiliary", aux.name, EntityKind::Auxiliary, seen, issues);
    }
    for (const auto& flow : model.flows) {
        check_name("flow", flow.name, EntityKind::Flow, seen, issues);
    }

    for (const auto& conn : model.flow_connections) {
        const auto flow_it = seen.find(conn.flow_name);
        if (flow_it == seen.end() || flow_it->second != EntityKind::Flow) {
            issues.push_back({ErrorCode::UnknownName, conn.flow_name,
                              "Flow '" + conn.flow_name +
                                  "' in connections config not found in defined flows."});
        }
        const auto stock_it = seen.find(conn.stock_name);
        if (stock_it == seen.end() || stock_it->second != EntityKind::Stock) {
            issues.push_back({ErrorCode::UnknownName, conn.stock_name,
                              "Stock '" + conn.stock_name +
                                  "' in connections config not found in defined stocks."});
        }
    }

    check_time_setting("end_time", model.simulation_settings.end_time, true, issues);
    check_time_setting("dt", model.simulation_settings.dt, false, issues);

    const auto& settings = model.simulation_settings;
    const bool times_valid = std::none_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.code == ErrorCode::InvalidTimeSettings;
    });
    if (times_valid) {
        const Real ratio = settings.end_time.value / settings.dt.value;
        if (!std::isfinite(ratio) || ratio >= static_cast<Real>(kMaxStepCount)) {
            issues.push_back({ErrorCode::InvalidTimeSettings, "dt",
                              "simulation_settings.end_time / dt must stay below " +
                                  std::to_string(kMaxStepCount) + " steps (end_time=" +
                                  std::to_string(settings.end_time.value) +
                                  ", dt=" + std::to_string(settings.dt.value) + ")"});
        }
    }

    return issues;
}

void require_valid(const ModelConfig& model) {
    const auto issues = validate_model(model);
    if (!issues.empty()) {
        const auto& first = issues.front();
        throw ConfigError(first.code, first.subject, first.message);
    }
}

std::size_t expected_step_count(const SimulationSettings& settings) {
    const Real ratio = settings.end_time.value / settings.dt.value;
    if (!(ratio >= 0.0) || !std::isfinite(ratio) || ratio >= static_cast<Real>(kMaxStepCount)) {
        throw ConfigError(ErrorCode::InvalidTimeSettings, "dt",
                          "simulation_settings do not give a usable step count");
    }
    return static_cast<std::size_t>(std::floor(ratio + kStepCountSlack)) + 1;
}

std::map<std::string, std::string> component_units(const ModelConfig& model) {
    std::map<std::string, std::string> units;
    for (const auto& stock : model.stocks) units[stock.name] = stock.unit;
    for (const auto& aux : model.auxiliaries) units[aux.name] = aux.unit;
    for (const auto& flow : model.flows) units[flow.name] = flow.unit;
    for (const auto& [name, parameter] : model.parameters) units[name] = parameter.unit;
    return units;
}

ModelConfig make_variant(const ModelConfig& base, const ParameterVariation& variation) {
    ModelConfig variant = base;
    for (const auto& [name, parameter] : variation.parameters) {
        auto it = variant.parameters.find(name);
        if (it == variant.parameters.end()) {
            throw ConfigError(ErrorCode::ParameterVariantMismatch, name,
                              "Scenario '" + variation.scenario_description +
                                  "' sets unknown parameter '" + name + "'");
        }
        if (!parameter.unit.empty() && parameter.unit != it->second.unit) {
            throw ConfigError(ErrorCode::ParameterVariantMismatch, name,
                              "Scenario '" + variation.scenario_description +
                                  "' changes the unit of parameter '" + name + "' from '" +
                                  it->second.unit + "' to '" + parameter.unit + "'");
        }
        it->second.value = parameter.value;
        if (!parameter.description.empty()) {
            it->second.description = parameter.description;
        }
    }
    return variant;
}

}  // namespace stockflow::v1
