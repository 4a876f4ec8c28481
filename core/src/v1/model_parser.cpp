#include "stockflow/v1/parser/model_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace stockflow::v1::parser {

namespace {

constexpr const char* kDiagSyntax = "STOCKFLOW_MODEL_E_SYNTAX";
constexpr const char* kDiagIo = "STOCKFLOW_MODEL_E_IO";
constexpr const char* kDiagUnknownField = "STOCKFLOW_MODEL_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "STOCKFLOW_MODEL_E_TYPE_MISMATCH";
constexpr const char* kDiagMissingField = "STOCKFLOW_MODEL_E_MISSING_FIELD";
constexpr const char* kDiagDirectionInvalid = "STOCKFLOW_MODEL_E_DIRECTION_INVALID";
constexpr const char* kDiagBareParameter = "STOCKFLOW_MODEL_W_PARAMETER_BARE_VALUE";
constexpr const char* kDiagDefaultSettings = "STOCKFLOW_MODEL_W_DEFAULT_SETTINGS";
constexpr const char* kDiagVariationInvalid = "STOCKFLOW_MODEL_W_VARIATION_INVALID";

constexpr const char* kDefaultParameterUnit = "dimensionless";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

// STOCKFLOW_MODEL_E_DUPLICATE_NAME etc. for model validation issues
std::string validation_diag_code(ErrorCode code) {
    std::string out = "STOCKFLOW_MODEL_E_";
    for (const char c : to_string(code)) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

class Diagnostics {
public:
    Diagnostics(std::vector<std::string>& errors,
                std::vector<std::string>& warnings,
                ErrorCode& first_error,
                bool strict)
        : errors_(errors), warnings_(warnings), first_error_(first_error), strict_(strict) {}

    void error(const std::string& diag, ErrorCode code, const std::string& message) {
        if (first_error_ == ErrorCode::None) first_error_ = code;
        errors_.push_back(with_diag_code(diag, message));
    }

    void warning(const std::string& diag, const std::string& message) {
        warnings_.push_back(with_diag_code(diag, message));
    }

    [[nodiscard]] bool strict() const { return strict_; }
    [[nodiscard]] std::size_t error_count() const { return errors_.size(); }

private:
    std::vector<std::string>& errors_;
    std::vector<std::string>& warnings_;
    ErrorCode& first_error_;
    bool strict_;
};

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) return "null";
    if (node.IsScalar()) return "scalar";
    if (node.IsSequence()) return "sequence";
    if (node.IsMap()) return "map";
    return "unknown";
}

void push_type_mismatch_error(Diagnostics& diag,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    diag.error(kDiagTypeMismatch, ErrorCode::ParseFailure,
               "Type mismatch at '" + path + "' (expected " + expected + ", got " +
                   yaml_node_class(received) + ")");
}

void push_missing_field_error(Diagnostics& diag, const std::string& path) {
    diag.error(kDiagMissingField, ErrorCode::ParseFailure, "Missing required field '" + path + "'");
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   Diagnostics& diag) {
    if (!diag.strict() || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            diag.error(kDiagUnknownField, ErrorCode::ParseFailure,
                       "Unknown field at '" + context + "." + key + "'");
        }
    }
}

std::optional<Real> parse_real(const YAML::Node& node, const std::string& path, Diagnostics& diag) {
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "number", node);
        return std::nullopt;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(diag, path, "number", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string(const YAML::Node& node, const std::string& path, Diagnostics& diag) {
    if (!node.IsScalar()) {
        push_type_mismatch_error(diag, path, "string", node);
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<std::string> required_string(const YAML::Node& parent,
                                           const char* key,
                                           const std::string& path,
                                           Diagnostics& diag) {
    const YAML::Node node = parent[key];
    if (!node) {
        push_missing_field_error(diag, path + "." + key);
        return std::nullopt;
    }
    return parse_string(node, path + "." + key, diag);
}

std::optional<Real> required_real(const YAML::Node& parent,
                                  const char* key,
                                  const std::string& path,
                                  Diagnostics& diag) {
    const YAML::Node node = parent[key];
    if (!node) {
        push_missing_field_error(diag, path + "." + key);
        return std::nullopt;
    }
    return parse_real(node, path + "." + key, diag);
}

std::string optional_string(const YAML::Node& parent,
                            const char* key,
                            const std::string& path,
                            Diagnostics& diag) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) return {};
    return parse_string(node, path + "." + key, diag).value_or(std::string{});
}

// -----------------------------------------------------------------------------
// Entities
// -----------------------------------------------------------------------------

std::optional<StockDef> parse_stock(const YAML::Node& item, const std::string& path, Diagnostics& diag) {
    validate_keys(item, {"name", "initial_value", "unit", "description"}, path, diag);
    const auto name = required_string(item, "name", path, diag);
    const auto initial = required_real(item, "initial_value", path, diag);
    if (!name || !initial) return std::nullopt;

    StockDef stock;
    stock.name = *name;
    stock.initial_value = *initial;
    stock.unit = optional_string(item, "unit", path, diag);
    stock.description = optional_string(item, "description", path, diag);
    return stock;
}

// Auxiliaries and flows share their shape
template <typename Def>
std::optional<Def> parse_formula_entity(const YAML::Node& item, const std::string& path, Diagnostics& diag) {
    validate_keys(item, {"name", "formula", "unit", "description"}, path, diag);
    const auto name = required_string(item, "name", path, diag);
    const auto formula = required_string(item, "formula", path, diag);
    if (!name || !formula) return std::nullopt;

    Def def;
    def.name = *name;
    def.formula = *formula;
    def.unit = optional_string(item, "unit", path, diag);
    def.description = optional_string(item, "description", path, diag);
    return def;
}

template <typename Def, typename ParseItem>
void parse_entity_list(const YAML::Node& node,
                       const std::string& path,
                       Diagnostics& diag,
                       std::vector<Def>& out,
                       ParseItem parse_item) {
    if (!node || node.IsNull()) return;
    if (!node.IsSequence()) {
        push_type_mismatch_error(diag, path, "sequence", node);
        return;
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        const std::string item_path = path + "[" + std::to_string(i) + "]";
        if (!item.IsMap()) {
            push_type_mismatch_error(diag, item_path, "map", item);
            continue;
        }
        if (auto def = parse_item(item, item_path, diag)) {
            out.push_back(std::move(*def));
        }
    }
}

std::optional<ParameterDef> parse_parameter(const YAML::Node& node,
                                            const std::string& path,
                                            Diagnostics& diag,
                                            bool is_base) {
    if (node.IsScalar()) {
        const auto value = parse_real(node, path, diag);
        if (!value) return std::nullopt;
        ParameterDef parameter;
        parameter.value = *value;
        if (is_base) {
            parameter.unit = kDefaultParameterUnit;
            diag.warning(kDiagBareParameter,
                         "Parameter at '" + path + "' is a bare number; unit set to '" +
                             kDefaultParameterUnit + "'");
        }
        return parameter;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(diag, path, "map or number", node);
        return std::nullopt;
    }

    validate_keys(node, {"value", "unit", "description"}, path, diag);
    const auto value = required_real(node, "value", path, diag);
    if (!value) return std::nullopt;

    ParameterDef parameter;
    parameter.value = *value;
    parameter.unit = optional_string(node, "unit", path, diag);
    parameter.description = optional_string(node, "description", path, diag);
    return parameter;
}

void parse_parameters(const YAML::Node& node,
                      const std::string& path,
                      Diagnostics& diag,
                      ParameterMap& out,
                      bool is_base) {
    if (!node || node.IsNull()) return;
    if (!node.IsMap()) {
        push_type_mismatch_error(diag, path, "map", node);
        return;
    }
    for (const auto& it : node) {
        const std::string name = it.first.as<std::string>();
        if (auto parameter = parse_parameter(it.second, path + "." + name, diag, is_base)) {
            out[name] = std::move(*parameter);
        }
    }
}

std::optional<FlowConnection> parse_connection(const YAML::Node& item,
                                               const std::string& path,
                                               Diagnostics& diag) {
    std::optional<std::string> flow;
    std::optional<std::string> stock;
    std::optional<std::string> direction;

    if (item.IsSequence()) {
        if (item.size() != 3) {
            diag.error(kDiagTypeMismatch, ErrorCode::ParseFailure,
                       "Connection at '" + path + "' must be [flow, stock, direction]");
            return std::nullopt;
        }
        flow = parse_string(item[0], path + "[0]", diag);
        stock = parse_string(item[1], path + "[1]", diag);
        direction = parse_string(item[2], path + "[2]", diag);
    } else if (item.IsMap()) {
        validate_keys(item, {"flow_name", "stock_name", "direction"}, path, diag);
        flow = required_string(item, "flow_name", path, diag);
        stock = required_string(item, "stock_name", path, diag);
        direction = required_string(item, "direction", path, diag);
    } else {
        push_type_mismatch_error(diag, path, "map or [flow, stock, direction]", item);
        return std::nullopt;
    }
    if (!flow || !stock || !direction) return std::nullopt;

    const auto parsed = parse_direction(*direction);
    if (!parsed) {
        diag.error(kDiagDirectionInvalid, ErrorCode::InvalidDirection,
                   "Invalid direction '" + *direction + "' at '" + path +
                       "' (expected 'inflow' or 'outflow')");
        return std::nullopt;
    }
    return FlowConnection{*flow, *stock, *parsed};
}

std::optional<TimeSetting> parse_time_setting(const YAML::Node& node,
                                              const std::string& path,
                                              Diagnostics& diag) {
    TimeSetting setting;
    if (node.IsScalar()) {
        const auto value = parse_real(node, path, diag);
        if (!value) return std::nullopt;
        setting.value = *value;
        return setting;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(diag, path, "map or number", node);
        return std::nullopt;
    }
    validate_keys(node, {"value", "unit"}, path, diag);
    const auto value = required_real(node, "value", path, diag);
    if (!value) return std::nullopt;
    setting.value = *value;
    const std::string unit = optional_string(node, "unit", path, diag);
    if (!unit.empty()) setting.unit = unit;
    return setting;
}

void parse_simulation_settings(const YAML::Node& node,
                               const std::string& path,
                               Diagnostics& diag,
                               SimulationSettings& out) {
    if (!node.IsMap()) {
        push_type_mismatch_error(diag, path, "map", node);
        return;
    }
    validate_keys(node, {"end_time", "dt"}, path, diag);
    if (const YAML::Node end = node["end_time"]) {
        if (auto setting = parse_time_setting(end, path + ".end_time", diag)) out.end_time = *setting;
    } else {
        push_missing_field_error(diag, path + ".end_time");
    }
    if (const YAML::Node dt = node["dt"]) {
        if (auto setting = parse_time_setting(dt, path + ".dt", diag)) out.dt = *setting;
    } else {
        push_missing_field_error(diag, path + ".dt");
    }
}

std::optional<ModelConfig> parse_model(const YAML::Node& root, const std::string& context, Diagnostics& diag) {
    if (!root.IsMap()) {
        push_type_mismatch_error(diag, context, "map", root);
        return std::nullopt;
    }
    const std::size_t errors_before = diag.error_count();

    validate_keys(root,
                  {"stocks", "parameters", "auxiliaries", "flows", "flow_connections",
                   "simulation_settings", "problem_description"},
                  context, diag);

    ModelConfig model;
    if (!root["stocks"]) {
        push_missing_field_error(diag, context + ".stocks");
    }
    parse_entity_list(root["stocks"], context + ".stocks", diag, model.stocks, parse_stock);
    parse_parameters(root["parameters"], context + ".parameters", diag, model.parameters, true);
    parse_entity_list(root["auxiliaries"], context + ".auxiliaries", diag, model.auxiliaries,
                      parse_formula_entity<AuxiliaryDef>);
    parse_entity_list(root["flows"], context + ".flows", diag, model.flows,
                      parse_formula_entity<FlowDef>);

    const YAML::Node connections = root["flow_connections"];
    if (connections && !connections.IsNull()) {
        if (!connections.IsSequence()) {
            push_type_mismatch_error(diag, context + ".flow_connections", "sequence", connections);
        } else {
            for (std::size_t i = 0; i < connections.size(); ++i) {
                const std::string path = context + ".flow_connections[" + std::to_string(i) + "]";
                if (auto conn = parse_connection(connections[i], path, diag)) {
                    model.flow_connections.push_back(std::move(*conn));
                }
            }
        }
    }

    if (const YAML::Node settings = root["simulation_settings"]) {
        parse_simulation_settings(settings, context + ".simulation_settings", diag,
                                  model.simulation_settings);
    } else {
        diag.warning(kDiagDefaultSettings,
                     "No '" + context + ".simulation_settings'; using end_time=100, dt=1");
    }

    model.problem_description = optional_string(root, "problem_description", context, diag);

    if (diag.error_count() != errors_before) {
        return std::nullopt;
    }

    for (const auto& issue : validate_model(model)) {
        diag.error(validation_diag_code(issue.code), issue.code, issue.message);
    }
    if (diag.error_count() != errors_before) {
        return std::nullopt;
    }
    return model;
}

std::optional<YAML::Node> load_document(const std::string& content, Diagnostics& diag) {
    try {
        return YAML::Load(content);
    } catch (const YAML::Exception& e) {
        diag.error(kDiagSyntax, ErrorCode::ParseFailure, std::string("YAML parse error: ") + e.what());
        return std::nullopt;
    }
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += separator;
        out += part;
    }
    return out;
}

}  // namespace

ModelParser::ModelParser(ModelParserOptions options)
    : options_(options) {}

void ModelParser::reset() {
    errors_.clear();
    warnings_.clear();
    first_error_code_ = ErrorCode::None;
}

std::optional<std::string> ModelParser::read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (first_error_code_ == ErrorCode::None) first_error_code_ = ErrorCode::ParseFailure;
        errors_.push_back(with_diag_code(kDiagIo, "Cannot open file: " + path.string()));
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

ModelConfig ModelParser::load(const std::filesystem::path& path) {
    reset();
    const auto content = read_file(path);
    if (!content) return {};
    return load_string(*content);
}

ModelConfig ModelParser::load_string(const std::string& content) {
    reset();
    Diagnostics diag(errors_, warnings_, first_error_code_, options_.strict);

    const auto root = load_document(content, diag);
    if (!root) return {};
    return parse_model(*root, "root", diag).value_or(ModelConfig{});
}

std::vector<Scenario> ModelParser::load_batch(const std::filesystem::path& path) {
    reset();
    const auto content = read_file(path);
    if (!content) return {};
    return load_batch_string(*content);
}

std::vector<Scenario> ModelParser::load_batch_string(const std::string& content) {
    reset();
    Diagnostics diag(errors_, warnings_, first_error_code_, options_.strict);

    const auto root = load_document(content, diag);
    if (!root) return {};
    if (!root->IsMap()) {
        push_type_mismatch_error(diag, "root", "map", *root);
        return {};
    }
    validate_keys(*root, {"base", "variations"}, "root", diag);
    const YAML::Node base_node = (*root)["base"];
    if (!base_node) {
        push_missing_field_error(diag, "root.base");
        return {};
    }
    const auto base = parse_model(base_node, "base", diag);
    if (!base || !errors_.empty()) return {};

    std::vector<Scenario> scenarios;
    scenarios.push_back({std::string(kBaseScenarioLabel), *base, {}});

    const YAML::Node variations = (*root)["variations"];
    if (!variations || variations.IsNull()) return scenarios;
    if (!variations.IsSequence()) {
        push_type_mismatch_error(diag, "root.variations", "sequence", variations);
        return {};
    }

    for (std::size_t i = 0; i < variations.size(); ++i) {
        const YAML::Node item = variations[i];
        const std::string path = "variations[" + std::to_string(i) + "]";

        Scenario scenario;
        scenario.label = "Variation " + std::to_string(i + 1);

        // A bad variation fails only its own scenario
        std::vector<std::string> variation_errors;
        ErrorCode variation_code = ErrorCode::None;
        Diagnostics local(variation_errors, warnings_, variation_code, options_.strict);

        ParameterVariation variation;
        if (!item.IsMap()) {
            push_type_mismatch_error(local, path, "map", item);
        } else {
            validate_keys(item, {"scenario_description", "parameters"}, path, local);
            const std::string description = optional_string(item, "scenario_description", path, local);
            if (!description.empty()) scenario.label = description;
            variation.scenario_description = scenario.label;
            parse_parameters(item["parameters"], path + ".parameters", local, variation.parameters, false);
        }

        if (!variation_errors.empty()) {
            scenario.preparation_error.code = variation_code;
            scenario.preparation_error.entity = scenario.label;
            scenario.preparation_error.message = join(variation_errors, "; ");
            diag.warning(kDiagVariationInvalid,
                         "Variation '" + scenario.label + "' will be reported as failed: " +
                             scenario.preparation_error.message);
        } else {
            try {
                scenario.model = make_variant(*base, variation);
            } catch (const ConfigError& e) {
                scenario.preparation_error = describe_error(e);
            }
        }
        scenarios.push_back(std::move(scenario));
    }
    return scenarios;
}

void ModelParser::throw_if_failed() const {
    if (errors_.empty()) return;
    const ErrorCode code =
        first_error_code_ == ErrorCode::None ? ErrorCode::ParseFailure : first_error_code_;
    throw ConfigError(code, "", join(errors_, "\n"));
}

ModelConfig ModelParser::load_or_throw(const std::filesystem::path& path) {
    ModelConfig model = load(path);
    throw_if_failed();
    return model;
}

ModelConfig ModelParser::load_string_or_throw(const std::string& content) {
    ModelConfig model = load_string(content);
    throw_if_failed();
    return model;
}

}  // namespace stockflow::v1::parser
