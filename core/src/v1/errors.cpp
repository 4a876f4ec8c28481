#include "stockflow/v1/errors.hpp"

#include <sstream>

namespace stockflow::v1 {

namespace {

std::string format_evaluation_message(ErrorCode code,
                                      const std::string& formula,
                                      const std::string& token,
                                      std::size_t column,
                                      const std::string& detail) {
    std::ostringstream out;
    out << detail;
    if (!token.empty()) {
        out << " ('" << token << "'";
        if (column > 0) {
            out << " at column " << column;
        }
        out << ")";
    }
    out << " in formula '" << formula << "' [" << to_string(code) << "]";
    return out.str();
}

std::string format_simulation_message(ErrorCode code, const SimulationError::Context& ctx) {
    std::ostringstream out;
    if (!ctx.entity.empty()) {
        out << "Error calculating ";
        if (ctx.kind) {
            out << to_string(*ctx.kind) << " ";
        }
        out << "'" << ctx.entity << "'";
        if (!ctx.formula.empty()) {
            out << " with formula '" << ctx.formula << "'";
        }
    } else {
        out << "Simulation aborted";
    }
    out << " at t=" << ctx.time << " (step " << ctx.step << "): " << ctx.cause;
    out << " [" << to_string(code) << "]";
    return out.str();
}

}  // namespace

EvaluationError::EvaluationError(ErrorCode code,
                                 std::string formula,
                                 std::string token,
                                 std::size_t column,
                                 std::string detail)
    : ModelError(code, format_evaluation_message(code, formula, token, column, detail))
    , formula_(std::move(formula))
    , token_(std::move(token))
    , column_(column)
    , detail_(std::move(detail)) {}

SimulationError::SimulationError(ErrorCode code, Context context, TimeSeries partial)
    : ModelError(code, format_simulation_message(code, context))
    , context_(std::move(context))
    , partial_(std::move(partial)) {
    partial_.mark_complete(false);
}

ErrorDetail describe_error(const std::exception& error) {
    ErrorDetail detail;
    detail.message = error.what();

    if (const auto* sim = dynamic_cast<const SimulationError*>(&error)) {
        detail.code = sim->code();
        detail.entity = sim->entity();
        detail.formula = sim->formula();
        detail.time = sim->time();
    } else if (const auto* res = dynamic_cast<const ResolutionError*>(&error)) {
        detail.code = res->code();
        detail.entity = res->entity();
        detail.formula = res->formula();
    } else if (const auto* eval = dynamic_cast<const EvaluationError*>(&error)) {
        detail.code = eval->code();
        detail.entity = eval->token();
        detail.formula = eval->formula();
    } else if (const auto* cfg = dynamic_cast<const ConfigError*>(&error)) {
        detail.code = cfg->code();
        detail.entity = cfg->subject();
    } else if (const auto* model = dynamic_cast<const ModelError*>(&error)) {
        detail.code = model->code();
    } else {
        detail.code = ErrorCode::Internal;
    }
    return detail;
}

}  // namespace stockflow::v1
