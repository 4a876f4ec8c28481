#pragma once

#include "stockflow/v1/time_series.hpp"
#include "stockflow/v1/types.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace stockflow::v1 {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : std::uint8_t {
    None,
    // Model configuration
    InvalidName,
    DuplicateName,
    UnknownName,
    InvalidDirection,
    InvalidTimeSettings,
    InvalidOption,
    InvalidFormula,
    ParseFailure,
    ParameterVariantMismatch,
    // Formula evaluation
    SyntaxError,
    UndefinedName,
    UnknownFunction,
    ArityMismatch,
    NonNumericValue,
    InvalidFieldAccess,
    DivisionByZero,
    NonFiniteResult,
    // Run control
    NonConvergence,
    Cancelled,
    TimedOut,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "";
        case ErrorCode::InvalidName: return "invalid_name";
        case ErrorCode::DuplicateName: return "duplicate_name";
        case ErrorCode::UnknownName: return "unknown_name";
        case ErrorCode::InvalidDirection: return "invalid_direction";
        case ErrorCode::InvalidTimeSettings: return "invalid_time_settings";
        case ErrorCode::InvalidOption: return "invalid_option";
        case ErrorCode::InvalidFormula: return "invalid_formula";
        case ErrorCode::ParseFailure: return "parse_failure";
        case ErrorCode::ParameterVariantMismatch: return "parameter_variant_mismatch";
        case ErrorCode::SyntaxError: return "syntax_error";
        case ErrorCode::UndefinedName: return "undefined_name";
        case ErrorCode::UnknownFunction: return "unknown_function";
        case ErrorCode::ArityMismatch: return "arity_mismatch";
        case ErrorCode::NonNumericValue: return "non_numeric_value";
        case ErrorCode::InvalidFieldAccess: return "invalid_field_access";
        case ErrorCode::DivisionByZero: return "division_by_zero";
        case ErrorCode::NonFiniteResult: return "non_finite_result";
        case ErrorCode::NonConvergence: return "non_convergence";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::TimedOut: return "timed_out";
        case ErrorCode::Internal: return "internal";
    }
    return "";
}

[[nodiscard]] constexpr bool is_config_error(ErrorCode code) noexcept {
    return code >= ErrorCode::InvalidName && code <= ErrorCode::ParameterVariantMismatch;
}

[[nodiscard]] constexpr bool is_evaluation_error(ErrorCode code) noexcept {
    return code >= ErrorCode::SyntaxError && code <= ErrorCode::NonFiniteResult;
}

// =============================================================================
// Exception Hierarchy
// =============================================================================

/// Base of every error raised by the engine
class ModelError : public std::runtime_error {
public:
    ModelError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Structural problem in a model configuration. Raised before any stepping.
class ConfigError : public ModelError {
public:
    ConfigError(ErrorCode code, std::string subject, const std::string& message)
        : ModelError(code, message), subject_(std::move(subject)) {}

    /// Entity, field or file the problem refers to (may be empty)
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    std::string subject_;
};

/// Failure to compile or evaluate one formula
class EvaluationError : public ModelError {
public:
    EvaluationError(ErrorCode code,
                    std::string formula,
                    std::string token,
                    std::size_t column,
                    std::string detail);

    [[nodiscard]] const std::string& formula() const noexcept { return formula_; }
    /// Offending name, operator or function (may be empty for end-of-input)
    [[nodiscard]] const std::string& token() const noexcept { return token_; }
    /// 1-based column of the token inside the formula, 0 when unknown
    [[nodiscard]] std::size_t column() const noexcept { return column_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string formula_;
    std::string token_;
    std::size_t column_;
    std::string detail_;
};

/// Auxiliary resolution failure (evaluation error or non-convergence)
class ResolutionError : public ModelError {
public:
    ResolutionError(ErrorCode code, std::string entity, std::string formula, const std::string& cause)
        : ModelError(code, cause), entity_(std::move(entity)), formula_(std::move(formula)) {}

    [[nodiscard]] const std::string& entity() const noexcept { return entity_; }
    [[nodiscard]] const std::string& formula() const noexcept { return formula_; }

private:
    std::string entity_;
    std::string formula_;
};

/// A scenario run aborted during stepping. Carries the partial series
/// (always marked incomplete) as context.
class SimulationError : public ModelError {
public:
    struct Context {
        std::string entity;
        std::optional<EntityKind> kind;
        std::string formula;
        Real time = 0.0;
        std::size_t step = 0;
        std::string cause;
    };

    SimulationError(ErrorCode code, Context context, TimeSeries partial);

    [[nodiscard]] const std::string& entity() const noexcept { return context_.entity; }
    [[nodiscard]] std::optional<EntityKind> kind() const noexcept { return context_.kind; }
    [[nodiscard]] const std::string& formula() const noexcept { return context_.formula; }
    [[nodiscard]] Real time() const noexcept { return context_.time; }
    [[nodiscard]] std::size_t step() const noexcept { return context_.step; }
    [[nodiscard]] const std::string& cause() const noexcept { return context_.cause; }
    [[nodiscard]] const TimeSeries& partial() const noexcept { return partial_; }

private:
    Context context_;
    TimeSeries partial_;
};

// =============================================================================
// Structured error detail (output contract for failed scenarios)
// =============================================================================

struct ErrorDetail {
    ErrorCode code = ErrorCode::None;
    std::string entity;
    std::string formula;
    std::optional<Real> time;
    std::string message;
};

/// Flatten any engine exception into an ErrorDetail
[[nodiscard]] ErrorDetail describe_error(const std::exception& error);

}  // namespace stockflow::v1
