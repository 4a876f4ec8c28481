#pragma once

// =============================================================================
// stockflow - Restricted Formula Language
// =============================================================================
// Formulas come from an untrusted generator. They are compiled by a dedicated
// tokenizer / recursive-descent parser into an expression tree and evaluated
// against an explicit Scope. Nothing outside the scope is reachable and only
// the allow-listed functions can be called.
//
// Grammar (lowest precedence first):
//   conditional := or_expr [ "if" or_expr "else" conditional ]
//   or_expr     := and_expr { "or" and_expr }
//   and_expr    := not_expr { "and" not_expr }
//   not_expr    := "not" not_expr | comparison
//   comparison  := sum { ("<"|"<="|">"|">="|"=="|"!=") sum }
//   sum         := term { ("+"|"-") term }
//   term        := factor { ("*"|"/"|"%") factor }
//   factor      := ("+"|"-") factor | power
//   power       := postfix [ "**" factor ]
//   postfix     := primary { "." NAME | "[" STRING "]" }
//   primary     := NUMBER | NAME | call | "(" conditional ")"
//   call        := [ ("np"|"numpy"|"math") "." ] FUNCTION "(" args ")"
// =============================================================================

#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/model.hpp"
#include "stockflow/v1/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace stockflow::v1 {

// =============================================================================
// Scope
// =============================================================================

/// A scope entry is either a plain number (stocks, auxiliaries, flows, time)
/// or a structured quantity (parameters, read through `.value`)
using ScopeValue = std::variant<Real, Quantity>;

class Scope {
public:
    void set(const std::string& name, Real value) { values_[name] = value; }
    void set(const std::string& name, Quantity value) { values_[name] = std::move(value); }

    [[nodiscard]] const ScopeValue* find(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return values_.find(name) != values_.end();
    }

    /// Numeric entry, or nullopt for missing / structured entries
    [[nodiscard]] std::optional<Real> number(const std::string& name) const {
        const ScopeValue* value = find(name);
        if (value == nullptr) return std::nullopt;
        if (const auto* real = std::get_if<Real>(value)) return *real;
        return std::nullopt;
    }

    [[nodiscard]] std::size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, ScopeValue> values_;
};

// =============================================================================
// Allow-listed functions
// =============================================================================

enum class Function : std::uint8_t {
    Min,
    Max,
    Abs,
    Exp,
    Log,
    Sqrt,
    Pow,
    Floor,
    Ceil
};

struct FunctionSignature {
    std::string_view name;
    Function function = Function::Min;
    std::size_t min_args = 1;
    std::size_t max_args = 1;  // 0 = unbounded
};

[[nodiscard]] std::span<const FunctionSignature> allowed_functions() noexcept;
[[nodiscard]] std::optional<FunctionSignature> find_function(std::string_view name) noexcept;

// =============================================================================
// Compiled formula
// =============================================================================

class CompiledFormula {
public:
    enum class NodeKind : std::uint8_t {
        Number,
        Name,
        Field,
        Unary,
        Binary,
        Conditional,
        Call
    };

    enum class Op : std::uint8_t {
        None,
        Add,
        Sub,
        Mul,
        Div,
        Mod,
        Pow,
        Neg,
        Pos,
        Not,
        Lt,
        Le,
        Gt,
        Ge,
        Eq,
        Ne,
        And,
        Or
    };

    /// Expression tree node. Children are indices into nodes().
    struct Node {
        NodeKind kind = NodeKind::Number;
        Op op = Op::None;
        Function function = Function::Min;
        Real number = 0.0;
        std::string text;      // name, field or function spelling
        std::size_t column = 0;
        std::vector<std::int32_t> children;
    };

    CompiledFormula() = default;

    /// Parse a formula; throws EvaluationError on syntax errors, string
    /// literals outside subscripts and calls to functions that are not
    /// allow-listed
    [[nodiscard]] static CompiledFormula compile(std::string formula);

    /// Evaluate against `scope`; throws EvaluationError on undefined names,
    /// non-numeric operands, division by zero and non-finite results
    [[nodiscard]] Real evaluate(const Scope& scope) const;

    [[nodiscard]] const std::string& text() const { return text_; }

    /// Free names referenced by the formula, in order of first appearance
    [[nodiscard]] const std::vector<std::string>& referenced_names() const { return names_; }

    [[nodiscard]] bool empty() const { return root_ < 0; }
    [[nodiscard]] const std::vector<Node>& nodes() const { return nodes_; }

private:
    friend class FormulaParser;

    [[nodiscard]] Real eval_node(std::int32_t index, const Scope& scope) const;
    [[nodiscard]] Real eval_name(const Node& node, const Scope& scope) const;
    [[nodiscard]] Real eval_field(const Node& node, const Scope& scope) const;
    [[nodiscard]] Real eval_binary(const Node& node, const Scope& scope) const;
    [[nodiscard]] Real eval_call(const Node& node, const Scope& scope) const;
    [[noreturn]] void fail(ErrorCode code, const Node& node, const std::string& detail) const;

    std::string text_;
    std::vector<Node> nodes_;
    std::int32_t root_ = -1;
    std::vector<std::string> names_;
};

/// Compile and evaluate in one call
[[nodiscard]] Real evaluate(const std::string& formula, const Scope& scope);

}  // namespace stockflow::v1
