#include "stockflow/v1/expression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace stockflow::v1 {

namespace {

constexpr std::size_t kMaxNestingDepth = 200;
constexpr std::size_t kMaxTreeHeight = 1000;

constexpr std::array<FunctionSignature, 9> kFunctions = {{
    {"min", Function::Min, 1, 0},
    {"max", Function::Max, 1, 0},
    {"abs", Function::Abs, 1, 1},
    {"exp", Function::Exp, 1, 1},
    {"log", Function::Log, 1, 1},
    {"sqrt", Function::Sqrt, 1, 1},
    {"pow", Function::Pow, 2, 2},
    {"floor", Function::Floor, 1, 1},
    {"ceil", Function::Ceil, 1, 1},
}};

// Module prefixes the generator habitually writes in front of math calls
constexpr std::array<std::string_view, 3> kModuleQualifiers = {"np", "numpy", "math"};

constexpr std::array<std::string_view, 5> kKeywords = {"and", "or", "not", "if", "else"};

enum class TokenKind : std::uint8_t {
    Number,
    Name,
    String,
    Operator,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Dot,
    End
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    Real number = 0.0;
    std::size_t column = 0;
};

bool is_module_qualifier(std::string_view name) {
    return std::find(kModuleQualifiers.begin(), kModuleQualifiers.end(), name) != kModuleQualifiers.end();
}

bool is_keyword(std::string_view name) {
    return std::find(kKeywords.begin(), kKeywords.end(), name) != kKeywords.end();
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
bool is_name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

[[noreturn]] void syntax_error(const std::string& formula,
                               std::string token,
                               std::size_t column,
                               const std::string& detail) {
    throw EvaluationError(ErrorCode::SyntaxError, formula, std::move(token), column, detail);
}

bool ends_operand(const std::vector<Token>& tokens) {
    if (tokens.empty()) return false;
    switch (tokens.back().kind) {
        case TokenKind::Number:
        case TokenKind::Name:
        case TokenKind::String:
        case TokenKind::RParen:
        case TokenKind::RBracket:
            return true;
        default:
            return false;
    }
}

std::vector<Token> tokenize(const std::string& formula) {
    std::vector<Token> tokens;
    const std::size_t n = formula.size();
    std::size_t i = 0;

    while (i < n) {
        const char c = formula[i];
        const std::size_t column = i + 1;

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        const bool leading_dot_number =
            c == '.' && i + 1 < n && is_digit(formula[i + 1]) && !ends_operand(tokens);
        if (is_digit(c) || leading_dot_number) {
            std::size_t j = i;
            while (j < n && is_digit(formula[j])) ++j;
            if (j < n && formula[j] == '.') {
                ++j;
                while (j < n && is_digit(formula[j])) ++j;
            }
            if (j < n && (formula[j] == 'e' || formula[j] == 'E')) {
                std::size_t k = j + 1;
                if (k < n && (formula[k] == '+' || formula[k] == '-')) ++k;
                if (k < n && is_digit(formula[k])) {
                    while (k < n && is_digit(formula[k])) ++k;
                    j = k;
                }
            }
            if (j < n && is_name_char(formula[j])) {
                syntax_error(formula, formula.substr(i, j - i + 1), column, "invalid number literal");
            }
            const std::string literal = formula.substr(i, j - i);
            Token tok{TokenKind::Number, literal, std::strtod(literal.c_str(), nullptr), column};
            tokens.push_back(std::move(tok));
            i = j;
            continue;
        }

        if (is_name_start(c)) {
            std::size_t j = i;
            while (j < n && is_name_char(formula[j])) ++j;
            tokens.push_back({TokenKind::Name, formula.substr(i, j - i), 0.0, column});
            i = j;
            continue;
        }

        if (c == '\'' || c == '"') {
            const std::size_t close = formula.find(c, i + 1);
            if (close == std::string::npos) {
                syntax_error(formula, formula.substr(i), column, "unterminated string literal");
            }
            tokens.push_back({TokenKind::String, formula.substr(i + 1, close - i - 1), 0.0, column});
            i = close + 1;
            continue;
        }

        const std::string two = formula.substr(i, 2);
        if (two == "**" || two == "<=" || two == ">=" || two == "==" || two == "!=") {
            tokens.push_back({TokenKind::Operator, two, 0.0, column});
            i += 2;
            continue;
        }

        switch (c) {
            case '+': case '-': case '*': case '/': case '%': case '<': case '>':
                tokens.push_back({TokenKind::Operator, std::string(1, c), 0.0, column});
                break;
            case '(': tokens.push_back({TokenKind::LParen, "(", 0.0, column}); break;
            case ')': tokens.push_back({TokenKind::RParen, ")", 0.0, column}); break;
            case '[': tokens.push_back({TokenKind::LBracket, "[", 0.0, column}); break;
            case ']': tokens.push_back({TokenKind::RBracket, "]", 0.0, column}); break;
            case ',': tokens.push_back({TokenKind::Comma, ",", 0.0, column}); break;
            case '.': tokens.push_back({TokenKind::Dot, ".", 0.0, column}); break;
            case '=':
                syntax_error(formula, "=", column, "assignment is not allowed in formulas");
            default:
                syntax_error(formula, std::string(1, c), column, "unexpected character");
        }
        ++i;
    }

    tokens.push_back({TokenKind::End, "", 0.0, n + 1});
    return tokens;
}

}  // namespace

std::span<const FunctionSignature> allowed_functions() noexcept {
    return kFunctions;
}

std::optional<FunctionSignature> find_function(std::string_view name) noexcept {
    for (const auto& sig : kFunctions) {
        if (sig.name == name) return sig;
    }
    return std::nullopt;
}

// =============================================================================
// Parser
// =============================================================================

class FormulaParser {
public:
    using Node = CompiledFormula::Node;
    using NodeKind = CompiledFormula::NodeKind;
    using Op = CompiledFormula::Op;

    FormulaParser(CompiledFormula& out, std::vector<Token> tokens)
        : out_(out), tokens_(std::move(tokens)) {}

    void parse() {
        out_.root_ = parse_conditional();
        if (peek().kind != TokenKind::End) {
            fail(peek(), "unexpected token after end of expression");
        }
    }

private:
    struct DepthGuard {
        explicit DepthGuard(FormulaParser& parser) : parser_(parser) {
            if (++parser_.depth_ > kMaxNestingDepth) {
                parser_.fail(parser_.peek(), "expression is nested too deeply");
            }
        }
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        FormulaParser& parser_;
    };

    [[nodiscard]] const Token& peek(std::size_t ahead = 0) const {
        const std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    const Token& advance() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return tok;
    }

    [[nodiscard]] bool at_operator(std::string_view op) const {
        return peek().kind == TokenKind::Operator && peek().text == op;
    }

    [[nodiscard]] bool at_keyword(std::string_view keyword) const {
        return peek().kind == TokenKind::Name && peek().text == keyword;
    }

    [[noreturn]] void fail(const Token& tok, const std::string& detail) const {
        syntax_error(out_.text_, tok.text, tok.column, detail);
    }

    void expect(TokenKind kind, const char* what) {
        if (peek().kind != kind) {
            fail(peek(), std::string("expected ") + what);
        }
        advance();
    }

    // Evaluation recurses once per tree level, so long operator chains are
    // bounded here as well as parenthesis nesting
    std::int32_t add_node(Node node) {
        std::size_t height = 1;
        for (const std::int32_t child : node.children) {
            height = std::max(height, heights_[static_cast<std::size_t>(child)] + 1);
        }
        if (height > kMaxTreeHeight) {
            fail(Token{TokenKind::Operator, node.text, 0.0, node.column}, "expression is nested too deeply");
        }
        heights_.push_back(height);
        out_.nodes_.push_back(std::move(node));
        return static_cast<std::int32_t>(out_.nodes_.size() - 1);
    }

    std::int32_t add_binary(Op op, const Token& tok, std::int32_t lhs, std::int32_t rhs) {
        Node node;
        node.kind = NodeKind::Binary;
        node.op = op;
        node.text = tok.text;
        node.column = tok.column;
        node.children = {lhs, rhs};
        return add_node(std::move(node));
    }

    std::int32_t add_unary(Op op, const Token& tok, std::int32_t operand) {
        Node node;
        node.kind = NodeKind::Unary;
        node.op = op;
        node.text = tok.text;
        node.column = tok.column;
        node.children = {operand};
        return add_node(std::move(node));
    }

    void record_name(const std::string& name) {
        auto& names = out_.names_;
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }

    std::int32_t parse_conditional() {
        DepthGuard guard(*this);
        const std::int32_t body = parse_or();
        if (!at_keyword("if")) {
            return body;
        }
        const Token tok = advance();
        const std::int32_t condition = parse_or();
        if (!at_keyword("else")) {
            fail(peek(), "expected 'else' in conditional expression");
        }
        advance();
        const std::int32_t otherwise = parse_conditional();

        Node node;
        node.kind = NodeKind::Conditional;
        node.text = tok.text;
        node.column = tok.column;
        node.children = {condition, body, otherwise};
        return add_node(std::move(node));
    }

    std::int32_t parse_or() {
        std::int32_t lhs = parse_and();
        while (at_keyword("or")) {
            const Token tok = advance();
            lhs = add_binary(Op::Or, tok, lhs, parse_and());
        }
        return lhs;
    }

    std::int32_t parse_and() {
        std::int32_t lhs = parse_not();
        while (at_keyword("and")) {
            const Token tok = advance();
            lhs = add_binary(Op::And, tok, lhs, parse_not());
        }
        return lhs;
    }

    std::int32_t parse_not() {
        if (at_keyword("not")) {
            DepthGuard guard(*this);
            const Token tok = advance();
            return add_unary(Op::Not, tok, parse_not());
        }
        return parse_comparison();
    }

    [[nodiscard]] std::optional<Op> comparison_op() const {
        if (peek().kind != TokenKind::Operator) return std::nullopt;
        const std::string& t = peek().text;
        if (t == "<") return Op::Lt;
        if (t == "<=") return Op::Le;
        if (t == ">") return Op::Gt;
        if (t == ">=") return Op::Ge;
        if (t == "==") return Op::Eq;
        if (t == "!=") return Op::Ne;
        return std::nullopt;
    }

    // a < b < c is evaluated as (a < b) and (b < c)
    std::int32_t parse_comparison() {
        const std::int32_t first = parse_sum();
        std::int32_t left = first;
        std::int32_t chain = -1;
        while (const auto op = comparison_op()) {
            const Token tok = advance();
            const std::int32_t right = parse_sum();
            const std::int32_t cmp = add_binary(*op, tok, left, right);
            chain = (chain < 0) ? cmp : add_binary(Op::And, tok, chain, cmp);
            left = right;
        }
        return chain < 0 ? first : chain;
    }

    std::int32_t parse_sum() {
        std::int32_t lhs = parse_term();
        while (at_operator("+") || at_operator("-")) {
            const Token tok = advance();
            const Op op = tok.text == "+" ? Op::Add : Op::Sub;
            lhs = add_binary(op, tok, lhs, parse_term());
        }
        return lhs;
    }

    std::int32_t parse_term() {
        std::int32_t lhs = parse_factor();
        while (at_operator("*") || at_operator("/") || at_operator("%")) {
            const Token tok = advance();
            const Op op = tok.text == "*" ? Op::Mul : (tok.text == "/" ? Op::Div : Op::Mod);
            lhs = add_binary(op, tok, lhs, parse_factor());
        }
        return lhs;
    }

    std::int32_t parse_factor() {
        if (at_operator("+") || at_operator("-")) {
            DepthGuard guard(*this);
            const Token tok = advance();
            const Op op = tok.text == "-" ? Op::Neg : Op::Pos;
            return add_unary(op, tok, parse_factor());
        }
        return parse_power();
    }

    std::int32_t parse_power() {
        const std::int32_t base = parse_postfix();
        if (at_operator("**")) {
            DepthGuard guard(*this);
            const Token tok = advance();
            return add_binary(Op::Pow, tok, base, parse_factor());
        }
        return base;
    }

    std::int32_t parse_postfix() {
        std::int32_t expr = parse_primary();
        while (true) {
            if (peek().kind == TokenKind::Dot) {
                advance();
                if (peek().kind != TokenKind::Name) {
                    fail(peek(), "expected field name after '.'");
                }
                expr = add_field(advance(), expr);
            } else if (peek().kind == TokenKind::LBracket) {
                advance();
                if (peek().kind != TokenKind::String) {
                    fail(peek(), "expected quoted field name in subscript");
                }
                const Token field = advance();
                expect(TokenKind::RBracket, "']'");
                expr = add_field(field, expr);
            } else {
                return expr;
            }
        }
    }

    std::int32_t add_field(const Token& field, std::int32_t base) {
        Node node;
        node.kind = NodeKind::Field;
        node.text = field.text;
        node.column = field.column;
        node.children = {base};
        return add_node(std::move(node));
    }

    std::int32_t parse_primary() {
        const Token& tok = peek();
        switch (tok.kind) {
            case TokenKind::Number: {
                Node node;
                node.kind = NodeKind::Number;
                node.number = tok.number;
                node.text = tok.text;
                node.column = tok.column;
                advance();
                return add_node(std::move(node));
            }
            case TokenKind::Name:
                return parse_name();
            case TokenKind::LParen: {
                advance();
                const std::int32_t inner = parse_conditional();
                expect(TokenKind::RParen, "')'");
                return inner;
            }
            case TokenKind::String:
                fail(tok, "string literals are only allowed as field subscripts");
            case TokenKind::End:
                fail(tok, "unexpected end of formula");
            default:
                fail(tok, "unexpected token");
        }
    }

    std::int32_t parse_name() {
        const Token tok = advance();
        if (is_keyword(tok.text)) {
            fail(tok, "unexpected keyword");
        }

        if (peek().kind == TokenKind::LParen) {
            return parse_call(tok, tok.text);
        }

        // module.function(...) is a call; anything else with a dot is field access
        if (peek().kind == TokenKind::Dot && peek(1).kind == TokenKind::Name &&
            peek(2).kind == TokenKind::LParen) {
            const std::string spelled = tok.text + "." + peek(1).text;
            if (!is_module_qualifier(tok.text)) {
                throw EvaluationError(ErrorCode::UnknownFunction, out_.text_, spelled, tok.column,
                                      "call is not allowed");
            }
            advance();
            const Token fn = advance();
            return parse_call(fn, spelled);
        }

        record_name(tok.text);
        Node node;
        node.kind = NodeKind::Name;
        node.text = tok.text;
        node.column = tok.column;
        return add_node(std::move(node));
    }

    std::int32_t parse_call(const Token& fn, const std::string& spelled) {
        const auto sig = find_function(fn.text);
        if (!sig) {
            throw EvaluationError(ErrorCode::UnknownFunction, out_.text_, spelled, fn.column,
                                  "function is not allowed");
        }
        expect(TokenKind::LParen, "'('");

        Node node;
        node.kind = NodeKind::Call;
        node.function = sig->function;
        node.text = std::string(sig->name);
        node.column = fn.column;

        if (peek().kind != TokenKind::RParen) {
            while (true) {
                node.children.push_back(parse_conditional());
                if (peek().kind == TokenKind::Comma) {
                    advance();
                    continue;
                }
                break;
            }
        }
        expect(TokenKind::RParen, "')' to close argument list");

        const std::size_t argc = node.children.size();
        if (argc < sig->min_args || (sig->max_args != 0 && argc > sig->max_args)) {
            std::string expected = std::to_string(sig->min_args);
            if (sig->max_args == 0) {
                expected = "at least " + expected;
            } else if (sig->max_args != sig->min_args) {
                expected += " to " + std::to_string(sig->max_args);
            }
            throw EvaluationError(ErrorCode::ArityMismatch, out_.text_, spelled, fn.column,
                                  "function expects " + expected + " argument(s), got " +
                                      std::to_string(argc));
        }
        return add_node(std::move(node));
    }

    CompiledFormula& out_;
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    std::vector<std::size_t> heights_;
};

// =============================================================================
// Evaluation
// =============================================================================

CompiledFormula CompiledFormula::compile(std::string formula) {
    CompiledFormula out;
    out.text_ = std::move(formula);
    FormulaParser parser(out, tokenize(out.text_));
    parser.parse();
    return out;
}

Real CompiledFormula::evaluate(const Scope& scope) const {
    if (root_ < 0) {
        throw EvaluationError(ErrorCode::SyntaxError, text_, "", 0, "formula was never compiled");
    }
    const Real value = eval_node(root_, scope);
    if (!std::isfinite(value)) {
        fail(ErrorCode::NonFiniteResult, nodes_[static_cast<std::size_t>(root_)],
             "formula produced a non-finite value");
    }
    return value;
}

void CompiledFormula::fail(ErrorCode code, const Node& node, const std::string& detail) const {
    throw EvaluationError(code, text_, node.text, node.column, detail);
}

Real CompiledFormula::eval_node(std::int32_t index, const Scope& scope) const {
    const Node& node = nodes_[static_cast<std::size_t>(index)];
    switch (node.kind) {
        case NodeKind::Number:
            return node.number;
        case NodeKind::Name:
            return eval_name(node, scope);
        case NodeKind::Field:
            return eval_field(node, scope);
        case NodeKind::Unary: {
            const Real v = eval_node(node.children[0], scope);
            switch (node.op) {
                case Op::Neg: return -v;
                case Op::Not: return v == 0.0 ? 1.0 : 0.0;
                default: return v;
            }
        }
        case NodeKind::Binary:
            return eval_binary(node, scope);
        case NodeKind::Conditional: {
            const Real condition = eval_node(node.children[0], scope);
            return eval_node(node.children[condition != 0.0 ? 1 : 2], scope);
        }
        case NodeKind::Call:
            return eval_call(node, scope);
    }
    fail(ErrorCode::SyntaxError, node, "unknown expression node");
}

Real CompiledFormula::eval_name(const Node& node, const Scope& scope) const {
    const ScopeValue* value = scope.find(node.text);
    if (value == nullptr) {
        fail(ErrorCode::UndefinedName, node, "name '" + node.text + "' is not defined");
    }
    if (const auto* real = std::get_if<Real>(value)) {
        return *real;
    }
    fail(ErrorCode::NonNumericValue, node,
         "'" + node.text + "' is a structured value; use " + node.text + ".value");
}

Real CompiledFormula::eval_field(const Node& node, const Scope& scope) const {
    const Node& base = nodes_[static_cast<std::size_t>(node.children[0])];
    if (base.kind != NodeKind::Name) {
        fail(ErrorCode::InvalidFieldAccess, node, "field access is only supported on names");
    }
    const ScopeValue* value = scope.find(base.text);
    if (value == nullptr) {
        fail(ErrorCode::UndefinedName, base, "name '" + base.text + "' is not defined");
    }
    const auto* quantity = std::get_if<Quantity>(value);
    if (quantity == nullptr) {
        fail(ErrorCode::InvalidFieldAccess, node,
             "'" + base.text + "' is a number and has no field '" + node.text + "'");
    }
    if (node.text == "value") {
        return quantity->value;
    }
    if (node.text == "unit") {
        fail(ErrorCode::NonNumericValue, node, "field 'unit' of '" + base.text + "' is not a number");
    }
    fail(ErrorCode::InvalidFieldAccess, node,
         "'" + base.text + "' has no field '" + node.text + "'");
}

Real CompiledFormula::eval_binary(const Node& node, const Scope& scope) const {
    // Python semantics: `and` / `or` short-circuit and yield an operand
    if (node.op == Op::And) {
        const Real lhs = eval_node(node.children[0], scope);
        return lhs == 0.0 ? lhs : eval_node(node.children[1], scope);
    }
    if (node.op == Op::Or) {
        const Real lhs = eval_node(node.children[0], scope);
        return lhs != 0.0 ? lhs : eval_node(node.children[1], scope);
    }

    const Real lhs = eval_node(node.children[0], scope);
    const Real rhs = eval_node(node.children[1], scope);
    switch (node.op) {
        case Op::Add: return lhs + rhs;
        case Op::Sub: return lhs - rhs;
        case Op::Mul: return lhs * rhs;
        case Op::Div:
            if (rhs == 0.0) fail(ErrorCode::DivisionByZero, node, "division by zero");
            return lhs / rhs;
        case Op::Mod: {
            if (rhs == 0.0) fail(ErrorCode::DivisionByZero, node, "modulo by zero");
            Real m = std::fmod(lhs, rhs);
            if (m != 0.0 && ((m < 0.0) != (rhs < 0.0))) m += rhs;
            return m;
        }
        case Op::Pow: {
            if (lhs == 0.0 && rhs < 0.0) {
                fail(ErrorCode::DivisionByZero, node, "zero raised to a negative power");
            }
            const Real result = std::pow(lhs, rhs);
            if (!std::isfinite(result)) {
                fail(ErrorCode::NonFiniteResult, node, "power produced a non-finite value");
            }
            return result;
        }
        case Op::Lt: return lhs < rhs ? 1.0 : 0.0;
        case Op::Le: return lhs <= rhs ? 1.0 : 0.0;
        case Op::Gt: return lhs > rhs ? 1.0 : 0.0;
        case Op::Ge: return lhs >= rhs ? 1.0 : 0.0;
        case Op::Eq: return lhs == rhs ? 1.0 : 0.0;
        case Op::Ne: return lhs != rhs ? 1.0 : 0.0;
        default: break;
    }
    fail(ErrorCode::SyntaxError, node, "unsupported operator");
}

Real CompiledFormula::eval_call(const Node& node, const Scope& scope) const {
    std::vector<Real> args;
    args.reserve(node.children.size());
    for (const auto child : node.children) {
        args.push_back(eval_node(child, scope));
    }

    Real result = 0.0;
    switch (node.function) {
        case Function::Min:
            result = *std::min_element(args.begin(), args.end());
            break;
        case Function::Max:
            result = *std::max_element(args.begin(), args.end());
            break;
        case Function::Abs:
            result = std::fabs(args[0]);
            break;
        case Function::Exp:
            result = std::exp(args[0]);
            break;
        case Function::Log:
            if (args[0] <= 0.0) {
                fail(ErrorCode::NonFiniteResult, node, "log of a non-positive value");
            }
            result = std::log(args[0]);
            break;
        case Function::Sqrt:
            if (args[0] < 0.0) {
                fail(ErrorCode::NonFiniteResult, node, "sqrt of a negative value");
            }
            result = std::sqrt(args[0]);
            break;
        case Function::Pow:
            if (args[0] == 0.0 && args[1] < 0.0) {
                fail(ErrorCode::DivisionByZero, node, "zero raised to a negative power");
            }
            result = std::pow(args[0], args[1]);
            break;
        case Function::Floor:
            result = std::floor(args[0]);
            break;
        case Function::Ceil:
            result = std::ceil(args[0]);
            break;
    }

    if (!std::isfinite(result)) {
        fail(ErrorCode::NonFiniteResult, node, "function produced a non-finite value");
    }
    return result;
}

Real evaluate(const std::string& formula, const Scope& scope) {
    return CompiledFormula::compile(formula).evaluate(scope);
}

}  // namespace stockflow::v1
