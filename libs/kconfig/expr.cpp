/**
 * @file expr.cpp
 * @brief Kconfig expression construction, rendering and evaluation
 */

#include "kcfgvex/kconfig/expr.hpp"

#include "lexer.hpp"

#include <charconv>
#include <optional>
#include <system_error>

namespace kcfgvex::kconfig {

namespace {

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

/// Decimal or 0x-prefixed hexadecimal integer
[[nodiscard]] std::optional<long long> parse_number(std::string_view text) noexcept
{
    if (text.empty()) {
        return std::nullopt;
    }
    int base = 10;
    std::string_view digits = text;
    bool negative = false;
    if (digits.front() == '-') {
        negative = true;
        digits.remove_prefix(1);
    }
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits.remove_prefix(2);
    }
    if (digits.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const auto* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

/// Numeric constant; names such as 64BIT stay symbols
[[nodiscard]] bool looks_numeric(std::string_view text) noexcept
{
    return parse_number(text).has_value();
}

[[nodiscard]] bool compare_ordering(CompareOp op, int ordering) noexcept
{
    switch (op) {
        case CompareOp::kEqual:
            return ordering == 0;
        case CompareOp::kNotEqual:
            return ordering != 0;
        case CompareOp::kLess:
            return ordering < 0;
        case CompareOp::kLessEqual:
            return ordering <= 0;
        case CompareOp::kGreater:
            return ordering > 0;
        case CompareOp::kGreaterEqual:
            return ordering >= 0;
    }
    return false;
}

[[nodiscard]] std::string operand_text(const Literal& literal, const SymbolLookup& lookup)
{
    if (literal.constant) {
        return literal.name;
    }
    return lookup(literal.name).text;
}

[[nodiscard]] std::string render_literal(const Literal& literal)
{
    if (!literal.constant || parse_tristate(literal.name) || looks_numeric(literal.name)) {
        return literal.name;
    }
    std::string out = "\"";
    for (char c : literal.name) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

/// Binding strength used to decide where parentheses are needed
[[nodiscard]] int precedence(const Expr& expr) noexcept
{
    return std::visit(Overloaded{
                          [](const Or&) { return 1; },
                          [](const And&) { return 2; },
                          [](const Not&) { return 3; },
                          [](const auto&) { return 4; },
                      },
                      expr.node);
}

void render(const Expr& expr, std::string& out);

void render_child(const ExprPtr& child, int parent_precedence, std::string& out)
{
    if (!child) {
        out += "y";
        return;
    }
    const bool wrap = precedence(*child) < parent_precedence;
    if (wrap) {
        out.push_back('(');
    }
    render(*child, out);
    if (wrap) {
        out.push_back(')');
    }
}

void render(const Expr& expr, std::string& out)
{
    std::visit(Overloaded{
                   [&out](const Literal& lit) { out += render_literal(lit); },
                   [&out](const Comparison& cmp) {
                       out += render_literal(cmp.lhs);
                       out += to_string(cmp.op);
                       out += render_literal(cmp.rhs);
                   },
                   [&out](const And& node) {
                       render_child(node.lhs, 2, out);
                       out += " && ";
                       render_child(node.rhs, 2, out);
                   },
                   [&out](const Or& node) {
                       render_child(node.lhs, 1, out);
                       out += " || ";
                       render_child(node.rhs, 1, out);
                   },
                   [&out](const Not& node) {
                       out.push_back('!');
                       render_child(node.operand, 4, out);
                   },
               },
               expr.node);
}

}  // namespace

std::string_view to_string(Tristate value) noexcept
{
    switch (value) {
        case Tristate::kNo:
            return "n";
        case Tristate::kMod:
            return "m";
        case Tristate::kYes:
            return "y";
    }
    return "n";
}

std::optional<Tristate> parse_tristate(std::string_view text) noexcept
{
    if (text == "y") {
        return Tristate::kYes;
    }
    if (text == "m") {
        return Tristate::kMod;
    }
    if (text == "n") {
        return Tristate::kNo;
    }
    return std::nullopt;
}

std::string_view to_string(CompareOp op) noexcept
{
    switch (op) {
        case CompareOp::kEqual:
            return "=";
        case CompareOp::kNotEqual:
            return "!=";
        case CompareOp::kLess:
            return "<";
        case CompareOp::kLessEqual:
            return "<=";
        case CompareOp::kGreater:
            return ">";
        case CompareOp::kGreaterEqual:
            return ">=";
    }
    return "=";
}

ExprPtr make_symbol(std::string_view name)
{
    return std::make_shared<const Expr>(
        Expr{Literal{.name = common::canonical_symbol_name(name), .constant = false}});
}

ExprPtr make_constant(std::string_view value)
{
    return std::make_shared<const Expr>(Expr{Literal{.name = std::string(value), .constant = true}});
}

ExprPtr make_comparison(CompareOp op, Literal lhs, Literal rhs)
{
    return std::make_shared<const Expr>(
        Expr{Comparison{.op = op, .lhs = std::move(lhs), .rhs = std::move(rhs)}});
}

ExprPtr make_not(ExprPtr operand)
{
    return std::make_shared<const Expr>(Expr{Not{.operand = std::move(operand)}});
}

ExprPtr make_and(ExprPtr lhs, ExprPtr rhs)
{
    if (!lhs) {
        return rhs;
    }
    if (!rhs) {
        return lhs;
    }
    return std::make_shared<const Expr>(Expr{And{.lhs = std::move(lhs), .rhs = std::move(rhs)}});
}

ExprPtr make_or(ExprPtr lhs, ExprPtr rhs)
{
    if (!lhs || !rhs) {
        // An absent side is unconstrained, so the disjunction is too.
        return nullptr;
    }
    return std::make_shared<const Expr>(Expr{Or{.lhs = std::move(lhs), .rhs = std::move(rhs)}});
}

Literal make_literal(std::string_view token, bool quoted)
{
    if (quoted || parse_tristate(token) || looks_numeric(token)) {
        return Literal{.name = std::string(token), .constant = true};
    }
    return Literal{.name = common::canonical_symbol_name(token), .constant = false};
}

std::string to_string(const Expr& expr)
{
    std::string out;
    render(expr, out);
    return out;
}

std::string to_string(const ExprPtr& expr)
{
    if (!expr) {
        return "y";
    }
    return to_string(*expr);
}

void collect_symbols(const Expr& expr, std::set<std::string>& out)
{
    std::visit(Overloaded{
                   [&out](const Literal& lit) {
                       if (!lit.constant) {
                           out.insert(lit.name);
                       }
                   },
                   [&out](const Comparison& cmp) {
                       if (!cmp.lhs.constant) {
                           out.insert(cmp.lhs.name);
                       }
                       if (!cmp.rhs.constant) {
                           out.insert(cmp.rhs.name);
                       }
                   },
                   [&out](const And& node) {
                       collect_symbols(*node.lhs, out);
                       collect_symbols(*node.rhs, out);
                   },
                   [&out](const Or& node) {
                       collect_symbols(*node.lhs, out);
                       collect_symbols(*node.rhs, out);
                   },
                   [&out](const Not& node) { collect_symbols(*node.operand, out); },
               },
               expr.node);
}

Tristate evaluate(const Expr& expr, const SymbolLookup& lookup)
{
    return std::visit(
        Overloaded{
            [&lookup](const Literal& lit) {
                if (lit.constant) {
                    return parse_tristate(lit.name).value_or(Tristate::kNo);
                }
                return lookup(lit.name).tri;
            },
            [&lookup](const Comparison& cmp) {
                const std::string lhs = operand_text(cmp.lhs, lookup);
                const std::string rhs = operand_text(cmp.rhs, lookup);
                int ordering = 0;
                auto lhs_num = parse_number(lhs);
                auto rhs_num = parse_number(rhs);
                if (lhs_num && rhs_num) {
                    ordering = *lhs_num < *rhs_num ? -1 : (*lhs_num > *rhs_num ? 1 : 0);
                } else {
                    ordering = lhs.compare(rhs);
                }
                return compare_ordering(cmp.op, ordering) ? Tristate::kYes : Tristate::kNo;
            },
            [&lookup](const And& node) {
                return tri_and(evaluate(*node.lhs, lookup), evaluate(*node.rhs, lookup));
            },
            [&lookup](const Or& node) {
                return tri_or(evaluate(*node.lhs, lookup), evaluate(*node.rhs, lookup));
            },
            [&lookup](const Not& node) { return tri_not(evaluate(*node.operand, lookup)); },
        },
        expr.node);
}

Tristate evaluate(const ExprPtr& expr, const SymbolLookup& lookup)
{
    if (!expr) {
        return Tristate::kYes;
    }
    return evaluate(*expr, lookup);
}

kcfgvex::Result<ExprPtr> parse_expression(std::string_view text)
{
    auto tokens = detail::tokenize(text);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    return detail::parse_expression_tokens(*tokens);
}

}  // namespace kcfgvex::kconfig
