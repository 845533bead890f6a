#pragma once

/**
 * @file expr.hpp
 * @brief Kconfig tristate values and dependency expressions
 *
 * An expression is a closed variant of five node kinds. Symbols are
 * referenced by canonical name, never by pointer, so expressions survive
 * forward references and cycles in the symbol table. Nodes are immutable
 * and shared: menu and if-block guards are attached to every enclosed
 * symbol without copying.
 */

#include "kcfgvex/common.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

namespace kcfgvex::kconfig {

/// Kconfig value domain, ordered n < m < y
enum class Tristate : std::uint8_t { kNo = 0, kMod = 1, kYes = 2 };

[[nodiscard]] constexpr Tristate tri_and(Tristate lhs, Tristate rhs) noexcept
{
    return lhs < rhs ? lhs : rhs;
}

[[nodiscard]] constexpr Tristate tri_or(Tristate lhs, Tristate rhs) noexcept
{
    return lhs < rhs ? rhs : lhs;
}

[[nodiscard]] constexpr Tristate tri_not(Tristate value) noexcept
{
    return static_cast<Tristate>(2 - static_cast<int>(value));
}

[[nodiscard]] std::string_view to_string(Tristate value) noexcept;

/// "y", "m", "n" (case-sensitive); anything else is not a tristate
[[nodiscard]] std::optional<Tristate> parse_tristate(std::string_view text) noexcept;

/**
 * @brief Value of a configuration symbol or constant
 *
 * For bool/tristate symbols text is "y", "m" or "n". For int, hex and
 * string symbols text is the scalar and tri stays kNo, as in Kconfig.
 */
struct ConfigValue
{
    Tristate tri = Tristate::kNo;
    std::string text = "n";

    [[nodiscard]] static ConfigValue from_tristate(Tristate value)
    {
        return ConfigValue{.tri = value, .text = std::string(to_string(value))};
    }

    [[nodiscard]] static ConfigValue from_text(std::string value)
    {
        return ConfigValue{.tri = Tristate::kNo, .text = std::move(value)};
    }

    bool operator==(const ConfigValue&) const = default;
};

enum class CompareOp { kEqual, kNotEqual, kLess, kLessEqual, kGreater, kGreaterEqual };

[[nodiscard]] std::string_view to_string(CompareOp op) noexcept;

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Symbol reference (`FOO`) or constant (`y`, `"text"`, `0x10`)
struct Literal
{
    std::string name;
    bool constant = false;
};

/// `lhs op rhs`
struct Comparison
{
    CompareOp op = CompareOp::kEqual;
    Literal lhs;
    Literal rhs;
};

struct And
{
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Or
{
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Not
{
    ExprPtr operand;
};

struct Expr
{
    std::variant<Literal, Comparison, And, Or, Not> node;
};

// ============================================================================
// Construction
// ============================================================================

[[nodiscard]] ExprPtr make_symbol(std::string_view name);
[[nodiscard]] ExprPtr make_constant(std::string_view value);
[[nodiscard]] ExprPtr make_comparison(CompareOp op, Literal lhs, Literal rhs);
[[nodiscard]] ExprPtr make_not(ExprPtr operand);

/// Conjunction; a null side means "no constraint" and yields the other side
[[nodiscard]] ExprPtr make_and(ExprPtr lhs, ExprPtr rhs);

/// Disjunction; null only if both sides are null
[[nodiscard]] ExprPtr make_or(ExprPtr lhs, ExprPtr rhs);

/**
 * Literal for an identifier token: y/m/n, numbers and quoted text are
 * constants; anything else is a canonicalized symbol reference.
 */
[[nodiscard]] Literal make_literal(std::string_view token, bool quoted);

// ============================================================================
// Inspection and evaluation
// ============================================================================

/// Kconfig-syntax rendering with minimal parentheses
[[nodiscard]] std::string to_string(const Expr& expr);

/// Render a possibly-null expression ("y" for null)
[[nodiscard]] std::string to_string(const ExprPtr& expr);

/// Every symbol name referenced (constants excluded)
void collect_symbols(const Expr& expr, std::set<std::string>& out);

/// Symbol value lookup used during evaluation
using SymbolLookup = std::function<ConfigValue(std::string_view name)>;

/**
 * Evaluate with Kconfig tristate semantics:
 * AND = min, OR = max, NOT = 2 - x, comparisons yield y or n.
 */
[[nodiscard]] Tristate evaluate(const Expr& expr, const SymbolLookup& lookup);

/// Evaluate a possibly-null expression (null evaluates to y)
[[nodiscard]] Tristate evaluate(const ExprPtr& expr, const SymbolLookup& lookup);

/**
 * Parse an expression such as `FOO && (BAR || !BAZ) && QUX!="x"`.
 * @return Expression tree, or ExprParseError
 */
[[nodiscard]] kcfgvex::Result<ExprPtr> parse_expression(std::string_view text);

}  // namespace kcfgvex::kconfig
