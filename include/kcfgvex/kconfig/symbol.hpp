#pragma once

/**
 * @file symbol.hpp
 * @brief Configuration symbols and the symbol arena
 */

#include "kcfgvex/kconfig/expr.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kcfgvex::kconfig {

enum class SymbolKind { kUnknown, kBool, kTristate, kInt, kHex, kString };

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

/// "bool"/"boolean", "tristate", "int", "hex", "string"
[[nodiscard]] std::optional<SymbolKind> parse_symbol_kind(std::string_view keyword) noexcept;

/// True for kinds whose value is a tristate (unknown kinds count as bool)
[[nodiscard]] constexpr bool is_tristate_kind(SymbolKind kind) noexcept
{
    return kind == SymbolKind::kUnknown || kind == SymbolKind::kBool
           || kind == SymbolKind::kTristate;
}

struct SourceLocation
{
    std::string file;
    int line = 0;

    [[nodiscard]] std::string to_string() const;
};

/// `default <value> [if <condition>]`
struct DefaultRule
{
    ExprPtr value;
    ExprPtr condition;  ///< null: unconditional
    SourceLocation location;
};

/// `select <target> [if <condition>]` and `imply <target> [if <condition>]`
struct SelectClause
{
    std::string target;
    ExprPtr condition;
    SourceLocation location;
};

/// `range <low> <high> [if <condition>]`
struct RangeRule
{
    Literal low;
    Literal high;
    ExprPtr condition;
};

/**
 * @brief One configuration item, merged over all of its definitions
 *
 * Defaults and prompt come from the last definition that declares them.
 * Dependency guards, selects and implies accumulate over every definition.
 */
struct ConfigSymbol
{
    std::string name;
    SymbolKind kind = SymbolKind::kUnknown;
    std::optional<std::string> prompt;
    ExprPtr prompt_condition;
    std::vector<DefaultRule> defaults;
    std::vector<ExprPtr> depends;
    std::vector<SelectClause> selects;
    std::vector<SelectClause> implies;
    std::vector<RangeRule> ranges;
    std::vector<SourceLocation> locations;
    std::optional<std::string> choice;  ///< enclosing choice group, if any
    bool has_help = false;
};

using SymbolId = std::uint32_t;

/**
 * @brief Arena of symbols addressed by stable integer ids
 *
 * Lookups accept prefixed or bare names.
 */
class SymbolTable
{
public:
    [[nodiscard]] SymbolId get_or_create(std::string_view name);
    [[nodiscard]] std::optional<SymbolId> find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name).has_value(); }

    [[nodiscard]] const ConfigSymbol& at(SymbolId id) const { return m_symbols.at(id); }
    [[nodiscard]] ConfigSymbol& at(SymbolId id) { return m_symbols.at(id); }

    [[nodiscard]] std::size_t size() const noexcept { return m_symbols.size(); }
    [[nodiscard]] const std::vector<ConfigSymbol>& symbols() const noexcept { return m_symbols; }

private:
    std::vector<ConfigSymbol> m_symbols;
    std::unordered_map<std::string, SymbolId> m_index;
};

}  // namespace kcfgvex::kconfig
