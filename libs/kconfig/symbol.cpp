/**
 * @file symbol.cpp
 * @brief Symbol kinds and the symbol arena
 */

#include "kcfgvex/kconfig/symbol.hpp"

#include <format>

namespace kcfgvex::kconfig {

std::string_view to_string(SymbolKind kind) noexcept
{
    switch (kind) {
        case SymbolKind::kUnknown:
            return "unknown";
        case SymbolKind::kBool:
            return "bool";
        case SymbolKind::kTristate:
            return "tristate";
        case SymbolKind::kInt:
            return "int";
        case SymbolKind::kHex:
            return "hex";
        case SymbolKind::kString:
            return "string";
    }
    return "unknown";
}

std::optional<SymbolKind> parse_symbol_kind(std::string_view keyword) noexcept
{
    if (keyword == "bool" || keyword == "boolean") {
        return SymbolKind::kBool;
    }
    if (keyword == "tristate") {
        return SymbolKind::kTristate;
    }
    if (keyword == "int") {
        return SymbolKind::kInt;
    }
    if (keyword == "hex") {
        return SymbolKind::kHex;
    }
    if (keyword == "string") {
        return SymbolKind::kString;
    }
    return std::nullopt;
}

std::string SourceLocation::to_string() const
{
    return std::format("{}:{}", file, line);
}

SymbolId SymbolTable::get_or_create(std::string_view name)
{
    std::string canonical = common::canonical_symbol_name(name);
    if (auto it = m_index.find(canonical); it != m_index.end()) {
        return it->second;
    }
    const auto id = static_cast<SymbolId>(m_symbols.size());
    m_symbols.push_back(ConfigSymbol{.name = canonical});
    m_index.emplace(std::move(canonical), id);
    return id;
}

std::optional<SymbolId> SymbolTable::find(std::string_view name) const
{
    auto it = m_index.find(common::canonical_symbol_name(name));
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace kcfgvex::kconfig
