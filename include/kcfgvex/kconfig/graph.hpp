#pragma once

/**
 * @file graph.hpp
 * @brief Read-only dependency graph over configuration symbols
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/kconfig/parser.hpp"
#include "kcfgvex/kconfig/symbol.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kcfgvex::kconfig {

enum class SelectKind { kSelect, kImply };

[[nodiscard]] std::string_view to_string(SelectKind kind) noexcept;

/// `source` forces `target` to at least `force_value` while `guard` holds
struct SelectEdge
{
    SymbolId source = 0;
    SymbolId target = 0;
    ExprPtr guard;
    Tristate force_value = Tristate::kYes;
    SelectKind kind = SelectKind::kSelect;
    SourceLocation location;
};

/**
 * @brief Symbols plus their depends-on guards and select/imply edges
 *
 * Built once from a parse result and immutable afterwards, so a single
 * instance can be shared by concurrent evaluations. Cycles are allowed.
 * References to undefined symbols are recorded as diagnostics and stay
 * unresolved; evaluation treats them as n.
 */
class DependencyGraph
{
public:
    [[nodiscard]] static DependencyGraph build(ParseResult parsed);

    [[nodiscard]] std::optional<SymbolId> find(std::string_view name) const
    {
        return m_symbols.find(name);
    }
    [[nodiscard]] const ConfigSymbol& symbol(SymbolId id) const { return m_symbols.at(id); }
    [[nodiscard]] const SymbolTable& symbols() const noexcept { return m_symbols; }
    [[nodiscard]] std::size_t size() const noexcept { return m_symbols.size(); }

    /// Conjunction of every depends-on clause of the symbol (null: none)
    [[nodiscard]] const ExprPtr& depends_guard(SymbolId id) const { return m_guards.at(id); }

    /// Symbols referenced by the depends-on guard
    [[nodiscard]] std::set<std::string> dependencies_of(SymbolId id) const;

    [[nodiscard]] const SelectEdge& edge(std::size_t index) const { return m_edges.at(index); }
    [[nodiscard]] const std::vector<SelectEdge>& edges() const noexcept { return m_edges; }

    /// Edge indices leaving the symbol (what it selects or implies)
    [[nodiscard]] const std::vector<std::size_t>& selects_of(SymbolId id) const
    {
        return m_outgoing.at(id);
    }

    /// Edge indices reaching the symbol (what selects or implies it)
    [[nodiscard]] const std::vector<std::size_t>& selected_by(SymbolId id) const
    {
        return m_incoming.at(id);
    }

    [[nodiscard]] bool is_unresolved(std::string_view name) const;
    [[nodiscard]] const std::set<std::string>& unresolved() const noexcept { return m_unresolved; }

    /// Parse diagnostics followed by unresolved-reference diagnostics
    [[nodiscard]] const std::vector<ParseDiagnostic>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    [[nodiscard]] const std::vector<std::string>& files() const noexcept { return m_files; }
    [[nodiscard]] const std::string& mainmenu() const noexcept { return m_mainmenu; }

private:
    DependencyGraph() = default;

    void resolve_references();

    SymbolTable m_symbols;
    std::vector<ExprPtr> m_guards;
    std::vector<SelectEdge> m_edges;
    std::vector<std::vector<std::size_t>> m_outgoing;
    std::vector<std::vector<std::size_t>> m_incoming;
    std::set<std::string> m_unresolved;
    std::vector<ParseDiagnostic> m_diagnostics;
    std::vector<std::string> m_files;
    std::string m_mainmenu;
};

struct LoadOptions
{
    std::filesystem::path srctree = ".";  ///< base for `source` paths
    std::string srcarch;                  ///< value of $(SRCARCH) and $(ARCH)
    std::map<std::string, std::string> variables;
};

/**
 * Parse a Kconfig tree from disk and build its graph.
 * @param root Root Kconfig file, relative to srctree or absolute
 */
[[nodiscard]] kcfgvex::Result<DependencyGraph> load_dependency_graph(const std::string& root,
                                                                     const LoadOptions& options);

}  // namespace kcfgvex::kconfig
