/**
 * @file graph.cpp
 * @brief Dependency graph construction
 */

#include "kcfgvex/kconfig/graph.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace kcfgvex::kconfig {

namespace {

struct UnresolvedUse
{
    std::string name;
    std::string referrer;
    SourceLocation location;
};

void collect_from(const ExprPtr& expr, std::set<std::string>& out)
{
    if (expr) {
        collect_symbols(*expr, out);
    }
}

void collect_literal(const Literal& literal, std::set<std::string>& out)
{
    if (!literal.constant) {
        out.insert(literal.name);
    }
}

/// Every symbol name a definition refers to, select targets excluded
[[nodiscard]] std::set<std::string> referenced_names(const ConfigSymbol& symbol)
{
    std::set<std::string> names;
    for (const ExprPtr& guard : symbol.depends) {
        collect_from(guard, names);
    }
    collect_from(symbol.prompt_condition, names);
    for (const DefaultRule& rule : symbol.defaults) {
        collect_from(rule.value, names);
        collect_from(rule.condition, names);
    }
    for (const SelectClause& clause : symbol.selects) {
        collect_from(clause.condition, names);
    }
    for (const SelectClause& clause : symbol.implies) {
        collect_from(clause.condition, names);
    }
    for (const RangeRule& range : symbol.ranges) {
        collect_literal(range.low, names);
        collect_literal(range.high, names);
        collect_from(range.condition, names);
    }
    return names;
}

}  // namespace

std::string_view to_string(SelectKind kind) noexcept
{
    return kind == SelectKind::kSelect ? "select" : "imply";
}

DependencyGraph DependencyGraph::build(ParseResult parsed)
{
    DependencyGraph graph;
    graph.m_symbols = std::move(parsed.symbols);
    graph.m_diagnostics = std::move(parsed.diagnostics);
    graph.m_files = std::move(parsed.files);
    graph.m_mainmenu = std::move(parsed.mainmenu);

    const std::size_t count = graph.m_symbols.size();
    graph.m_guards.resize(count);
    graph.m_outgoing.resize(count);
    graph.m_incoming.resize(count);
    for (SymbolId id = 0; id < count; ++id) {
        ExprPtr guard;
        for (const ExprPtr& clause : graph.m_symbols.at(id).depends) {
            guard = make_and(guard, clause);
        }
        graph.m_guards[id] = std::move(guard);
    }
    graph.resolve_references();
    return graph;
}

void DependencyGraph::resolve_references()
{
    std::vector<UnresolvedUse> uses;
    const auto add_edges = [this, &uses](SymbolId source,
                                         const std::vector<SelectClause>& clauses,
                                         SelectKind kind) {
        const ConfigSymbol& symbol = m_symbols.at(source);
        for (const SelectClause& clause : clauses) {
            auto target = m_symbols.find(clause.target);
            if (!target) {
                uses.push_back(UnresolvedUse{.name = clause.target,
                                             .referrer = symbol.name,
                                             .location = clause.location});
                continue;
            }
            const std::size_t index = m_edges.size();
            m_edges.push_back(SelectEdge{.source = source,
                                         .target = *target,
                                         .guard = clause.condition,
                                         .force_value = Tristate::kYes,
                                         .kind = kind,
                                         .location = clause.location});
            m_outgoing[source].push_back(index);
            m_incoming[*target].push_back(index);
        }
    };

    for (SymbolId id = 0; id < m_symbols.size(); ++id) {
        const ConfigSymbol& symbol = m_symbols.at(id);
        add_edges(id, symbol.selects, SelectKind::kSelect);
        add_edges(id, symbol.implies, SelectKind::kImply);
        for (const std::string& name : referenced_names(symbol)) {
            if (!m_symbols.contains(name)) {
                uses.push_back(UnresolvedUse{
                    .name = name,
                    .referrer = symbol.name,
                    .location = symbol.locations.empty() ? SourceLocation{} : symbol.locations.front()});
            }
        }
    }

    std::ranges::sort(uses, [](const UnresolvedUse& lhs, const UnresolvedUse& rhs) {
        return std::tie(lhs.name, lhs.referrer, lhs.location.file, lhs.location.line)
               < std::tie(rhs.name, rhs.referrer, rhs.location.file, rhs.location.line);
    });
    for (const UnresolvedUse& use : uses) {
        m_unresolved.insert(use.name);
        m_diagnostics.push_back(ParseDiagnostic{
            .file = use.location.file,
            .line = use.location.line,
            .code = "UnresolvedReference",
            .message = std::format("'{}' referenced by '{}' is not defined", use.name, use.referrer)});
    }
}

std::set<std::string> DependencyGraph::dependencies_of(SymbolId id) const
{
    std::set<std::string> names;
    collect_from(m_guards.at(id), names);
    return names;
}

bool DependencyGraph::is_unresolved(std::string_view name) const
{
    return m_unresolved.contains(common::canonical_symbol_name(name));
}

kcfgvex::Result<DependencyGraph> load_dependency_graph(const std::string& root,
                                                       const LoadOptions& options)
{
    ParseOptions parse_options{.variables = options.variables};
    if (!options.srcarch.empty()) {
        parse_options.variables.try_emplace("SRCARCH", options.srcarch);
        parse_options.variables.try_emplace("ARCH", options.srcarch);
    }
    KconfigParser parser(make_directory_resolver(options.srctree), std::move(parse_options));
    auto parsed = parser.parse(root);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return DependencyGraph::build(std::move(*parsed));
}

}  // namespace kcfgvex::kconfig
