/**
 * @file explain.cpp
 * @brief Trace text, dependency DOT and symbol descriptions
 */

#include "kcfgvex/report/explain.hpp"

#include <deque>
#include <format>
#include <set>

namespace kcfgvex::report {

namespace {

[[nodiscard]] std::string dot_quote(std::string_view text)
{
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

[[nodiscard]] nlohmann::json clause_json(const kconfig::DependencyGraph& graph,
                                         const kconfig::SelectEdge& edge,
                                         kconfig::SymbolId other)
{
    nlohmann::json clause = {
        {"symbol", graph.symbol(other).name},
        {"location", edge.location.to_string()},
    };
    if (edge.guard) {
        clause["if"] = kconfig::to_string(edge.guard);
    }
    return clause;
}

}  // namespace

std::string render_trace_text(const kconfig::TraceResult& result)
{
    std::string out = std::format("verdict: {}\n", kconfig::to_string(result.verdict));
    if (result.justification != kconfig::Justification::kNone) {
        out += std::format("justification: {}\n", kconfig::to_string(result.justification));
    }
    out += "targets:\n";
    for (const kconfig::TargetResolution& target : result.targets) {
        if (!target.known) {
            out += std::format("  {} = <undefined>\n", common::prefixed_symbol_name(target.symbol));
            continue;
        }
        const kconfig::Resolution& resolution = target.resolution;
        out += std::format("  {} = {}{}{}{}\n",
                           common::prefixed_symbol_name(target.symbol),
                           resolution.value.text.empty() ? "\"\"" : resolution.value.text,
                           resolution.explicit_value ? " [explicit]" : "",
                           resolution.forced ? " [forced]" : "",
                           resolution.dependency_blocked() ? " [dependencies unmet]" : "");
    }
    out += "evidence:\n";
    std::size_t index = 1;
    for (const kconfig::EvidenceStep& step : result.evidence) {
        out += std::format("  {}. {} = {} [{}] {}\n",
                           index++,
                           common::prefixed_symbol_name(step.symbol),
                           step.value,
                           kconfig::to_string(step.kind),
                           step.reason);
    }
    return out;
}

nlohmann::json trace_to_json(const kconfig::TraceResult& result)
{
    nlohmann::json targets = nlohmann::json::array();
    for (const kconfig::TargetResolution& target : result.targets) {
        nlohmann::json item = {{"symbol", target.symbol}, {"known", target.known}};
        if (target.known) {
            item["value"] = target.resolution.value.text;
            item["explicit"] = target.resolution.explicit_value;
            item["forced"] = target.resolution.forced;
            item["dependency"] = std::string(kconfig::to_string(target.resolution.ceiling));
        }
        targets.push_back(std::move(item));
    }
    nlohmann::json evidence = nlohmann::json::array();
    for (const kconfig::EvidenceStep& step : result.evidence) {
        evidence.push_back({{"symbol", step.symbol},
                            {"value", step.value},
                            {"kind", std::string(kconfig::to_string(step.kind))},
                            {"reason", step.reason}});
    }
    nlohmann::json out = {
        {"verdict", std::string(kconfig::to_string(result.verdict))},
        {"targets", std::move(targets)},
        {"evidence", std::move(evidence)},
    };
    if (result.justification != kconfig::Justification::kNone) {
        out["justification"] = std::string(kconfig::to_string(result.justification));
    }
    return out;
}

std::string render_dependency_dot(const kconfig::DependencyGraph& graph,
                                  std::span<const std::string> roots)
{
    std::set<std::string> nodes;
    std::set<std::string> missing;
    std::set<std::string> edges;
    std::deque<std::string> queue;

    const auto visit = [&](const std::string& name) {
        if (nodes.insert(name).second) {
            queue.push_back(name);
        }
    };
    for (const std::string& root : roots) {
        visit(common::canonical_symbol_name(root));
    }

    while (!queue.empty()) {
        const std::string name = std::move(queue.front());
        queue.pop_front();
        auto id = graph.find(name);
        if (!id) {
            missing.insert(name);
            continue;
        }
        for (const std::string& dependency : graph.dependencies_of(*id)) {
            edges.insert(std::format("  {} -> {} [label=\"depends\"];",
                                     dot_quote(name),
                                     dot_quote(dependency)));
            visit(dependency);
        }
        for (std::size_t index : graph.selected_by(*id)) {
            const kconfig::SelectEdge& edge = graph.edge(index);
            const std::string& source = graph.symbol(edge.source).name;
            const bool select = edge.kind == kconfig::SelectKind::kSelect;
            edges.insert(std::format("  {} -> {} [label=\"{}\", style={}];",
                                     dot_quote(source),
                                     dot_quote(name),
                                     kconfig::to_string(edge.kind),
                                     select ? "bold" : "dotted"));
            visit(source);
        }
    }

    std::string out = "digraph kconfig {\n  rankdir=LR;\n  node [shape=box];\n";
    for (const std::string& node : nodes) {
        out += std::format("  {}{};\n", dot_quote(node), missing.contains(node) ? " [style=dashed]" : "");
    }
    for (const std::string& edge : edges) {
        out += edge;
        out += '\n';
    }
    out += "}\n";
    return out;
}

kcfgvex::Result<nlohmann::json> describe_symbol(const kconfig::DependencyGraph& graph,
                                                std::string_view name)
{
    auto id = graph.find(name);
    if (!id) {
        return std::unexpected(Error::make(
            "InvalidQuery",
            std::format("{} is not defined in the Kconfig tree", common::prefixed_symbol_name(
                                                                   common::canonical_symbol_name(name)))));
    }
    const kconfig::ConfigSymbol& symbol = graph.symbol(*id);

    nlohmann::json defaults = nlohmann::json::array();
    for (const kconfig::DefaultRule& rule : symbol.defaults) {
        nlohmann::json item = {{"value", kconfig::to_string(rule.value)},
                               {"location", rule.location.to_string()}};
        if (rule.condition) {
            item["if"] = kconfig::to_string(rule.condition);
        }
        defaults.push_back(std::move(item));
    }
    nlohmann::json selects = nlohmann::json::array();
    nlohmann::json implies = nlohmann::json::array();
    for (std::size_t index : graph.selects_of(*id)) {
        const kconfig::SelectEdge& edge = graph.edge(index);
        auto& list = edge.kind == kconfig::SelectKind::kSelect ? selects : implies;
        list.push_back(clause_json(graph, edge, edge.target));
    }
    nlohmann::json selected_by = nlohmann::json::array();
    nlohmann::json implied_by = nlohmann::json::array();
    for (std::size_t index : graph.selected_by(*id)) {
        const kconfig::SelectEdge& edge = graph.edge(index);
        auto& list = edge.kind == kconfig::SelectKind::kSelect ? selected_by : implied_by;
        list.push_back(clause_json(graph, edge, edge.source));
    }
    nlohmann::json locations = nlohmann::json::array();
    for (const kconfig::SourceLocation& location : symbol.locations) {
        locations.push_back(location.to_string());
    }

    nlohmann::json out = {
        {"name", symbol.name},
        {"kind", std::string(kconfig::to_string(symbol.kind))},
        {"depends_on", kconfig::to_string(graph.depends_guard(*id))},
        {"defaults", std::move(defaults)},
        {"selects", std::move(selects)},
        {"implies", std::move(implies)},
        {"selected_by", std::move(selected_by)},
        {"implied_by", std::move(implied_by)},
        {"locations", std::move(locations)},
    };
    if (symbol.prompt) {
        out["prompt"] = *symbol.prompt;
    }
    if (symbol.choice) {
        out["choice"] = *symbol.choice;
    }
    return out;
}

}  // namespace kcfgvex::report
