#pragma once

/**
 * @file explain.hpp
 * @brief Human-facing projections of traces and the dependency graph
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/kconfig/evaluator.hpp"
#include "kcfgvex/kconfig/graph.hpp"

#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kcfgvex::report {

enum class ExplainFormat { kText, kJson };

/// Verdict, per-target values and the numbered evidence trail
[[nodiscard]] std::string render_trace_text(const kconfig::TraceResult& result);

[[nodiscard]] nlohmann::json trace_to_json(const kconfig::TraceResult& result);

/**
 * Graphviz DOT of the dependency closure of roots: depends-on edges
 * towards dependencies and select/imply edges from the symbols that
 * select or imply a node. Undefined symbols are drawn dashed.
 */
[[nodiscard]] std::string render_dependency_dot(const kconfig::DependencyGraph& graph,
                                                std::span<const std::string> roots);

/**
 * JSON view of one symbol: kind, prompt, defaults, dependency guard,
 * selects, implies, selected-by and definition locations.
 * @return InvalidQuery for an undefined symbol
 */
[[nodiscard]] kcfgvex::Result<nlohmann::json> describe_symbol(const kconfig::DependencyGraph& graph,
                                                              std::string_view name);

}  // namespace kcfgvex::report
