/**
 * @file resolver.cpp
 * @brief Per-query symbol value resolution
 *
 * A symbol's value is computed from, in order: its depends-on guard (the
 * ceiling), its explicit .config value or first satisfied default, and
 * the symbols that select or imply it. Selection raises the value but
 * never above the ceiling.
 *
 * Cycles are broken with a visiting stack. A result computed while a
 * cycle pointed at a symbol still on the stack depends on that symbol's
 * unfinished state; the cycle floor records the shallowest such symbol.
 * Those results are kept in a provisional memo tied to the floor's stack
 * frame and are reused only while that frame is live.
 */

#include "kcfgvex/kconfig/evaluator.hpp"

#include <algorithm>
#include <format>

namespace kcfgvex::kconfig {

namespace {

[[nodiscard]] std::string_view zero_value(SymbolKind kind) noexcept
{
    switch (kind) {
        case SymbolKind::kInt:
            return "0";
        case SymbolKind::kHex:
            return "0x0";
        case SymbolKind::kString:
            return "";
        default:
            return "n";
    }
}

[[nodiscard]] std::string describe_rule(std::string_view keyword,
                                        const ExprPtr& value,
                                        const ExprPtr& condition)
{
    if (!condition) {
        return std::format("{} {}", keyword, to_string(value));
    }
    return std::format("{} {} if {}", keyword, to_string(value), to_string(condition));
}

}  // namespace

std::string_view to_string(StepKind kind) noexcept
{
    switch (kind) {
        case StepKind::kExplicit:
            return "explicit";
        case StepKind::kModulePromoted:
            return "module_promoted";
        case StepKind::kDefault:
            return "default";
        case StepKind::kNoDefault:
            return "no_default";
        case StepKind::kDependencyCeiling:
            return "dependency_ceiling";
        case StepKind::kSelectForced:
            return "select_forced";
        case StepKind::kImplyRaised:
            return "imply_raised";
        case StepKind::kCycleBroken:
            return "cycle_broken";
        case StepKind::kUnresolvedReference:
            return "unresolved_reference";
        case StepKind::kUnknownTarget:
            return "unknown_target";
    }
    return "default";
}

ValueResolver::ValueResolver(const DependencyGraph& graph, const BuildState& state)
    : m_graph(graph)
    , m_state(state)
{}

void ValueResolver::note(EvidenceStep step)
{
    auto key = std::make_tuple(step.symbol, step.value, step.kind, step.reason);
    if (m_seen.insert(std::move(key)).second) {
        m_evidence.push_back(std::move(step));
    }
}

Resolution ValueResolver::resolve(SymbolId id)
{
    if (auto it = m_memo.find(id); it != m_memo.end()) {
        return it->second;
    }
    if (auto it = m_provisional.find(id); it != m_provisional.end()) {
        const Provisional& entry = it->second;
        if (entry.floor < m_frames.size() && m_frames[entry.floor] == entry.frame) {
            m_cycle_floor = std::min(m_cycle_floor, entry.floor);
            return entry.resolution;
        }
        m_provisional.erase(it);
    }
    if (auto it = m_visiting.find(id); it != m_visiting.end()) {
        m_cycle_floor = std::min(m_cycle_floor, it->second);
        const std::string& name = m_graph.symbol(id).name;
        note(EvidenceStep{.symbol = name,
                          .value = "n",
                          .kind = StepKind::kCycleBroken,
                          .reason = std::format("cycle reached {} while it was being resolved; "
                                                "the cyclic contribution counts as n",
                                                common::prefixed_symbol_name(name))});
        return Resolution{.value = ConfigValue::from_tristate(Tristate::kNo)};
    }

    const std::size_t depth = m_frames.size();
    m_visiting.emplace(id, depth);
    m_frames.push_back(m_next_frame++);
    Resolution resolution = compute(id);
    m_frames.pop_back();
    m_visiting.erase(id);

    if (m_cycle_floor >= depth) {
        m_cycle_floor = kNoCycle;
        m_memo.emplace(id, resolution);
    } else {
        m_provisional.insert_or_assign(
            id, Provisional{.resolution = resolution, .floor = m_cycle_floor, .frame = m_frames[m_cycle_floor]});
    }
    return resolution;
}

ConfigValue ValueResolver::value_of(std::string_view name)
{
    auto id = m_graph.find(name);
    if (!id) {
        const std::string canonical = common::canonical_symbol_name(name);
        note(EvidenceStep{.symbol = canonical,
                          .value = "n",
                          .kind = StepKind::kUnresolvedReference,
                          .reason = std::format("{} is not defined in any Kconfig file; treated as n",
                                                common::prefixed_symbol_name(canonical))});
        return ConfigValue::from_tristate(Tristate::kNo);
    }
    return resolve(*id).value;
}

Tristate ValueResolver::evaluate(const ExprPtr& expr)
{
    return kconfig::evaluate(expr, [this](std::string_view name) { return value_of(name); });
}

Resolution ValueResolver::compute(SymbolId id)
{
    const ConfigSymbol& symbol = m_graph.symbol(id);
    const Tristate ceiling = evaluate(m_graph.depends_guard(id));
    if (is_tristate_kind(symbol.kind)) {
        return compute_tristate(id, ceiling);
    }
    return compute_scalar(id, ceiling);
}

Resolution ValueResolver::compute_tristate(SymbolId id, Tristate ceiling)
{
    const ConfigSymbol& symbol = m_graph.symbol(id);
    const ExprPtr& guard = m_graph.depends_guard(id);
    const bool is_bool = symbol.kind != SymbolKind::kTristate;
    // A bool symbol whose dependencies are m may still be y.
    const Tristate limit = is_bool && ceiling == Tristate::kMod ? Tristate::kYes : ceiling;

    Resolution resolution{.ceiling = ceiling};
    Tristate value = Tristate::kNo;

    const auto step = [this, &symbol](Tristate v, StepKind kind, std::string reason) {
        note(EvidenceStep{.symbol = symbol.name,
                          .value = std::string(to_string(v)),
                          .kind = kind,
                          .reason = std::move(reason)});
    };

    if (auto explicit_text = m_state.explicit_value(symbol.name)) {
        resolution.explicit_value = true;
        if (auto parsed = parse_tristate(*explicit_text)) {
            value = *parsed;
            step(value, StepKind::kExplicit, std::format("set to {} in .config", *explicit_text));
        } else {
            step(value,
                 StepKind::kExplicit,
                 std::format("'{}' in .config is not a tristate value; treated as n", *explicit_text));
        }
        if (is_bool && value == Tristate::kMod) {
            value = Tristate::kYes;
            step(value, StepKind::kModulePromoted, "bool symbol set to m; promoted to y");
        }
        if (value > limit) {
            step(limit,
                 StepKind::kDependencyCeiling,
                 std::format("depends on {} is {}; .config value {} capped at {}",
                             to_string(guard),
                             to_string(ceiling),
                             to_string(value),
                             to_string(limit)));
            value = limit;
        }
    } else if (ceiling == Tristate::kNo) {
        step(Tristate::kNo,
             StepKind::kDependencyCeiling,
             std::format("depends on {} is n; the symbol cannot be enabled", to_string(guard)));
    } else {
        bool matched = false;
        for (const DefaultRule& rule : symbol.defaults) {
            const Tristate condition = evaluate(rule.condition);
            if (condition == Tristate::kNo) {
                continue;
            }
            value = tri_and(evaluate(rule.value), condition);
            step(value,
                 StepKind::kDefault,
                 std::format("{} ({})",
                             describe_rule("default", rule.value, rule.condition),
                             rule.location.to_string()));
            matched = true;
            break;
        }
        if (!matched) {
            step(Tristate::kNo, StepKind::kNoDefault, "unset in .config and no default applies");
        }
        if (is_bool && value == Tristate::kMod) {
            value = Tristate::kYes;
            step(value, StepKind::kModulePromoted, "bool symbol defaulted to m; promoted to y");
        }
        if (value > limit) {
            step(limit,
                 StepKind::kDependencyCeiling,
                 std::format("depends on {} is {}; default capped", to_string(guard), to_string(ceiling)));
            value = limit;
        }
    }

    Tristate raised = apply_selectors(id, value, limit, SelectKind::kSelect);
    if (!resolution.explicit_value) {
        raised = apply_selectors(id, raised, limit, SelectKind::kImply);
    }
    if (raised > value) {
        resolution.forced = true;
        value = raised;
    }
    resolution.value = ConfigValue::from_tristate(value);
    resolution.active = value != Tristate::kNo;
    return resolution;
}

Tristate ValueResolver::apply_selectors(SymbolId id, Tristate base, Tristate limit, SelectKind kind)
{
    const ConfigSymbol& symbol = m_graph.symbol(id);
    const bool is_bool = symbol.kind != SymbolKind::kTristate;
    const StepKind step_kind =
        kind == SelectKind::kSelect ? StepKind::kSelectForced : StepKind::kImplyRaised;

    Tristate forced = Tristate::kNo;
    std::string strongest;
    for (std::size_t index : m_graph.selected_by(id)) {
        const SelectEdge& edge = m_graph.edge(index);
        if (edge.kind != kind) {
            continue;
        }
        const Resolution source = resolve(edge.source);
        Tristate contribution = tri_and(source.value.tri, edge.force_value);
        if (contribution == Tristate::kNo) {
            continue;
        }
        contribution = tri_and(contribution, evaluate(edge.guard));
        if (contribution == Tristate::kNo) {
            continue;
        }
        if (is_bool && contribution == Tristate::kMod) {
            contribution = Tristate::kYes;
        }
        const std::string& source_name = m_graph.symbol(edge.source).name;
        std::string reason = std::format("{} by {}={}",
                                         kind == SelectKind::kSelect ? "selected" : "implied",
                                         common::prefixed_symbol_name(source_name),
                                         to_string(source.value.tri));
        if (edge.guard) {
            reason += std::format(" if {}", to_string(edge.guard));
        }
        note(EvidenceStep{.symbol = symbol.name,
                          .value = std::string(to_string(contribution)),
                          .kind = step_kind,
                          .reason = std::move(reason)});
        if (contribution > forced) {
            forced = contribution;
            strongest = source_name;
        }
    }

    if (forced <= base) {
        return base;
    }
    const Tristate capped = tri_and(forced, limit);
    if (capped < forced) {
        note(EvidenceStep{
            .symbol = symbol.name,
            .value = std::string(to_string(capped)),
            .kind = StepKind::kDependencyCeiling,
            .reason = std::format("depends on {} is {}; {} from {} capped at {}",
                                  to_string(m_graph.depends_guard(id)),
                                  to_string(limit),
                                  to_string(kind),
                                  common::prefixed_symbol_name(strongest),
                                  to_string(capped))});
    }
    return tri_or(base, capped);
}

Resolution ValueResolver::compute_scalar(SymbolId id, Tristate ceiling)
{
    const ConfigSymbol& symbol = m_graph.symbol(id);
    Resolution resolution{.ceiling = ceiling};
    const auto step = [this, &symbol](const std::string& value, StepKind kind, std::string reason) {
        note(EvidenceStep{.symbol = symbol.name,
                          .value = value,
                          .kind = kind,
                          .reason = std::move(reason)});
    };

    if (ceiling == Tristate::kNo) {
        resolution.value = ConfigValue::from_text(std::string(zero_value(symbol.kind)));
        step(resolution.value.text,
             StepKind::kDependencyCeiling,
             std::format("depends on {} is n; {} symbol has no value",
                         to_string(m_graph.depends_guard(id)),
                         to_string(symbol.kind)));
        return resolution;
    }
    resolution.active = true;

    if (auto explicit_text = m_state.explicit_value(symbol.name)) {
        resolution.explicit_value = true;
        resolution.value = ConfigValue::from_text(*explicit_text);
        step(*explicit_text, StepKind::kExplicit, "set in .config");
        return resolution;
    }
    for (const DefaultRule& rule : symbol.defaults) {
        if (evaluate(rule.condition) == Tristate::kNo) {
            continue;
        }
        resolution.value = scalar_default_value(rule.value);
        step(resolution.value.text,
             StepKind::kDefault,
             std::format("{} ({})",
                         describe_rule("default", rule.value, rule.condition),
                         rule.location.to_string()));
        return resolution;
    }
    resolution.value = ConfigValue::from_text(std::string(zero_value(symbol.kind)));
    step(resolution.value.text, StepKind::kNoDefault, "unset in .config and no default applies");
    return resolution;
}

ConfigValue ValueResolver::scalar_default_value(const ExprPtr& value)
{
    if (const auto* literal = std::get_if<Literal>(&value->node)) {
        if (literal->constant) {
            return ConfigValue::from_text(literal->name);
        }
        return value_of(literal->name);
    }
    return ConfigValue::from_text(std::string(to_string(evaluate(value))));
}

}  // namespace kcfgvex::kconfig
