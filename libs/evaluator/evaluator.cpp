/**
 * @file evaluator.cpp
 * @brief Verdicts over resolved target symbols
 */

#include "kcfgvex/kconfig/evaluator.hpp"

#include <algorithm>
#include <format>

namespace kcfgvex::kconfig {

namespace {

/// requires_configuration only when every target is reachable, unset and unforced
[[nodiscard]] Justification not_affected_justification(const std::vector<TargetResolution>& targets)
{
    const auto off_by_default = [](const TargetResolution& target) {
        const Resolution& resolution = target.resolution;
        return !resolution.dependency_blocked() && !resolution.explicit_value && !resolution.forced;
    };
    return !targets.empty() && std::ranges::all_of(targets, off_by_default)
               ? Justification::kRequiresConfiguration
               : Justification::kCodeNotReachable;
}

void classify(TraceResult& result)
{
    const auto is_active = [](const TargetResolution& target) {
        return target.known && target.resolution.active;
    };
    const auto is_unknown = [](const TargetResolution& target) { return !target.known; };

    if (std::ranges::any_of(result.targets, is_active)) {
        result.verdict = Verdict::kAffected;
        result.justification = Justification::kNone;
    } else if (std::ranges::any_of(result.targets, is_unknown)) {
        result.verdict = Verdict::kUnderInvestigation;
        result.justification = Justification::kNone;
    } else {
        result.verdict = Verdict::kNotAffected;
        result.justification = not_affected_justification(result.targets);
    }
}

}  // namespace

std::string_view to_string(Verdict verdict) noexcept
{
    switch (verdict) {
        case Verdict::kAffected:
            return "affected";
        case Verdict::kNotAffected:
            return "not_affected";
        case Verdict::kUnderInvestigation:
            return "under_investigation";
    }
    return "under_investigation";
}

std::string_view to_string(Justification justification) noexcept
{
    switch (justification) {
        case Justification::kNone:
            return "";
        case Justification::kCodeNotReachable:
            return "code_not_reachable";
        case Justification::kRequiresConfiguration:
            return "requires_configuration";
    }
    return "";
}

kcfgvex::Result<TraceResult> Evaluator::evaluate(std::span<const std::string> targets) const
{
    if (targets.empty()) {
        return std::unexpected(Error::make("InvalidQuery", "empty target symbol set"));
    }

    ValueResolver resolver(m_graph, m_state);
    TraceResult result;
    std::set<std::string> seen;
    for (const std::string& target : targets) {
        std::string name = common::canonical_symbol_name(target);
        if (name.empty()) {
            return std::unexpected(Error::make("InvalidQuery", "empty symbol name in target set"));
        }
        if (!seen.insert(name).second) {
            continue;
        }
        TargetResolution resolved{.symbol = name};
        if (auto id = m_graph.find(name)) {
            resolved.known = true;
            resolved.resolution = resolver.resolve(*id);
        } else {
            resolver.note(EvidenceStep{
                .symbol = name,
                .value = "unknown",
                .kind = StepKind::kUnknownTarget,
                .reason = std::format("{} is not defined in the parsed Kconfig tree; needs review",
                                      common::prefixed_symbol_name(name))});
        }
        result.targets.push_back(std::move(resolved));
    }
    result.evidence = resolver.evidence();
    classify(result);
    return result;
}

kcfgvex::Result<TraceResult> Evaluator::evaluate_expression(std::string_view expression) const
{
    auto parsed = parse_expression(expression);
    if (!parsed) {
        return std::unexpected(Error::make(
            "InvalidQuery",
            std::format("cannot parse expression '{}': {}", expression, parsed.error().message)));
    }

    ValueResolver resolver(m_graph, m_state);
    const Tristate value = resolver.evaluate(*parsed);

    std::set<std::string> names;
    collect_symbols(**parsed, names);
    TraceResult result;
    for (const std::string& name : names) {
        TargetResolution resolved{.symbol = name};
        if (auto id = m_graph.find(name)) {
            resolved.known = true;
            resolved.resolution = resolver.resolve(*id);
        }
        result.targets.push_back(std::move(resolved));
    }
    result.evidence = resolver.evidence();

    if (value != Tristate::kNo) {
        result.verdict = Verdict::kAffected;
    } else if (std::ranges::any_of(result.targets,
                                   [](const TargetResolution& target) { return !target.known; })) {
        result.verdict = Verdict::kUnderInvestigation;
    } else {
        result.verdict = Verdict::kNotAffected;
        result.justification = not_affected_justification(result.targets);
    }
    return result;
}

}  // namespace kcfgvex::kconfig
