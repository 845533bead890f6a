#pragma once

/**
 * @file evaluator.hpp
 * @brief Value resolution and reachability verdicts
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/kconfig/build_state.hpp"
#include "kcfgvex/kconfig/graph.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace kcfgvex::kconfig {

enum class StepKind {
    kExplicit,            ///< value taken from .config
    kModulePromoted,      ///< m on a bool symbol becomes y
    kDefault,             ///< first satisfied default rule
    kNoDefault,           ///< no default applies
    kDependencyCeiling,   ///< depends-on guard capped the value
    kSelectForced,        ///< raised by an enabled selector
    kImplyRaised,         ///< raised by an enabled implier
    kCycleBroken,         ///< re-entered symbol contributed n
    kUnresolvedReference, ///< undefined symbol treated as n
    kUnknownTarget,       ///< queried symbol not in the tree
};

[[nodiscard]] std::string_view to_string(StepKind kind) noexcept;

/// One link of the causal chain behind a verdict
struct EvidenceStep
{
    std::string symbol;
    std::string value;
    StepKind kind = StepKind::kDefault;
    std::string reason;

    bool operator==(const EvidenceStep&) const = default;
};

/// Resolved value of one symbol and how it was reached
struct Resolution
{
    ConfigValue value;
    Tristate ceiling = Tristate::kYes;  ///< value of the depends-on guard
    bool explicit_value = false;
    bool forced = false;                ///< raised by select or imply
    bool active = false;                ///< enabled (y/m), or visible for non-tristate kinds

    [[nodiscard]] bool dependency_blocked() const noexcept { return ceiling == Tristate::kNo; }

    bool operator==(const Resolution&) const = default;
};

/**
 * @brief Memoizing resolver for one query
 *
 * Holds the per-query memo table, visiting stack and evidence trail.
 * Create one per evaluation task; never share between threads.
 */
class ValueResolver
{
public:
    ValueResolver(const DependencyGraph& graph, const BuildState& state);

    [[nodiscard]] Resolution resolve(SymbolId id);

    /// Value by name; undefined names yield n with an evidence note
    [[nodiscard]] ConfigValue value_of(std::string_view name);

    [[nodiscard]] Tristate evaluate(const ExprPtr& expr);

    [[nodiscard]] const std::vector<EvidenceStep>& evidence() const noexcept { return m_evidence; }

    void note(EvidenceStep step);

private:
    static constexpr std::size_t kNoCycle = std::numeric_limits<std::size_t>::max();

    [[nodiscard]] Resolution compute(SymbolId id);
    [[nodiscard]] Resolution compute_tristate(SymbolId id, Tristate ceiling);
    [[nodiscard]] Resolution compute_scalar(SymbolId id, Tristate ceiling);
    [[nodiscard]] Tristate apply_selectors(SymbolId id, Tristate base, Tristate ceiling, SelectKind kind);
    [[nodiscard]] ConfigValue scalar_default_value(const ExprPtr& value);

    /// Result that depends on a symbol still being resolved
    struct Provisional
    {
        Resolution resolution;
        std::size_t floor = 0;    ///< stack depth of the cycle head
        std::uint64_t frame = 0;  ///< serial of the head's stack frame
    };

    const DependencyGraph& m_graph;
    const BuildState& m_state;
    std::unordered_map<SymbolId, Resolution> m_memo;
    std::unordered_map<SymbolId, Provisional> m_provisional;
    std::unordered_map<SymbolId, std::size_t> m_visiting;  ///< symbol -> stack depth
    std::vector<std::uint64_t> m_frames;                    ///< frame serial per stack depth
    std::uint64_t m_next_frame = 0;
    std::size_t m_cycle_floor = kNoCycle;
    std::vector<EvidenceStep> m_evidence;
    std::set<std::tuple<std::string, std::string, StepKind, std::string>> m_seen;
};

enum class Verdict { kAffected, kNotAffected, kUnderInvestigation };

/// Why a NotAffected verdict holds (kNone for other verdicts)
enum class Justification { kNone, kCodeNotReachable, kRequiresConfiguration };

[[nodiscard]] std::string_view to_string(Verdict verdict) noexcept;
[[nodiscard]] std::string_view to_string(Justification justification) noexcept;

struct TargetResolution
{
    std::string symbol;
    bool known = false;
    Resolution resolution;

    bool operator==(const TargetResolution&) const = default;
};

struct TraceResult
{
    Verdict verdict = Verdict::kUnderInvestigation;
    Justification justification = Justification::kNone;
    std::vector<TargetResolution> targets;
    std::vector<EvidenceStep> evidence;

    bool operator==(const TraceResult&) const = default;
};

/**
 * @brief Reachability evaluator over a shared graph and build state
 *
 * Stateless between calls: each evaluation uses its own resolver, so
 * concurrent calls on one instance are safe.
 */
class Evaluator
{
public:
    Evaluator(const DependencyGraph& graph, const BuildState& state)
        : m_graph(graph)
        , m_state(state)
    {}

    /**
     * Resolve every target and map the results to a verdict.
     * Any enabled target makes the verdict Affected; otherwise any unknown
     * target makes it UnderInvestigation; otherwise NotAffected.
     * @return InvalidQuery for an empty target set
     */
    [[nodiscard]] kcfgvex::Result<TraceResult> evaluate(std::span<const std::string> targets) const;

    /// Verdict for a Kconfig expression over the build state
    [[nodiscard]] kcfgvex::Result<TraceResult> evaluate_expression(std::string_view expression) const;

    [[nodiscard]] const DependencyGraph& graph() const noexcept { return m_graph; }
    [[nodiscard]] const BuildState& state() const noexcept { return m_state; }

private:
    const DependencyGraph& m_graph;
    const BuildState& m_state;
};

}  // namespace kcfgvex::kconfig
