#pragma once

/**
 * @file vex.hpp
 * @brief VEX synthesis: verdicts to CycloneDX vulnerability analyses
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/cve.hpp"
#include "kcfgvex/kconfig/evaluator.hpp"
#include "kcfgvex/sbom.hpp"
#include "kcfgvex/version.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace kcfgvex::vex {

/// CycloneDX impact analysis state
enum class VexState { kExploitable, kInTriage, kNotAffected };

/// "exploitable", "in_triage", "not_affected"
[[nodiscard]] std::string_view to_string(VexState state) noexcept;

struct VexEntry
{
    std::string cve_id;
    VexState state = VexState::kInTriage;
    kconfig::Justification justification = kconfig::Justification::kNone;
    std::string detail;
    std::vector<std::string> affects;
    std::optional<kconfig::TraceResult> trace;  ///< full evaluation; not serialized

    bool operator==(const VexEntry&) const = default;
};

/**
 * @brief Output document; entries follow input order
 *
 * The serial number is derived from the canonical vulnerabilities array,
 * so only the timestamp differs between runs over identical inputs.
 */
struct VexDocument
{
    std::string spec_version{kDefaultCycloneDxSpecVersion};
    std::string timestamp;
    std::vector<VexEntry> entries;

    [[nodiscard]] nlohmann::json vulnerabilities_json() const;
    [[nodiscard]] std::string serial_number() const;
    [[nodiscard]] nlohmann::json to_json() const;
};

/// A requested CVE: the collaborator's record, or its error
struct CveInput
{
    std::string cve_id;
    kcfgvex::Result<cve::CveRecord> record;
};

/// Evaluates one implicated symbol set
using EvaluateFn =
    std::function<kcfgvex::Result<kconfig::TraceResult>(std::span<const std::string> symbols)>;

struct SynthesisOptions
{
    std::string timestamp;  ///< assigned once for the whole document
    std::string spec_version{kDefaultCycloneDxSpecVersion};
    std::string component = "linux_kernel";  ///< SBOM identifier to attach
    std::size_t jobs = 1;
};

[[nodiscard]] EvaluateFn make_evaluate_fn(const kconfig::Evaluator& evaluator);

/**
 * Analysis entry for one CVE. Fetch failures, records without implicated
 * symbols and evaluation errors all become in_triage entries.
 */
[[nodiscard]] VexEntry make_entry(const CveInput& input,
                                  const EvaluateFn& evaluate,
                                  const std::optional<std::string>& component_ref);

/**
 * One entry per input, in input order. With jobs > 1 the evaluations run
 * on worker threads; EvaluateFn must then be safe to call concurrently.
 */
[[nodiscard]] VexDocument synthesize(std::span<const CveInput> inputs,
                                     const EvaluateFn& evaluate,
                                     const SbomIndex* sbom,
                                     const SynthesisOptions& options);

[[nodiscard]] VexDocument synthesize(std::span<const cve::CveRecord> records,
                                     const EvaluateFn& evaluate,
                                     const SbomIndex* sbom,
                                     const SynthesisOptions& options);

/// One document per state that has entries, ordered by state name
[[nodiscard]] std::vector<std::pair<VexState, VexDocument>> split_by_state(const VexDocument& document);

/**
 * Write `vex_<state>.json` per state into directory.
 * @return Paths written, in state order
 */
[[nodiscard]] kcfgvex::Result<std::vector<std::filesystem::path>>
write_split_documents(const VexDocument& document, const std::filesystem::path& directory);

/// Sorted, de-duplicated `<CVE-ID> CONFIG_<SYMBOL>` lines for fetched records
[[nodiscard]] std::vector<std::string> cve_symbol_pairs(std::span<const CveInput> inputs);

/// Evidence trail condensed to one line (at most a dozen steps)
[[nodiscard]] std::string summarize_evidence(const kconfig::TraceResult& result);

}  // namespace kcfgvex::vex
