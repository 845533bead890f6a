/**
 * @file synthesizer.cpp
 * @brief Per-CVE verdicts folded into one VEX document
 */

#include "kcfgvex/vex.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <thread>

namespace kcfgvex::vex {

namespace {

constexpr std::size_t kMaxEvidenceSteps = 12;

constexpr std::string_view kNoSymbolsDetail = "No programFiles or implicated symbols in CVE record";
constexpr std::string_view kNoInferenceDetail =
    "Could not infer enabling symbols for listed programFiles";

[[nodiscard]] std::string join_symbols(const std::vector<std::string>& names)
{
    std::string out;
    for (const std::string& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += common::prefixed_symbol_name(name);
    }
    return out;
}

template <typename Predicate>
[[nodiscard]] std::vector<std::string> target_names(const kconfig::TraceResult& trace,
                                                    Predicate predicate)
{
    std::vector<std::string> names;
    for (const kconfig::TargetResolution& target : trace.targets) {
        if (predicate(target)) {
            names.push_back(target.symbol);
        }
    }
    return names;
}

[[nodiscard]] std::string verdict_detail(const kconfig::TraceResult& trace)
{
    switch (trace.verdict) {
        case kconfig::Verdict::kAffected:
            return std::format("Enabled symbols: {}",
                               join_symbols(target_names(trace, [](const auto& target) {
                                   return target.known && target.resolution.active;
                               })));
        case kconfig::Verdict::kNotAffected:
            return std::format(
                "Required symbols present in source but not enabled in provided .config: {}",
                join_symbols(target_names(trace, [](const auto&) { return true; })));
        case kconfig::Verdict::kUnderInvestigation:
            return std::format("Symbols not defined in the Kconfig tree: {}",
                               join_symbols(target_names(trace, [](const auto& target) {
                                   return !target.known;
                               })));
    }
    return {};
}

[[nodiscard]] VexState state_for(kconfig::Verdict verdict) noexcept
{
    switch (verdict) {
        case kconfig::Verdict::kAffected:
            return VexState::kExploitable;
        case kconfig::Verdict::kNotAffected:
            return VexState::kNotAffected;
        case kconfig::Verdict::kUnderInvestigation:
            return VexState::kInTriage;
    }
    return VexState::kInTriage;
}

}  // namespace

EvaluateFn make_evaluate_fn(const kconfig::Evaluator& evaluator)
{
    return [&evaluator](std::span<const std::string> symbols) { return evaluator.evaluate(symbols); };
}

std::string summarize_evidence(const kconfig::TraceResult& result)
{
    if (result.evidence.empty()) {
        return {};
    }
    std::string out = "Evidence: ";
    const std::size_t shown = std::min(result.evidence.size(), kMaxEvidenceSteps);
    for (std::size_t i = 0; i < shown; ++i) {
        const kconfig::EvidenceStep& step = result.evidence[i];
        if (i > 0) {
            out += "; ";
        }
        out += std::format("{}={} ({})",
                           common::prefixed_symbol_name(step.symbol),
                           step.value,
                           step.reason);
    }
    if (result.evidence.size() > shown) {
        out += std::format("; +{} more steps", result.evidence.size() - shown);
    }
    return out;
}

VexEntry make_entry(const CveInput& input,
                    const EvaluateFn& evaluate,
                    const std::optional<std::string>& component_ref)
{
    VexEntry entry{.cve_id = input.cve_id};
    if (component_ref) {
        entry.affects.push_back(*component_ref);
    }
    if (!input.record) {
        entry.state = VexState::kInTriage;
        entry.detail = std::format("fetch failed: {}", input.record.error().message);
        return entry;
    }

    const cve::CveRecord& record = *input.record;
    if (record.implicated_symbols.empty()) {
        entry.state = VexState::kInTriage;
        entry.detail =
            std::string(record.program_files.empty() ? kNoSymbolsDetail : kNoInferenceDetail);
        for (const std::string& note : record.notes) {
            entry.detail += std::format("; {}", note);
        }
        return entry;
    }

    auto trace = evaluate(record.implicated_symbols);
    if (!trace) {
        entry.state = VexState::kInTriage;
        entry.detail = std::format("evaluation failed: {}", trace.error().message);
        return entry;
    }
    entry.state = state_for(trace->verdict);
    entry.justification = trace->justification;
    entry.detail = verdict_detail(*trace);
    if (std::string evidence = summarize_evidence(*trace); !evidence.empty()) {
        entry.detail += std::format(". {}", evidence);
    }
    entry.trace = std::move(*trace);
    return entry;
}

VexDocument synthesize(std::span<const CveInput> inputs,
                       const EvaluateFn& evaluate,
                       const SbomIndex* sbom,
                       const SynthesisOptions& options)
{
    const std::optional<std::string> component_ref =
        sbom != nullptr ? sbom->lookup(options.component) : std::nullopt;

    std::vector<VexEntry> entries(inputs.size());
    const std::size_t jobs = std::clamp<std::size_t>(options.jobs, 1, std::max<std::size_t>(inputs.size(), 1));
    if (jobs == 1) {
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            entries[i] = make_entry(inputs[i], evaluate, component_ref);
        }
    } else {
        // Contiguous slice per worker; each writes only its own slots.
        std::vector<std::jthread> workers;
        workers.reserve(jobs);
        for (std::size_t tid = 0; tid < jobs; ++tid) {
            workers.emplace_back([&, tid]() {
                const std::size_t start = (tid * inputs.size()) / jobs;
                const std::size_t end = ((tid + 1) * inputs.size()) / jobs;
                for (std::size_t i = start; i < end; ++i) {
                    entries[i] = make_entry(inputs[i], evaluate, component_ref);
                }
            });
        }
        workers.clear();
    }

    return VexDocument{.spec_version = options.spec_version,
                       .timestamp = options.timestamp,
                       .entries = std::move(entries)};
}

VexDocument synthesize(std::span<const cve::CveRecord> records,
                       const EvaluateFn& evaluate,
                       const SbomIndex* sbom,
                       const SynthesisOptions& options)
{
    std::vector<CveInput> inputs;
    inputs.reserve(records.size());
    for (const cve::CveRecord& record : records) {
        inputs.push_back(CveInput{.cve_id = record.id, .record = record});
    }
    return synthesize(std::span<const CveInput>(inputs), evaluate, sbom, options);
}

std::vector<std::string> cve_symbol_pairs(std::span<const CveInput> inputs)
{
    std::set<std::string> lines;
    for (const CveInput& input : inputs) {
        if (!input.record) {
            continue;
        }
        for (const std::string& symbol : input.record->implicated_symbols) {
            lines.insert(std::format("{} {}", input.cve_id, common::prefixed_symbol_name(symbol)));
        }
    }
    return {lines.begin(), lines.end()};
}

}  // namespace kcfgvex::vex
