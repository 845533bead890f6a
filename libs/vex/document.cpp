/**
 * @file document.cpp
 * @brief CycloneDX VEX document serialization
 */

#include "kcfgvex/vex.hpp"

#include "kcfgvex/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <map>

namespace kcfgvex::vex {

std::string_view to_string(VexState state) noexcept
{
    switch (state) {
        case VexState::kExploitable:
            return "exploitable";
        case VexState::kInTriage:
            return "in_triage";
        case VexState::kNotAffected:
            return "not_affected";
    }
    return "in_triage";
}

nlohmann::json VexDocument::vulnerabilities_json() const
{
    nlohmann::json vulnerabilities = nlohmann::json::array();
    for (const VexEntry& entry : entries) {
        nlohmann::json analysis = {
            {"state", std::string(to_string(entry.state))},
            {"detail", entry.detail},
        };
        if (entry.state == VexState::kNotAffected
            && entry.justification != kconfig::Justification::kNone) {
            analysis["justification"] = std::string(kconfig::to_string(entry.justification));
        }
        nlohmann::json affects = nlohmann::json::array();
        for (const std::string& ref : entry.affects) {
            affects.push_back({{"ref", ref}});
        }
        vulnerabilities.push_back({
            {"id", entry.cve_id},
            {"source",
             {{"name", kVulnerabilitySourceName},
              {"url", std::format("{}{}", kVulnerabilitySourceUrlPrefix, entry.cve_id)}}},
            {"analysis", std::move(analysis)},
            {"affects", std::move(affects)},
        });
    }
    return vulnerabilities;
}

std::string VexDocument::serial_number() const
{
    const nlohmann::json vulnerabilities = vulnerabilities_json();
    auto canonical = canonical::canonicalize(vulnerabilities);
    return common::uuid_urn_from_hash(canonical ? *canonical : vulnerabilities.dump());
}

nlohmann::json VexDocument::to_json() const
{
    return {
        {"bomFormat", "CycloneDX"},
        {"specVersion", spec_version},
        {"version", 1},
        {"serialNumber", serial_number()},
        {"metadata", {{"timestamp", timestamp}}},
        {"vulnerabilities", vulnerabilities_json()},
    };
}

std::vector<std::pair<VexState, VexDocument>> split_by_state(const VexDocument& document)
{
    std::map<std::string_view, std::pair<VexState, VexDocument>> by_state;
    for (const VexEntry& entry : document.entries) {
        auto [it, inserted] = by_state.try_emplace(
            to_string(entry.state),
            entry.state,
            VexDocument{.spec_version = document.spec_version, .timestamp = document.timestamp});
        it->second.second.entries.push_back(entry);
    }
    std::vector<std::pair<VexState, VexDocument>> documents;
    for (auto& [name, split] : by_state) {
        documents.push_back(std::move(split));
    }
    return documents;
}

kcfgvex::Result<std::vector<std::filesystem::path>>
write_split_documents(const VexDocument& document, const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> written;
    for (const auto& [state, split] : split_by_state(document)) {
        const std::filesystem::path path = directory / std::format("vex_{}.json", to_string(state));
        if (auto result = canonical::write_json_file(path, split.to_json(), canonical::JsonStyle::kPretty);
            !result) {
            return std::unexpected(result.error());
        }
        written.push_back(path);
    }
    return written;
}

}  // namespace kcfgvex::vex
