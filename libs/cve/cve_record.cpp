/**
 * @file cve_record.cpp
 * @brief CVE JSON 5 record parsing
 */

#include "kcfgvex/cve.hpp"

#include <algorithm>
#include <set>

namespace kcfgvex::cve {

namespace {

[[nodiscard]] std::string string_field(const nlohmann::json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] const nlohmann::json* cna_container(const nlohmann::json& record)
{
    auto containers = record.find("containers");
    if (containers == record.end() || !containers->is_object()) {
        return nullptr;
    }
    auto cna = containers->find("cna");
    if (cna == containers->end() || !cna->is_object()) {
        return nullptr;
    }
    return &*cna;
}

[[nodiscard]] std::string english_description(const nlohmann::json& cna)
{
    auto descriptions = cna.find("descriptions");
    if (descriptions == cna.end() || !descriptions->is_array()) {
        return {};
    }
    std::string fallback;
    for (const auto& entry : *descriptions) {
        if (!entry.is_object()) {
            continue;
        }
        const std::string value = string_field(entry, "value");
        const std::string lang = string_field(entry, "lang");
        if (lang == "en" || lang.starts_with("en-") || lang.starts_with("en_")) {
            return value;
        }
        if (fallback.empty()) {
            fallback = value;
        }
    }
    return fallback;
}

[[nodiscard]] std::vector<VersionRange> affected_versions(const nlohmann::json& cna)
{
    std::vector<VersionRange> ranges;
    auto affected = cna.find("affected");
    if (affected == cna.end() || !affected->is_array()) {
        return ranges;
    }
    for (const auto& product : *affected) {
        auto versions = product.find("versions");
        if (!product.is_object() || versions == product.end() || !versions->is_array()) {
            continue;
        }
        for (const auto& version : *versions) {
            if (!version.is_object()) {
                continue;
            }
            ranges.push_back(VersionRange{.version = string_field(version, "version"),
                                          .less_than = string_field(version, "lessThan"),
                                          .less_than_or_equal =
                                              string_field(version, "lessThanOrEqual"),
                                          .status = string_field(version, "status"),
                                          .version_type = string_field(version, "versionType")});
        }
    }
    return ranges;
}

}  // namespace

std::vector<std::string> extract_program_files(const nlohmann::json& record)
{
    std::set<std::string> files;
    const nlohmann::json* cna = cna_container(record);
    if (cna == nullptr) {
        return {};
    }
    auto affected = cna->find("affected");
    if (affected == cna->end() || !affected->is_array()) {
        return {};
    }
    for (const auto& product : *affected) {
        if (!product.is_object()) {
            continue;
        }
        auto program_files = product.find("programFiles");
        if (program_files == product.end() || !program_files->is_array()) {
            continue;
        }
        for (const auto& file : *program_files) {
            if (!file.is_string()) {
                continue;
            }
            std::string_view path = file.get_ref<const std::string&>();
            while (path.starts_with("./")) {
                path.remove_prefix(2);
            }
            if (!path.empty()) {
                files.emplace(path);
            }
        }
    }
    return {files.begin(), files.end()};
}

kcfgvex::Result<CveRecord> parse_cve_record(const nlohmann::json& record)
{
    if (!record.is_object()) {
        return std::unexpected(Error::make("ParseError", "CVE record is not a JSON object"));
    }
    auto metadata = record.find("cveMetadata");
    if (metadata == record.end() || !metadata->is_object()) {
        return std::unexpected(Error::make("ParseError", "CVE record has no cveMetadata"));
    }
    CveRecord result;
    result.id = string_field(*metadata, "cveId");
    if (result.id.empty()) {
        return std::unexpected(Error::make("ParseError", "CVE record has no cveMetadata.cveId"));
    }
    if (const nlohmann::json* cna = cna_container(record)) {
        result.description = english_description(*cna);
        result.affected_versions = affected_versions(*cna);
    }
    result.program_files = extract_program_files(record);

    if (auto symbols = record.find("implicatedSymbols"); symbols != record.end()) {
        if (!symbols->is_array()) {
            return std::unexpected(
                Error::make("ParseError", "implicatedSymbols must be an array of strings"));
        }
        std::set<std::string> names;
        for (const auto& symbol : *symbols) {
            if (!symbol.is_string()) {
                return std::unexpected(
                    Error::make("ParseError", "implicatedSymbols must be an array of strings"));
            }
            std::string name = common::canonical_symbol_name(symbol.get_ref<const std::string&>());
            if (!name.empty()) {
                names.insert(std::move(name));
            }
        }
        result.implicated_symbols.assign(names.begin(), names.end());
    }
    return result;
}

}  // namespace kcfgvex::cve
