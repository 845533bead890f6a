/**
 * @file sbom.cpp
 * @brief CycloneDX SBOM component lookup
 */

#include "kcfgvex/sbom.hpp"

#include "kcfgvex/canonical_json.hpp"

#include <format>

namespace kcfgvex::vex {

namespace {

[[nodiscard]] std::optional<std::string> string_member(const nlohmann::json& object,
                                                       const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

kcfgvex::Result<SbomIndex> SbomIndex::from_cyclonedx(const nlohmann::json& sbom)
{
    if (!sbom.is_object() || string_member(sbom, "bomFormat") != "CycloneDX") {
        return std::unexpected(Error::make("InvalidSbom", "SBOM is not CycloneDX JSON"));
    }
    SbomIndex index;
    if (auto serial = string_member(sbom, "serialNumber")) {
        const std::size_t colon = serial->rfind(':');
        index.m_serial_uuid = colon == std::string::npos ? *serial : serial->substr(colon + 1);
    }
    if (auto version = sbom.find("version"); version != sbom.end() && version->is_number_integer()) {
        index.m_bom_version = version->get<std::int64_t>();
    }
    if (auto components = sbom.find("components"); components != sbom.end()) {
        if (!components->is_array()) {
            return std::unexpected(Error::make("InvalidSbom", "SBOM components must be an array"));
        }
        index.index_components(*components);
    }
    return index;
}

kcfgvex::Result<SbomIndex> SbomIndex::from_path(const std::filesystem::path& path)
{
    auto json = canonical::read_json_file(path);
    if (!json) {
        return std::unexpected(json.error());
    }
    return from_cyclonedx(*json);
}

void SbomIndex::index_components(const nlohmann::json& components)
{
    for (const auto& component : components) {
        if (!component.is_object()) {
            continue;
        }
        const auto bom_ref = string_member(component, "bom-ref");
        const auto bom_ref_alt = string_member(component, "bomRef");
        const auto purl = string_member(component, "purl");
        const auto name = string_member(component, "name");
        const std::optional<std::string> fragment = bom_ref   ? bom_ref
                                                    : bom_ref_alt ? bom_ref_alt
                                                    : purl        ? purl
                                                                  : name;
        if (fragment) {
            const std::string ref =
                std::format("urn:cdx:{}/{}#{}", m_serial_uuid, m_bom_version, *fragment);
            for (const auto& key : {bom_ref, bom_ref_alt, purl, name}) {
                if (key) {
                    m_refs.try_emplace(*key, ref);
                }
            }
        }
        if (auto nested = component.find("components"); nested != component.end() && nested->is_array()) {
            index_components(*nested);
        }
    }
}

std::optional<std::string> SbomIndex::lookup(std::string_view identifier) const
{
    auto it = m_refs.find(identifier);
    if (it == m_refs.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace kcfgvex::vex
