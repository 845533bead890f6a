#pragma once

/**
 * @file sbom.hpp
 * @brief CycloneDX SBOM component lookup
 */

#include "kcfgvex/common.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kcfgvex::vex {

/**
 * @brief Component identifier to BOM-Link reference table
 *
 * Every component is reachable by its `bom-ref`, `purl` and `name`. The
 * reference is `urn:cdx:<serial-uuid>/<bom-version>#<fragment>` where the
 * fragment is the bom-ref, else the purl, else the name.
 */
class SbomIndex
{
public:
    /// @return Index, or InvalidSbom when bomFormat is not "CycloneDX"
    [[nodiscard]] static kcfgvex::Result<SbomIndex> from_cyclonedx(const nlohmann::json& sbom);

    [[nodiscard]] static kcfgvex::Result<SbomIndex> from_path(const std::filesystem::path& path);

    [[nodiscard]] std::optional<std::string> lookup(std::string_view identifier) const;

    [[nodiscard]] const std::string& serial_uuid() const noexcept { return m_serial_uuid; }
    [[nodiscard]] std::int64_t bom_version() const noexcept { return m_bom_version; }
    [[nodiscard]] std::size_t size() const noexcept { return m_refs.size(); }

private:
    void index_components(const nlohmann::json& components);

    std::string m_serial_uuid = "unknown";
    std::int64_t m_bom_version = 1;
    std::map<std::string, std::string, std::less<>> m_refs;
};

}  // namespace kcfgvex::vex
