#pragma once

/**
 * @file cve.hpp
 * @brief CVE records, the CVE source collaborator and Yocto summaries
 */

#include "kcfgvex/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kcfgvex::cve {

/// One `affected[].versions[]` entry of a CVE JSON 5 record
struct VersionRange
{
    std::string version;
    std::string less_than;
    std::string less_than_or_equal;
    std::string status;
    std::string version_type;

    bool operator==(const VersionRange&) const = default;
};

/**
 * @brief Structured CVE record as consumed by the synthesizer
 *
 * implicated_symbols holds canonical names (no CONFIG_ prefix), sorted.
 */
struct CveRecord
{
    std::string id;
    std::string description;
    std::vector<std::string> implicated_symbols;
    std::vector<std::string> program_files;
    std::vector<VersionRange> affected_versions;
    std::vector<std::string> notes;  ///< problems met while deriving symbols

    bool operator==(const CveRecord&) const = default;
};

/**
 * Program files listed in `containers.cna.affected[].programFiles`,
 * leading "./" stripped, de-duplicated and sorted.
 */
[[nodiscard]] std::vector<std::string> extract_program_files(const nlohmann::json& record);

/**
 * Parse a CVE JSON 5 record.
 * An `implicatedSymbols` string array, when present at the top level,
 * supplies the implicated symbols directly.
 * @return Record, or ParseError when cveMetadata.cveId is missing
 */
[[nodiscard]] kcfgvex::Result<CveRecord> parse_cve_record(const nlohmann::json& record);

/**
 * @brief Supplier of structured CVE records
 *
 * Implementations own retrieval and caching. Callers only see a parsed
 * record or a FetchError for the requested id.
 */
class CveSource
{
public:
    virtual ~CveSource() = default;

    [[nodiscard]] virtual kcfgvex::Result<CveRecord> fetch(const std::string& cve_id,
                                                           bool force_refresh) = 0;
};

/**
 * @brief CVE source backed by a directory of `<CVE-ID>.json` files
 *
 * When a kernel source tree is given, records without implicated symbols
 * get them from the Kbuild gates of their program files.
 */
class DirectoryCveSource final : public CveSource
{
public:
    explicit DirectoryCveSource(std::filesystem::path directory,
                                std::optional<std::filesystem::path> srctree = std::nullopt);

    [[nodiscard]] kcfgvex::Result<CveRecord> fetch(const std::string& cve_id,
                                                   bool force_refresh) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }

private:
    void derive_symbols(CveRecord& record) const;

    std::filesystem::path m_directory;
    std::optional<std::filesystem::path> m_srctree;
};

/// CVE ids of a Yocto cve-check summary
struct YoctoCves
{
    std::vector<std::string> unpatched;
    std::vector<std::string> patched;
};

/**
 * CVE ids of packages whose products include `linux_kernel`.
 * Issues with status "Patched" go to `patched`, all others to `unpatched`.
 * Both lists are de-duplicated and sorted.
 */
[[nodiscard]] YoctoCves extract_yocto_cves(const nlohmann::json& summary);

[[nodiscard]] kcfgvex::Result<YoctoCves> load_yocto_summary(const std::filesystem::path& path);

}  // namespace kcfgvex::cve
