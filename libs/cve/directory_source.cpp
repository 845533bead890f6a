/**
 * @file directory_source.cpp
 * @brief CVE records from a local directory of CVE JSON 5 files
 */

#include "kcfgvex/cve.hpp"

#include "kcfgvex/canonical_json.hpp"
#include "kcfgvex/kbuild.hpp"

#include <format>
#include <set>

namespace kcfgvex::cve {

DirectoryCveSource::DirectoryCveSource(std::filesystem::path directory,
                                       std::optional<std::filesystem::path> srctree)
    : m_directory(std::move(directory))
    , m_srctree(std::move(srctree))
{}

kcfgvex::Result<CveRecord> DirectoryCveSource::fetch(const std::string& cve_id, bool force_refresh)
{
    if (force_refresh) {
        return std::unexpected(Error::make(
            "FetchError",
            std::format("{}: refresh requested but only the local cache {} is available",
                        cve_id,
                        m_directory.string())));
    }
    const std::filesystem::path path = m_directory / std::format("{}.json", cve_id);
    auto json = canonical::read_json_file(path);
    if (!json) {
        return std::unexpected(
            Error::make("FetchError", std::format("{}: {}", cve_id, json.error().message)));
    }
    auto record = parse_cve_record(*json);
    if (!record) {
        return std::unexpected(
            Error::make("FetchError", std::format("{}: {}", cve_id, record.error().message)));
    }
    if (record->id != cve_id) {
        return std::unexpected(Error::make(
            "FetchError", std::format("{}: cached file holds {}", cve_id, record->id)));
    }
    if (record->implicated_symbols.empty() && m_srctree) {
        derive_symbols(*record);
    }
    return record;
}

void DirectoryCveSource::derive_symbols(CveRecord& record) const
{
    std::set<std::string> symbols;
    for (const std::string& file : record.program_files) {
        auto trace = kbuild::trace_kbuild_gates(file, *m_srctree);
        if (!trace) {
            record.notes.push_back(std::format("{}: {}", file, trace.error().message));
            continue;
        }
        if (trace->error) {
            record.notes.push_back(*trace->error);
            continue;
        }
        for (const std::string& symbol : trace->symbols) {
            symbols.insert(common::canonical_symbol_name(symbol));
        }
    }
    record.implicated_symbols.assign(symbols.begin(), symbols.end());
}

}  // namespace kcfgvex::cve
