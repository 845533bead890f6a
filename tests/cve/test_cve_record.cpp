/**
 * @file test_cve_record.cpp
 * @brief CVE record parsing and directory source tests
 */

#include "kcfgvex/cve.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace kcfgvex::cve::test {

namespace {

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

void write_file(const std::filesystem::path& path, const std::string& text)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

nlohmann::json make_record(const std::string& id)
{
    return nlohmann::json{
        {"dataType", "CVE_RECORD"},
        {"cveMetadata", {{"cveId", id}, {"state", "PUBLISHED"}}},
        {"containers",
         {{"cna",
           {{"descriptions",
             nlohmann::json::array({{{"lang", "de"}, {"value", "Beschreibung"}},
                                    {{"lang", "en"}, {"value", "net: fix use-after-free"}}})},
            {"affected",
             nlohmann::json::array(
                 {{{"product", "Linux"},
                   {"programFiles", nlohmann::json::array({"./net/core/sock.c", "net/core/dev.c"})},
                   {"versions",
                    nlohmann::json::array({{{"version", "5.10"},
                                            {"lessThan", "5.10.200"},
                                            {"status", "affected"},
                                            {"versionType", "semver"}}})}},
                  {{"product", "Linux"},
                   {"programFiles", nlohmann::json::array({"net/core/sock.c"})}}})}}}}}};
}

}  // namespace

TEST(CveRecordTest, ParsesCveJson5)
{
    auto record = parse_cve_record(make_record("CVE-2024-0001"));
    ASSERT_TRUE(record) << record.error().message;
    EXPECT_EQ(record->id, "CVE-2024-0001");
    EXPECT_EQ(record->description, "net: fix use-after-free");
    EXPECT_EQ(record->program_files, (std::vector<std::string>{"net/core/dev.c", "net/core/sock.c"}));
    ASSERT_EQ(record->affected_versions.size(), 1U);
    EXPECT_EQ(record->affected_versions[0].less_than, "5.10.200");
    EXPECT_EQ(record->affected_versions[0].version_type, "semver");
    EXPECT_TRUE(record->implicated_symbols.empty());
}

TEST(CveRecordTest, ImplicatedSymbolsAreCanonical)
{
    nlohmann::json json = make_record("CVE-2024-0002");
    json["implicatedSymbols"] = {"CONFIG_NET", "INET", "CONFIG_INET", " "};
    auto record = parse_cve_record(json);
    ASSERT_TRUE(record) << record.error().message;
    EXPECT_EQ(record->implicated_symbols, (std::vector<std::string>{"INET", "NET"}));
}

TEST(CveRecordTest, RejectsMalformedRecords)
{
    auto not_object = parse_cve_record(nlohmann::json::array());
    ASSERT_FALSE(not_object);
    EXPECT_EQ(not_object.error().code, "ParseError");

    auto no_id = parse_cve_record(nlohmann::json{{"cveMetadata", {{"state", "PUBLISHED"}}}});
    ASSERT_FALSE(no_id);
    EXPECT_EQ(no_id.error().code, "ParseError");

    nlohmann::json bad_symbols = make_record("CVE-2024-0003");
    bad_symbols["implicatedSymbols"] = "CONFIG_NET";
    auto bad = parse_cve_record(bad_symbols);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "ParseError");
}

TEST(CveRecordTest, ProgramFilesWithoutCnaContainer)
{
    EXPECT_TRUE(extract_program_files(nlohmann::json{{"cveMetadata", {{"cveId", "CVE-1"}}}}).empty());
}

TEST(DirectoryCveSourceTest, FetchesCachedRecord)
{
    TempDir temp_dir("kcfgvex_cve_source_test");
    nlohmann::json json = make_record("CVE-2024-1000");
    json["implicatedSymbols"] = {"CONFIG_NET"};
    write_file(temp_dir.path() / "CVE-2024-1000.json", json.dump());

    DirectoryCveSource source(temp_dir.path());
    auto record = source.fetch("CVE-2024-1000", false);
    ASSERT_TRUE(record) << record.error().message;
    EXPECT_EQ(record->implicated_symbols, (std::vector<std::string>{"NET"}));
}

TEST(DirectoryCveSourceTest, FailuresAreFetchErrors)
{
    TempDir temp_dir("kcfgvex_cve_source_fail_test");
    write_file(temp_dir.path() / "CVE-2024-2000.json", make_record("CVE-2024-2001").dump());
    write_file(temp_dir.path() / "CVE-2024-2002.json", "{ not json");

    DirectoryCveSource source(temp_dir.path());
    for (const char* id : {"CVE-2024-2000", "CVE-2024-2002", "CVE-2024-9999"}) {
        auto record = source.fetch(id, false);
        ASSERT_FALSE(record) << id;
        EXPECT_EQ(record.error().code, "FetchError");
        EXPECT_TRUE(record.error().message.starts_with(id));
    }

    write_file(temp_dir.path() / "CVE-2024-2003.json", make_record("CVE-2024-2003").dump());
    auto refreshed = source.fetch("CVE-2024-2003", true);
    ASSERT_FALSE(refreshed);
    EXPECT_EQ(refreshed.error().code, "FetchError");
}

TEST(DirectoryCveSourceTest, DerivesSymbolsFromKbuild)
{
    TempDir temp_dir("kcfgvex_cve_source_kbuild_test");
    const auto cache = temp_dir.path() / "cache";
    const auto srctree = temp_dir.path() / "linux";
    write_file(cache / "CVE-2024-3000.json", make_record("CVE-2024-3000").dump());
    write_file(srctree / "net/core/sock.c", "");
    write_file(srctree / "net/core/Makefile", "obj-y += sock.o\nobj-$(CONFIG_NET_DEV) += dev.o\n");
    write_file(srctree / "net/Makefile", "obj-$(CONFIG_NET) += core/\n");

    DirectoryCveSource source(cache, srctree);
    auto record = source.fetch("CVE-2024-3000", false);
    ASSERT_TRUE(record) << record.error().message;
    EXPECT_EQ(record->implicated_symbols, (std::vector<std::string>{"NET"}));
    ASSERT_EQ(record->notes.size(), 1U);
    EXPECT_NE(record->notes[0].find("net/core/dev.c"), std::string::npos);
}

}  // namespace kcfgvex::cve::test
