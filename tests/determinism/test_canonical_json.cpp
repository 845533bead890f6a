/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON serialization and file I/O tests
 */

#include "kcfgvex/canonical_json.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace kcfgvex::canonical;
using Json = nlohmann::json;

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

std::string read_text(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(CanonicalJSON, SortedKeysWithoutWhitespace)
{
    Json analysis;
    analysis["state"] = "not_affected";
    analysis["detail"] = "Required symbols present in source";
    analysis["justification"] = "code_not_reachable";
    Json j = {
        {"vulnerabilities", Json::array({{{"id", "CVE-2024-1"}, {"analysis", analysis}}})},
        {"bomFormat", "CycloneDX"},
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical,
              R"({"bomFormat":"CycloneDX","vulnerabilities":[{"analysis":{"detail":"Required symbols present in source",)"
              R"("justification":"code_not_reachable","state":"not_affected"},"id":"CVE-2024-1"}]})");
}

TEST(CanonicalJSON, ArrayOrderIsKept)
{
    auto canonical = canonicalize(Json{{"affects", {"b", "a", "c"}}});
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"affects":["b","a","c"]})");
}

TEST(CanonicalJSON, FloatRejectedWithPath)
{
    auto canonical = canonicalize(Json{{"metadata", {{"tools", {1, 2.5}}}}});
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, "FloatingPointNotAllowed");
    EXPECT_NE(canonical.error().message.find("$.metadata.tools[1]"), std::string::npos);
}

TEST(CanonicalJSON, NonAsciiStringsAreKept)
{
    auto canonical = canonicalize(Json{{"detail", "caf\xc3\xa9"}});
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, "{\"detail\":\"caf\xc3\xa9\"}");
}

TEST(CanonicalJSON, InsertionOrderDoesNotChangeHash)
{
    Json first;
    first["version"] = 1;
    first["specVersion"] = "1.4";
    Json second;
    second["specVersion"] = "1.4";
    second["version"] = 1;

    auto h1 = hash_canonical(first);
    auto h2 = hash_canonical(second);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
    EXPECT_TRUE(h1->starts_with("sha256:"));
    EXPECT_EQ(h1->size(), 7U + 64U);
}

TEST(CanonicalJSON, WriteAndReadBack)
{
    TempDir temp_dir("kcfgvex_canonical_io_test");
    const Json doc = {{"b", 1}, {"a", {{"nested", true}}}};

    const auto canonical_path = temp_dir.path() / "out" / "doc.json";
    ASSERT_TRUE(write_json_file(canonical_path, doc));
    EXPECT_EQ(read_text(canonical_path), "{\"a\":{\"nested\":true},\"b\":1}\n");

    const auto pretty_path = temp_dir.path() / "pretty.json";
    ASSERT_TRUE(write_json_file(pretty_path, doc, JsonStyle::kPretty));
    EXPECT_EQ(read_text(pretty_path), "{\n  \"a\": {\n    \"nested\": true\n  },\n  \"b\": 1\n}\n");

    auto reread = read_json_file(pretty_path);
    ASSERT_TRUE(reread);
    EXPECT_EQ(*reread, doc);
}

TEST(CanonicalJSON, ReadErrors)
{
    TempDir temp_dir("kcfgvex_canonical_read_test");
    auto missing = read_json_file(temp_dir.path() / "missing.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "IOError");

    {
        std::ofstream out(temp_dir.path() / "broken.json");
        out << "{\"vulnerabilities\": [";
    }
    auto broken = read_json_file(temp_dir.path() / "broken.json");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, "ParseError");
}

TEST(CanonicalJSON, CanonicalWriteRejectsFloats)
{
    TempDir temp_dir("kcfgvex_canonical_float_test");
    const auto path = temp_dir.path() / "float.json";
    auto written = write_json_file(path, Json{{"score", 9.8}});
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, "FloatingPointNotAllowed");
    EXPECT_FALSE(std::filesystem::exists(path));
}
