/**
 * @file test_yocto.cpp
 * @brief Yocto cve-check summary tests
 */

#include "kcfgvex/cve.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace kcfgvex::cve::test {

namespace {

nlohmann::json make_summary()
{
    return nlohmann::json::parse(R"({
  "version": "1",
  "package": [
    {
      "name": "linux-yocto",
      "products": [{"product": "linux_kernel", "cvesInRecord": "Yes"}],
      "issue": [
        {"id": "CVE-2024-0003", "status": "Unpatched"},
        {"id": "CVE-2024-0001", "status": "Patched"},
        {"id": "CVE-2024-0002", "status": "Ignored"},
        {"id": "CVE-2024-0003", "status": "Unpatched"},
        {"id": "not-a-cve", "status": "Unpatched"},
        {"status": "Unpatched"}
      ]
    },
    {
      "name": "openssl",
      "products": [{"product": "openssl"}],
      "issue": [{"id": "CVE-2024-9999", "status": "Unpatched"}]
    }
  ]
})");
}

}  // namespace

TEST(YoctoTest, KernelIssuesOnly)
{
    const YoctoCves cves = extract_yocto_cves(make_summary());
    EXPECT_EQ(cves.unpatched, (std::vector<std::string>{"CVE-2024-0002", "CVE-2024-0003"}));
    EXPECT_EQ(cves.patched, (std::vector<std::string>{"CVE-2024-0001"}));
}

TEST(YoctoTest, MalformedSummaryIsEmpty)
{
    EXPECT_TRUE(extract_yocto_cves(nlohmann::json::array()).unpatched.empty());
    EXPECT_TRUE(extract_yocto_cves(nlohmann::json{{"package", "x"}}).unpatched.empty());
}

TEST(YoctoTest, LoadsSummaryFile)
{
    const auto path = std::filesystem::temp_directory_path() / "kcfgvex_yocto_summary.json";
    {
        std::ofstream out(path);
        out << make_summary().dump(2);
    }
    auto cves = load_yocto_summary(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(cves) << cves.error().message;
    EXPECT_EQ(cves->unpatched.size(), 2U);

    auto missing = load_yocto_summary(path);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "IOError");
}

}  // namespace kcfgvex::cve::test
