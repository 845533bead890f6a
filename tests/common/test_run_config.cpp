/**
 * @file test_run_config.cpp
 * @brief Run configuration loading tests
 */

#include "kcfgvex/run_config.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

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
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST(RunConfig, RelativePathsResolveAgainstConfigDirectory)
{
    const nlohmann::json document = {
        {"schema_version", "run_config.v1"},
        {"kconfig", "linux/Kconfig"},
        {"dotconfig", "/boot/config"},
        {"jobs", 8},
        {"split_output", true},
        {"component", "kernel"},
    };
    const kcfgvex::RunConfig config = kcfgvex::run_config_from_json(document, "/work/vex");
    ASSERT_TRUE(config.kconfig);
    EXPECT_EQ(config.kconfig->generic_string(), "/work/vex/linux/Kconfig");
    ASSERT_TRUE(config.dotconfig);
    EXPECT_EQ(config.dotconfig->generic_string(), "/boot/config");
    EXPECT_EQ(config.jobs, 8U);
    EXPECT_EQ(config.split_output, true);
    EXPECT_EQ(config.component, "kernel");
    EXPECT_FALSE(config.srctree);
    EXPECT_FALSE(config.spec_version);
}

TEST(RunConfig, LoadValidatesAgainstSchema)
{
    TempDir temp_dir("kcfgvex_run_config_test");
    const auto path = temp_dir.path() / "run.json";
    write_file(path, R"({"schema_version":"run_config.v1","srcarch":"x86","jobs":0})");

    auto config = kcfgvex::load_run_config(path, KCFGVEX_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "SchemaValidationFailed");
}

TEST(RunConfig, LoadReadsVariables)
{
    TempDir temp_dir("kcfgvex_run_config_vars_test");
    const auto path = temp_dir.path() / "run.json";
    write_file(path,
               R"({"schema_version":"run_config.v1","srcarch":"arm64",)"
               R"("variables":{"HEADER_ARCH":"arm64"}})");

    auto config = kcfgvex::load_run_config(path, KCFGVEX_SCHEMA_DIR);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->srcarch, "arm64");
    ASSERT_EQ(config->variables.size(), 1U);
    EXPECT_EQ(config->variables.at("HEADER_ARCH"), "arm64");
}

TEST(RunConfig, MissingFile)
{
    auto config = kcfgvex::load_run_config("/nonexistent/kcfgvex/run.json", KCFGVEX_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "IOError");
}
