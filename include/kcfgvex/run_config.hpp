#pragma once

/**
 * @file run_config.hpp
 * @brief JSON run configuration for batch VEX synthesis
 */

#include "kcfgvex/common.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kcfgvex {

/**
 * @brief Values read from a run_config.v1 document
 *
 * Unset members leave the corresponding CLI default in place. Relative
 * paths are resolved against the directory holding the configuration.
 */
struct RunConfig
{
    std::optional<std::filesystem::path> kconfig;
    std::optional<std::filesystem::path> srctree;
    std::optional<std::string> srcarch;
    std::optional<std::filesystem::path> dotconfig;
    std::optional<std::filesystem::path> cve_dir;
    std::optional<std::filesystem::path> sbom;
    std::optional<std::string> component;
    std::optional<std::string> spec_version;
    std::optional<std::size_t> jobs;
    std::optional<bool> split_output;
    std::map<std::string, std::string> variables;  ///< extra `$(NAME)` values for source paths
};

/**
 * Build a RunConfig from an already validated document.
 * @param base_dir Directory that relative paths are resolved against
 */
[[nodiscard]] RunConfig run_config_from_json(const nlohmann::json& document,
                                             const std::filesystem::path& base_dir);

/**
 * Read, validate against run_config.v1.schema.json and convert.
 * @return Config, or IOError / ParseError / SchemaValidationFailed
 */
[[nodiscard]] kcfgvex::Result<RunConfig> load_run_config(const std::filesystem::path& path,
                                                         const std::filesystem::path& schema_dir);

}  // namespace kcfgvex
