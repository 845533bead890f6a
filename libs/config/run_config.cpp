/**
 * @file run_config.cpp
 * @brief Run configuration loading
 */

#include "kcfgvex/run_config.hpp"

#include "kcfgvex/canonical_json.hpp"
#include "kcfgvex/schema_validate.hpp"

#include <format>

namespace kcfgvex {

namespace {

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& document,
                                                         const char* key)
{
    if (auto it = document.find(key); it != document.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::filesystem::path> optional_path(const nlohmann::json& document,
                                                                 const char* key,
                                                                 const std::filesystem::path& base_dir)
{
    auto value = optional_string(document, key);
    if (!value) {
        return std::nullopt;
    }
    std::filesystem::path path(*value);
    if (path.is_relative() && !base_dir.empty()) {
        path = base_dir / path;
    }
    return path.lexically_normal();
}

}  // namespace

RunConfig run_config_from_json(const nlohmann::json& document, const std::filesystem::path& base_dir)
{
    RunConfig config{
        .kconfig = optional_path(document, "kconfig", base_dir),
        .srctree = optional_path(document, "srctree", base_dir),
        .srcarch = optional_string(document, "srcarch"),
        .dotconfig = optional_path(document, "dotconfig", base_dir),
        .cve_dir = optional_path(document, "cve_dir", base_dir),
        .sbom = optional_path(document, "sbom", base_dir),
        .component = optional_string(document, "component"),
        .spec_version = optional_string(document, "spec_version"),
    };
    if (auto it = document.find("jobs"); it != document.end() && it->is_number_integer()) {
        config.jobs = it->get<std::size_t>();
    }
    if (auto it = document.find("split_output"); it != document.end() && it->is_boolean()) {
        config.split_output = it->get<bool>();
    }
    if (auto it = document.find("variables"); it != document.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) {
                config.variables.emplace(name, value.get<std::string>());
            }
        }
    }
    return config;
}

kcfgvex::Result<RunConfig> load_run_config(const std::filesystem::path& path,
                                           const std::filesystem::path& schema_dir)
{
    auto document = canonical::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const std::string schema_path = (schema_dir / "run_config.v1.schema.json").string();
    if (auto valid = common::validate_json(*document, schema_path); !valid) {
        return std::unexpected(Error::make(
            valid.error().code,
            std::format("run config {} is invalid: {}", path.string(), valid.error().message)));
    }
    return run_config_from_json(*document, path.parent_path());
}

}  // namespace kcfgvex
