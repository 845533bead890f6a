/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization and JSON file I/O
 */

#include "kcfgvex/canonical_json.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <system_error>

namespace kcfgvex::canonical {

namespace {

kcfgvex::VoidResult validate_no_float(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, path + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        std::size_t index = 0;
        for (const auto& elem : j) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, index)); !result) {
                return result;
            }
            ++index;
        }
    }
    return {};
}

}  // namespace

kcfgvex::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }
    // nlohmann::json objects are std::map backed: keys already iterate in order.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

kcfgvex::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

kcfgvex::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

kcfgvex::VoidResult write_json_file(const std::filesystem::path& path,
                                    const nlohmann::json& payload,
                                    JsonStyle style)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError",
                "Failed to create directory " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    std::string text;
    if (style == JsonStyle::kCanonical) {
        auto canonical = canonicalize(payload);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        text = std::move(*canonical);
    } else {
        text = payload.dump(2, ' ', false, nlohmann::json::error_handler_t::strict);
    }

    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << text << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace kcfgvex::canonical
