#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization and JSON file I/O
 *
 * Canonical form:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace
 * - Integers only (no floating point)
 */

#include "kcfgvex/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace kcfgvex::canonical {

/**
 * Layout used when writing a JSON document to disk
 */
enum class JsonStyle {
    kCanonical,  ///< Minimal canonical bytes (hash input)
    kPretty      ///< Two-space indentation for people
};

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string, or FloatingPointNotAllowed
 */
[[nodiscard]] kcfgvex::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] kcfgvex::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] kcfgvex::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write a JSON document (parent directories are created)
 */
[[nodiscard]] kcfgvex::VoidResult write_json_file(const std::filesystem::path& path,
                                                  const nlohmann::json& payload,
                                                  JsonStyle style = JsonStyle::kCanonical);

}  // namespace kcfgvex::canonical
