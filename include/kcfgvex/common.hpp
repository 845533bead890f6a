#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, hash, path normalization, symbol names
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcfgvex {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace kcfgvex

namespace kcfgvex::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/**
 * Derive a UUID-shaped URN from the SHA-256 of data.
 * Same input, same URN; used for document serial numbers.
 * @return "urn:uuid:xxxxxxxx-xxxx-5xxx-yxxx-xxxxxxxxxxxx"
 */
[[nodiscard]] std::string uuid_urn_from_hash(std::string_view data);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes and a leading "./"
 * - Resolve '..' and '.'
 *
 * @param input Input path
 * @return Normalized path ("." for an empty result)
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Directory part of a normalized path ("." when there is none)
 */
[[nodiscard]] std::string parent_path(std::string_view path);

/**
 * Join base and relative, then normalize. An absolute relative wins.
 */
[[nodiscard]] std::string join_path(std::string_view base, std::string_view relative);

// ============================================================================
// Configuration symbol names
// ============================================================================

/// Prefix carried by symbol names in .config files and Makefiles
constexpr std::string_view kConfigPrefix = "CONFIG_";

/**
 * Canonical symbol name: surrounding whitespace trimmed, one leading
 * "CONFIG_" removed. Kconfig sources, .config keys and CVE symbol lists
 * all resolve to the same canonical name.
 */
[[nodiscard]] std::string canonical_symbol_name(std::string_view name);

/**
 * Display form of a canonical name ("FOO" -> "CONFIG_FOO")
 */
[[nodiscard]] std::string prefixed_symbol_name(std::string_view name);

/**
 * Trim ASCII whitespace on both sides
 */
[[nodiscard]] std::string trim(std::string_view input);

}  // namespace kcfgvex::common
