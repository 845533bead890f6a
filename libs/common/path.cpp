/**
 * @file path.cpp
 * @brief Path normalization for Kconfig source directives and CVE program files
 */

#include "kcfgvex/common.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace kcfgvex::common {

namespace {

/**
 * @brief Split a path string into non-empty parts
 */
[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        if (!sv.empty()) {
            parts.emplace_back(sv);
        }
    }
    return parts;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_parts(const std::vector<std::string>& parts)
{
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += '/';
        }
        result += part;
    }
    return result;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    return !path.empty() && path.front() == '/';
}

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    std::string path_str(input);
    std::ranges::replace(path_str, '\\', '/');
    const bool absolute_input = is_absolute_path(path_str);

    std::string normalized = join_parts(resolve_parts(split_path(path_str), absolute_input));
    if (absolute_input) {
        return "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

std::string parent_path(std::string_view path)
{
    std::string normalized = normalize_path(path);
    const auto slash = normalized.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return normalized.substr(0, slash);
}

std::string join_path(std::string_view base, std::string_view relative)
{
    if (is_absolute_path(relative) || base.empty() || base == ".") {
        return normalize_path(relative);
    }
    std::string combined(base);
    combined += '/';
    combined += relative;
    return normalize_path(combined);
}

}  // namespace kcfgvex::common
