/**
 * @file symbol_name.cpp
 * @brief Canonical configuration symbol names
 */

#include "kcfgvex/common.hpp"

#include <cctype>

namespace kcfgvex::common {

std::string trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

std::string canonical_symbol_name(std::string_view name)
{
    std::string trimmed = trim(name);
    if (trimmed.starts_with(kConfigPrefix)) {
        trimmed.erase(0, kConfigPrefix.size());
    }
    return trimmed;
}

std::string prefixed_symbol_name(std::string_view name)
{
    return std::string(kConfigPrefix) + std::string(name);
}

}  // namespace kcfgvex::common
