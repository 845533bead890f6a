/**
 * @file build_state.cpp
 * @brief .config loading
 */

#include "kcfgvex/kconfig/build_state.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace kcfgvex::kconfig {

namespace {

constexpr std::string_view kNotSetSuffix = " is not set";

[[nodiscard]] std::string unquote(std::string_view value)
{
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return std::string(value);
    }
    std::string out;
    value = value.substr(1, value.size() - 2);
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

}  // namespace

BuildState BuildState::from_text(std::string_view text)
{
    BuildState state;
    std::istringstream stream{std::string(text)};
    std::string raw;
    while (std::getline(stream, raw)) {
        const std::string line = common::trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '#') {
            // "# CONFIG_FOO is not set"
            std::string_view body = std::string_view(line).substr(1);
            while (!body.empty() && body.front() == ' ') {
                body.remove_prefix(1);
            }
            if (body.starts_with(common::kConfigPrefix) && body.ends_with(kNotSetSuffix)) {
                body.remove_suffix(kNotSetSuffix.size());
                state.set(body, "n");
            }
            continue;
        }
        const std::size_t eq = line.find('=');
        if (eq == std::string::npos || !line.starts_with(common::kConfigPrefix)) {
            continue;
        }
        state.set(line.substr(0, eq), unquote(common::trim(std::string_view(line).substr(eq + 1))));
    }
    return state;
}

kcfgvex::Result<BuildState> BuildState::from_path(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", std::format("Failed to open .config: {}", path.string())));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return from_text(buffer.str());
}

void BuildState::set(std::string_view name, std::string value)
{
    m_values.insert_or_assign(common::canonical_symbol_name(name), std::move(value));
}

std::optional<std::string> BuildState::explicit_value(std::string_view name) const
{
    auto it = m_values.find(common::canonical_symbol_name(name));
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool BuildState::is_enabled(std::string_view name, bool include_modules) const
{
    auto value = explicit_value(name);
    return value && (*value == "y" || (include_modules && *value == "m"));
}

std::vector<std::string> BuildState::enabled_symbols(bool include_modules) const
{
    std::vector<std::string> names;
    for (const auto& [name, value] : m_values) {
        if (value == "y" || (include_modules && value == "m")) {
            names.push_back(name);
        }
    }
    return names;
}

}  // namespace kcfgvex::kconfig
