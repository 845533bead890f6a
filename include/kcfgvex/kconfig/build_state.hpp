#pragma once

/**
 * @file build_state.hpp
 * @brief Concrete .config assignment
 */

#include "kcfgvex/common.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcfgvex::kconfig {

/**
 * @brief Explicit symbol values from a .config snapshot
 *
 * Keys are canonical symbol names. Symbols not present are unset and
 * are resolved from their Kconfig defaults at query time. Populated at
 * load time only; a loaded state is shared read-only by every query.
 */
class BuildState
{
public:
    BuildState() = default;

    /**
     * Parse .config text: `CONFIG_X=value` and `# CONFIG_X is not set`.
     * Other lines are ignored; quoted string values are unquoted.
     */
    [[nodiscard]] static BuildState from_text(std::string_view text);

    [[nodiscard]] static kcfgvex::Result<BuildState> from_path(const std::filesystem::path& path);

    void set(std::string_view name, std::string value);

    [[nodiscard]] std::optional<std::string> explicit_value(std::string_view name) const;

    /// Explicitly "y", or "m" when include_modules is set
    [[nodiscard]] bool is_enabled(std::string_view name, bool include_modules = true) const;

    /// Sorted canonical names of explicitly enabled symbols
    [[nodiscard]] std::vector<std::string> enabled_symbols(bool include_modules = true) const;

    [[nodiscard]] const std::map<std::string, std::string>& values() const noexcept
    {
        return m_values;
    }
    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }

private:
    std::map<std::string, std::string> m_values;
};

}  // namespace kcfgvex::kconfig
