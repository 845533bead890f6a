#pragma once

/**
 * @file kbuild.hpp
 * @brief Kbuild Makefile gate tracer
 */

#include "kcfgvex/common.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kcfgvex::kbuild {

/// One hop of a trace: `src` reaches `dst` through a Makefile rule
struct TraceEdge
{
    std::string src;
    std::string dst;
    std::string via;

    bool operator==(const TraceEdge&) const = default;
};

struct KbuildTrace
{
    std::string file;
    std::set<std::string> objects;
    std::set<std::string> symbols;  ///< CONFIG_-prefixed, as written in Makefiles
    std::vector<TraceEdge> edges;
    std::optional<std::string> error;
};

/**
 * Collect the CONFIG_ symbols gating the object built from a source file.
 *
 * Scans the Makefile next to the file for `obj-$(CONFIG_X)` rules and
 * composite objects (`name-y`, `name-objs`, `name-$(CONFIG_X)`,
 * `name-objs-$(CONFIG_X)`), following composites to their own gates, then
 * the Makefiles of every ancestor directory below the source root for
 * directory gates `obj-$(CONFIG_X) += subdir/`.
 *
 * @param relative_file Path relative to source_root (a leading "./" is ignored)
 * @return Trace; a file missing from the tree sets `error`. IOError if a
 *         Makefile exists but cannot be read.
 */
[[nodiscard]] kcfgvex::Result<KbuildTrace> trace_kbuild_gates(std::string_view relative_file,
                                                              const std::filesystem::path& source_root);

/**
 * Read a Makefile as logical lines: continuations joined, comments removed,
 * whitespace compacted, blank lines dropped.
 */
[[nodiscard]] kcfgvex::Result<std::vector<std::string>>
read_makefile_lines(const std::filesystem::path& path);

}  // namespace kcfgvex::kbuild
