/**
 * @file kbuild.cpp
 * @brief Kbuild Makefile gate tracer
 *
 * Breadth-first over (target, directory) pairs. The queue starts with the
 * object in its own directory plus its relative path in every ancestor
 * directory below the source root; composite objects found on the way are
 * queued in the directory that defines them.
 */

#include "kcfgvex/kbuild.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <format>
#include <fstream>
#include <regex>
#include <sstream>

namespace kcfgvex::kbuild {

namespace {

constexpr std::string_view kViaMakefileRule = "makefile rule";
constexpr std::string_view kViaDirectoryGate = "parent directory gate";
constexpr std::string_view kViaContainer = "container includes target";
constexpr std::string_view kViaParentContainer = "parent container includes target";

/// Kbuild list variables that look like composite objects but are not
constexpr std::array<std::string_view, 12> kReservedPrefixes = {
    "obj",     "lib",     "always",  "targets", "extra",   "hostprogs",
    "subdir",  "ccflags", "asflags", "ldflags", "head",    "clean-files",
};

struct PendingTarget
{
    std::string target;
    std::filesystem::path directory;
    std::optional<std::string> subdir;
    std::string source_target;
};

struct ScanResult
{
    std::set<std::string> configs;
    std::set<std::string> containers;
};

[[nodiscard]] std::string escape_regex(std::string_view text)
{
    std::string out;
    for (char c : text) {
        if (std::string_view(R"(\^$.|?*+()[]{})").find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

[[nodiscard]] std::string compact_whitespace(std::string_view line)
{
    std::string out;
    bool pending_space = false;
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

[[nodiscard]] std::filesystem::path strip_trailing_separator(std::filesystem::path path)
{
    path = path.lexically_normal();
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    if (path == ".") {
        // Relative to the working directory: compare paths without a prefix.
        return {};
    }
    return path;
}

[[nodiscard]] bool is_within(const std::filesystem::path& path, const std::filesystem::path& root)
{
    return std::mismatch(root.begin(), root.end(), path.begin(), path.end()).first == root.end();
}

[[nodiscard]] std::string container_object(std::string name)
{
    constexpr std::string_view kObjsSuffix = "-objs";
    if (name.ends_with(kObjsSuffix)) {
        name.erase(name.size() - kObjsSuffix.size());
    }
    return name + ".o";
}

[[nodiscard]] bool is_reserved(std::string_view name)
{
    return std::ranges::find(kReservedPrefixes, name) != kReservedPrefixes.end();
}

/// Split a Makefile assignment right-hand side on spaces
[[nodiscard]] std::vector<std::string> split_words(std::string_view text)
{
    std::vector<std::string> words;
    std::istringstream stream{std::string(text)};
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

[[nodiscard]] ScanResult scan_makefile(const std::vector<std::string>& lines,
                                       const std::string& target,
                                       const std::optional<std::string>& subdir)
{
    ScanResult result;
    if (target.empty()) {
        return result;
    }

    const std::string t = escape_regex(target);
    const std::string name = R"(([A-Za-z0-9_-]+))";
    const std::string tail = R"(\s*[:+]?=\s.*\b)" + t + R"(\b)";
    const std::regex obj_config(R"(\bobj-\$\((CONFIG_[A-Z0-9_]+)\))" + tail);
    const std::regex container_config(R"(\b)" + name + R"(-(?:y|m|\$\((CONFIG_[A-Z0-9_]+)\)))" + tail);
    const std::regex container_objs(R"(\b)" + name + R"(-objs)" + tail);
    const std::regex container_objs_config(R"(\b)" + name + R"(-objs-\$\((CONFIG_[A-Z0-9_]+)\))" + tail);
    const std::regex dir_gate(R"(\bobj-\$\((CONFIG_[A-Z0-9_]+)\)\s*[:+]?=(.*))");
    const std::string subdir_word = subdir ? *subdir + "/" : std::string();

    const auto add_container = [&result](const std::string& container) {
        if (!is_reserved(container)) {
            result.containers.insert(container_object(container));
        }
    };

    for (const std::string& line : lines) {
        std::smatch match;
        if (line.find(target) != std::string::npos) {
            if (std::regex_search(line, match, obj_config)) {
                result.configs.insert(match[1].str());
            }
            if (std::regex_search(line, match, container_config)) {
                add_container(match[1].str());
                if (match[2].matched) {
                    result.configs.insert(match[2].str());
                }
            }
            if (std::regex_search(line, match, container_objs)) {
                add_container(match[1].str());
            }
            if (std::regex_search(line, match, container_objs_config)) {
                add_container(match[1].str());
                result.configs.insert(match[2].str());
            }
        }
        if (subdir && std::regex_search(line, match, dir_gate)) {
            const auto words = split_words(match[2].str());
            if (std::ranges::find(words, subdir_word) != words.end()) {
                result.configs.insert(match[1].str());
            }
        }
    }
    return result;
}

}  // namespace

kcfgvex::Result<std::vector<std::string>> read_makefile_lines(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", std::format("Failed to open Makefile: {}", path.string())));
    }
    std::vector<std::string> lines;
    std::string raw;
    std::string buffer;
    const auto flush = [&lines](const std::string& logical) {
        std::string_view text = logical;
        if (auto hash = text.find('#'); hash != std::string_view::npos) {
            text = text.substr(0, hash);
        }
        std::string compact = compact_whitespace(text);
        if (!compact.empty()) {
            lines.push_back(std::move(compact));
        }
    };
    while (std::getline(in, raw)) {
        std::string_view line = raw;
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())) != 0) {
            line.remove_suffix(1);
        }
        if (line.ends_with('\\')) {
            line.remove_suffix(1);
            buffer.append(line);
            buffer.push_back(' ');
            continue;
        }
        buffer.append(line);
        flush(buffer);
        buffer.clear();
    }
    if (!buffer.empty()) {
        flush(buffer);
    }
    return lines;
}

kcfgvex::Result<KbuildTrace> trace_kbuild_gates(std::string_view relative_file,
                                                const std::filesystem::path& source_root)
{
    KbuildTrace trace{.file = std::string(relative_file)};

    std::string_view rel = relative_file;
    while (!rel.empty() && std::isspace(static_cast<unsigned char>(rel.front())) != 0) {
        rel.remove_prefix(1);
    }
    while (!rel.empty() && std::isspace(static_cast<unsigned char>(rel.back())) != 0) {
        rel.remove_suffix(1);
    }
    while (rel.starts_with("./")) {
        rel.remove_prefix(2);
    }

    const std::filesystem::path root = strip_trailing_separator(source_root);
    const std::filesystem::path source_path = (root / std::string(rel)).lexically_normal();
    std::error_code ec;
    if (rel.empty() || !std::filesystem::exists(source_path, ec)) {
        trace.error = std::format("File not found in source tree: {}", source_path.string());
        return trace;
    }

    const std::filesystem::path object_path = std::filesystem::path(source_path).replace_extension(".o");
    const std::string object_name = object_path.filename().string();
    const std::filesystem::path file_dir = source_path.parent_path();
    trace.objects.insert(object_name);

    std::deque<PendingTarget> queue;
    queue.push_back(PendingTarget{.target = object_name,
                                  .directory = file_dir,
                                  .subdir = std::nullopt,
                                  .source_target = object_name});
    std::filesystem::path child = file_dir;
    for (std::filesystem::path parent = child.parent_path();
         parent != child && is_within(parent, root) && parent != root;
         child = parent, parent = child.parent_path()) {
        queue.push_back(PendingTarget{.target = object_path.lexically_relative(parent).generic_string(),
                                      .directory = parent,
                                      .subdir = child.filename().string(),
                                      .source_target = object_name});
    }

    std::set<std::string> visited;
    const auto add_edge = [&trace](TraceEdge edge) {
        if (std::ranges::find(trace.edges, edge) == trace.edges.end()) {
            trace.edges.push_back(std::move(edge));
        }
    };

    while (!queue.empty()) {
        PendingTarget pending = std::move(queue.front());
        queue.pop_front();
        const std::string directory = pending.directory.generic_string();
        if (!visited.insert(std::format("{}@{}", pending.target, directory)).second) {
            continue;
        }
        const std::filesystem::path makefile = pending.directory / "Makefile";
        if (!std::filesystem::exists(makefile, ec)) {
            continue;
        }
        auto lines = read_makefile_lines(makefile);
        if (!lines) {
            return std::unexpected(lines.error());
        }
        const ScanResult scan = scan_makefile(*lines, pending.target, pending.subdir);

        for (const std::string& config : scan.configs) {
            trace.symbols.insert(config);
            add_edge(TraceEdge{
                .src = std::format("{}@{}", pending.source_target, file_dir.generic_string()),
                .dst = std::format("CONFIG:{}", config),
                .via = std::string(pending.subdir ? kViaDirectoryGate : kViaMakefileRule)});
        }
        for (const std::string& container : scan.containers) {
            if (!trace.objects.insert(container).second) {
                continue;
            }
            add_edge(TraceEdge{.src = std::format("{}@{}", pending.target, directory),
                               .dst = std::format("{}@{}", container, directory),
                               .via = std::string(pending.subdir ? kViaParentContainer : kViaContainer)});
            queue.push_back(PendingTarget{.target = container,
                                          .directory = pending.directory,
                                          .subdir = std::nullopt,
                                          .source_target = pending.source_target});
        }
    }
    return trace;
}

}  // namespace kcfgvex::kbuild
