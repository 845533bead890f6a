/**
 * @file main.cpp
 * @brief kcfgvex CLI entry point
 *
 * Commands:
 *   eval      - Resolve symbols or an expression against a .config
 *   vex       - Synthesize a CycloneDX VEX document for a CVE batch
 *   graph     - Show the dependency closure of symbols
 *   trace     - Show the Kbuild gates of source files
 *   version   - Show version information
 */

#include "kcfgvex/canonical_json.hpp"
#include "kcfgvex/common.hpp"
#include "kcfgvex/cve.hpp"
#include "kcfgvex/kbuild.hpp"
#include "kcfgvex/kconfig/build_state.hpp"
#include "kcfgvex/kconfig/evaluator.hpp"
#include "kcfgvex/kconfig/graph.hpp"
#include "kcfgvex/print.hpp"
#include "kcfgvex/report/explain.hpp"
#include "kcfgvex/run_config.hpp"
#include "kcfgvex/sbom.hpp"
#include "kcfgvex/schema_validate.hpp"
#include "kcfgvex/version.hpp"
#include "kcfgvex/vex.hpp"

#include <charconv>
#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_version()
{
    std::println("kcfgvex {} ({})", kcfgvex::kVersion, kcfgvex::kBuildId);
    std::println("  cyclonedx: {}", kcfgvex::kDefaultCycloneDxSpecVersion);
}

void print_help()
{
    std::print(R"(kcfgvex - Kconfig dependency tracer and VEX generator

Usage: kcfgvex <command> [options]

Commands:
  eval        Resolve symbols or an expression against a .config
  vex         Produce a CycloneDX VEX document for a batch of CVEs
  graph       Show the dependency closure of symbols (DOT or JSON)
  trace       Show the CONFIG_ symbols gating kernel source files
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'kcfgvex <command> --help' for command-specific options.
)");
}

void print_eval_help()
{
    std::print(R"(Usage: kcfgvex eval [options] SYMBOL...

Resolve symbols against a .config and report the reachability verdict

Options:
  --kconfig FILE            Root Kconfig file (required)
  --dotconfig FILE          Kernel .config (required)
  --srctree DIR             Base directory for source directives
  --srcarch ARCH            Value of $(SRCARCH) and $(ARCH)
  --expr EXPR               Evaluate a Kconfig expression instead of symbols
  --json                    Print the trace as JSON
  --quiet                   Suppress progress lines
  --verbose                 Print every parse diagnostic
  --help, -h                Show this help
)");
}

void print_vex_help()
{
    std::print(R"(Usage: kcfgvex vex [options] [CVE-ID...]

Produce a CycloneDX VEX document for a batch of CVEs

Options:
  --yocto FILE              Yocto cve-check summary; adds unpatched CVEs
  --cve-dir DIR             Directory of <CVE-ID>.json records (required)
  --kconfig FILE            Root Kconfig file (required)
  --dotconfig FILE          Kernel .config (required)
  --srctree DIR             Kernel source tree (symbols from programFiles)
  --srcarch ARCH            Value of $(SRCARCH) and $(ARCH)
  --sbom FILE               CycloneDX SBOM to link affected components
  --component NAME          SBOM component to link (default: linux_kernel)
  --spec-version VER        CycloneDX spec version (default: 1.4)
  --jobs N, -j N            Number of parallel evaluations (default: 1)
  --timestamp TS            Document timestamp (default: now, UTC)
  --split                   Write one vex_<state>.json per state into --out
  --pairs-out FILE          Write "<CVE-ID> CONFIG_<SYMBOL>" lines
  --out PATH, -o            Output file, or directory with --split
  --config FILE             JSON run configuration (flags override it)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --pretty                  Indent JSON output
  --quiet                   Suppress progress lines
  --verbose                 Print diagnostics and per-CVE results
  --help, -h                Show this help

Output:
  VEX document on stdout, or <out>, or <out>/vex_<state>.json
)");
}

void print_graph_help()
{
    std::print(R"(Usage: kcfgvex graph [options] SYMBOL...

Show the dependency closure of symbols

Options:
  --kconfig FILE            Root Kconfig file (required)
  --srctree DIR             Base directory for source directives
  --srcarch ARCH            Value of $(SRCARCH) and $(ARCH)
  --json                    Describe each symbol as JSON instead of DOT
  --help, -h                Show this help
)");
}

void print_trace_help()
{
    std::print(R"(Usage: kcfgvex trace [options] FILE...

Show the CONFIG_ symbols gating kernel source files

Options:
  --srctree DIR             Kernel source tree (required)
  --json                    Print traces as JSON
  --help, -h                Show this help
)");
}

struct TreeOptions
{
    std::string kconfig;
    std::string srctree;
    std::string srcarch;
    std::map<std::string, std::string> variables;
};

struct OutputFlags
{
    bool quiet = false;
    bool verbose = false;
};

struct EvalOptions
{
    TreeOptions tree;
    std::string dotconfig;
    std::optional<std::string> expression;
    std::vector<std::string> symbols;
    bool json = false;
    OutputFlags flags;
    bool show_help = false;
};

/// Optional members are unset unless given on the command line
struct VexOptions
{
    std::vector<std::string> cve_ids;
    std::optional<std::string> yocto;
    std::optional<std::string> cve_dir;
    std::optional<std::string> kconfig;
    std::optional<std::string> dotconfig;
    std::optional<std::string> srctree;
    std::optional<std::string> srcarch;
    std::optional<std::string> sbom;
    std::optional<std::string> component;
    std::optional<std::string> spec_version;
    std::optional<std::size_t> jobs;
    std::optional<std::string> timestamp;
    std::optional<bool> split;
    std::optional<std::string> pairs_out;
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::string schema_dir = "schemas";
    bool pretty = false;
    OutputFlags flags;
    bool show_help = false;
};

struct GraphOptions
{
    TreeOptions tree;
    std::vector<std::string> symbols;
    bool json = false;
    bool show_help = false;
};

struct TraceOptions
{
    std::string srctree;
    std::vector<std::string> files;
    bool json = false;
    bool show_help = false;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> kcfgvex::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(kcfgvex::Error::make(
            "MissingArgument",
            std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] kcfgvex::Result<std::size_t> parse_jobs_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(kcfgvex::Error::make(
            "InvalidArgument",
            std::string("Invalid --jobs value: ") + std::string(value)));
    }
    return parsed;
}

/// Shared handling of the Kconfig tree options
[[nodiscard]] auto set_tree_option(std::string_view arg,
                                   // CLI parsing signature is stable.
                                   // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                   std::span<char*> args,
                                   std::size_t idx,
                                   TreeOptions& options,
                                   bool& skip_next) -> kcfgvex::Result<bool>
{
    std::string* target = nullptr;
    if (arg == "--kconfig") {
        target = &options.kconfig;
    } else if (arg == "--srctree") {
        target = &options.srctree;
    } else if (arg == "--srcarch") {
        target = &options.srcarch;
    }
    if (target == nullptr) {
        return kcfgvex::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    *target = *value;
    skip_next = true;
    return kcfgvex::Result<bool>{true};
}

[[nodiscard]] bool set_output_flag(std::string_view arg, OutputFlags& flags)
{
    if (arg == "--quiet" || arg == "-q") {
        flags.quiet = true;
        return true;
    }
    if (arg == "--verbose") {
        flags.verbose = true;
        return true;
    }
    return false;
}

[[nodiscard]] kcfgvex::Result<EvalOptions> parse_eval_args(std::span<char*> args)
{
    EvalOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--json") {
            options.json = true;
            continue;
        }
        if (set_output_flag(arg, options.flags)) {
            continue;
        }
        auto handled = set_tree_option(arg, args, idx, options.tree, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg == "--dotconfig" || arg == "--expr") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--dotconfig") {
                options.dotconfig = *value;
            } else {
                options.expression = *value;
            }
            skip_next = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                kcfgvex::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        options.symbols.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] auto set_vex_value_option(std::string_view arg,
                                        // CLI parsing signature is stable.
                                        // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                        std::span<char*> args,
                                        std::size_t idx,
                                        VexOptions& options,
                                        bool& skip_next) -> kcfgvex::Result<bool>
{
    std::optional<std::string>* target = nullptr;
    if (arg == "--yocto") {
        target = &options.yocto;
    } else if (arg == "--cve-dir") {
        target = &options.cve_dir;
    } else if (arg == "--kconfig") {
        target = &options.kconfig;
    } else if (arg == "--dotconfig") {
        target = &options.dotconfig;
    } else if (arg == "--srctree") {
        target = &options.srctree;
    } else if (arg == "--srcarch") {
        target = &options.srcarch;
    } else if (arg == "--sbom") {
        target = &options.sbom;
    } else if (arg == "--component") {
        target = &options.component;
    } else if (arg == "--spec-version") {
        target = &options.spec_version;
    } else if (arg == "--timestamp") {
        target = &options.timestamp;
    } else if (arg == "--pairs-out") {
        target = &options.pairs_out;
    } else if (arg == "--out" || arg == "-o") {
        target = &options.output;
    } else if (arg == "--config") {
        target = &options.config;
    }

    if (target == nullptr && arg != "--schema-dir" && arg != "--jobs" && arg != "-j") {
        return kcfgvex::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;
    if (target != nullptr) {
        *target = *value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else {
        auto parsed = parse_jobs_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = *parsed;
    }
    return kcfgvex::Result<bool>{true};
}

[[nodiscard]] kcfgvex::Result<VexOptions> parse_vex_args(std::span<char*> args)
{
    VexOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--split") {
            options.split = true;
            continue;
        }
        if (arg == "--pretty") {
            options.pretty = true;
            continue;
        }
        if (set_output_flag(arg, options.flags)) {
            continue;
        }
        auto handled = set_vex_value_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                kcfgvex::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        options.cve_ids.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] kcfgvex::Result<GraphOptions> parse_graph_args(std::span<char*> args)
{
    GraphOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--json") {
            options.json = true;
            continue;
        }
        auto handled = set_tree_option(arg, args, idx, options.tree, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                kcfgvex::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        options.symbols.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] kcfgvex::Result<TraceOptions> parse_trace_args(std::span<char*> args)
{
    TraceOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--json") {
            options.json = true;
            continue;
        }
        if (arg == "--srctree") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.srctree = *value;
            skip_next = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                kcfgvex::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        options.files.emplace_back(arg);
    }
    return options;
}

// ============================================================================
// Shared helpers
// ============================================================================

/**
 * Parse the Kconfig tree. Without --srctree the directory of the root
 * Kconfig is the base for source directives.
 */
[[nodiscard]] kcfgvex::Result<kcfgvex::kconfig::DependencyGraph>
load_graph(const TreeOptions& tree, const OutputFlags& flags, std::string_view tag)
{
    std::filesystem::path root(tree.kconfig);
    kcfgvex::kconfig::LoadOptions load{.srcarch = tree.srcarch, .variables = tree.variables};
    if (tree.srctree.empty()) {
        load.srctree = root.has_parent_path() ? root.parent_path() : std::filesystem::path(".");
        root = root.filename();
    } else {
        load.srctree = tree.srctree;
        const std::filesystem::path relative = root.lexically_relative(load.srctree);
        if (!relative.empty() && !relative.string().starts_with("..")) {
            root = relative;
        }
    }

    auto graph = kcfgvex::kconfig::load_dependency_graph(root.generic_string(), load);
    if (!graph) {
        return graph;
    }
    if (!flags.quiet) {
        std::println("[{}] {} symbols from {} Kconfig files ({} diagnostics)",
                     tag,
                     graph->size(),
                     graph->files().size(),
                     graph->diagnostics().size());
    }
    if (flags.verbose) {
        for (const auto& diagnostic : graph->diagnostics()) {
            std::println(stderr, "warning: {}", diagnostic.to_string());
        }
    }
    return graph;
}

[[nodiscard]] kcfgvex::VoidResult print_json(const nlohmann::json& payload, bool pretty)
{
    if (pretty) {
        std::println("{}", payload.dump(2));
        return {};
    }
    auto canonical = kcfgvex::canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::println("{}", *canonical);
    return {};
}

[[nodiscard]] std::string current_timestamp()
{
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

[[nodiscard]] kcfgvex::VoidResult write_lines(const std::filesystem::path& path,
                                              const std::vector<std::string>& lines)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            kcfgvex::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    for (const std::string& line : lines) {
        out << line << '\n';
    }
    if (!out) {
        return std::unexpected(
            kcfgvex::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

// ============================================================================
// eval
// ============================================================================

int run_eval(const EvalOptions& options)
{
    auto graph = load_graph(options.tree, options.flags, "eval");
    if (!graph) {
        std::println(stderr, "Error: {}", graph.error().message);
        return 1;
    }
    auto state = kcfgvex::kconfig::BuildState::from_path(options.dotconfig);
    if (!state) {
        std::println(stderr, "Error: {}", state.error().message);
        return 1;
    }

    const kcfgvex::kconfig::Evaluator evaluator(*graph, *state);
    auto trace = options.expression ? evaluator.evaluate_expression(*options.expression)
                                    : evaluator.evaluate(options.symbols);
    if (!trace) {
        std::println(stderr, "Error: {}", trace.error().message);
        return 1;
    }

    if (options.json) {
        if (auto printed = print_json(kcfgvex::report::trace_to_json(*trace), true); !printed) {
            std::println(stderr, "Error: {}", printed.error().message);
            return 1;
        }
        return 0;
    }
    std::print("{}", kcfgvex::report::render_trace_text(*trace));
    return 0;
}

int cmd_eval(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_eval_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_eval_help();
        return 0;
    }
    if (options->tree.kconfig.empty() || options->dotconfig.empty()) {
        std::println(stderr, "Error: --kconfig and --dotconfig are required");
        print_eval_help();
        return 1;
    }
    if (options->symbols.empty() && !options->expression) {
        std::println(stderr, "Error: at least one SYMBOL or --expr is required");
        print_eval_help();
        return 1;
    }
    return run_eval(*options);
}

// ============================================================================
// vex
// ============================================================================

template <typename T>
void fill_from_config(std::optional<T>& option, const std::optional<T>& configured)
{
    if (!option && configured) {
        option = configured;
    }
}

void fill_path_from_config(std::optional<std::string>& option,
                           const std::optional<std::filesystem::path>& configured)
{
    if (!option && configured) {
        option = configured->string();
    }
}

[[nodiscard]] kcfgvex::VoidResult apply_run_config(VexOptions& options,
                                                   std::map<std::string, std::string>& variables)
{
    if (!options.config) {
        return {};
    }
    auto config = kcfgvex::load_run_config(*options.config, options.schema_dir);
    if (!config) {
        return std::unexpected(config.error());
    }
    fill_path_from_config(options.kconfig, config->kconfig);
    fill_path_from_config(options.srctree, config->srctree);
    fill_path_from_config(options.dotconfig, config->dotconfig);
    fill_path_from_config(options.cve_dir, config->cve_dir);
    fill_path_from_config(options.sbom, config->sbom);
    fill_from_config(options.srcarch, config->srcarch);
    fill_from_config(options.component, config->component);
    fill_from_config(options.spec_version, config->spec_version);
    fill_from_config(options.jobs, config->jobs);
    fill_from_config(options.split, config->split_output);
    variables = config->variables;
    return {};
}

/// Positional ids first, then unpatched Yocto ids, each id once
[[nodiscard]] kcfgvex::Result<std::vector<std::string>> collect_cve_ids(const VexOptions& options)
{
    std::vector<std::string> ids;
    std::set<std::string> seen;
    const auto add = [&ids, &seen](const std::string& id) {
        std::string trimmed = kcfgvex::common::trim(id);
        if (!trimmed.empty() && seen.insert(trimmed).second) {
            ids.push_back(std::move(trimmed));
        }
    };
    for (const std::string& id : options.cve_ids) {
        add(id);
    }
    if (options.yocto) {
        auto yocto = kcfgvex::cve::load_yocto_summary(*options.yocto);
        if (!yocto) {
            return std::unexpected(yocto.error());
        }
        if (!options.flags.quiet) {
            std::println("[vex] yocto summary: {} unpatched, {} patched",
                         yocto->unpatched.size(),
                         yocto->patched.size());
        }
        for (const std::string& id : yocto->unpatched) {
            add(id);
        }
    }
    return ids;
}

[[nodiscard]] kcfgvex::VoidResult write_vex_output(const VexOptions& options,
                                                   const kcfgvex::vex::VexDocument& document)
{
    const auto style =
        options.pretty ? kcfgvex::canonical::JsonStyle::kPretty : kcfgvex::canonical::JsonStyle::kCanonical;
    if (options.split.value_or(false)) {
        const std::filesystem::path directory = options.output.value_or(".");
        auto written = kcfgvex::vex::write_split_documents(document, directory);
        if (!written) {
            return std::unexpected(written.error());
        }
        if (!options.flags.quiet) {
            for (const auto& path : *written) {
                std::println("  output: {}", path.string());
            }
        }
        return {};
    }
    if (!options.output) {
        return print_json(document.to_json(), options.pretty);
    }
    if (auto result = kcfgvex::canonical::write_json_file(*options.output, document.to_json(), style);
        !result) {
        return result;
    }
    if (!options.flags.quiet) {
        std::println("  output: {}", *options.output);
    }
    return {};
}

int run_vex(VexOptions options)
{
    std::map<std::string, std::string> variables;
    if (auto applied = apply_run_config(options, variables); !applied) {
        std::println(stderr, "Error: {}", applied.error().message);
        return 1;
    }
    if (!options.kconfig || !options.dotconfig || !options.cve_dir) {
        std::println(stderr, "Error: --kconfig, --dotconfig and --cve-dir are required");
        print_vex_help();
        return 1;
    }

    auto ids = collect_cve_ids(options);
    if (!ids) {
        std::println(stderr, "Error: {}", ids.error().message);
        return 1;
    }
    if (ids->empty()) {
        std::println(stderr, "Error: no CVE ids given (positional or --yocto)");
        return 1;
    }

    const TreeOptions tree{.kconfig = *options.kconfig,
                           .srctree = options.srctree.value_or(""),
                           .srcarch = options.srcarch.value_or(""),
                           .variables = std::move(variables)};
    auto graph = load_graph(tree, options.flags, "vex");
    if (!graph) {
        std::println(stderr, "Error: {}", graph.error().message);
        return 1;
    }
    auto state = kcfgvex::kconfig::BuildState::from_path(*options.dotconfig);
    if (!state) {
        std::println(stderr, "Error: {}", state.error().message);
        return 1;
    }

    std::optional<kcfgvex::vex::SbomIndex> sbom;
    if (options.sbom) {
        auto loaded = kcfgvex::vex::SbomIndex::from_path(*options.sbom);
        if (!loaded) {
            std::println(stderr, "Error: {}", loaded.error().message);
            return 1;
        }
        sbom = std::move(*loaded);
    }

    std::optional<std::filesystem::path> srctree;
    if (options.srctree) {
        srctree = *options.srctree;
    }
    kcfgvex::cve::DirectoryCveSource source(*options.cve_dir, srctree);
    std::vector<kcfgvex::vex::CveInput> inputs;
    inputs.reserve(ids->size());
    for (const std::string& id : *ids) {
        auto record = source.fetch(id, false);
        if (!record) {
            std::println(stderr, "warning: {}: {}", id, record.error().message);
        }
        inputs.push_back(kcfgvex::vex::CveInput{.cve_id = id, .record = std::move(record)});
    }

    const kcfgvex::kconfig::Evaluator evaluator(*graph, *state);
    const kcfgvex::vex::SynthesisOptions synthesis{
        .timestamp = options.timestamp.value_or(current_timestamp()),
        .spec_version = options.spec_version.value_or(kcfgvex::kDefaultCycloneDxSpecVersion),
        .component = options.component.value_or("linux_kernel"),
        .jobs = options.jobs.value_or(1),
    };
    const kcfgvex::vex::VexDocument document =
        kcfgvex::vex::synthesize(std::span<const kcfgvex::vex::CveInput>(inputs),
                                 kcfgvex::vex::make_evaluate_fn(evaluator),
                                 sbom ? &*sbom : nullptr,
                                 synthesis);

    const std::string schema_path =
        (std::filesystem::path(options.schema_dir) / "vex.v1.schema.json").string();
    if (auto valid = kcfgvex::common::validate_json(document.to_json(), schema_path); !valid) {
        std::println(stderr, "Error: VEX document failed schema validation: {}", valid.error().message);
        return 1;
    }

    if (options.flags.verbose) {
        for (const kcfgvex::vex::VexEntry& entry : document.entries) {
            if (!entry.trace) {
                std::println(stderr, "{}: {}: {}", entry.cve_id, kcfgvex::vex::to_string(entry.state), entry.detail);
                continue;
            }
            std::println(stderr, "{}: {}", entry.cve_id, kcfgvex::vex::to_string(entry.state));
            std::print(stderr, "{}", kcfgvex::report::render_trace_text(*entry.trace));
        }
    }
    if (options.pairs_out) {
        if (auto written = write_lines(*options.pairs_out, kcfgvex::vex::cve_symbol_pairs(inputs)); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
    }
    if (auto written = write_vex_output(options, document); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }

    if (!options.flags.quiet) {
        std::size_t exploitable = 0;
        std::size_t in_triage = 0;
        std::size_t not_affected = 0;
        for (const kcfgvex::vex::VexEntry& entry : document.entries) {
            switch (entry.state) {
                case kcfgvex::vex::VexState::kExploitable:
                    ++exploitable;
                    break;
                case kcfgvex::vex::VexState::kInTriage:
                    ++in_triage;
                    break;
                case kcfgvex::vex::VexState::kNotAffected:
                    ++not_affected;
                    break;
            }
        }
        std::println("[vex] {} CVEs: {} exploitable, {} in_triage, {} not_affected",
                     document.entries.size(),
                     exploitable,
                     in_triage,
                     not_affected);
    }
    return 0;
}

int cmd_vex(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_vex_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_vex_help();
        return 0;
    }
    // Progress lines would corrupt a document printed to stdout.
    if (!options->output && !options->split.value_or(false)) {
        options->flags.quiet = true;
    }
    return run_vex(std::move(*options));
}

// ============================================================================
// graph
// ============================================================================

int run_graph(const GraphOptions& options)
{
    auto graph = load_graph(options.tree, OutputFlags{.quiet = true}, "graph");
    if (!graph) {
        std::println(stderr, "Error: {}", graph.error().message);
        return 1;
    }
    if (!options.json) {
        std::print("{}", kcfgvex::report::render_dependency_dot(*graph, options.symbols));
        return 0;
    }
    nlohmann::json described = nlohmann::json::array();
    for (const std::string& name : options.symbols) {
        auto symbol = kcfgvex::report::describe_symbol(*graph, name);
        if (!symbol) {
            std::println(stderr, "Error: {}", symbol.error().message);
            return 1;
        }
        described.push_back(std::move(*symbol));
    }
    std::println("{}", described.dump(2));
    return 0;
}

int cmd_graph(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_graph_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_graph_help();
        return 0;
    }
    if (options->tree.kconfig.empty() || options->symbols.empty()) {
        std::println(stderr, "Error: --kconfig and at least one SYMBOL are required");
        print_graph_help();
        return 1;
    }
    return run_graph(*options);
}

// ============================================================================
// trace
// ============================================================================

[[nodiscard]] nlohmann::json trace_json(const kcfgvex::kbuild::KbuildTrace& trace)
{
    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : trace.edges) {
        edges.push_back({{"src", edge.src}, {"dst", edge.dst}, {"via", edge.via}});
    }
    nlohmann::json out = {
        {"file", trace.file},
        {"objects", trace.objects},
        {"symbols", trace.symbols},
        {"edges", std::move(edges)},
    };
    if (trace.error) {
        out["error"] = *trace.error;
    }
    return out;
}

int run_trace(const TraceOptions& options)
{
    nlohmann::json traces = nlohmann::json::array();
    for (const std::string& file : options.files) {
        auto trace = kcfgvex::kbuild::trace_kbuild_gates(file, options.srctree);
        if (!trace) {
            std::println(stderr, "Error: {}", trace.error().message);
            return 1;
        }
        if (options.json) {
            traces.push_back(trace_json(*trace));
            continue;
        }
        if (trace->error) {
            std::println(stderr, "warning: {}", *trace->error);
            continue;
        }
        std::println("[trace] {}", trace->file);
        for (const std::string& symbol : trace->symbols) {
            std::println("  {}", symbol);
        }
        for (const auto& edge : trace->edges) {
            std::println("    {} -> {} ({})", edge.src, edge.dst, edge.via);
        }
    }
    if (options.json) {
        std::println("{}", traces.dump(2));
    }
    return 0;
}

int cmd_trace(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_trace_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_trace_help();
        return 0;
    }
    if (options->srctree.empty() || options->files.empty()) {
        std::println(stderr, "Error: --srctree and at least one FILE are required");
        print_trace_help();
        return 1;
    }
    return run_trace(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "eval") {
            return cmd_eval(sub_argc, sub_argv);
        }
        if (cmd == "vex") {
            return cmd_vex(sub_argc, sub_argv);
        }
        if (cmd == "graph") {
            return cmd_graph(sub_argc, sub_argv);
        }
        if (cmd == "trace") {
            return cmd_trace(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
