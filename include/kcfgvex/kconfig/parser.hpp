#pragma once

/**
 * @file parser.hpp
 * @brief Kconfig source parser
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/kconfig/symbol.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace kcfgvex::kconfig {

/// Recoverable per-file problem; the entry or directive was skipped
struct ParseDiagnostic
{
    std::string file;
    int line = 0;
    std::string code;
    std::string message;

    [[nodiscard]] std::string to_string() const;
};

struct ParseResult
{
    SymbolTable symbols;
    std::vector<ParseDiagnostic> diagnostics;
    std::vector<std::string> files;  ///< every file read, in read order
    std::string mainmenu;
};

/**
 * Reads a Kconfig file by its tree-relative (or absolute) path.
 * Returns the file contents or an IOError.
 */
using SourceResolver = std::function<kcfgvex::Result<std::string>(const std::string& path)>;

struct ParseOptions
{
    /// Values for `$(NAME)` references in source directives (e.g. SRCARCH)
    std::map<std::string, std::string> variables;
};

/**
 * @brief Parser for a Kconfig tree
 *
 * Malformed entries and unreadable `source` files are reported as
 * diagnostics and skipped. Only an unreadable root file is fatal.
 */
class KconfigParser
{
public:
    explicit KconfigParser(SourceResolver resolver, ParseOptions options = {});

    [[nodiscard]] kcfgvex::Result<ParseResult> parse(const std::string& root_path) const;

private:
    SourceResolver m_resolver;
    ParseOptions m_options;
};

/// Resolver reading files relative to a kernel source tree
[[nodiscard]] SourceResolver make_directory_resolver(std::filesystem::path base_dir);

/// Resolver over in-memory files keyed by normalized path
[[nodiscard]] SourceResolver make_memory_resolver(std::map<std::string, std::string> files);

}  // namespace kcfgvex::kconfig
