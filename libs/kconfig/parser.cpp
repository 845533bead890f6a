/**
 * @file parser.cpp
 * @brief Kconfig source parser
 *
 * The parser is line oriented. Each `config`/`menuconfig` entry collects
 * its attributes into a pending definition that is merged into the symbol
 * table when the next entry, block delimiter or end of file is reached.
 * `menu`, `if` and `choice` blocks contribute their dependency guards to
 * every entry they enclose, including entries in sourced files.
 */

#include "kcfgvex/kconfig/parser.hpp"

#include "lexer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <span>
#include <sstream>
#include <string_view>
#include <utility>

namespace kcfgvex::kconfig {

namespace {

using detail::Token;
using detail::TokenKind;

enum class BlockKind { kMenu, kIf, kChoice };

[[nodiscard]] std::string_view to_string(BlockKind kind) noexcept
{
    switch (kind) {
        case BlockKind::kMenu:
            return "menu";
        case BlockKind::kIf:
            return "if";
        case BlockKind::kChoice:
            return "choice";
    }
    return "menu";
}

struct ChoiceDefault
{
    std::string member;
    ExprPtr condition;
};

struct Block
{
    BlockKind kind = BlockKind::kMenu;
    ExprPtr guard;
    SourceLocation location;
    std::string choice_label;
    std::vector<ChoiceDefault> choice_defaults;
    std::vector<SymbolId> members;
    std::optional<SymbolKind> member_kind;
    bool optional = false;
};

enum class EntryKind { kNone, kConfig, kMenu, kChoice, kComment };

struct PendingEntry
{
    EntryKind kind = EntryKind::kNone;
    SymbolId id = 0;
    SourceLocation location;
    std::optional<SymbolKind> declared_kind;
    std::optional<std::string> prompt;
    ExprPtr prompt_condition;
    ExprPtr depends;
    std::vector<DefaultRule> defaults;
    std::vector<SelectClause> selects;
    std::vector<SelectClause> implies;
    std::vector<RangeRule> ranges;
    bool has_help = false;
};

struct Line
{
    int number = 0;
    std::string text;
};

/// Split into logical lines, joining trailing-backslash continuations
[[nodiscard]] std::vector<Line> split_lines(const std::string& content)
{
    std::vector<Line> lines;
    std::istringstream stream(content);
    std::string raw;
    int number = 0;
    std::string pending;
    int pending_start = 0;
    while (std::getline(stream, raw)) {
        ++number;
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        if (pending.empty()) {
            pending_start = number;
        }
        if (!raw.empty() && raw.back() == '\\') {
            raw.pop_back();
            pending += raw;
            pending.push_back(' ');
            continue;
        }
        pending += raw;
        lines.push_back(Line{.number = pending_start, .text = std::move(pending)});
        pending.clear();
    }
    if (!pending.empty()) {
        lines.push_back(Line{.number = pending_start, .text = std::move(pending)});
    }
    return lines;
}

/// Indentation width with tabs expanded to 8 columns
[[nodiscard]] int indentation(std::string_view text) noexcept
{
    int width = 0;
    for (char c : text) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else {
            break;
        }
    }
    return width;
}

[[nodiscard]] bool is_blank(std::string_view text) noexcept
{
    return std::ranges::all_of(
        text, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

[[nodiscard]] bool is_symbol_name(std::string_view name) noexcept
{
    return !name.empty() && std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

class ParseSession
{
public:
    ParseSession(const SourceResolver& resolver, const ParseOptions& options)
        : m_resolver(resolver)
        , m_options(options)
    {}

    [[nodiscard]] kcfgvex::Result<ParseResult> run(const std::string& root_path)
    {
        const std::string root = common::normalize_path(root_path);
        auto content = m_resolver(root);
        if (!content) {
            return std::unexpected(Error::make(
                "IOError",
                std::format("Failed to read Kconfig root {}: {}", root, content.error().message)));
        }
        m_result.files.push_back(root);
        parse_file(root, *content);
        return std::move(m_result);
    }

private:
    void diagnose(const SourceLocation& location, std::string code, std::string message)
    {
        m_result.diagnostics.push_back(ParseDiagnostic{.file = location.file,
                                                       .line = location.line,
                                                       .code = std::move(code),
                                                       .message = std::move(message)});
    }

    void parse_file(const std::string& path, const std::string& content)
    {
        m_include_stack.push_back(path);
        const std::size_t base_depth = m_blocks.size();
        m_include_depths.push_back(base_depth);
        bool in_help = false;
        int help_indent = -1;

        for (const Line& line : split_lines(content)) {
            const SourceLocation location{.file = path, .line = line.number};
            if (in_help) {
                if (is_blank(line.text)) {
                    continue;
                }
                const int indent = indentation(line.text);
                if (help_indent < 0 && indent > 0) {
                    help_indent = indent;
                    continue;
                }
                if (help_indent >= 0 && indent >= help_indent) {
                    continue;
                }
                in_help = false;
            }
            if (process_line(location, line.text)) {
                in_help = true;
                help_indent = -1;
            }
        }

        commit_entry();
        while (m_blocks.size() > base_depth) {
            const Block& open = m_blocks.back();
            diagnose(open.location,
                     "UnbalancedBlock",
                     std::format("'{}' block is not closed before end of file", to_string(open.kind)));
            close_block(open.kind);
        }
        m_include_depths.pop_back();
        m_include_stack.pop_back();
    }

    /// @return true when the line starts a help text block
    [[nodiscard]] bool process_line(const SourceLocation& location, const std::string& text)
    {
        const std::string line = common::trim(text);
        if (line.empty() || line.front() == '#') {
            return false;
        }
        const std::size_t split = line.find_first_of(" \t");
        const std::string keyword = line.substr(0, split);
        const std::string rest =
            split == std::string::npos ? std::string() : common::trim(line.substr(split));

        if (keyword == "config" || keyword == "menuconfig") {
            start_config(location, rest);
        } else if (keyword == "choice") {
            commit_entry();
            Block block{.kind = BlockKind::kChoice,
                        .location = location,
                        .choice_label = rest.empty() ? std::format("<choice>@{}", location.to_string())
                                                     : rest};
            m_blocks.push_back(std::move(block));
            m_entry = PendingEntry{.kind = EntryKind::kChoice, .location = location};
        } else if (keyword == "endchoice") {
            commit_entry();
            end_block(location, BlockKind::kChoice);
        } else if (keyword == "menu") {
            commit_entry();
            m_blocks.push_back(Block{.kind = BlockKind::kMenu, .location = location});
            m_entry = PendingEntry{.kind = EntryKind::kMenu, .location = location};
        } else if (keyword == "endmenu") {
            commit_entry();
            end_block(location, BlockKind::kMenu);
        } else if (keyword == "if") {
            commit_entry();
            Block block{.kind = BlockKind::kIf, .location = location};
            if (auto guard = parse_expr_text(location, rest)) {
                block.guard = *guard;
            }
            m_blocks.push_back(std::move(block));
        } else if (keyword == "endif") {
            commit_entry();
            end_block(location, BlockKind::kIf);
        } else if (keyword == "comment") {
            commit_entry();
            m_entry = PendingEntry{.kind = EntryKind::kComment, .location = location};
        } else if (keyword == "mainmenu") {
            commit_entry();
            if (auto tokens = tokenize_checked(location, rest); tokens && !tokens->empty()) {
                m_result.mainmenu = tokens->front().text;
            }
        } else if (keyword == "source" || keyword == "rsource" || keyword == "osource"
                   || keyword == "orsource") {
            commit_entry();
            include_source(location, keyword, rest);
        } else {
            return process_attribute(location, keyword, rest);
        }
        return false;
    }

    void start_config(const SourceLocation& location, const std::string& rest)
    {
        commit_entry();
        if (!is_symbol_name(rest)) {
            diagnose(location, "InvalidSymbolName", std::format("invalid symbol name '{}'", rest));
            m_entry = PendingEntry{.kind = EntryKind::kComment, .location = location};
            return;
        }
        const SymbolId id = m_result.symbols.get_or_create(rest);
        m_entry = PendingEntry{.kind = EntryKind::kConfig, .id = id, .location = location};
        for (auto it = m_blocks.rbegin(); it != m_blocks.rend(); ++it) {
            if (it->kind == BlockKind::kChoice) {
                it->members.push_back(id);
                m_result.symbols.at(id).choice = it->choice_label;
                break;
            }
        }
    }

    /// @return true when the attribute opens a help text block
    [[nodiscard]] bool process_attribute(const SourceLocation& location,
                                         const std::string& keyword,
                                         const std::string& rest)
    {
        if (keyword == "help" || keyword == "---help---") {
            m_entry.has_help = true;
            return true;
        }
        if (m_entry.kind == EntryKind::kNone) {
            diagnose(location,
                     "UnknownDirective",
                     std::format("unexpected '{}' outside of an entry", keyword));
            return false;
        }

        if (auto kind = parse_symbol_kind(keyword)) {
            parse_type(location, *kind, rest);
        } else if (keyword == "def_bool" || keyword == "def_tristate") {
            const SymbolKind kind = keyword == "def_bool" ? SymbolKind::kBool : SymbolKind::kTristate;
            auto tokens = tokenize_checked(location, rest);
            if (!tokens) {
                m_entry.declared_kind = kind;
                return false;
            }
            parse_type(location, kind, "");
            add_default(location, *tokens);
        } else if (keyword == "prompt") {
            parse_prompt(location, rest);
        } else if (keyword == "default") {
            if (auto tokens = tokenize_checked(location, rest)) {
                add_default(location, *tokens);
            }
        } else if (keyword == "depends") {
            std::string_view expr_text = rest;
            const bool has_on = expr_text.starts_with("on")
                                && (expr_text.size() == 2
                                    || std::isspace(static_cast<unsigned char>(expr_text[2])) != 0);
            if (has_on) {
                expr_text.remove_prefix(2);
            }
            if (auto guard = parse_expr_text(location, expr_text)) {
                add_dependency(*guard);
            }
        } else if (keyword == "select" || keyword == "imply") {
            add_select(location, keyword == "imply", rest);
        } else if (keyword == "range") {
            add_range(location, rest);
        } else if (keyword == "visible") {
            if (!rest.starts_with("if")) {
                diagnose(location, "UnknownDirective", "expected 'visible if'");
            }
        } else if (keyword == "optional") {
            if (!m_blocks.empty() && m_blocks.back().kind == BlockKind::kChoice
                && m_entry.kind == EntryKind::kChoice) {
                m_blocks.back().optional = true;
            }
        } else if (keyword == "option" || keyword == "modules" || keyword == "transitional"
                   || keyword == "allnoconfig_y" || keyword == "defconfig_list") {
            // Accepted; these do not affect value resolution.
        } else {
            diagnose(location, "UnknownDirective", std::format("unknown attribute '{}'", keyword));
        }
        return false;
    }

    void parse_type(const SourceLocation& location, SymbolKind kind, const std::string& rest)
    {
        if (m_entry.kind == EntryKind::kMenu || m_entry.kind == EntryKind::kComment) {
            diagnose(location, "UnknownDirective", "type declared outside of a config entry");
            return;
        }
        if (m_entry.kind == EntryKind::kChoice) {
            m_blocks.back().member_kind = kind;
        } else {
            m_entry.declared_kind = kind;
        }
        if (!rest.empty()) {
            parse_prompt(location, rest);
        }
    }

    void parse_prompt(const SourceLocation& location, const std::string& rest)
    {
        auto tokens = tokenize_checked(location, rest);
        if (!tokens || tokens->empty()) {
            return;
        }
        if (tokens->front().kind != TokenKind::kString) {
            diagnose(location, "ParseError", "prompt must be a quoted string");
            return;
        }
        ExprPtr condition;
        if (tokens->size() > 1) {
            if ((*tokens)[1].kind != TokenKind::kWord || (*tokens)[1].text != "if") {
                diagnose(location, "ParseError", "expected 'if' after prompt");
                return;
            }
            auto parsed = parse_tokens(location, std::span(*tokens).subspan(2));
            if (!parsed) {
                return;
            }
            condition = *parsed;
        }
        m_entry.prompt = tokens->front().text;
        m_entry.prompt_condition = condition;
    }

    void add_default(const SourceLocation& location, const std::vector<Token>& tokens)
    {
        auto parts = split_condition(location, tokens);
        if (!parts) {
            return;
        }
        auto [value, condition] = std::move(*parts);
        if (!value) {
            diagnose(location, "ParseError", "default without a value");
            return;
        }
        if (m_entry.kind == EntryKind::kChoice) {
            const auto* literal = std::get_if<Literal>(&value->node);
            if (literal == nullptr || literal->constant) {
                diagnose(location, "ParseError", "choice default must name a member symbol");
                return;
            }
            m_blocks.back().choice_defaults.push_back(
                ChoiceDefault{.member = literal->name, .condition = condition});
            return;
        }
        m_entry.defaults.push_back(
            DefaultRule{.value = value, .condition = condition, .location = location});
    }

    void add_dependency(const ExprPtr& guard)
    {
        switch (m_entry.kind) {
            case EntryKind::kConfig:
                m_entry.depends = make_and(m_entry.depends, guard);
                break;
            case EntryKind::kMenu:
            case EntryKind::kChoice:
                m_blocks.back().guard = make_and(m_blocks.back().guard, guard);
                break;
            case EntryKind::kComment:
            case EntryKind::kNone:
                break;
        }
    }

    void add_select(const SourceLocation& location, bool weak, const std::string& rest)
    {
        auto tokens = tokenize_checked(location, rest);
        if (!tokens) {
            return;
        }
        if (tokens->empty() || tokens->front().kind != TokenKind::kWord
            || !is_symbol_name(tokens->front().text)) {
            diagnose(location,
                     "ParseError",
                     std::format("'{}' needs a target symbol", weak ? "imply" : "select"));
            return;
        }
        ExprPtr condition;
        if (tokens->size() > 1) {
            if ((*tokens)[1].kind != TokenKind::kWord || (*tokens)[1].text != "if") {
                diagnose(location, "ParseError", "expected 'if' after select target");
                return;
            }
            auto parsed = parse_tokens(location, std::span(*tokens).subspan(2));
            if (!parsed) {
                return;
            }
            condition = *parsed;
        }
        if (m_entry.kind != EntryKind::kConfig) {
            diagnose(location, "UnknownDirective", "select outside of a config entry");
            return;
        }
        SelectClause clause{.target = common::canonical_symbol_name(tokens->front().text),
                            .condition = condition,
                            .location = location};
        (weak ? m_entry.implies : m_entry.selects).push_back(std::move(clause));
    }

    void add_range(const SourceLocation& location, const std::string& rest)
    {
        auto tokens = tokenize_checked(location, rest);
        if (!tokens) {
            return;
        }
        const bool operands_ok = tokens->size() >= 2
                                 && (*tokens)[0].kind == TokenKind::kWord
                                 && (*tokens)[1].kind == TokenKind::kWord;
        if (!operands_ok) {
            diagnose(location, "ParseError", "range needs two bounds");
            return;
        }
        ExprPtr condition;
        if (tokens->size() > 2) {
            if ((*tokens)[2].text != "if") {
                diagnose(location, "ParseError", "expected 'if' after range bounds");
                return;
            }
            auto parsed = parse_tokens(location, std::span(*tokens).subspan(3));
            if (!parsed) {
                return;
            }
            condition = *parsed;
        }
        m_entry.ranges.push_back(RangeRule{.low = make_literal((*tokens)[0].text, false),
                                           .high = make_literal((*tokens)[1].text, false),
                                           .condition = condition});
    }

    void include_source(const SourceLocation& location,
                        const std::string& keyword,
                        const std::string& rest)
    {
        const bool optional = keyword.front() == 'o';
        const bool relative = keyword == "rsource" || keyword == "orsource";

        auto tokens = tokenize_checked(location, rest);
        if (!tokens) {
            return;
        }
        if (tokens->size() != 1) {
            diagnose(location, "ParseError", std::format("{} expects one path", keyword));
            return;
        }
        auto expanded = expand_variables(location, tokens->front().text);
        if (!expanded) {
            return;
        }
        if (expanded->find_first_of("*?") != std::string::npos) {
            diagnose(location,
                     "UnsupportedGlob",
                     std::format("wildcard source '{}' is not expanded", *expanded));
            return;
        }
        const std::string path = relative
                                     ? common::join_path(common::parent_path(location.file), *expanded)
                                     : common::normalize_path(*expanded);
        if (std::ranges::find(m_include_stack, path) != m_include_stack.end()) {
            diagnose(location, "SourceCycle", std::format("'{}' sources itself", path));
            return;
        }
        auto content = m_resolver(path);
        if (!content) {
            if (!optional) {
                diagnose(location, "MissingSource", content.error().message);
            }
            return;
        }
        if (std::ranges::find(m_result.files, path) == m_result.files.end()) {
            m_result.files.push_back(path);
        }
        parse_file(path, *content);
    }

    [[nodiscard]] std::optional<std::string> expand_variables(const SourceLocation& location,
                                                              const std::string& text)
    {
        std::string out;
        std::size_t pos = 0;
        while (pos < text.size()) {
            const std::size_t open = text.find("$(", pos);
            if (open == std::string::npos) {
                out.append(text, pos);
                break;
            }
            const std::size_t close = text.find(')', open);
            if (close == std::string::npos) {
                diagnose(location, "ParseError", std::format("unterminated variable in '{}'", text));
                return std::nullopt;
            }
            out.append(text, pos, open - pos);
            const std::string name = text.substr(open + 2, close - open - 2);
            auto it = m_options.variables.find(name);
            if (it == m_options.variables.end()) {
                diagnose(location, "UnknownVariable", std::format("variable '{}' is not defined", name));
                return std::nullopt;
            }
            out += it->second;
            pos = close + 1;
        }
        return out;
    }

    [[nodiscard]] std::optional<std::vector<Token>> tokenize_checked(const SourceLocation& location,
                                                                     std::string_view text)
    {
        auto tokens = detail::tokenize(text);
        if (!tokens) {
            diagnose(location, tokens.error().code, tokens.error().message);
            return std::nullopt;
        }
        return std::move(*tokens);
    }

    [[nodiscard]] std::optional<ExprPtr> parse_tokens(const SourceLocation& location,
                                                      std::span<const Token> tokens)
    {
        auto expr = detail::parse_expression_tokens(tokens);
        if (!expr) {
            diagnose(location, expr.error().code, expr.error().message);
            return std::nullopt;
        }
        return *expr;
    }

    [[nodiscard]] std::optional<ExprPtr> parse_expr_text(const SourceLocation& location,
                                                         std::string_view text)
    {
        auto tokens = tokenize_checked(location, text);
        if (!tokens) {
            return std::nullopt;
        }
        return parse_tokens(location, *tokens);
    }

    /// Split `<value> if <condition>`; either part may be absent (null)
    [[nodiscard]] std::optional<std::pair<ExprPtr, ExprPtr>>
    split_condition(const SourceLocation& location, const std::vector<Token>& tokens)
    {
        const std::span<const Token> all(tokens);
        const std::size_t if_pos = detail::find_if_keyword(all);
        const std::span<const Token> value_tokens =
            if_pos == std::string_view::npos ? all : all.first(if_pos);
        ExprPtr value;
        ExprPtr condition;
        if (!value_tokens.empty()) {
            auto parsed = parse_tokens(location, value_tokens);
            if (!parsed) {
                return std::nullopt;
            }
            value = *parsed;
        }
        if (if_pos != std::string_view::npos) {
            auto parsed = parse_tokens(location, all.subspan(if_pos + 1));
            if (!parsed) {
                return std::nullopt;
            }
            condition = *parsed;
        }
        return std::make_pair(value, condition);
    }

    [[nodiscard]] ExprPtr enclosing_guard() const
    {
        ExprPtr guard;
        for (const Block& block : m_blocks) {
            guard = make_and(guard, block.guard);
        }
        return guard;
    }

    void commit_entry()
    {
        PendingEntry entry = std::exchange(m_entry, PendingEntry{});
        if (entry.kind != EntryKind::kConfig) {
            return;
        }
        ConfigSymbol& symbol = m_result.symbols.at(entry.id);
        symbol.locations.push_back(entry.location);
        if (ExprPtr guard = make_and(enclosing_guard(), entry.depends)) {
            symbol.depends.push_back(std::move(guard));
        }
        if (entry.declared_kind) {
            if (symbol.kind != SymbolKind::kUnknown && symbol.kind != *entry.declared_kind) {
                diagnose(entry.location,
                         "KindConflict",
                         std::format("'{}' redeclared as {} (was {})",
                                     symbol.name,
                                     to_string(*entry.declared_kind),
                                     to_string(symbol.kind)));
            }
            symbol.kind = *entry.declared_kind;
        }
        if (!entry.defaults.empty()) {
            symbol.defaults = std::move(entry.defaults);
        }
        if (entry.prompt) {
            symbol.prompt = std::move(entry.prompt);
            symbol.prompt_condition = std::move(entry.prompt_condition);
        }
        if (!entry.ranges.empty()) {
            symbol.ranges = std::move(entry.ranges);
        }
        std::ranges::move(entry.selects, std::back_inserter(symbol.selects));
        std::ranges::move(entry.implies, std::back_inserter(symbol.implies));
        symbol.has_help = symbol.has_help || entry.has_help;
    }

    void end_block(const SourceLocation& location, BlockKind expected)
    {
        const std::size_t base_depth = m_include_depths.empty() ? 0 : m_include_depths.back();
        if (m_blocks.size() <= base_depth) {
            diagnose(location,
                     "UnbalancedBlock",
                     std::format("'end{}' without matching '{}'", to_string(expected), to_string(expected)));
            return;
        }
        if (m_blocks.back().kind != expected) {
            diagnose(location,
                     "UnbalancedBlock",
                     std::format("'end{}' closes an open '{}' block",
                                 to_string(expected),
                                 to_string(m_blocks.back().kind)));
        }
        close_block(m_blocks.back().kind);
    }

    void close_block(BlockKind kind)
    {
        if (kind == BlockKind::kChoice) {
            finish_choice(m_blocks.back());
        }
        m_blocks.pop_back();
    }

    /**
     * Choice members take the choice type when untyped. The selected
     * member defaults to y: the first choice default whose condition holds,
     * otherwise the first member unless the choice is optional.
     */
    void finish_choice(const Block& block)
    {
        if (block.member_kind) {
            for (SymbolId id : block.members) {
                if (m_result.symbols.at(id).kind == SymbolKind::kUnknown) {
                    m_result.symbols.at(id).kind = *block.member_kind;
                }
            }
        }
        if (block.members.empty()) {
            return;
        }
        ExprPtr taken;
        bool any_taken = false;
        bool exhausted = false;
        for (const ChoiceDefault& choice_default : block.choice_defaults) {
            auto member = m_result.symbols.find(choice_default.member);
            if (!member) {
                diagnose(block.location,
                         "UnresolvedReference",
                         std::format("choice default '{}' is not a member", choice_default.member));
                continue;
            }
            ExprPtr condition = any_taken ? make_and(make_not(taken), choice_default.condition)
                                          : choice_default.condition;
            add_choice_default(*member, std::move(condition), block);
            if (!choice_default.condition) {
                exhausted = true;
                break;
            }
            taken = any_taken ? make_or(taken, choice_default.condition) : choice_default.condition;
            any_taken = true;
        }
        if (!exhausted && !block.optional) {
            add_choice_default(block.members.front(), any_taken ? make_not(taken) : nullptr, block);
        }
    }

    void add_choice_default(SymbolId id, ExprPtr condition, const Block& block)
    {
        m_result.symbols.at(id).defaults.push_back(DefaultRule{
            .value = make_constant("y"), .condition = std::move(condition), .location = block.location});
    }

    const SourceResolver& m_resolver;
    const ParseOptions& m_options;
    ParseResult m_result;
    PendingEntry m_entry;
    std::vector<Block> m_blocks;
    std::vector<std::string> m_include_stack;
    std::vector<std::size_t> m_include_depths;
};

}  // namespace

std::string ParseDiagnostic::to_string() const
{
    return std::format("{}:{}: {}: {}", file, line, code, message);
}

KconfigParser::KconfigParser(SourceResolver resolver, ParseOptions options)
    : m_resolver(std::move(resolver))
    , m_options(std::move(options))
{}

kcfgvex::Result<ParseResult> KconfigParser::parse(const std::string& root_path) const
{
    ParseSession session(m_resolver, m_options);
    return session.run(root_path);
}

SourceResolver make_directory_resolver(std::filesystem::path base_dir)
{
    return [base = std::move(base_dir)](const std::string& path) -> kcfgvex::Result<std::string> {
        const std::filesystem::path full =
            common::is_absolute_path(path) ? std::filesystem::path(path) : base / path;
        std::ifstream in(full, std::ios::binary);
        if (!in) {
            return std::unexpected(
                Error::make("IOError", std::format("Failed to open {}", full.string())));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    };
}

SourceResolver make_memory_resolver(std::map<std::string, std::string> files)
{
    return [files = std::move(files)](const std::string& path) -> kcfgvex::Result<std::string> {
        auto it = files.find(common::normalize_path(path));
        if (it == files.end()) {
            return std::unexpected(Error::make("IOError", std::format("No such file: {}", path)));
        }
        return it->second;
    };
}

}  // namespace kcfgvex::kconfig
