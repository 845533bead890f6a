/**
 * @file lexer.cpp
 * @brief Kconfig tokenizer and recursive-descent expression parser
 *
 * Grammar (lowest to highest precedence):
 *   expr       := and ('||' and)*
 *   and        := unary ('&&' unary)*
 *   unary      := '!' unary | '(' expr ')' | comparison
 *   comparison := literal (cmp-op literal)?
 */

#include "lexer.hpp"

#include <cctype>
#include <format>
#include <optional>

namespace kcfgvex::kconfig::detail {

namespace {

[[nodiscard]] bool is_word_char(char c) noexcept
{
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_' || c == '-' || c == '.';
}

[[nodiscard]] kcfgvex::Error parse_error(std::string message)
{
    return Error::make("ExprParseError", std::move(message));
}

class ExprParser
{
public:
    explicit ExprParser(std::span<const Token> tokens)
        : m_tokens(tokens)
    {}

    [[nodiscard]] kcfgvex::Result<ExprPtr> parse_all()
    {
        if (m_tokens.empty()) {
            return std::unexpected(parse_error("empty expression"));
        }
        auto expr = parse_or();
        if (!expr) {
            return expr;
        }
        if (m_pos != m_tokens.size()) {
            return std::unexpected(
                parse_error(std::format("unexpected token '{}'", m_tokens[m_pos].text)));
        }
        return expr;
    }

private:
    [[nodiscard]] bool accept(TokenKind kind)
    {
        if (m_pos < m_tokens.size() && m_tokens[m_pos].kind == kind) {
            ++m_pos;
            return true;
        }
        return false;
    }

    [[nodiscard]] kcfgvex::Result<ExprPtr> parse_or()
    {
        auto lhs = parse_and();
        if (!lhs) {
            return lhs;
        }
        ExprPtr result = *lhs;
        while (accept(TokenKind::kOr)) {
            auto rhs = parse_and();
            if (!rhs) {
                return rhs;
            }
            result = make_or(result, *rhs);
        }
        return result;
    }

    [[nodiscard]] kcfgvex::Result<ExprPtr> parse_and()
    {
        auto lhs = parse_unary();
        if (!lhs) {
            return lhs;
        }
        ExprPtr result = *lhs;
        while (accept(TokenKind::kAnd)) {
            auto rhs = parse_unary();
            if (!rhs) {
                return rhs;
            }
            result = make_and(result, *rhs);
        }
        return result;
    }

    [[nodiscard]] kcfgvex::Result<ExprPtr> parse_unary()
    {
        if (accept(TokenKind::kNot)) {
            auto operand = parse_unary();
            if (!operand) {
                return operand;
            }
            return make_not(*operand);
        }
        if (accept(TokenKind::kLParen)) {
            auto inner = parse_or();
            if (!inner) {
                return inner;
            }
            if (!accept(TokenKind::kRParen)) {
                return std::unexpected(parse_error("missing ')'"));
            }
            return inner;
        }
        return parse_comparison();
    }

    [[nodiscard]] kcfgvex::Result<Literal> parse_literal()
    {
        if (m_pos >= m_tokens.size()) {
            return std::unexpected(parse_error("expression ends where an operand is expected"));
        }
        const Token& token = m_tokens[m_pos];
        if (token.kind != TokenKind::kWord && token.kind != TokenKind::kString) {
            return std::unexpected(
                parse_error(std::format("expected operand, found '{}'", token.text)));
        }
        ++m_pos;
        return make_literal(token.text, token.kind == TokenKind::kString);
    }

    [[nodiscard]] kcfgvex::Result<ExprPtr> parse_comparison()
    {
        auto lhs = parse_literal();
        if (!lhs) {
            return std::unexpected(lhs.error());
        }
        if (m_pos < m_tokens.size()) {
            if (auto op = comparison_op(m_tokens[m_pos].kind)) {
                ++m_pos;
                auto rhs = parse_literal();
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                return make_comparison(*op, std::move(*lhs), std::move(*rhs));
            }
        }
        if (lhs->constant) {
            return make_constant(lhs->name);
        }
        return make_symbol(lhs->name);
    }

    [[nodiscard]] static std::optional<CompareOp> comparison_op(TokenKind kind) noexcept
    {
        switch (kind) {
            case TokenKind::kEqual:
                return CompareOp::kEqual;
            case TokenKind::kNotEqual:
                return CompareOp::kNotEqual;
            case TokenKind::kLess:
                return CompareOp::kLess;
            case TokenKind::kLessEqual:
                return CompareOp::kLessEqual;
            case TokenKind::kGreater:
                return CompareOp::kGreater;
            case TokenKind::kGreaterEqual:
                return CompareOp::kGreaterEqual;
            default:
                return std::nullopt;
        }
    }

    std::span<const Token> m_tokens;
    std::size_t m_pos = 0;
};

}  // namespace

kcfgvex::Result<std::vector<Token>> tokenize(std::string_view line)
{
    std::vector<Token> tokens;
    std::size_t pos = 0;
    const auto push = [&tokens](TokenKind kind, std::string text) {
        tokens.push_back(Token{.kind = kind, .text = std::move(text)});
    };

    while (pos < line.size()) {
        const char c = line[pos];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++pos;
            continue;
        }
        if (c == '#') {
            break;
        }
        if (c == '"' || c == '\'') {
            const char quote = c;
            std::string text;
            ++pos;
            bool closed = false;
            while (pos < line.size()) {
                char ch = line[pos++];
                if (ch == '\\' && pos < line.size()) {
                    text.push_back(line[pos++]);
                    continue;
                }
                if (ch == quote) {
                    closed = true;
                    break;
                }
                text.push_back(ch);
            }
            if (!closed) {
                return std::unexpected(parse_error("unterminated string literal"));
            }
            push(TokenKind::kString, std::move(text));
            continue;
        }
        const char next = pos + 1 < line.size() ? line[pos + 1] : '\0';
        if (c == '&' && next == '&') {
            push(TokenKind::kAnd, "&&");
            pos += 2;
        } else if (c == '|' && next == '|') {
            push(TokenKind::kOr, "||");
            pos += 2;
        } else if (c == '!' && next == '=') {
            push(TokenKind::kNotEqual, "!=");
            pos += 2;
        } else if (c == '!') {
            push(TokenKind::kNot, "!");
            ++pos;
        } else if (c == '(') {
            push(TokenKind::kLParen, "(");
            ++pos;
        } else if (c == ')') {
            push(TokenKind::kRParen, ")");
            ++pos;
        } else if (c == '=') {
            push(TokenKind::kEqual, "=");
            ++pos;
        } else if (c == '<' && next == '=') {
            push(TokenKind::kLessEqual, "<=");
            pos += 2;
        } else if (c == '<') {
            push(TokenKind::kLess, "<");
            ++pos;
        } else if (c == '>' && next == '=') {
            push(TokenKind::kGreaterEqual, ">=");
            pos += 2;
        } else if (c == '>') {
            push(TokenKind::kGreater, ">");
            ++pos;
        } else if (is_word_char(c)) {
            const std::size_t start = pos;
            while (pos < line.size() && is_word_char(line[pos])) {
                ++pos;
            }
            push(TokenKind::kWord, std::string(line.substr(start, pos - start)));
        } else {
            return std::unexpected(parse_error(std::format("unexpected character '{}'", c)));
        }
    }
    return tokens;
}

kcfgvex::Result<ExprPtr> parse_expression_tokens(std::span<const Token> tokens)
{
    ExprParser parser(tokens);
    return parser.parse_all();
}

std::size_t find_if_keyword(std::span<const Token> tokens) noexcept
{
    int depth = 0;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.kind == TokenKind::kLParen) {
            ++depth;
        } else if (token.kind == TokenKind::kRParen) {
            --depth;
        } else if (depth == 0 && token.kind == TokenKind::kWord && token.text == "if") {
            return i;
        }
    }
    return std::string_view::npos;
}

}  // namespace kcfgvex::kconfig::detail
