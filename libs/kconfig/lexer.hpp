#pragma once

/**
 * @file lexer.hpp
 * @brief Kconfig line tokenizer and token-level expression parser
 */

#include "kcfgvex/common.hpp"
#include "kcfgvex/kconfig/expr.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcfgvex::kconfig::detail {

enum class TokenKind {
    kWord,
    kString,
    kAnd,
    kOr,
    kNot,
    kLParen,
    kRParen,
    kEqual,
    kNotEqual,
    kLess,
    kLessEqual,
    kGreater,
    kGreaterEqual,
};

struct Token
{
    TokenKind kind = TokenKind::kWord;
    std::string text;
};

/// Tokenize one logical line; a '#' outside quotes ends the line
[[nodiscard]] kcfgvex::Result<std::vector<Token>> tokenize(std::string_view line);

/// Parse a complete token range as one expression
[[nodiscard]] kcfgvex::Result<ExprPtr> parse_expression_tokens(std::span<const Token> tokens);

/// Index of the first `if` word outside parentheses, or npos
[[nodiscard]] std::size_t find_if_keyword(std::span<const Token> tokens) noexcept;

}  // namespace kcfgvex::kconfig::detail
