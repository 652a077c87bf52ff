#ifndef EQPP_LEXER_HPP
#define EQPP_LEXER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace eqpp {

enum class TokenType {
    Number,
    Identifier,
    Plus,
    Minus,
    Star,
    Slash,
    Caret,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Comma,
    Semicolon,
    Prime,
    EqualEqual,
    End,
};

std::string
to_string(TokenType type);

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double value = 0.0;     // valid for Number
    std::size_t offset = 0; // byte offset of the first character
};

/**
 * @brief Splits equation source into tokens.
 *
 * Identifiers are an ASCII letter followed by letters or digits. Numbers are
 * decimal with optional fraction and exponent. Whitespace is insignificant.
 * The returned vector always ends with a single End token.
 *
 * @throws ParseError (UnexpectedToken) on a character outside the alphabet,
 *         including a lone '='.
 */
std::vector<Token>
tokenize(const std::string &source);

} // namespace eqpp

#endif // EQPP_LEXER_HPP
