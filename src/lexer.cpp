#include "eqpp/lexer.hpp"

#include "eqpp/errors.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace eqpp {

namespace {

bool
is_letter(char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool
is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// Length of the numeric literal starting at `pos`, or 0 if there is none.
std::size_t
scan_number(const std::string &source, std::size_t pos) {
    std::size_t i = pos;
    bool digits = false;
    while (i < source.size() && is_digit(source[i])) {
        ++i;
        digits = true;
    }
    if (i < source.size() && source[i] == '.') {
        ++i;
        while (i < source.size() && is_digit(source[i])) {
            ++i;
            digits = true;
        }
    }
    if (!digits) { return 0; }

    // Exponent only if it is complete; "2e" leaves the 'e' for the identifier scanner.
    if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < source.size() && (source[j] == '+' || source[j] == '-')) { ++j; }
        if (j < source.size() && is_digit(source[j])) {
            while (j < source.size() && is_digit(source[j])) { ++j; }
            i = j;
        }
    }
    return i - pos;
}

} // namespace

std::string
to_string(TokenType type) {
    switch (type) {
        case TokenType::Number:
            return "number";
        case TokenType::Identifier:
            return "identifier";
        case TokenType::Plus:
            return "'+'";
        case TokenType::Minus:
            return "'-'";
        case TokenType::Star:
            return "'*'";
        case TokenType::Slash:
            return "'/'";
        case TokenType::Caret:
            return "'^'";
        case TokenType::LParen:
            return "'('";
        case TokenType::RParen:
            return "')'";
        case TokenType::LBracket:
            return "'['";
        case TokenType::RBracket:
            return "']'";
        case TokenType::LBrace:
            return "'{'";
        case TokenType::RBrace:
            return "'}'";
        case TokenType::Comma:
            return "','";
        case TokenType::Semicolon:
            return "';'";
        case TokenType::Prime:
            return "'''";
        case TokenType::EqualEqual:
            return "'=='";
        case TokenType::End:
            return "end of input";
    }
    return "token";
}

std::vector<Token>
tokenize(const std::string &source) {
    std::vector<Token> tokens;
    std::size_t pos = 0;

    auto single = [&](TokenType type) {
        tokens.push_back(Token{ type, source.substr(pos, 1), 0.0, pos });
        ++pos;
    };

    while (pos < source.size()) {
        const char ch = source[pos];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            ++pos;
            continue;
        }

        if (is_digit(ch) || ch == '.') {
            const std::size_t len = scan_number(source, pos);
            if (len == 0) { throw ParseError(ParseErrorKind::UnexpectedToken, pos, "stray '.'"); }
            Token tok;
            tok.type = TokenType::Number;
            tok.text = source.substr(pos, len);
            tok.value = std::strtod(tok.text.c_str(), nullptr);
            tok.offset = pos;
            tokens.push_back(std::move(tok));
            pos += len;
            continue;
        }

        if (is_letter(ch)) {
            std::size_t end = pos + 1;
            while (end < source.size() && (is_letter(source[end]) || is_digit(source[end]))) { ++end; }
            tokens.push_back(Token{ TokenType::Identifier, source.substr(pos, end - pos), 0.0, pos });
            pos = end;
            continue;
        }

        switch (ch) {
            case '+':
                single(TokenType::Plus);
                break;
            case '-':
                single(TokenType::Minus);
                break;
            case '*':
                single(TokenType::Star);
                break;
            case '/':
                single(TokenType::Slash);
                break;
            case '^':
                single(TokenType::Caret);
                break;
            case '(':
                single(TokenType::LParen);
                break;
            case ')':
                single(TokenType::RParen);
                break;
            case '[':
                single(TokenType::LBracket);
                break;
            case ']':
                single(TokenType::RBracket);
                break;
            case '{':
                single(TokenType::LBrace);
                break;
            case '}':
                single(TokenType::RBrace);
                break;
            case ',':
                single(TokenType::Comma);
                break;
            case ';':
                single(TokenType::Semicolon);
                break;
            case '\'':
                single(TokenType::Prime);
                break;
            case '=':
                if (pos + 1 < source.size() && source[pos + 1] == '=') {
                    tokens.push_back(Token{ TokenType::EqualEqual, "==", 0.0, pos });
                    pos += 2;
                    break;
                }
                throw ParseError(ParseErrorKind::UnexpectedToken, pos, "single '=' (equations use '==')");
            default:
                throw ParseError(
                  ParseErrorKind::UnexpectedToken, pos, std::string("unexpected character '") + ch + "'");
        }
    }

    tokens.push_back(Token{ TokenType::End, "", 0.0, source.size() });
    return tokens;
}

} // namespace eqpp
