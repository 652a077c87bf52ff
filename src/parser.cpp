#include "eqpp/parser.hpp"

#include "eqpp/errors.hpp"
#include "eqpp/lexer.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace eqpp {

namespace {

bool
is_opener(TokenType type) {
    return type == TokenType::LParen || type == TokenType::LBracket;
}

bool
is_word_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.';
}

TokenType
closer_for(TokenType opener) {
    switch (opener) {
        case TokenType::LParen:
            return TokenType::RParen;
        case TokenType::LBracket:
            return TokenType::RBracket;
        case TokenType::LBrace:
            return TokenType::RBrace;
        default:
            return TokenType::End;
    }
}

// Recursive descent over the token vector.
//   expr  := term (('+' | '-') term)*
//   term  := unary (('*' | '/') unary)*
//   unary := ('-' | '+') unary | power
//   power := primary ['^' unary]
// Tree depth is bounded by kMaxDepth, counting both nesting and the length of
// left-associative operator chains, so later recursive passes stay shallow.
class Parser {
  public:
    explicit Parser(std::vector<Token> tokens)
      : tokens_(std::move(tokens)) {}

    SystemAst parse_source() {
        if (peek().type == TokenType::End) {
            throw ParseError(ParseErrorKind::EmptyInput, 0, "no equations given");
        }
        SystemAst ast;
        while (true) {
            ast.groups.push_back(parse_construct());
            if (match(TokenType::Semicolon)) {
                if (check(TokenType::End)) { break; }
                continue;
            }
            if (check(TokenType::End)) { break; }
            unexpected(peek(), "';' or end of input");
        }
        return ast;
    }

  private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    static constexpr std::size_t kMaxDepth = 512;

    class DepthGuard {
      public:
        DepthGuard(Parser &parser, const Token &at)
          : parser_(parser) {
            parser_.check_depth(at, 1);
            ++parser_.depth_;
        }
        ~DepthGuard() { --parser_.depth_; }

        DepthGuard(const DepthGuard &) = delete;
        DepthGuard &operator=(const DepthGuard &) = delete;

      private:
        Parser &parser_;
    };

    void check_depth(const Token &at, std::size_t extra) const {
        if (depth_ + extra > kMaxDepth) {
            throw ParseError(ParseErrorKind::UnexpectedToken, at.offset, "expression nested too deeply");
        }
    }

    const Token &peek(std::size_t ahead = 0) const {
        const std::size_t index = pos_ + ahead;
        return index < tokens_.size() ? tokens_[index] : tokens_.back();
    }

    const Token &advance() {
        const Token &tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) { ++pos_; }
        return tok;
    }

    bool check(TokenType type) const { return peek().type == type; }

    bool match(TokenType type) {
        if (!check(type)) { return false; }
        advance();
        return true;
    }

    [[noreturn]] void unexpected(const Token &tok, const std::string &expected) const {
        const std::string found = tok.type == TokenType::End ? to_string(tok.type) : "'" + tok.text + "'";
        throw ParseError(ParseErrorKind::UnexpectedToken, tok.offset, "expected " + expected + ", found " + found);
    }

    void expect_closer(const Token &opener) {
        const TokenType closer = closer_for(opener.type);
        if (match(closer)) { return; }
        if (check(TokenType::End)) {
            throw ParseError(
              ParseErrorKind::UnterminatedGroup, opener.offset, "group opened by '" + opener.text + "' is never closed");
        }
        unexpected(peek(), to_string(closer));
    }

    std::string expect_identifier(const std::string &what) {
        if (!check(TokenType::Identifier)) { unexpected(peek(), what); }
        return advance().text;
    }

    // [open ident close], used by x[t], x'(t) and D[x[t], t]
    std::optional<std::string> parse_access_argument() {
        if (!is_opener(peek().type)) { return std::nullopt; }
        const Token opener = advance();
        std::string arg = expect_identifier("independent variable");
        expect_closer(opener);
        return arg;
    }

    EquationGroup parse_construct() {
        EquationGroup group;
        group.offset = peek().offset;

        if (check(TokenType::LBrace)) {
            const Token opener = advance();
            group.list_form = true;
            group.lhs.push_back(parse_derivative());
            while (match(TokenType::Comma)) { group.lhs.push_back(parse_derivative()); }
            expect_closer(opener);
        } else {
            group.lhs.push_back(parse_derivative());
        }

        if (!match(TokenType::EqualEqual)) { unexpected(peek(), "'=='"); }

        if (check(TokenType::LBrace)) {
            const Token opener = advance();
            group.list_form = true;
            group.rhs.push_back(parse_expression());
            while (match(TokenType::Comma)) { group.rhs.push_back(parse_expression()); }
            expect_closer(opener);
        } else {
            group.rhs.push_back(parse_expression());
        }
        return group;
    }

    Derivative parse_derivative() {
        const Token &tok = peek();
        Derivative d;
        d.offset = tok.offset;

        // D(x), D[x], D(x(t)), D[x[t], t]
        if (tok.type == TokenType::Identifier && tok.text == "D" && is_opener(peek(1).type)) {
            advance();
            const Token opener = advance();
            d.variable = expect_identifier("state variable");
            d.access_argument = parse_access_argument();
            if (match(TokenType::Comma)) { d.with_respect_to = expect_identifier("independent variable"); }
            expect_closer(opener);
            return d;
        }

        // x', x'[t], x'(t)
        if (tok.type == TokenType::Identifier && peek(1).type == TokenType::Prime) {
            d.variable = advance().text;
            advance();
            d.access_argument = parse_access_argument();
            return d;
        }

        unexpected(tok, "a derivative such as D(x) or x'");
    }

    ExprPtr parse_expression() {
        ExprPtr left = parse_term();
        std::size_t chain = 0;
        while (check(TokenType::Plus) || check(TokenType::Minus)) {
            check_depth(peek(), ++chain);
            const Token op = advance();
            ExprPtr right = parse_term();
            left = Expr::binary(
              op.type == TokenType::Plus ? BinaryOp::Add : BinaryOp::Sub, std::move(left), std::move(right), op.offset);
        }
        return left;
    }

    ExprPtr parse_term() {
        ExprPtr left = parse_unary();
        std::size_t chain = 0;
        while (check(TokenType::Star) || check(TokenType::Slash)) {
            check_depth(peek(), ++chain);
            const Token op = advance();
            ExprPtr right = parse_unary();
            left = Expr::binary(
              op.type == TokenType::Star ? BinaryOp::Mul : BinaryOp::Div, std::move(left), std::move(right), op.offset);
        }
        return left;
    }

    ExprPtr parse_unary() {
        DepthGuard guard(*this, peek());
        if (check(TokenType::Minus)) {
            const Token op = advance();
            return Expr::negate(parse_unary(), op.offset);
        }
        if (match(TokenType::Plus)) { return parse_unary(); }
        return parse_power();
    }

    ExprPtr parse_power() {
        ExprPtr base = parse_primary();
        if (check(TokenType::Caret)) {
            const Token op = advance();
            // Exponent goes back through unary so that a^b^c == a^(b^c) and a^-b is accepted.
            ExprPtr exponent = parse_unary();
            return Expr::binary(BinaryOp::Pow, std::move(base), std::move(exponent), op.offset);
        }
        return base;
    }

    ExprPtr parse_primary() {
        const Token &tok = peek();
        switch (tok.type) {
            case TokenType::Number: {
                const Token num = advance();
                return Expr::number(num.value, num.offset);
            }
            case TokenType::Identifier: {
                const Token ident = advance();
                if (match(TokenType::Prime)) {
                    parse_access_argument();
                    return Expr::derivative(ident.text, ident.offset);
                }
                if (is_opener(peek().type)) {
                    const Token opener = advance();
                    return Expr::call(ident.text, parse_arguments(opener), ident.offset);
                }
                return Expr::variable(ident.text, ident.offset);
            }
            case TokenType::LParen: {
                const Token opener = advance();
                ExprPtr inner = parse_expression();
                expect_closer(opener);
                return inner;
            }
            default:
                unexpected(tok, "an expression");
        }
    }

    std::vector<ExprPtr> parse_arguments(const Token &opener) {
        std::vector<ExprPtr> args;
        if (match(closer_for(opener.type))) { return args; }
        args.push_back(parse_expression());
        while (match(TokenType::Comma)) { args.push_back(parse_expression()); }
        expect_closer(opener);
        return args;
    }
};

} // namespace

SystemAst
parse(const std::string &source) {
    Parser parser(tokenize(source));
    return parser.parse_source();
}

std::string
normalize_source(const std::string &source) {
    std::string out;
    out.reserve(source.size());
    for (const Token &tok : tokenize(source)) {
        if (tok.type == TokenType::End) { break; }
        // "a b" and "1 2" must not collapse into "ab" and "12"
        if (!out.empty() && is_word_char(out.back()) && is_word_char(tok.text.front())) { out.push_back(' '); }
        out += tok.text;
    }
    return out;
}

} // namespace eqpp
