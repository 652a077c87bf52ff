#include "eqpp/parser.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace eqpp;
using eqpp_test::expect_parse_error;

namespace {

std::string
rhs_text(const std::string &source, std::size_t group = 0, std::size_t index = 0) {
    const SystemAst ast = parse(source);
    return to_string(*ast.groups.at(group).rhs.at(index));
}

} // namespace

TEST(ParserTest, SingleEquation) {
    const SystemAst ast = parse("D(x) == -k*x");
    ASSERT_EQ(ast.groups.size(), 1u);
    const EquationGroup &g = ast.groups[0];
    EXPECT_FALSE(g.list_form);
    ASSERT_EQ(g.lhs.size(), 1u);
    EXPECT_EQ(g.lhs[0].variable, "x");
    EXPECT_FALSE(g.lhs[0].access_argument.has_value());
    ASSERT_EQ(g.rhs.size(), 1u);
    EXPECT_EQ(to_string(*g.rhs[0]), "((-k) * x)");
}

TEST(ParserTest, ListForm) {
    const SystemAst ast = parse("{D(x), D(y)} == {x - y, x*y}");
    ASSERT_EQ(ast.groups.size(), 1u);
    const EquationGroup &g = ast.groups[0];
    EXPECT_TRUE(g.list_form);
    ASSERT_EQ(g.lhs.size(), 2u);
    EXPECT_EQ(g.lhs[0].variable, "x");
    EXPECT_EQ(g.lhs[1].variable, "y");
    ASSERT_EQ(g.rhs.size(), 2u);
    EXPECT_EQ(to_string(*g.rhs[0]), "(x - y)");
    EXPECT_EQ(to_string(*g.rhs[1]), "(x * y)");
}

TEST(ParserTest, MultipleConstructsAndTrailingSemicolon) {
    const SystemAst ast = parse("D(x) == v; D(v) == -x;");
    ASSERT_EQ(ast.groups.size(), 2u);
    EXPECT_EQ(ast.groups[0].lhs[0].variable, "x");
    EXPECT_EQ(ast.groups[1].lhs[0].variable, "v");
}

TEST(ParserTest, DerivativeSpellings) {
    const SystemAst ast = parse("x' == 1; y'[t] == 1; z'(t) == 1; D[u[t], t] == 1; D(w(t)) == 1");
    ASSERT_EQ(ast.groups.size(), 5u);

    EXPECT_EQ(ast.groups[0].lhs[0].variable, "x");
    EXPECT_FALSE(ast.groups[0].lhs[0].access_argument.has_value());

    EXPECT_EQ(ast.groups[1].lhs[0].variable, "y");
    EXPECT_EQ(ast.groups[1].lhs[0].access_argument.value_or(""), "t");

    EXPECT_EQ(ast.groups[2].lhs[0].variable, "z");
    EXPECT_EQ(ast.groups[2].lhs[0].access_argument.value_or(""), "t");

    EXPECT_EQ(ast.groups[3].lhs[0].variable, "u");
    EXPECT_EQ(ast.groups[3].lhs[0].access_argument.value_or(""), "t");
    EXPECT_EQ(ast.groups[3].lhs[0].with_respect_to.value_or(""), "t");

    EXPECT_EQ(ast.groups[4].lhs[0].variable, "w");
    EXPECT_EQ(ast.groups[4].lhs[0].access_argument.value_or(""), "t");
    EXPECT_FALSE(ast.groups[4].lhs[0].with_respect_to.has_value());
}

TEST(ParserTest, Precedence) {
    EXPECT_EQ(rhs_text("D(x) == 1 + 2*3^2^2"), "(1 + (2 * (3 ^ (2 ^ 2))))");
    EXPECT_EQ(rhs_text("D(x) == a - b - c"), "((a - b) - c)");
    EXPECT_EQ(rhs_text("D(x) == a / b * c"), "((a / b) * c)");
    EXPECT_EQ(rhs_text("D(x) == -x^2"), "(-(x ^ 2))");
    EXPECT_EQ(rhs_text("D(x) == 2^-1"), "(2 ^ (-1))");
    EXPECT_EQ(rhs_text("D(x) == (a + b)*c"), "((a + b) * c)");
    EXPECT_EQ(rhs_text("D(x) == +x"), "x");
}

TEST(ParserTest, PrintedExpressionParsesBackExactly) {
    EXPECT_EQ(std::stod(rhs_text("D(x) == 0.1234567")), 0.1234567);
    for (const char *rhs : { "0.1234567*x - 1/3", "6.02214076e23 + 1e-300*t", "sin(0.1) ^ 2.5" }) {
        const std::string printed = rhs_text(std::string("D(x) == ") + rhs);
        EXPECT_EQ(rhs_text("D(x) == " + printed), printed) << rhs;
    }
    EXPECT_EQ(std::stod(rhs_text("D(x) == 0.3333333333333333")), 0.3333333333333333);
}

TEST(ParserTest, CallsWithEitherBracket) {
    EXPECT_EQ(rhs_text("D(x) == sin(x) + Cos[x]"), "(sin(x) + Cos(x))");
    EXPECT_EQ(rhs_text("D(x) == Power[x[t], 2]"), "Power(x(t), 2)");
    EXPECT_EQ(rhs_text("D(x) == f()"), "f()");
}

TEST(ParserTest, PrimeInsideExpressionIsKept) {
    const SystemAst ast = parse("D(x) == y'");
    ASSERT_EQ(ast.groups[0].rhs.size(), 1u);
    EXPECT_EQ(ast.groups[0].rhs[0]->kind, ExprKind::Derivative);
    EXPECT_EQ(ast.groups[0].rhs[0]->name, "y");
}

TEST(ParserTest, EmptyInput) {
    EXPECT_EQ(expect_parse_error([] { parse(""); }).kind(), ParseErrorKind::EmptyInput);
    EXPECT_EQ(expect_parse_error([] { parse("  \n\t "); }).kind(), ParseErrorKind::EmptyInput);
}

TEST(ParserTest, UnterminatedGroupPointsAtOpener) {
    ParseError e = expect_parse_error([] { parse("D(x) == (x + 1"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnterminatedGroup);
    EXPECT_EQ(e.offset(), 8u);

    e = expect_parse_error([] { parse("{D(x), D(y)} == {x, y"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnterminatedGroup);
    EXPECT_EQ(e.offset(), 16u);
}

TEST(ParserTest, UnexpectedTokens) {
    ParseError e = expect_parse_error([] { parse("D(x) == x +"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), 11u);

    e = expect_parse_error([] { parse("x == 1"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), 0u);

    e = expect_parse_error([] { parse("D(x) == sin[x)"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), 13u);

    e = expect_parse_error([] { parse("D(x) == x D(y) == y"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), 10u);

    e = expect_parse_error([] { parse("D(x) x"); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), 5u);
}

TEST(ParserTest, NormalizeSourceDropsWhitespace) {
    EXPECT_EQ(normalize_source(" D(x)  ==\n -k * x "), "D(x)==-k*x");
    EXPECT_EQ(normalize_source("D(x)==-k*x"), normalize_source("D( x ) == - k*x"));
    EXPECT_EQ(normalize_source("D(x) == 2e"), normalize_source("D(x) == 2 e"));
}

TEST(ParserTest, NormalizeSourceKeepsTokensApart) {
    EXPECT_EQ(normalize_source("D(x) == 1 2"), "D(x)==1 2");
    EXPECT_NE(normalize_source("D(x) == 1 2"), normalize_source("D(x) == 12"));
    EXPECT_NE(normalize_source("D(x) == a b"), normalize_source("D(x) == ab"));
    EXPECT_EQ(expect_parse_error([] { normalize_source("D(x) = x"); }).offset(), 5u);
}

TEST(ParserTest, DeepNestingIsRejected) {
    const std::string prefix = "D(x) == ";
    const std::string parens = prefix + std::string(30000, '(') + "x" + std::string(30000, ')');
    ParseError e = expect_parse_error([&] { parse(parens); });
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(e.offset(), prefix.size() + 512);
    EXPECT_NE(std::string(e.what()).find("nested too deeply"), std::string::npos);

    const std::string signs = prefix + std::string(100000, '-') + "x";
    EXPECT_EQ(expect_parse_error([&] { parse(signs); }).offset(), prefix.size() + 512);

    std::string powers = prefix + "x";
    for (int i = 0; i < 5000; ++i) { powers += "^x"; }
    EXPECT_EQ(expect_parse_error([&] { parse(powers); }).kind(), ParseErrorKind::UnexpectedToken);

    std::string sum = prefix + "x";
    for (int i = 0; i < 100000; ++i) { sum += "+x"; }
    EXPECT_EQ(expect_parse_error([&] { parse(sum); }).kind(), ParseErrorKind::UnexpectedToken);
}

TEST(ParserTest, ModerateNestingIsAccepted) {
    EXPECT_NO_THROW(parse("D(x) == " + std::string(400, '(') + "x" + std::string(400, ')')));
    EXPECT_NO_THROW(parse("D(x) == " + std::string(400, '-') + "x"));
    std::string sum = "D(x) == x";
    for (int i = 0; i < 400; ++i) { sum += " + x"; }
    EXPECT_NO_THROW(parse(sum));
}
