#include "eqpp/compiled_system.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace eqpp;
using eqpp_test::compile_with;

TEST(CompiledSystemTest, EvaluatesCoupledSystem) {
    auto system = compile_with("{D(x), D(y)} == {x - y, x*y}");
    ASSERT_EQ(system->dimension(), 2u);
    EXPECT_EQ(system->state_variables(), (std::vector<std::string>{ "x", "y" }));

    const State dx = system->evaluate(0.0, State{ 2.0, 3.0 });
    ASSERT_EQ(dx.size(), 2u);
    EXPECT_DOUBLE_EQ(dx[0], -1.0);
    EXPECT_DOUBLE_EQ(dx[1], 6.0);
}

TEST(CompiledSystemTest, ParametersAndTime) {
    auto system = compile_with("D(x) == -k*x + t", { { "k", 0.5 } });
    const State dx = system->evaluate(3.0, State{ 4.0 });
    EXPECT_DOUBLE_EQ(dx[0], -2.0 + 3.0);
    EXPECT_EQ(system->parameters().at("k"), 0.5);
}

TEST(CompiledSystemTest, BuiltinFunctions) {
    auto system = compile_with("D(a) == sin(a) + cos(a); D(b) == exp(b) * log(b); D(c) == sqrt(c) - abs(-c);"
                               "D(d) == pow(d, 3) + min(d, 1) + max(d, 1)");
    const State x{ 0.3, 2.0, 9.0, 2.0 };
    const State dx = system->evaluate(0.0, x);
    EXPECT_DOUBLE_EQ(dx[0], std::sin(0.3) + std::cos(0.3));
    EXPECT_DOUBLE_EQ(dx[1], std::exp(2.0) * std::log(2.0));
    EXPECT_DOUBLE_EQ(dx[2], 3.0 - 9.0);
    EXPECT_DOUBLE_EQ(dx[3], 8.0 + 1.0 + 2.0);
}

TEST(CompiledSystemTest, ConstantSubtreesAreFolded) {
    auto system = compile_with("D(x) == 2*3 + x");
    const Program &program = system->program(0);
    ASSERT_EQ(program.size(), 3u);
    EXPECT_EQ(program[0].op, OpCode::Const);
    EXPECT_DOUBLE_EQ(program[0].value, 6.0);
    EXPECT_EQ(program[1].op, OpCode::State);
    EXPECT_EQ(program[2].op, OpCode::Add);

    auto constant = compile_with("D(x) == sin(0) + k", { { "k", 1.0 } });
    ASSERT_EQ(constant->program(0).size(), 1u);
    EXPECT_DOUBLE_EQ(constant->evaluate(0.0, State{ 5.0 })[0], 1.0);
}

TEST(CompiledSystemTest, DomainErrorsBecomeNaN) {
    auto log_system = compile_with("D(x) == log(x)");
    EXPECT_TRUE(std::isnan(log_system->evaluate(0.0, State{ 0.0 })[0]));
    EXPECT_TRUE(std::isnan(log_system->evaluate(0.0, State{ -1.0 })[0]));

    auto sqrt_system = compile_with("D(x) == sqrt(x)");
    EXPECT_TRUE(std::isnan(sqrt_system->evaluate(0.0, State{ -1.0 })[0]));
    EXPECT_DOUBLE_EQ(sqrt_system->evaluate(0.0, State{ 0.0 })[0], 0.0);

    auto pow_system = compile_with("D(x) == x^0.5");
    EXPECT_TRUE(std::isnan(pow_system->evaluate(0.0, State{ -4.0 })[0]));

    auto folded = compile_with("D(x) == (-8)^(1/3)");
    EXPECT_TRUE(std::isnan(folded->evaluate(0.0, State{ 1.0 })[0]));

    auto min_system = compile_with("D(x) == min(log(x), 1) + max(1, log(x))");
    EXPECT_TRUE(std::isnan(min_system->evaluate(0.0, State{ -1.0 })[0]));
}

TEST(CompiledSystemTest, RuntimeDivisionByZeroFollowsIeee) {
    auto system = compile_with("D(x) == 1/x");
    const double value = system->evaluate(0.0, State{ 0.0 })[0];
    EXPECT_TRUE(std::isinf(value));
    EXPECT_GT(value, 0.0);
}

TEST(CompiledSystemTest, DeterministicAcrossCompilations) {
    const std::string source = "{D(x), D(y)} == {x*sin(y) - y^2/3, exp(-x*y) + t*cos(x)}";
    auto first = compile_with(source);
    auto second = compile_with(source);
    for (int i = 0; i < 50; ++i) {
        const double t = 0.1 * i;
        const State x{ std::sin(0.37 * i), std::cos(0.11 * i) };
        const State a = first->evaluate(t, x);
        const State b = second->evaluate(t, x);
        EXPECT_EQ(a[0], b[0]);
        EXPECT_EQ(a[1], b[1]);
    }
}

TEST(CompiledSystemTest, ConcurrentEvaluationMatchesSerial) {
    auto system = compile_with("{D(x), D(y)} == {x - y, x*y + sin(t)}");
    const State x{ 0.7, -1.3 };
    const State expected = system->evaluate(1.5, x);

    std::vector<std::thread> threads;
    std::vector<int> mismatches(8, 0);
    for (int k = 0; k < 8; ++k) {
        threads.emplace_back([&, k] {
            for (int i = 0; i < 1000; ++i) {
                const State dx = system->evaluate(1.5, x);
                if (dx[0] != expected[0] || dx[1] != expected[1]) { ++mismatches[k]; }
            }
        });
    }
    for (auto &th : threads) { th.join(); }
    for (int m : mismatches) { EXPECT_EQ(m, 0); }
}

TEST(CompiledSystemTest, WrongStateSizeThrows) {
    auto system = compile_with("{D(x), D(y)} == {x, y}");
    EXPECT_THROW(system->evaluate(0.0, State{ 1.0 }), std::invalid_argument);
    EXPECT_THROW(system->evaluate(0.0, State{ 1.0, 2.0, 3.0 }), std::invalid_argument);
}

TEST(CompiledSystemTest, OdeintSignature) {
    auto system = compile_with("D(x) == v; D(v) == -x");
    State dxdt;
    (*system)(State{ 1.0, 2.0 }, dxdt, 0.0);
    ASSERT_EQ(dxdt.size(), 2u);
    EXPECT_DOUBLE_EQ(dxdt[0], 2.0);
    EXPECT_DOUBLE_EQ(dxdt[1], -1.0);
}

TEST(CompiledSystemTest, CompileSourceRecordsNormalizedText) {
    auto system = compile_with("D(x) ==  -x ");
    EXPECT_EQ(system->normalized_source(), "D(x)==-x");
    EXPECT_EQ(system->independent_variable(), "t");
}

TEST(CompiledSystemTest, DeeplyNestedSourceEvaluates) {
    auto parens = compile_with("D(x) == " + std::string(400, '(') + "x + 1" + std::string(400, ')'));
    EXPECT_DOUBLE_EQ(parens->evaluate(0.0, State{ 2.0 })[0], 3.0);

    auto signs = compile_with("D(x) == " + std::string(401, '-') + "x");
    EXPECT_DOUBLE_EQ(signs->evaluate(0.0, State{ 2.0 })[0], -2.0);

    // Right-nested: x + (x + (x + ... ))
    std::string nested = "x";
    for (int i = 0; i < 300; ++i) { nested = "x + (" + nested + ")"; }
    auto right = compile_with("D(x) == " + nested);
    EXPECT_DOUBLE_EQ(right->evaluate(0.0, State{ 0.5 })[0], 150.5);
}

TEST(CompiledSystemTest, RejectsSpecTooDeepToEvaluate) {
    auto x = std::make_shared<BoundExpr>();
    x->kind = BoundKind::State;
    BoundExprPtr tree = x;
    for (int i = 0; i < 3000; ++i) {
        auto node = std::make_shared<BoundExpr>();
        node->kind = BoundKind::Binary;
        node->op = BinaryOp::Add;
        node->args = { x, tree };
        tree = node;
    }
    SystemSpec spec;
    spec.state_variables = { "x" };
    spec.independent_variable = "t";
    spec.rhs = { tree };
    EXPECT_THROW(CompiledSystem{ spec }, std::invalid_argument);
}

TEST(CompiledSystemTest, RejectsIncompleteSpec) {
    SystemSpec spec;
    spec.state_variables = { "x" };
    spec.independent_variable = "t";
    EXPECT_THROW(CompiledSystem{ spec }, std::invalid_argument);

    spec.rhs.push_back(nullptr);
    EXPECT_THROW(CompiledSystem{ spec }, std::invalid_argument);
}
