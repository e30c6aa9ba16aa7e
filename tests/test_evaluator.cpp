#include <gtest/gtest.h>
#include <mathpad/builtins.hpp>
#include <mathpad/context.hpp>
#include <mathpad/evaluator.hpp>
#include <mathpad/parser.hpp>
#include <mathpad/solve.hpp>

#include <cmath>
#include <memory>
#include <string>

using namespace mathpad;

namespace {

double eval(const std::string& text, const EvalContext& ctx = EvalContext()) {
    return evaluate(*parse_expression(text), ctx);
}

EvalContext with_constants(ConstantTable table) {
    return EvalContext(std::make_shared<const ConstantTable>(std::move(table)), nullptr);
}

} // namespace

TEST(Evaluator, Arithmetic) {
    EXPECT_DOUBLE_EQ(eval("1 + 2 * 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("2 ** 3 ** 2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-2 ** 2"), 4.0);
    EXPECT_DOUBLE_EQ(eval("7 % 3"), 1.0);
    EXPECT_DOUBLE_EQ(eval("10 - 4 - 3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("50% * 8"), 4.0);
}

TEST(Evaluator, PowerOutOfDomainIsNaN) {
    EXPECT_TRUE(std::isnan(eval("(-8) ** 0.5")));
}

TEST(Evaluator, DivisionByZero) {
    EXPECT_THROW(eval("1 / 0"), DivisionByZeroError);
    EXPECT_THROW(eval("1 / (2 - 2)"), EvalError);
}

TEST(Evaluator, UndefinedVariable) {
    try {
        eval("a + 1");
        FAIL() << "expected UndefinedVariableError";
    } catch (const UndefinedVariableError& e) {
        EXPECT_EQ(e.name, "a");
        EXPECT_STREQ(e.what(), "Undefined variable: a");
    }
}

TEST(Evaluator, Variables) {
    EvalContext ctx;
    ctx.set_variable("w", 3);
    ctx.set_variable("h", 4);
    EXPECT_DOUBLE_EQ(eval("w * h", ctx), 12.0);
}

TEST(Evaluator, ComparisonsAndLogic) {
    EXPECT_DOUBLE_EQ(eval("3 > 2"), 1.0);
    EXPECT_DOUBLE_EQ(eval("3 <= 2"), 0.0);
    EXPECT_DOUBLE_EQ(eval("2 == 2 && 1 != 2"), 1.0);
    EXPECT_DOUBLE_EQ(eval("5 ^^ 0"), 1.0);
    EXPECT_DOUBLE_EQ(eval("5 ^^ 3"), 0.0);
    EXPECT_DOUBLE_EQ(eval("!0"), 1.0);
}

TEST(Evaluator, ShortCircuit) {
    EXPECT_DOUBLE_EQ(eval("0 && 1 / 0"), 0.0);
    EXPECT_DOUBLE_EQ(eval("1 || 1 / 0"), 1.0);
    EXPECT_THROW(eval("1 && 1 / 0"), DivisionByZeroError);
}

TEST(Evaluator, Bitwise) {
    EXPECT_DOUBLE_EQ(eval("6 & 3"), 2.0);
    EXPECT_DOUBLE_EQ(eval("6 | 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("6 ^ 3"), 5.0);
    EXPECT_DOUBLE_EQ(eval("1 << 4"), 16.0);
    EXPECT_DOUBLE_EQ(eval("-16 >> 2"), -4.0);
    EXPECT_DOUBLE_EQ(eval("~0"), -1.0);
    EXPECT_DOUBLE_EQ(eval("7.9 & 3.2"), 3.0);
}

TEST(Evaluator, Builtins) {
    EXPECT_DOUBLE_EQ(eval("sqrt(16)"), 4.0);
    EXPECT_DOUBLE_EQ(eval("abs(-2.5)"), 2.5);
    EXPECT_DOUBLE_EQ(eval("int(-2.7)"), -2.0);
    EXPECT_DOUBLE_EQ(eval("round(2.5)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("round(3.14159; 2)"), 3.14);
    EXPECT_DOUBLE_EQ(eval("max(1; 5; 3)"), 5.0);
    EXPECT_DOUBLE_EQ(eval("min(4, 2, 8)"), 2.0);
    EXPECT_DOUBLE_EQ(eval("avg(1; 2; 3; 4)"), 2.5);
    EXPECT_DOUBLE_EQ(eval("sum()"), 0.0);
    EXPECT_DOUBLE_EQ(eval("fact(5)"), 120.0);
    EXPECT_DOUBLE_EQ(eval("log(100)"), 2.0);
    EXPECT_NEAR(eval("log(8; 2)"), 3.0, 1e-12);
    EXPECT_NEAR(eval("root(27; 3)"), 3.0, 1e-12);
    EXPECT_NEAR(eval("ln(exp(2))"), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(eval("PI"), eval("pi"));
}

TEST(Evaluator, Factorial) {
    EXPECT_NEAR(factorial(0.5), std::sqrt(std::acos(-1.0)) / 2.0, 1e-10);
    EXPECT_TRUE(std::isinf(factorial(171)));
    EXPECT_TRUE(std::isnan(factorial(-1)));
}

TEST(Evaluator, ChooseAndIf) {
    EXPECT_DOUBLE_EQ(eval("choose(2; 10; 20; 30)"), 20.0);
    EXPECT_DOUBLE_EQ(eval("choose(5; 10)"), 0.0);
    EXPECT_DOUBLE_EQ(eval("if(1 > 2; 10; 20)"), 20.0);
    EXPECT_DOUBLE_EQ(eval("if(0; 10)"), 0.0);
    // only the selected branch is evaluated
    EXPECT_DOUBLE_EQ(eval("if(1; 5; 1 / 0)"), 5.0);
}

TEST(Evaluator, ArityErrors) {
    EXPECT_THROW(eval("sqrt(1; 2)"), EvalError);
    EXPECT_THROW(eval("max()"), EvalError);
    EXPECT_THROW(eval("nosuch(1)"), EvalError);
}

TEST(Evaluator, DegreesMode) {
    EvalContext rad;
    EvalContext deg(nullptr, nullptr, true);
    EXPECT_NEAR(eval("sin(90)", deg), 1.0, 1e-12);
    EXPECT_NEAR(eval("asin(1)", deg), 90.0, 1e-12);
    EXPECT_NEAR(eval("sin(pi / 2)", rad), 1.0, 1e-12);
    // hyperbolic functions ignore the angle mode
    EXPECT_DOUBLE_EQ(eval("sinh(1)", deg), std::sinh(1.0));
}

TEST(Evaluator, Dates) {
    EXPECT_DOUBLE_EQ(eval("year(20240315)"), 2024.0);
    EXPECT_DOUBLE_EQ(eval("month(20240315)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("day(20240315)"), 15.0);
    EXPECT_DOUBLE_EQ(eval("year(990101)"), 1999.0);
    EXPECT_DOUBLE_EQ(eval("year(240101)"), 2024.0);
    EXPECT_DOUBLE_EQ(eval("days(20240101; 20240301)"), 60.0);
    EXPECT_DOUBLE_EQ(eval("weekday(20240315)"), 6.0); // Friday
    EXPECT_DOUBLE_EQ(eval("date(jdays(20231231) + 1)"), 20240101.0);
    EXPECT_DOUBLE_EQ(eval("hour(20240315.143005)"), 14.0);
    EXPECT_DOUBLE_EQ(eval("minute(20240315.143005)"), 30.0);
    EXPECT_DOUBLE_EQ(eval("second(20240315.143005)"), 5.0);
    EXPECT_NEAR(eval("hms(1.5)"), 0.013, 1e-12);
}

TEST(Evaluator, Random) {
    for (int i = 0; i < 20; ++i) {
        const double r = eval("rand(5; 10)");
        EXPECT_GE(r, 5.0);
        EXPECT_LT(r, 10.0);
    }
}

TEST(Evaluator, UserFunctionsAndRecursion) {
    EvalContext ctx = create_context("", "Fact2(n) = if(n <= 1; 1; n * fact2(n - 1))\nadd(a; b) = a + b");
    EXPECT_DOUBLE_EQ(eval("fact2(5)", ctx), 120.0);
    EXPECT_DOUBLE_EQ(eval("FACT2(3)", ctx), 6.0);
    // missing trailing arguments are 0
    EXPECT_DOUBLE_EQ(eval("add(4)", ctx), 4.0);
    EXPECT_EQ(ctx.state().used_functions.count("fact2"), 1u);
}

TEST(Evaluator, ParametersDoNotLeak) {
    EvalContext ctx = create_context("", "sq(x) = x * x");
    ctx.set_variable("x", 10);
    EXPECT_DOUBLE_EQ(eval("sq(3) + x", ctx), 19.0);
}

TEST(Evaluator, RunawayRecursionIsAnError) {
    EvalContext ctx = create_context("", "loop(n) = loop(n + 1)");
    EXPECT_THROW(eval("loop(0)", ctx), EvalError);
}

TEST(EvalContext, ConstantsAndUsage) {
    EvalContext ctx = with_constants({{"g", Constant{9.81, "gravity"}}});
    EXPECT_DOUBLE_EQ(eval("2 * g", ctx), 19.62);
    EXPECT_EQ(ctx.state().used_constants.count("g"), 1u);

    ctx.set_variable("g", 10);
    EXPECT_DOUBLE_EQ(eval("g", ctx), 10.0);
}

TEST(EvalContext, ShadowingIsPositional) {
    EvalContext ctx = with_constants({{"g", Constant{9.81, ""}}});
    ctx.set_variable("g", 10);
    ctx.shadow_constant("g", 5);

    ctx.set_line(2);
    EXPECT_DOUBLE_EQ(eval("g", ctx), 9.81);
    ctx.set_line(5);
    EXPECT_DOUBLE_EQ(eval("g", ctx), 10.0);

    ctx.erase_variable("g");
    EXPECT_FALSE(ctx.is_known("g"));
    EXPECT_THROW(eval("g", ctx), UndefinedVariableError);
}

TEST(EvalContext, BoundNameBeatsConstantBeforeShadowPoint) {
    EvalContext ctx = with_constants({{"g", Constant{9.81, ""}}});
    ctx.shadow_constant("g", 5);
    ctx.set_line(2);

    EvalContext f = ctx.frame();
    f.bind_variable("g", 3);
    EXPECT_DOUBLE_EQ(eval("g", f), 3.0);
    // a document value still waits for its declaration line
    ctx.set_variable("g", 10);
    EXPECT_DOUBLE_EQ(eval("g", ctx), 9.81);

    f.erase_variable("g");
    EXPECT_DOUBLE_EQ(eval("g", f), 9.81);
}

TEST(Evaluator, ParameterNamedLikeShadowedConstant) {
    EvalContext ctx = create_context("k: 100", "twice(k) = k * 2");
    ctx.shadow_constant("k", 3);
    ctx.set_line(1);
    EXPECT_DOUBLE_EQ(eval("twice(4)", ctx), 8.0);
    EXPECT_DOUBLE_EQ(eval("k", ctx), 100.0);
}

TEST(EvalContext, FramesShareState) {
    EvalContext ctx = with_constants({{"k", Constant{2, ""}}});
    EvalContext f = ctx.frame();
    EXPECT_EQ(f.depth(), 1);
    f.set_variable("local", 1);
    EXPECT_FALSE(ctx.has_variable("local"));
    eval("k", f);
    EXPECT_EQ(ctx.state().used_constants.count("k"), 1u);
}
