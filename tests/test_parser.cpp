#include <gtest/gtest.h>
#include <mathpad/ast.hpp>
#include <mathpad/lexer.hpp>
#include <mathpad/parser.hpp>

#include <map>
#include <set>
#include <string>

using mathpad::NodeKind;
using mathpad::ParseError;
using mathpad::parse_expression;

TEST(Parser, MultiplicationBindsTighter) {
    auto n = parse_expression("1 + 2 * 3");
    ASSERT_EQ(n->kind, NodeKind::Binary);
    EXPECT_EQ(n->op, "+");
    EXPECT_EQ(n->args[0]->kind, NodeKind::Number);
    EXPECT_EQ(n->args[1]->op, "*");
}

TEST(Parser, PowerIsRightAssociative) {
    auto n = parse_expression("2 ** 3 ** 2");
    ASSERT_EQ(n->op, "**");
    EXPECT_EQ(n->args[0]->kind, NodeKind::Number);
    EXPECT_EQ(n->args[1]->op, "**");
}

TEST(Parser, SubtractionIsLeftAssociative) {
    auto n = parse_expression("a - b - c");
    ASSERT_EQ(n->op, "-");
    EXPECT_EQ(n->args[0]->op, "-");
    EXPECT_EQ(n->args[1]->name, "c");
}

TEST(Parser, PrefixOperators) {
    auto n = parse_expression("-x");
    ASSERT_EQ(n->kind, NodeKind::Unary);
    EXPECT_EQ(n->op, "-");

    auto m = parse_expression("!a && b");
    ASSERT_EQ(m->op, "&&");
    EXPECT_EQ(m->args[0]->kind, NodeKind::Unary);
}

TEST(Parser, LogicalBelowComparison) {
    auto n = parse_expression("a < b || c == d");
    ASSERT_EQ(n->op, "||");
    EXPECT_EQ(n->args[0]->op, "<");
    EXPECT_EQ(n->args[1]->op, "==");
}

TEST(Parser, BitwiseLevels) {
    auto n = parse_expression("a | b & c << 1");
    ASSERT_EQ(n->op, "|");
    EXPECT_EQ(n->args[1]->op, "&");
    EXPECT_EQ(n->args[1]->args[1]->op, "<<");
}

TEST(Parser, CallsAcceptBothSeparators) {
    auto a = parse_expression("max(1; 2, 3)");
    ASSERT_EQ(a->kind, NodeKind::Call);
    EXPECT_EQ(a->name, "max");
    EXPECT_EQ(a->args.size(), 3u);

    auto nested = parse_expression("f(g(x); (1 + 2))");
    ASSERT_EQ(nested->args.size(), 2u);
    EXPECT_EQ(nested->args[0]->kind, NodeKind::Call);
    EXPECT_EQ(nested->args[1]->op, "+");
}

TEST(Parser, ZeroArgumentCall) {
    auto n = parse_expression("now()");
    ASSERT_EQ(n->kind, NodeKind::Call);
    EXPECT_TRUE(n->args.empty());
}

TEST(Parser, SkipsNameSuffixesAndComments) {
    auto n = parse_expression("rate% * 2 \"comment\"");
    ASSERT_EQ(n->op, "*");
    EXPECT_EQ(n->args[0]->name, "rate");
}

TEST(Parser, KeepsLiteralBase) {
    auto n = parse_expression("0xFF");
    EXPECT_DOUBLE_EQ(n->number, 255.0);
    EXPECT_EQ(n->base, 16);
}

TEST(Parser, Errors) {
    EXPECT_THROW(parse_expression(""), ParseError);
    EXPECT_THROW(parse_expression("1 +"), ParseError);
    EXPECT_THROW(parse_expression("(1 + 2"), ParseError);
    EXPECT_THROW(parse_expression("1 + 2)"), ParseError);
    EXPECT_THROW(parse_expression("()"), ParseError);
    EXPECT_THROW(parse_expression("f(1;)"), ParseError);
    EXPECT_THROW(parse_expression("a b"), ParseError);
    EXPECT_THROW(parse_expression("1; 2"), ParseError);
    EXPECT_THROW(parse_expression("a = b"), ParseError);
}

TEST(Parser, ErrorCarriesPosition) {
    try {
        parse_expression("1 + @");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line, 1);
        EXPECT_EQ(e.col, 5);
    }
}

TEST(Parser, ParsesTokenSlice) {
    const auto toks = mathpad::tokenize("a + b = c");
    auto eq = toks.begin();
    while (eq->text != "=") ++eq;
    auto left = mathpad::parse_tokens(toks.begin(), eq);
    EXPECT_EQ(left->op, "+");
    auto right = mathpad::parse_tokens(eq + 1, toks.end());
    EXPECT_EQ(right->name, "c");
}

TEST(Ast, CollectVariablesSkipsFunctionNames) {
    auto n = parse_expression("f(x; y) + x * z");
    EXPECT_EQ(mathpad::collect_variables(*n), (std::set<std::string>{"x", "y", "z"}));
}

TEST(Ast, SubstituteSharesUnchangedSubtrees) {
    auto n = parse_expression("(a + 1) * b");
    std::map<std::string, mathpad::NodePtr> subs{{"b", parse_expression("2 * c")}};
    auto out = mathpad::substitute(n, subs);
    EXPECT_NE(out, n);
    EXPECT_EQ(out->args[0], n->args[0]);
    EXPECT_EQ(out->args[1]->op, "*");
    EXPECT_EQ(mathpad::collect_variables(*out), (std::set<std::string>{"a", "c"}));

    EXPECT_EQ(mathpad::substitute(n, {{"q", parse_expression("1")}}), n);
}
