#include <gtest/gtest.h>
#include <mathpad/document.hpp>

#include <string>
#include <vector>

using namespace mathpad;

TEST(Document, SplitAndJoin) {
    const std::vector<std::string> lines = split_lines("a\n\nb");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(join_lines(lines), "a\n\nb");
    EXPECT_EQ(split_lines("").size(), 1u);
}

TEST(Document, FindEquations) {
    const std::vector<std::string> lines = {
        "a: 2",
        "c = a * 3",
        "x == 1 -> ",
        "{ y + 1 = ",
        "  4 }",
        "f(x) = x + 1",
    };
    const auto eqs = find_equations(lines);
    ASSERT_EQ(eqs.size(), 2u);

    EXPECT_EQ(eqs[0].text, "c = a * 3");
    EXPECT_FALSE(eqs[0].braced);
    EXPECT_EQ(eqs[0].start_line, 1);

    EXPECT_EQ(eqs[1].text, "y + 1 =    4");
    EXPECT_TRUE(eqs[1].braced);
    EXPECT_EQ(eqs[1].start_line, 3);
    EXPECT_EQ(eqs[1].end_line, 4);
}

TEST(Document, EquationsDropComments) {
    const auto eqs = find_equations({"z = 2 * w \"scaled\""});
    ASSERT_EQ(eqs.size(), 1u);
    EXPECT_EQ(eqs[0].text, "z = 2 * w");
}

TEST(Document, UnclosedBraceIsNotAnEquation) {
    EXPECT_TRUE(find_equations({"{ a = 1", "b: 2"}).empty());
}

TEST(Document, EqualsAfterMarkerIsNotAnEquation) {
    EXPECT_TRUE(find_equations({"x-> a = b"}).empty());
}

TEST(Document, InlineEvaluations) {
    const auto evals = find_inline_evals("Half is \\2 + 3\\ and \"\\x\\\"");
    ASSERT_EQ(evals.size(), 1u);
    EXPECT_EQ(evals[0].begin, 8u);
    EXPECT_EQ(evals[0].end, 15u);
    EXPECT_EQ(evals[0].expression, "2 + 3");

    EXPECT_TRUE(find_inline_evals("a single \\ backslash").empty());
}

TEST(Document, InlineEvaluationInEquationBecomesParentheses) {
    const auto eqs = find_equations({"x = \\2 + 3\\ * 2"});
    ASSERT_EQ(eqs.size(), 1u);
    EXPECT_EQ(eqs[0].text, "x = (2 + 3) * 2");
}

TEST(Document, FunctionDefinitions) {
    const std::vector<std::string> lines = {
        "area(w; h) = w * h",
        "sq(x) = {",
        "  x * x",
        "}",
        "sqrt(x) = 2",
    };
    const auto fns = parse_function_definitions(lines);
    ASSERT_EQ(fns.size(), 2u);

    EXPECT_EQ(fns[0].name, "area");
    EXPECT_EQ(fns[0].params, (std::vector<std::string>{"w", "h"}));
    EXPECT_EQ(fns[0].body, "w * h");
    EXPECT_EQ(fns[0].source, "area(w; h) = w * h");

    EXPECT_EQ(fns[1].name, "sq");
    EXPECT_EQ(fns[1].body, "x * x");
    EXPECT_EQ(fns[1].first_line, 1);
    EXPECT_EQ(fns[1].last_line, 3);
    EXPECT_EQ(fns[1].source, "sq(x) = {\n  x * x\n}");

    // definitions are not equations; a builtin name falls through to one
    const auto eqs = find_equations(lines);
    ASSERT_EQ(eqs.size(), 1u);
    EXPECT_EQ(eqs[0].start_line, 4);
}

TEST(Document, WriteValueKeepsUnitAndComment) {
    const auto info = classify_line("x-> 5 kg \"mass\"");
    ASSERT_TRUE(info);
    EXPECT_EQ(write_value("x-> 5 kg \"mass\"", *info, "7"), "x-> 7 kg \"mass\"");
    EXPECT_EQ(write_value("x-> 5 kg \"mass\"", *info, ""), "x-> kg \"mass\"");
}

TEST(Document, ClearValues) {
    const std::string text = "a<- 1\nb-> 2\nc: 3\nd->> 4 kg\ne + 1-> 5\nf + 1:: 6";

    EXPECT_EQ(clear_values(text, ClearMode::Output), "a<- 1\nb->\nc: 3\nd->> kg\ne + 1->\nf + 1:: 6");
    EXPECT_EQ(clear_values(text, ClearMode::Input), "a<-\nb->\nc: 3\nd->> kg\ne + 1->\nf + 1:: 6");
    EXPECT_EQ(clear_values(text, ClearMode::All), "a<-\nb->\nc:\nd->> kg\ne + 1->\nf + 1::");
}

TEST(Document, ClearLeavesPlainTextAlone) {
    const std::string text = "Notes about the pad\ny = 2 * x";
    EXPECT_EQ(clear_values(text, ClearMode::All), text);
}

TEST(Document, RemoveReferenceSection) {
    const std::string text =
        "x-> 1\n\n\"--- Reference Constants and Functions ---\"\nc: 299792458 \"speed of light\"";
    EXPECT_EQ(remove_reference_section(text), "x-> 1");
    EXPECT_EQ(remove_reference_section("no references here"), "no references here");
}

TEST(Document, LimitsSpanningLines) {
    const auto infos = classify_lines({"rate[0:", "1]: 0.5"});
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_FALSE(infos[0]);
    ASSERT_TRUE(infos[1] && infos[1]->declaration());

    const Declaration* d = infos[1]->declaration();
    EXPECT_EQ(d->name, "rate");
    ASSERT_TRUE(d->limits);
    EXPECT_EQ(d->limits->low, "0");
    EXPECT_EQ(d->limits->high, "1");
    EXPECT_EQ(d->value_text, "0.5");
    EXPECT_EQ(infos[1]->marker_begin, 2u);
}
