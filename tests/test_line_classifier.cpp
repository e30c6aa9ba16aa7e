#include <gtest/gtest.h>
#include <mathpad/line_classifier.hpp>

using namespace mathpad;

TEST(LineClassifier, PlainDeclaration) {
    auto info = classify_line("x: 5");
    ASSERT_TRUE(info);
    const Declaration* d = info->declaration();
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->name, "x");
    EXPECT_EQ(d->marker, TokKind::Colon);
    EXPECT_EQ(d->clear, ClearBehavior::None);
    EXPECT_EQ(d->value_text, "5");
    EXPECT_FALSE(d->full_precision);
    EXPECT_EQ(info->marker_begin, 1u);
    EXPECT_EQ(info->marker_end, 2u);
}

TEST(LineClassifier, MarkerKinds) {
    EXPECT_EQ(classify_line("a<- 1")->declaration()->clear, ClearBehavior::OnClear);
    EXPECT_EQ(classify_line("a-> 1")->declaration()->clear, ClearBehavior::OnSolve);
    EXPECT_TRUE(classify_line("a->> 1")->declaration()->full_precision);
    EXPECT_TRUE(classify_line("a:: 1")->declaration()->full_precision);
    EXPECT_TRUE(classify_line("a-> 1")->declaration()->is_output());
    EXPECT_FALSE(classify_line("a<- 1")->declaration()->is_output());
}

TEST(LineClassifier, LabelTextBeforeName) {
    auto info = classify_line("Monthly payment pmt->");
    ASSERT_TRUE(info && info->declaration());
    EXPECT_EQ(info->declaration()->name, "pmt");
    EXPECT_EQ(info->declaration()->label_end, 16u);
}

TEST(LineClassifier, OutputValueUnitAndComment) {
    auto info = classify_line("mass-> 12.5 kg \"loaded\"");
    ASSERT_TRUE(info && info->declaration());
    const Declaration* d = info->declaration();
    EXPECT_EQ(d->value_text, "12.5");
    EXPECT_EQ(info->unit, "kg");
    EXPECT_EQ(d->comment, "loaded");
    EXPECT_FALSE(d->comment_unquoted);
    EXPECT_EQ(info->trailing, "\"loaded\"");
}

TEST(LineClassifier, UnquotedUnitBecomesComment) {
    auto info = classify_line("speed-> m/s");
    ASSERT_TRUE(info && info->declaration());
    EXPECT_EQ(info->declaration()->value_text, "");
    EXPECT_EQ(info->unit, "m/s");
    EXPECT_EQ(info->declaration()->comment, "m/s");
    EXPECT_TRUE(info->declaration()->comment_unquoted);
}

TEST(LineClassifier, Limits) {
    auto info = classify_line("x[0:10]: 3");
    ASSERT_TRUE(info && info->declaration());
    const Declaration* d = info->declaration();
    EXPECT_EQ(d->name, "x");
    ASSERT_TRUE(d->limits);
    EXPECT_EQ(d->limits->low, "0");
    EXPECT_EQ(d->limits->high, "10");
    EXPECT_EQ(d->value_text, "3");
}

TEST(LineClassifier, FormatAndBaseSuffixes) {
    auto money = classify_line("price$: 10");
    ASSERT_TRUE(money && money->declaration());
    EXPECT_EQ(money->declaration()->name, "price");
    EXPECT_EQ(money->declaration()->format, Format::Money);

    auto hex = classify_line("mask#16->");
    ASSERT_TRUE(hex && hex->declaration());
    EXPECT_EQ(hex->declaration()->base, 16);

    auto pct = classify_line("rate%[0:1]->");
    ASSERT_TRUE(pct && pct->declaration());
    EXPECT_EQ(pct->declaration()->name, "rate");
    EXPECT_EQ(pct->declaration()->format, Format::Percent);
    EXPECT_TRUE(pct->declaration()->limits);
}

TEST(LineClassifier, ExpressionOutput) {
    auto info = classify_line("a + b->");
    ASSERT_TRUE(info);
    const ExpressionOutput* out = info->expression_output();
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->expression, "a + b");
    EXPECT_TRUE(out->recalculates);
    EXPECT_EQ(out->value_text, "");
}

TEST(LineClassifier, ExpressionOutputAfterLabel) {
    auto info = classify_line("Total: sqrt(a) * 2::");
    ASSERT_TRUE(info && info->expression_output());
    EXPECT_EQ(info->expression_output()->expression, "sqrt(a) * 2");
    EXPECT_TRUE(info->expression_output()->full_precision);
    EXPECT_FALSE(info->expression_output()->recalculates);
}

TEST(LineClassifier, CallIsExpression) {
    auto info = classify_line("sqrt(16)->");
    ASSERT_TRUE(info && info->expression_output());
    EXPECT_EQ(info->expression_output()->expression, "sqrt(16)");
}

TEST(LineClassifier, StrongestMarkerWins) {
    auto info = classify_line("Distance: d->");
    ASSERT_TRUE(info && info->declaration());
    EXPECT_EQ(info->declaration()->name, "d");
    EXPECT_EQ(info->declaration()->marker, TokKind::ArrowRight);
}

TEST(LineClassifier, InputArrowAlwaysWins) {
    auto info = classify_line("rate<- 5 -> ignored");
    ASSERT_TRUE(info && info->declaration());
    EXPECT_EQ(info->declaration()->marker, TokKind::ArrowLeft);
    EXPECT_EQ(info->declaration()->name, "rate");
}

TEST(LineClassifier, NotDeclarations) {
    EXPECT_FALSE(classify_line("just some text"));
    EXPECT_FALSE(classify_line("y = 2 * x"));
    EXPECT_FALSE(classify_line("x: {"));
    EXPECT_FALSE(classify_line(": 5"));
    EXPECT_FALSE(classify_line(""));
}

TEST(LineClassifier, SplitOutputValue) {
    EXPECT_EQ(split_output_value("12.5 kg"), std::make_pair(std::string("12.5"), std::string("kg")));
    EXPECT_EQ(split_output_value("kg"), std::make_pair(std::string(), std::string("kg")));
    EXPECT_EQ(split_output_value("-$1,200.50"), std::make_pair(std::string("-$1,200.50"), std::string()));
    EXPECT_EQ(split_output_value("FF#16 mask"), std::make_pair(std::string("FF#16"), std::string("mask")));
    EXPECT_EQ(split_output_value("1.5e+3 N"), std::make_pair(std::string("1.5e+3"), std::string("N")));
    EXPECT_EQ(split_output_value("NaN"), std::make_pair(std::string("NaN"), std::string()));
}
