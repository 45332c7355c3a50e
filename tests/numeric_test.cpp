#include "statbench/numeric.hpp"

#include <gtest/gtest.h>

using statbench::BooleanAnswer;
using statbench::ModelResponse;
using statbench::NumericAnswer;
using statbench::NumericEvaluator;
using statbench::NumericRangeAnswer;
using statbench::ToleranceKind;

TEST(NumericTest, RelativeToleranceWithinBound) {
    NumericEvaluator evaluator;
    ModelResponse response;
    response.content = "After computing, the final answer is 1.97";
    const auto evaluation = evaluator.evaluate(response, NumericAnswer{1.96, 0.01, ToleranceKind::Relative});
    EXPECT_TRUE(evaluation.correct);
    EXPECT_DOUBLE_EQ(evaluation.extracted.value(), 1.97);
    EXPECT_NEAR(evaluation.difference.value(), 0.0051, 1e-4);
    EXPECT_DOUBLE_EQ(evaluation.expected_value, 1.96);
}

TEST(NumericTest, RangeOutsideReportsDistance) {
    NumericEvaluator evaluator;
    ModelResponse response;
    response.content = "n = 45";
    const auto evaluation = evaluator.evaluate(response, NumericRangeAnswer{30.0, 40.0});
    EXPECT_FALSE(evaluation.correct);
    EXPECT_DOUBLE_EQ(evaluation.extracted.value(), 45.0);
    EXPECT_DOUBLE_EQ(evaluation.difference.value(), 5.0);
    EXPECT_DOUBLE_EQ(evaluation.expected_value, 35.0);
}

TEST(NumericTest, RangeBoundsAreInclusive) {
    const NumericRangeAnswer range{30.0, 40.0};
    EXPECT_TRUE(NumericEvaluator::score(30.0, range).correct);
    EXPECT_TRUE(NumericEvaluator::score(40.0, range).correct);
    const auto below = NumericEvaluator::score(25.0, range);
    EXPECT_FALSE(below.correct);
    EXPECT_DOUBLE_EQ(below.difference.value(), 5.0);
}

TEST(NumericTest, AbsoluteTolerance) {
    const NumericAnswer expected{100.0, 2.0, ToleranceKind::Absolute};
    EXPECT_TRUE(NumericEvaluator::score(102.0, expected).correct);
    EXPECT_FALSE(NumericEvaluator::score(102.5, expected).correct);
}

TEST(NumericTest, ZeroExpectedUsesAbsoluteDifference) {
    const NumericAnswer expected{0.0, 0.01, ToleranceKind::Relative};
    EXPECT_TRUE(NumericEvaluator::score(0.005, expected).correct);
    const auto far = NumericEvaluator::score(0.5, expected);
    EXPECT_FALSE(far.correct);
    EXPECT_DOUBLE_EQ(far.difference.value(), 0.5);
}

TEST(NumericTest, MissingValueIsIncorrect) {
    const auto evaluation = NumericEvaluator::score(std::nullopt, NumericAnswer{1.0, 0.01, ToleranceKind::Relative});
    EXPECT_FALSE(evaluation.correct);
    EXPECT_FALSE(evaluation.extracted.has_value());
    EXPECT_FALSE(evaluation.difference.has_value());
}

TEST(NumericTest, NonNumericKindsNeverCorrect) {
    const auto evaluation = NumericEvaluator::score(1.0, statbench::ExpectedAnswer{BooleanAnswer{true}});
    EXPECT_FALSE(evaluation.correct);
    EXPECT_DOUBLE_EQ(evaluation.expected_value, 0.0);
}
