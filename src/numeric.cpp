#include "../include/statbench/numeric.hpp"

#include <cmath>

namespace statbench {

NumericEvaluation NumericEvaluator::evaluate(const ModelResponse& response, const ExpectedAnswer& expected) const {
    return score(m_extractor.extract(response), expected);
}

NumericEvaluation NumericEvaluator::score(std::optional<double> extracted, const ExpectedAnswer& expected) {
    if (const auto* numeric = std::get_if<NumericAnswer>(&expected)) {
        return score(extracted, *numeric);
    }
    if (const auto* range = std::get_if<NumericRangeAnswer>(&expected)) {
        return score(extracted, *range);
    }
    NumericEvaluation evaluation;
    evaluation.extracted = extracted;
    evaluation.expected_value = 0.0;
    return evaluation;
}

NumericEvaluation NumericEvaluator::score(std::optional<double> extracted, const NumericAnswer& expected) {
    NumericEvaluation evaluation;
    evaluation.expected_value = expected.value;
    if (!extracted) {
        return evaluation;
    }
    evaluation.extracted = extracted;

    double difference = 0.0;
    if (expected.tolerance_kind == ToleranceKind::Relative) {
        difference = expected.value == 0.0 ? std::fabs(*extracted)
                                           : std::fabs(*extracted - expected.value) / std::fabs(expected.value);
    } else {
        difference = std::fabs(*extracted - expected.value);
    }
    evaluation.difference = difference;
    evaluation.within_tolerance = difference <= expected.tolerance;
    evaluation.correct = evaluation.within_tolerance;
    return evaluation;
}

NumericEvaluation NumericEvaluator::score(std::optional<double> extracted, const NumericRangeAnswer& expected) {
    NumericEvaluation evaluation;
    evaluation.expected_value = (expected.min + expected.max) / 2.0;
    if (!extracted) {
        return evaluation;
    }
    evaluation.extracted = extracted;

    const double value = *extracted;
    const bool inside = expected.min <= value && value <= expected.max;
    if (inside) {
        evaluation.difference = 0.0;
    } else if (value < expected.min) {
        evaluation.difference = expected.min - value;
    } else {
        evaluation.difference = value - expected.max;
    }
    evaluation.within_tolerance = inside;
    evaluation.correct = inside;
    return evaluation;
}

} // namespace statbench
