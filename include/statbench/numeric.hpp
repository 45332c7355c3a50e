#pragma once

#include "extract.hpp"
#include "question.hpp"
#include "response.hpp"
#include "result.hpp"

#include <optional>

namespace statbench {

class NumericEvaluator {
public:
    NumericEvaluation evaluate(const ModelResponse& response, const ExpectedAnswer& expected) const;

    // Scores an already extracted value. Only numeric and range answers can
    // be correct; other kinds report expected_value 0.
    static NumericEvaluation score(std::optional<double> extracted, const ExpectedAnswer& expected);
    static NumericEvaluation score(std::optional<double> extracted, const NumericAnswer& expected);
    static NumericEvaluation score(std::optional<double> extracted, const NumericRangeAnswer& expected);

private:
    AnswerExtractor m_extractor;
};

} // namespace statbench
