#pragma once

#include "judge.hpp"
#include "numeric.hpp"
#include "question.hpp"
#include "response.hpp"
#include "result.hpp"

#include <optional>
#include <string>

namespace statbench {

// Turns a response into one Evaluation according to the question's policy.
//   exact_match  deterministic 0/1 per answer kind
//   llm_judge    judge score for overall and explanation
//   hybrid       nw * numeric + ew * judge, clamped
// A judge-backed policy without a configured judge throws.
class CompositeEvaluator {
public:
    explicit CompositeEvaluator(const JudgeEvaluator* judge = nullptr);

    Evaluation evaluate(const Question& question, const ModelResponse& response) const;

    static bool categorical_match(const CategoricalAnswer& expected, const std::string& text);
    // Case-insensitive token presence. Expected false needs "no" or "false";
    // expected true needs "yes" or "true" and no standalone "no"/"false".
    static bool boolean_match(const BooleanAnswer& expected, const std::string& text);

private:
    const JudgeEvaluator* m_judge;
    NumericEvaluator m_numeric;

    Evaluation exact_match(const Question& question, const ModelResponse& response) const;
    Evaluation llm_judge(const Question& question, const ModelResponse& response) const;
    Evaluation hybrid(const Question& question, const ModelResponse& response) const;
    const JudgeEvaluator& require_judge(const Question& question) const;
};

} // namespace statbench
