#include "../include/statbench/composite.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace statbench {

namespace {

std::string lowercase(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
}

// Offset of the first whole-word occurrence of `word` in `text`.
std::optional<std::size_t> find_word(const std::string& text, const std::string& word) {
    std::size_t pos = text.find(word);
    while (pos != std::string::npos) {
        const bool starts = pos == 0 || !is_word_char(text[pos - 1]);
        const std::size_t end = pos + word.size();
        const bool ends = end >= text.size() || !is_word_char(text[end]);
        if (starts && ends) {
            return pos;
        }
        pos = text.find(word, pos + 1);
    }
    return std::nullopt;
}

double binary(bool correct) {
    return correct ? 1.0 : 0.0;
}

} // namespace

CompositeEvaluator::CompositeEvaluator(const JudgeEvaluator* judge) : m_judge(judge) {}

bool CompositeEvaluator::categorical_match(const CategoricalAnswer& expected, const std::string& text) {
    const std::string haystack = lowercase(text);
    if (haystack.find(lowercase(expected.value)) != std::string::npos) {
        return true;
    }
    return std::any_of(expected.alternatives.begin(), expected.alternatives.end(), [&](const std::string& alternative) {
        return haystack.find(lowercase(alternative)) != std::string::npos;
    });
}

bool CompositeEvaluator::boolean_match(const BooleanAnswer& expected, const std::string& text) {
    const std::string haystack = lowercase(text);
    auto contains = [&haystack](const char* token) { return haystack.find(token) != std::string::npos; };
    if (!expected.value) {
        return contains("no") || contains("false");
    }
    // A standalone "no"/"false" vetoes the affirmative; "not", "know" or
    // "nominal" in the explanation do not.
    const bool negated = find_word(haystack, "no").has_value() || find_word(haystack, "false").has_value();
    return (contains("yes") || contains("true")) && !negated;
}

const JudgeEvaluator& CompositeEvaluator::require_judge(const Question& question) const {
    if (!m_judge) {
        throw std::runtime_error("question " + question.id + " uses " +
                                 evaluation_method_to_string(question.policy.method) +
                                 " evaluation but no judge model is configured");
    }
    return *m_judge;
}

Evaluation CompositeEvaluator::evaluate(const Question& question, const ModelResponse& response) const {
    switch (question.policy.method) {
    case EvaluationMethod::ExactMatch:
        return exact_match(question, response);
    case EvaluationMethod::LlmJudge:
        return llm_judge(question, response);
    case EvaluationMethod::Hybrid:
        return hybrid(question, response);
    }
    throw std::runtime_error("unknown evaluation method");
}

Evaluation CompositeEvaluator::exact_match(const Question& question, const ModelResponse& response) const {
    const ExpectedAnswer& expected = question.expected;

    if (std::holds_alternative<NumericAnswer>(expected) || std::holds_alternative<NumericRangeAnswer>(expected)) {
        NumericEvaluation numeric = m_numeric.evaluate(response, expected);
        const double score = binary(numeric.correct);
        return make_evaluation(score, score, 0.0, std::move(numeric));
    }
    if (const auto* categorical = std::get_if<CategoricalAnswer>(&expected)) {
        const double score = binary(categorical_match(*categorical, response.content));
        return make_evaluation(score, score, 0.0);
    }
    if (const auto* boolean = std::get_if<BooleanAnswer>(&expected)) {
        const double score = binary(boolean_match(*boolean, response.content));
        return make_evaluation(score, score, 0.0);
    }
    return make_evaluation(0.0, 0.0, 0.0);
}

Evaluation CompositeEvaluator::llm_judge(const Question& question, const ModelResponse& response) const {
    JudgeEvaluation verdict = require_judge(question).evaluate(question, response);
    const double score = verdict.score;
    return make_evaluation(score, 0.0, score, std::nullopt, std::move(verdict));
}

Evaluation CompositeEvaluator::hybrid(const Question& question, const ModelResponse& response) const {
    const JudgeEvaluator& judge = require_judge(question);

    std::optional<NumericEvaluation> numeric;
    double numeric_score = 0.0;
    if (std::holds_alternative<NumericAnswer>(question.expected) ||
        std::holds_alternative<NumericRangeAnswer>(question.expected)) {
        numeric = m_numeric.evaluate(response, question.expected);
        numeric_score = binary(numeric->correct);
    }

    JudgeEvaluation verdict = judge.evaluate(question, response);
    const double explanation_score = verdict.score;
    const auto& policy = question.policy;
    const double overall = policy.numeric_weight * numeric_score + policy.explanation_weight * explanation_score;
    return make_evaluation(overall, numeric_score, explanation_score, std::move(numeric), std::move(verdict));
}

} // namespace statbench
