#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace statbench {

enum class Difficulty {
    Easy,
    Medium,
    Hard,
    Expert
};

Difficulty parse_difficulty(const std::string& name);
std::string difficulty_to_string(Difficulty difficulty);

enum class ToleranceKind {
    Relative,
    Absolute
};

struct NumericAnswer {
    double value = 0.0;
    double tolerance = 0.01;
    ToleranceKind tolerance_kind = ToleranceKind::Relative;
};

struct NumericRangeAnswer {
    double min = 0.0;
    double max = 0.0;
};

struct CategoricalAnswer {
    std::string value;
    std::vector<std::string> alternatives;
};

struct BooleanAnswer {
    bool value = false;
};

using ExpectedAnswer = std::variant<NumericAnswer, NumericRangeAnswer, CategoricalAnswer, BooleanAnswer>;

// Human-readable form handed to the judge, e.g. "numeric 0.8 (relative tolerance 0.01)".
std::string describe(const ExpectedAnswer& answer);

enum class EvaluationMethod {
    ExactMatch,
    LlmJudge,
    Hybrid
};

EvaluationMethod parse_evaluation_method(const std::string& name);
std::string evaluation_method_to_string(EvaluationMethod method);

struct EvaluationPolicy {
    EvaluationMethod method = EvaluationMethod::ExactMatch;
    std::optional<std::string> rubric;
    std::vector<std::string> key_concepts;
    double numeric_weight = 0.7;
    double explanation_weight = 0.3;
};

struct Question {
    std::string id;
    std::string category;
    Difficulty difficulty = Difficulty::Medium;
    std::string prompt;
    std::optional<std::string> context;
    std::optional<std::string> source;
    ExpectedAnswer expected;
    EvaluationPolicy policy;
    bool requires_code = false;
};

const std::vector<std::string>& known_categories();
bool is_known_category(const std::string& category);
bool is_valid_question_id(const std::string& id);

} // namespace statbench
