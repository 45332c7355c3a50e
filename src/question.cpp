#include "../include/statbench/question.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace statbench {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Difficulty parse_difficulty(const std::string& name) {
    if (name == "easy") return Difficulty::Easy;
    if (name == "medium") return Difficulty::Medium;
    if (name == "hard") return Difficulty::Hard;
    if (name == "expert") return Difficulty::Expert;
    throw std::runtime_error("unknown difficulty: " + name);
}

std::string difficulty_to_string(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard: return "hard";
    case Difficulty::Expert: return "expert";
    }
    return "unknown";
}

EvaluationMethod parse_evaluation_method(const std::string& name) {
    if (name == "exact_match") return EvaluationMethod::ExactMatch;
    if (name == "llm_judge") return EvaluationMethod::LlmJudge;
    if (name == "hybrid") return EvaluationMethod::Hybrid;
    throw std::runtime_error("unknown evaluation method: " + name);
}

std::string evaluation_method_to_string(EvaluationMethod method) {
    switch (method) {
    case EvaluationMethod::ExactMatch: return "exact_match";
    case EvaluationMethod::LlmJudge: return "llm_judge";
    case EvaluationMethod::Hybrid: return "hybrid";
    }
    return "unknown";
}

std::string describe(const ExpectedAnswer& answer) {
    std::ostringstream oss;
    std::visit(overloaded{
                   [&](const NumericAnswer& numeric) {
                       oss << "numeric " << numeric.value << " ("
                           << (numeric.tolerance_kind == ToleranceKind::Relative ? "relative" : "absolute")
                           << " tolerance " << numeric.tolerance << ")";
                   },
                   [&](const NumericRangeAnswer& range) {
                       oss << "numeric range [" << range.min << ", " << range.max << "]";
                   },
                   [&](const CategoricalAnswer& categorical) {
                       oss << "categorical \"" << categorical.value << "\"";
                       if (!categorical.alternatives.empty()) {
                           oss << " (also accepted: ";
                           for (std::size_t i = 0; i < categorical.alternatives.size(); ++i) {
                               if (i > 0) oss << ", ";
                               oss << '"' << categorical.alternatives[i] << '"';
                           }
                           oss << ")";
                       }
                   },
                   [&](const BooleanAnswer& boolean) {
                       oss << "boolean " << (boolean.value ? "true" : "false");
                   },
               },
               answer);
    return oss.str();
}

const std::vector<std::string>& known_categories() {
    static const std::vector<std::string> categories = {
        "power_analysis",
        "sample_size",
        "significance_testing",
        "confidence_intervals",
        "effect_size",
    };
    return categories;
}

bool is_known_category(const std::string& category) {
    const auto& categories = known_categories();
    return std::find(categories.begin(), categories.end(), category) != categories.end();
}

bool is_valid_question_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

} // namespace statbench
