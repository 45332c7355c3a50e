#pragma once

#include "question.hpp"
#include "response.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statbench {

struct NumericEvaluation {
    bool correct = false;
    std::optional<double> extracted;
    double expected_value = 0.0;
    std::optional<double> difference;
    bool within_tolerance = false;
};

struct JudgeEvaluation {
    double score = 0.0;
    std::string reasoning;
    std::vector<std::string> key_concepts_found;
    std::vector<std::string> key_concepts_missing;
};

inline double clamp_score(double value) {
    return std::clamp(value, 0.0, 1.0);
}

struct Evaluation {
    double overall_score = 0.0;
    double numeric_score = 0.0;
    double explanation_score = 0.0;
    std::optional<NumericEvaluation> numeric;
    std::optional<JudgeEvaluation> judge;
};

// Clamps the three scores into [0,1].
inline Evaluation make_evaluation(double overall,
                                  double numeric_score,
                                  double explanation_score,
                                  std::optional<NumericEvaluation> numeric = std::nullopt,
                                  std::optional<JudgeEvaluation> judge = std::nullopt) {
    Evaluation evaluation;
    evaluation.overall_score = clamp_score(overall);
    evaluation.numeric_score = clamp_score(numeric_score);
    evaluation.explanation_score = clamp_score(explanation_score);
    evaluation.numeric = std::move(numeric);
    evaluation.judge = std::move(judge);
    return evaluation;
}

// success == true carries an evaluation; success == false carries an error.
struct QuestionResult {
    std::string question_id;
    std::string category;
    Difficulty difficulty = Difficulty::Medium;
    bool success = false;
    std::optional<ModelResponse> response;
    std::optional<Evaluation> evaluation;
    std::optional<std::string> error;
    double elapsed_seconds = 0.0;
};

struct ModelSummary {
    std::string provider;
    std::string model;
    std::size_t total_questions = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    double overall_accuracy = 0.0;
    double numeric_accuracy = 0.0;
    std::map<std::string, double> by_category;
    std::map<std::string, double> by_difficulty;
    long total_tokens = 0;
    double total_time_seconds = 0.0;
};

struct BenchmarkResult {
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::pair<std::string, std::vector<QuestionResult>>> results;
};

} // namespace statbench
