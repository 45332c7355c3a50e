#include "../include/statbench/questions.hpp"
#include "../include/statbench/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <stdexcept>

namespace statbench {

namespace {

constexpr const char* kComponent = "Questions";

const Json& require_member(const JsonObject& obj, const std::string& key) {
    const Json* value = find_member(obj, key);
    if (!value || value->is_null()) {
        throw std::runtime_error("missing field '" + key + "'");
    }
    return *value;
}

std::string require_string(const JsonObject& obj, const std::string& key) {
    const Json& value = require_member(obj, key);
    if (!value.is_string()) {
        throw std::runtime_error("field '" + key + "' must be a string");
    }
    return value.as_string();
}

double require_number(const JsonObject& obj, const std::string& key) {
    const Json& value = require_member(obj, key);
    if (!value.is_number()) {
        throw std::runtime_error("field '" + key + "' must be a number");
    }
    return value.as_number();
}

std::optional<std::string> optional_string(const JsonObject& obj, const std::string& key) {
    const Json* value = find_member(obj, key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw std::runtime_error("field '" + key + "' must be a string");
    }
    return value->as_string();
}

std::vector<std::string> string_array(const JsonObject& obj, const std::string& key) {
    std::vector<std::string> items;
    const Json* value = find_member(obj, key);
    if (!value || value->is_null()) {
        return items;
    }
    if (!value->is_array()) {
        throw std::runtime_error("field '" + key + "' must be an array of strings");
    }
    for (const auto& item : value->as_array()) {
        if (!item.is_string()) {
            throw std::runtime_error("field '" + key + "' must be an array of strings");
        }
        items.push_back(item.as_string());
    }
    return items;
}

ExpectedAnswer parse_expected(const Json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("field 'expected_answer' must be an object");
    }
    const auto& obj = value.as_object();
    const std::string type = find_string(obj, "type").value_or("numeric");

    if (type == "numeric") {
        NumericAnswer answer;
        answer.value = require_number(obj, "value");
        answer.tolerance = find_number(obj, "tolerance").value_or(answer.tolerance);
        if (answer.tolerance < 0.0) {
            throw std::runtime_error("tolerance must be non-negative");
        }
        auto kind = find_string(obj, "tolerance_type");
        if (!kind) {
            kind = find_string(obj, "tolerance_kind");
        }
        if (kind) {
            if (*kind == "relative") {
                answer.tolerance_kind = ToleranceKind::Relative;
            } else if (*kind == "absolute") {
                answer.tolerance_kind = ToleranceKind::Absolute;
            } else {
                throw std::runtime_error("unknown tolerance type '" + *kind + "'");
            }
        }
        return answer;
    }
    if (type == "numeric_range" || type == "range") {
        NumericRangeAnswer answer;
        answer.min = require_number(obj, "min");
        answer.max = require_number(obj, "max");
        if (answer.min > answer.max) {
            throw std::runtime_error("range min exceeds max");
        }
        return answer;
    }
    if (type == "categorical") {
        CategoricalAnswer answer;
        answer.value = require_string(obj, "value");
        answer.alternatives = string_array(obj, "alternatives");
        return answer;
    }
    if (type == "boolean") {
        const Json& flag = require_member(obj, "value");
        if (!flag.is_bool()) {
            throw std::runtime_error("boolean answer 'value' must be true or false");
        }
        return BooleanAnswer{flag.as_bool()};
    }
    throw std::runtime_error("unknown expected_answer type '" + type + "'");
}

EvaluationPolicy parse_policy(const Json* value, const EvaluationConfig& defaults) {
    EvaluationPolicy policy;
    policy.numeric_weight = defaults.numeric_weight;
    policy.explanation_weight = defaults.explanation_weight;
    if (!value || value->is_null()) {
        return policy;
    }
    if (!value->is_object()) {
        throw std::runtime_error("field 'evaluation' must be an object");
    }
    const auto& obj = value->as_object();
    if (auto method = find_string(obj, "method")) {
        policy.method = parse_evaluation_method(*method);
    }
    policy.rubric = optional_string(obj, "rubric");
    policy.key_concepts = string_array(obj, "key_concepts");
    if (auto weight = find_number(obj, "numeric_weight")) {
        policy.numeric_weight = *weight;
    }
    if (auto weight = find_number(obj, "explanation_weight")) {
        policy.explanation_weight = *weight;
    }
    if (policy.numeric_weight < 0.0 || policy.numeric_weight > 1.0 ||
        policy.explanation_weight < 0.0 || policy.explanation_weight > 1.0) {
        throw std::runtime_error("evaluation weights must lie in [0, 1]");
    }
    return policy;
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

} // namespace

Question parse_question(const Json& record, const EvaluationConfig& defaults) {
    if (!record.is_object()) {
        throw std::runtime_error("question record must be a JSON object");
    }
    const auto& obj = record.as_object();

    Question question;
    question.id = require_string(obj, "id");
    if (!is_valid_question_id(question.id)) {
        throw std::runtime_error("invalid question id '" + question.id + "'");
    }

    auto category = optional_string(obj, "category");
    if (!category) {
        category = optional_string(obj, "topic");
    }
    if (!category) {
        throw std::runtime_error("missing field 'category'");
    }
    if (!is_known_category(*category)) {
        throw std::runtime_error("unknown category '" + *category + "'");
    }
    question.category = *category;

    question.difficulty = parse_difficulty(require_string(obj, "difficulty"));
    question.prompt = require_string(obj, "question");
    question.context = optional_string(obj, "context");
    question.source = optional_string(obj, "source");
    if (const Json* flag = find_member(obj, "requires_code"); flag && !flag->is_null()) {
        if (!flag->is_bool()) {
            throw std::runtime_error("field 'requires_code' must be true or false");
        }
        question.requires_code = flag->as_bool();
    }
    question.expected = parse_expected(require_member(obj, "expected_answer"));
    question.policy = parse_policy(find_member(obj, "evaluation"), defaults);
    return question;
}

std::vector<Question> parse_question_lines(std::istream& input,
                                           const std::string& source_name,
                                           const EvaluationConfig& defaults) {
    std::vector<Question> questions;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
            continue;
        }
        try {
            questions.push_back(parse_question(Json::parse(line), defaults));
        } catch (const std::exception& ex) {
            log_warning(kComponent, source_name + ":" + std::to_string(line_number) + ": skipped, " + ex.what());
        }
    }
    return questions;
}

std::vector<Question> filter_questions(const std::vector<Question>& questions, const QuestionFilter& filter) {
    std::vector<Question> selected;
    for (const auto& question : questions) {
        if (!filter.categories.empty() && !contains(filter.categories, question.category)) {
            continue;
        }
        if (!filter.difficulties.empty() && !contains(filter.difficulties, difficulty_to_string(question.difficulty))) {
            continue;
        }
        if (!filter.ids.empty() && !contains(filter.ids, question.id)) {
            continue;
        }
        selected.push_back(question);
    }
    return selected;
}

QuestionStatistics summarize_questions(const std::vector<Question>& questions) {
    QuestionStatistics stats;
    stats.total = questions.size();
    for (const auto& question : questions) {
        ++stats.by_category[question.category];
        ++stats.by_difficulty[difficulty_to_string(question.difficulty)];
    }
    return stats;
}

QuestionBank::QuestionBank(std::filesystem::path directory, EvaluationConfig defaults)
    : m_directory(std::move(directory)), m_defaults(std::move(defaults)) {}

std::vector<Question> QuestionBank::load_all() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(m_directory, ec)) {
        throw std::runtime_error("[questions] directory not found: " + m_directory.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(m_directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".jsonl") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<Question> questions;
    std::set<std::string> seen;
    for (const auto& path : files) {
        std::ifstream file(path);
        if (!file) {
            log_warning(kComponent, "cannot open " + path.string());
            continue;
        }
        for (auto& question : parse_question_lines(file, path.filename().string(), m_defaults)) {
            if (!seen.insert(question.id).second) {
                log_warning(kComponent, path.filename().string() + ": duplicate id '" + question.id + "' skipped");
                continue;
            }
            questions.push_back(std::move(question));
        }
    }
    return questions;
}

std::vector<Question> QuestionBank::load(const QuestionFilter& filter) const {
    return filter_questions(load_all(), filter);
}

QuestionStatistics QuestionBank::statistics() const {
    return summarize_questions(load_all());
}

} // namespace statbench
