#include "../include/statbench/judge.hpp"
#include "../include/statbench/prompts.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>

namespace statbench {

namespace {

constexpr const char* kJudgeSystemPrompt = "You are an expert evaluator. Respond with JSON only.";
constexpr const char* kDefaultRubric = "Evaluate correctness and explanation quality";
constexpr std::size_t kExcerptLength = 200;

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << items[i];
    }
    return oss.str();
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Plain searches only: replies can run to hundreds of kilobytes.
std::string candidate_json(const std::string& reply) {
    static const std::string kFenceOpen = "```json";
    static const std::string kFenceClose = "```";
    if (const std::size_t open = reply.find(kFenceOpen); open != std::string::npos) {
        const std::size_t body = open + kFenceOpen.size();
        if (const std::size_t close = reply.find(kFenceClose, body); close != std::string::npos) {
            return trim(reply.substr(body, close - body));
        }
    }
    const std::size_t open = reply.find('{');
    const std::size_t close = reply.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        return reply.substr(open, close - open + 1);
    }
    return reply;
}

std::vector<std::string> string_list(const JsonObject& obj, const std::string& key) {
    std::vector<std::string> items;
    if (const Json* value = find_member(obj, key); value && value->is_array()) {
        for (const auto& item : value->as_array()) {
            if (item.is_string()) {
                items.push_back(item.as_string());
            }
        }
    }
    return items;
}

double score_value(const Json& value) {
    double score = 0.0;
    if (value.is_number()) {
        score = value.as_number();
    } else if (value.is_string()) {
        score = std::stod(value.as_string());
    } else {
        throw std::runtime_error("score is not a number");
    }
    if (!std::isfinite(score)) {
        throw std::runtime_error("score is not finite");
    }
    return score;
}

} // namespace

JudgeEvaluator::JudgeEvaluator(chat::CompletionClient& client, std::string model, std::string prompt_template)
    : m_client(client),
      m_model(std::move(model)),
      m_template(prompt_template.empty() ? default_judge_template() : std::move(prompt_template)) {}

std::string JudgeEvaluator::tool_transcript(const ModelResponse& response) {
    if (response.tool_history.empty()) {
        return "No tool calls made";
    }
    std::vector<std::string> entries;
    entries.reserve(response.tool_history.size());
    for (const auto& result : response.tool_history) {
        entries.push_back("Tool: " + result.tool_name + "\nInput: " + result.input.dump() + "\nOutput: " + result.output);
    }
    return join(entries, "\n");
}

std::string JudgeEvaluator::build_prompt(const Question& question, const ModelResponse& response) const {
    const auto& policy = question.policy;
    std::map<std::string, std::string> values;
    values["question"] = question.prompt;
    values["expected_answer"] = describe(question.expected);
    values["rubric"] = policy.rubric && !policy.rubric->empty() ? *policy.rubric : kDefaultRubric;
    values["key_concepts"] = join(policy.key_concepts, ", ");
    values["response"] = response.content;
    values["tool_outputs"] = tool_transcript(response);
    return render_template(m_template, values);
}

JudgeEvaluation JudgeEvaluator::evaluate(const Question& question, const ModelResponse& response) const {
    const std::vector<ChatMessage> conversation = {ChatMessage::user(build_prompt(question, response))};
    const ModelResponse verdict = m_client.complete(conversation, m_model, nullptr, std::string(kJudgeSystemPrompt));
    return parse_verdict(verdict.content);
}

JudgeEvaluation JudgeEvaluator::parse_verdict(const std::string& reply) {
    JudgeEvaluation evaluation;
    try {
        const Json parsed = Json::parse(candidate_json(reply));
        if (!parsed.is_object()) {
            throw std::runtime_error("verdict is not an object");
        }
        const auto& obj = parsed.as_object();
        if (const Json* score = find_member(obj, "score"); score && !score->is_null()) {
            evaluation.score = clamp_score(score_value(*score));
        }
        evaluation.reasoning = find_string(obj, "reasoning").value_or("");
        evaluation.key_concepts_found = string_list(obj, "key_concepts_found");
        evaluation.key_concepts_missing = string_list(obj, "key_concepts_missing");
    } catch (const std::exception&) {
        evaluation = JudgeEvaluation{};
        evaluation.reasoning = "Failed to parse judge response: " + reply.substr(0, kExcerptLength);
    }
    return evaluation;
}

} // namespace statbench
