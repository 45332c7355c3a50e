#pragma once

#include "chat/completion.hpp"
#include "question.hpp"
#include "response.hpp"
#include "result.hpp"

#include <string>

namespace statbench {

// Asks a second model to grade a response against the expected answer,
// rubric and key concepts. An unparseable verdict scores 0; transport
// failures propagate.
class JudgeEvaluator {
public:
    JudgeEvaluator(chat::CompletionClient& client, std::string model, std::string prompt_template = std::string());

    JudgeEvaluation evaluate(const Question& question, const ModelResponse& response) const;

    std::string build_prompt(const Question& question, const ModelResponse& response) const;

    static std::string tool_transcript(const ModelResponse& response);
    static JudgeEvaluation parse_verdict(const std::string& reply);

    const std::string& model() const noexcept { return m_model; }

private:
    chat::CompletionClient& m_client;
    std::string m_model;
    std::string m_template;
};

} // namespace statbench
