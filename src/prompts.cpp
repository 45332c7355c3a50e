#include "../include/statbench/prompts.hpp"
#include "../include/statbench/log.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace statbench {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        log_warning("Prompts", "cannot open " + path.string());
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace

const std::string& default_system_prompt() {
    static const std::string prompt =
        "You are an expert statistician specializing in A/B testing.\n"
        "Use the execute_python tool for calculations. State your final answer clearly.";
    return prompt;
}

const std::string& default_judge_template() {
    static const std::string prompt = R"(You are evaluating an LLM response to an A/B testing statistics question.

## Question
{question}

## Expected Answer
{expected_answer}

## Grading Rubric
{rubric}

## Key Concepts
{key_concepts}

## Response
{response}

## Tool Outputs
{tool_outputs}

Evaluate and respond with JSON only:
```json
{
    "score": <0.0-1.0>,
    "reasoning": "<explanation>",
    "key_concepts_found": ["concept1"],
    "key_concepts_missing": ["concept2"]
}
```)";
    return prompt;
}

PromptSet load_prompts(const std::filesystem::path& directory) {
    PromptSet prompts;
    if (auto system = read_file(directory / "benchmark_system.txt")) {
        prompts.system_prompt = std::move(*system);
        log_info("Prompts", "system prompt loaded from " + (directory / "benchmark_system.txt").string());
    }
    if (auto judge = read_file(directory / "judge_prompt.txt")) {
        prompts.judge_template = std::move(*judge);
        log_info("Prompts", "judge template loaded from " + (directory / "judge_prompt.txt").string());
    }
    return prompts;
}

std::string render_template(const std::string& text, const std::map<std::string, std::string>& values) {
    std::string rendered;
    rendered.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t open = text.find('{', pos);
        if (open == std::string::npos) {
            rendered.append(text, pos, std::string::npos);
            break;
        }
        rendered.append(text, pos, open - pos);
        const std::size_t close = text.find('}', open + 1);
        if (close != std::string::npos) {
            auto it = values.find(text.substr(open + 1, close - open - 1));
            if (it != values.end()) {
                rendered += it->second;
                pos = close + 1;
                continue;
            }
        }
        rendered.push_back('{');
        pos = open + 1;
    }
    return rendered;
}

std::string format_question(const Question& question) {
    std::string text = question.prompt;
    if (question.context && !question.context->empty()) {
        text += "\n\nAdditional context:\n" + *question.context;
    }
    return text;
}

} // namespace statbench
