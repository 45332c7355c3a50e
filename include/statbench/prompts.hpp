#pragma once

#include "question.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace statbench {

const std::string& default_system_prompt();
const std::string& default_judge_template();

struct PromptSet {
    std::string system_prompt = default_system_prompt();
    std::string judge_template = default_judge_template();
};

// benchmark_system.txt and judge_prompt.txt in `directory` replace the
// built-in prompts when present.
PromptSet load_prompts(const std::filesystem::path& directory);

// Replaces "{name}" for every key in `values`. Other braces stay as written.
std::string render_template(const std::string& text, const std::map<std::string, std::string>& values);

// The user turn for a question: its text, then any additional context.
std::string format_question(const Question& question);

} // namespace statbench
