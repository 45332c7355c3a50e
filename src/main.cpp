#include "../include/statbench/chat/completion.hpp"
#include "../include/statbench/composite.hpp"
#include "../include/statbench/config.hpp"
#include "../include/statbench/judge.hpp"
#include "../include/statbench/log.hpp"
#include "../include/statbench/prompts.hpp"
#include "../include/statbench/questions.hpp"
#include "../include/statbench/report.hpp"
#include "../include/statbench/runner.hpp"
#include "../include/statbench/sandbox.hpp"
#include "../include/statbench/tools.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kComponent = "statbench";

void require_choices(const std::vector<std::string>& values,
                     const std::vector<std::string>& allowed,
                     const std::string& option) {
    for (const auto& value : values) {
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            throw std::runtime_error("invalid value '" + value + "' for --" + option);
        }
    }
}

void list_questions(const statbench::QuestionBank& bank) {
    const auto questions = bank.load_all();
    const auto stats = statbench::summarize_questions(questions);

    std::cout << "\nQuestion Bank Statistics:\n";
    std::cout << "  Total questions: " << stats.total << '\n';
    std::cout << "\nBy Category:\n";
    for (const auto& [category, count] : stats.by_category) {
        std::cout << "  " << category << ": " << count << '\n';
    }
    std::cout << "\nBy Difficulty:\n";
    for (const char* difficulty : {"easy", "medium", "hard", "expert"}) {
        if (auto it = stats.by_difficulty.find(difficulty); it != stats.by_difficulty.end()) {
            std::cout << "  " << difficulty << ": " << it->second << '\n';
        }
    }
    std::cout << "\nQuestions:\n";
    for (const auto& question : questions) {
        std::cout << "  " << question.id << " (" << question.category << ", "
                  << statbench::difficulty_to_string(question.difficulty) << ")"
                  << (question.requires_code ? " [code]" : "") << '\n';
    }
}

int run(int argc, char** argv) {
    using namespace statbench;

    cxxopts::Options options("statbench", "Statistics benchmark for language models with sandboxed tool use");
    options.add_options()
        ("m,models", "Models to test (comma separated)", cxxopts::value<std::vector<std::string>>())
        ("c,categories", "Filter to categories (comma separated)", cxxopts::value<std::vector<std::string>>())
        ("d,difficulties", "Filter to difficulties (comma separated)", cxxopts::value<std::vector<std::string>>())
        ("q,questions", "Specific question ids to run (comma separated)", cxxopts::value<std::vector<std::string>>())
        ("questions-dir", "Directory of *.jsonl question files", cxxopts::value<std::string>())
        ("o,output", "Output directory for results", cxxopts::value<std::string>())
        ("f,format", "Output formats: json, markdown, csv", cxxopts::value<std::vector<std::string>>()->default_value("json,markdown"))
        ("list-questions", "List available questions and exit")
        ("h,help", "Print usage");

    auto parsed = options.parse(argc, argv);
    if (parsed.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    BenchmarkConfig config = resolve_benchmark_config();
    if (parsed.count("questions-dir")) {
        config.questions_dir = parsed["questions-dir"].as<std::string>();
    }
    if (parsed.count("output")) {
        config.results_dir = parsed["output"].as<std::string>();
    }
    if (parsed.count("models")) {
        config.models = parsed["models"].as<std::vector<std::string>>();
    }
    if (parsed.count("categories")) {
        config.categories = parsed["categories"].as<std::vector<std::string>>();
        require_choices(config.categories, known_categories(), "categories");
    }
    if (parsed.count("difficulties")) {
        config.difficulties = parsed["difficulties"].as<std::vector<std::string>>();
        require_choices(config.difficulties, {"easy", "medium", "hard", "expert"}, "difficulties");
    }

    std::vector<ReportFormat> formats;
    for (const auto& name : parsed["format"].as<std::vector<std::string>>()) {
        formats.push_back(parse_report_format(name));
    }

    QuestionBank bank(config.questions_dir, config.evaluation);
    if (parsed.count("list-questions")) {
        list_questions(bank);
        return 0;
    }

    QuestionFilter filter;
    filter.categories = config.categories;
    filter.difficulties = config.difficulties;
    if (parsed.count("questions")) {
        filter.ids = parsed["questions"].as<std::vector<std::string>>();
    }
    const std::vector<Question> questions = bank.load(filter);
    if (questions.empty()) {
        log_error(kComponent, "no questions found matching the specified filters in " + config.questions_dir.string());
        return 1;
    }

    chat::CompletionClientPtr client = chat::make_completion_client(config.provider);
    const PromptSet prompts = load_prompts(config.prompts_dir);

    std::unique_ptr<Sandbox> sandbox = make_sandbox(config.sandbox);
    ToolDispatcher dispatcher;
    register_python_tool(dispatcher, *sandbox);

    std::unique_ptr<JudgeEvaluator> judge;
    if (!config.evaluation.judge_model.empty()) {
        judge = std::make_unique<JudgeEvaluator>(*client, config.evaluation.judge_model, prompts.judge_template);
    }
    CompositeEvaluator evaluator(judge.get());

    RunnerOptions runner_options;
    runner_options.concurrency = config.runner.concurrency;
    runner_options.max_tool_iterations = config.runner.max_tool_iterations;
    runner_options.system_prompt = prompts.system_prompt;
    runner_options.tools = {python_tool_definition()};

    Runner runner(*client, dispatcher, evaluator, std::move(runner_options));
    const BenchmarkResult result = runner.run(config.models, questions);

    for (const auto& path : write_reports(result, config.results_dir, formats)) {
        log_info(kComponent, "results saved to " + path.string());
    }
    print_summary(result, std::cout);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& ex) {
        statbench::log_error(kComponent, std::string("error running benchmark: ") + ex.what());
        return 1;
    }
}
