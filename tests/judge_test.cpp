#include "statbench/judge.hpp"
#include "statbench/prompts.hpp"

#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>

using statbench::JudgeEvaluator;
using statbench::ModelResponse;
using statbench::Question;
using statbench::ToolResult;
using statbench::testing::ScriptedClient;
using statbench::testing::text_response;

namespace {

Question power_question() {
    Question question;
    question.id = "power_001";
    question.category = "power_analysis";
    question.prompt = "What sample size gives 80% power for d = 0.5?";
    question.expected = statbench::NumericAnswer{64.0, 0.05, statbench::ToleranceKind::Relative};
    question.policy.method = statbench::EvaluationMethod::LlmJudge;
    question.policy.key_concepts = {"effect size", "alpha"};
    return question;
}

} // namespace

TEST(JudgeTest, FencedVerdictIgnoresSurroundingProse) {
    const auto verdict = JudgeEvaluator::parse_verdict(
        "Here is my assessment.\n```json\n{\"score\": 0.8, \"reasoning\": \"ok\"}\n```\nHope that helps {not json}.");
    EXPECT_DOUBLE_EQ(verdict.score, 0.8);
    EXPECT_EQ(verdict.reasoning, "ok");
}

TEST(JudgeTest, VeryLongFencedVerdictParsesOnWorkerThread) {
    const std::string reply = "Thinking it over.\n```json\n{\"score\": 0.7, \"reasoning\": \"" +
                              std::string(150000, 'x') + "\"}\n```\n";
    statbench::JudgeEvaluation verdict;
    // Worker threads have smaller stacks than the main thread.
    std::thread worker([&verdict, &reply] { verdict = JudgeEvaluator::parse_verdict(reply); });
    worker.join();
    EXPECT_DOUBLE_EQ(verdict.score, 0.7);
    EXPECT_EQ(verdict.reasoning.size(), 150000u);
}

TEST(JudgeTest, UnclosedFenceFallsBackToBraces) {
    const auto verdict = JudgeEvaluator::parse_verdict("```json\n{\"score\": 0.4}");
    EXPECT_DOUBLE_EQ(verdict.score, 0.4);
}

TEST(JudgeTest, BraceSpanFallback) {
    const auto verdict = JudgeEvaluator::parse_verdict(
        R"(Verdict: {"score": "0.6", "reasoning": "partial", "key_concepts_found": ["alpha"], "key_concepts_missing": ["effect size"]})");
    EXPECT_DOUBLE_EQ(verdict.score, 0.6);
    ASSERT_EQ(verdict.key_concepts_found.size(), 1u);
    EXPECT_EQ(verdict.key_concepts_found.front(), "alpha");
    EXPECT_EQ(verdict.key_concepts_missing.front(), "effect size");
}

TEST(JudgeTest, ScoreIsClamped) {
    EXPECT_DOUBLE_EQ(JudgeEvaluator::parse_verdict(R"({"score": 1.7})").score, 1.0);
    EXPECT_DOUBLE_EQ(JudgeEvaluator::parse_verdict(R"({"score": -2})").score, 0.0);
}

TEST(JudgeTest, UnparseableVerdictScoresZero) {
    const auto verdict = JudgeEvaluator::parse_verdict("I think this deserves a good grade.");
    EXPECT_DOUBLE_EQ(verdict.score, 0.0);
    EXPECT_EQ(verdict.reasoning, "Failed to parse judge response: I think this deserves a good grade.");

    const std::string long_reply(500, 'x');
    EXPECT_EQ(JudgeEvaluator::parse_verdict(long_reply).reasoning,
              "Failed to parse judge response: " + std::string(200, 'x'));
}

TEST(JudgeTest, PromptCarriesQuestionContext) {
    ScriptedClient client;
    JudgeEvaluator judge(client, "judge/model");
    ModelResponse response;
    response.content = "n = 64 per group";

    const std::string prompt = judge.build_prompt(power_question(), response);
    EXPECT_NE(prompt.find("What sample size gives 80% power"), std::string::npos);
    EXPECT_NE(prompt.find("effect size, alpha"), std::string::npos);
    EXPECT_NE(prompt.find("Evaluate correctness and explanation quality"), std::string::npos);
    EXPECT_NE(prompt.find("No tool calls made"), std::string::npos);
    EXPECT_NE(prompt.find("n = 64 per group"), std::string::npos);
}

TEST(JudgeTest, ToolTranscriptListsCallsInOrder) {
    ModelResponse response;
    ToolResult first;
    first.tool_name = "execute_python";
    first.input = statbench::Json::parse(R"json({"code":"print(1)"})json");
    first.output = "1";
    ToolResult second = first;
    second.output = "2";
    response.tool_history = {first, second};
    EXPECT_EQ(JudgeEvaluator::tool_transcript(response),
              "Tool: execute_python\nInput: {\"code\":\"print(1)\"}\nOutput: 1\n"
              "Tool: execute_python\nInput: {\"code\":\"print(1)\"}\nOutput: 2");
}

TEST(JudgeTest, EvaluateAsksJudgeModelWithoutTools) {
    ScriptedClient client;
    client.push(text_response(R"({"score": 0.9, "reasoning": "correct"})"));
    JudgeEvaluator judge(client, "judge/model");

    const auto verdict = judge.evaluate(power_question(), text_response("64"));
    EXPECT_DOUBLE_EQ(verdict.score, 0.9);

    const auto calls = client.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls.front().model, "judge/model");
    EXPECT_FALSE(calls.front().had_tools);
    EXPECT_EQ(calls.front().system_prompt.value(), "You are an expert evaluator. Respond with JSON only.");
}

TEST(PromptsTest, RenderLeavesUnknownBraces) {
    EXPECT_EQ(statbench::render_template("{a} and {b} with {\"score\": 1}", {{"a", "x"}}),
              "x and {b} with {\"score\": 1}");
}

TEST(PromptsTest, FormatQuestionAppendsContext) {
    Question question = power_question();
    EXPECT_EQ(statbench::format_question(question), question.prompt);
    question.context = "Two-sided test.";
    EXPECT_EQ(statbench::format_question(question), question.prompt + "\n\nAdditional context:\nTwo-sided test.");
}

TEST(PromptsTest, DirectoryOverridesBuiltIns) {
    const auto dir = std::filesystem::temp_directory_path() / "statbench-prompts-test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "benchmark_system.txt");
        out << "Custom system prompt";
    }
    const auto prompts = statbench::load_prompts(dir);
    EXPECT_EQ(prompts.system_prompt, "Custom system prompt");
    EXPECT_EQ(prompts.judge_template, statbench::default_judge_template());
    std::filesystem::remove_all(dir);

    const auto defaults = statbench::load_prompts(dir);
    EXPECT_EQ(defaults.system_prompt, statbench::default_system_prompt());
}
