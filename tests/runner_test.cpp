#include "statbench/runner.hpp"

#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using statbench::AdmissionGate;
using statbench::CompositeEvaluator;
using statbench::ModelResponse;
using statbench::NumericAnswer;
using statbench::Question;
using statbench::Runner;
using statbench::RunnerOptions;
using statbench::ToolDispatcher;
using statbench::testing::ScriptedClient;
using statbench::testing::text_response;

namespace {

std::vector<Question> numbered_questions(int count) {
    std::vector<Question> questions;
    for (int i = 0; i < count; ++i) {
        Question question;
        question.id = "q_" + std::to_string(i);
        question.category = "sample_size";
        question.difficulty = i % 2 == 0 ? statbench::Difficulty::Easy : statbench::Difficulty::Hard;
        question.prompt = std::to_string(i);
        question.expected = NumericAnswer{static_cast<double>(i + 10), 0.01, statbench::ToleranceKind::Relative};
        questions.push_back(question);
    }
    return questions;
}

int question_number(const ScriptedClient::Call& call) {
    return std::stoi(call.conversation.front().content);
}

} // namespace

TEST(AdmissionGateTest, CountsInFlight) {
    AdmissionGate gate(2);
    gate.acquire();
    gate.acquire();
    EXPECT_EQ(gate.in_flight(), 2u);
    gate.release();
    EXPECT_EQ(gate.in_flight(), 1u);
    EXPECT_EQ(AdmissionGate(0).capacity(), 1u);
}

TEST(RunnerTest, ResultsKeepInputOrderAndBoundConcurrency) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    ScriptedClient client([&](const ScriptedClient::Call& call) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        const int n = question_number(call);
        // Earlier questions finish later.
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (8 - n)));
        --active;
        return text_response("The answer is " + std::to_string(n + 10));
    });
    ToolDispatcher dispatcher;
    CompositeEvaluator evaluator;
    RunnerOptions options;
    options.concurrency = 3;
    options.system_prompt = "system";
    Runner runner(client, dispatcher, evaluator, options);

    const auto questions = numbered_questions(8);
    const auto results = runner.run_model("vendor/model", questions);

    ASSERT_EQ(results.size(), questions.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].question_id, questions[i].id);
        EXPECT_TRUE(results[i].success);
        EXPECT_DOUBLE_EQ(results[i].evaluation->overall_score, 1.0);
    }
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
    for (const auto& call : client.calls()) {
        EXPECT_EQ(call.system_prompt.value(), "system");
        EXPECT_FALSE(call.had_tools);
    }
}

TEST(RunnerTest, FailedAttemptIsRecordedNotThrown) {
    ScriptedClient client([](const ScriptedClient::Call& call) -> ModelResponse {
        if (question_number(call) == 1) {
            throw std::runtime_error("[http] POST failed: timeout");
        }
        return text_response("The answer is " + std::to_string(question_number(call) + 10));
    });
    ToolDispatcher dispatcher;
    CompositeEvaluator evaluator;
    Runner runner(client, dispatcher, evaluator, RunnerOptions{});

    std::atomic<int> progress_calls{0};
    runner.set_progress_callback([&](std::size_t, std::size_t total, const statbench::QuestionResult&) {
        EXPECT_EQ(total, 3u);
        ++progress_calls;
    });

    const auto result = runner.run({"a/one", "b/two"}, numbered_questions(3));
    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0].first, "a/one");
    EXPECT_EQ(result.results[1].first, "b/two");
    const auto& rows = result.results[0].second;
    EXPECT_TRUE(rows[0].success);
    EXPECT_FALSE(rows[1].success);
    EXPECT_FALSE(rows[1].evaluation.has_value());
    EXPECT_EQ(rows[1].error.value(), "[http] POST failed: timeout");
    EXPECT_TRUE(rows[2].success);
    EXPECT_EQ(progress_calls.load(), 6);
}

TEST(RunnerTest, CodeQuestionsGoThroughToolLoop) {
    ScriptedClient client;
    client.push(text_response("The answer is 10"));
    ToolDispatcher dispatcher;
    CompositeEvaluator evaluator;
    RunnerOptions options;
    options.tools = {statbench::python_tool_definition()};
    Runner runner(client, dispatcher, evaluator, options);

    auto questions = numbered_questions(1);
    questions.front().requires_code = true;
    const auto result = runner.run_question("m", questions.front());
    EXPECT_TRUE(result.success);
    ASSERT_EQ(client.calls().size(), 1u);
    EXPECT_TRUE(client.calls().front().had_tools);
}

TEST(RunnerTest, EmptyQuestionSetIsRejected) {
    ScriptedClient client;
    ToolDispatcher dispatcher;
    CompositeEvaluator evaluator;
    Runner runner(client, dispatcher, evaluator, RunnerOptions{});
    EXPECT_THROW(runner.run({"m"}, {}), std::runtime_error);
}
