#pragma once

#include "chat/completion.hpp"
#include "composite.hpp"
#include "json.hpp"
#include "question.hpp"
#include "result.hpp"
#include "tools.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace statbench {

// Counting gate bounding how many question attempts are in flight.
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t capacity);

    void acquire();
    void release();

    std::size_t capacity() const noexcept { return m_capacity; }
    std::size_t in_flight() const;

private:
    const std::size_t m_capacity;
    std::size_t m_in_flight{0};
    mutable std::mutex m_mutex;
    std::condition_variable m_released;
};

struct RunnerOptions {
    std::size_t concurrency = 3;
    int max_tool_iterations = 10;
    std::optional<std::string> system_prompt;
    JsonArray tools;
};

// Called once per finished attempt, from the worker thread that ran it.
using ProgressCallback = std::function<void(std::size_t index, std::size_t total, const QuestionResult& result)>;

// Runs every question against every model. Within a model questions are
// admitted in order through the gate, each attempt runs on its own thread
// and writes only its own pre-allocated slot, so results keep input order.
// Any std::exception inside an attempt becomes a failed QuestionResult.
class Runner {
public:
    Runner(chat::CompletionClient& client,
           const ToolDispatcher& dispatcher,
           const CompositeEvaluator& evaluator,
           RunnerOptions options);

    QuestionResult run_question(const std::string& model, const Question& question) const;
    std::vector<QuestionResult> run_model(const std::string& model, const std::vector<Question>& questions) const;
    BenchmarkResult run(const std::vector<std::string>& models, const std::vector<Question>& questions) const;

    void set_progress_callback(ProgressCallback callback) { m_progress = std::move(callback); }

private:
    chat::CompletionClient& m_client;
    const ToolDispatcher& m_dispatcher;
    const CompositeEvaluator& m_evaluator;
    RunnerOptions m_options;
    ProgressCallback m_progress;

    ModelResponse attempt(const std::string& model, const Question& question) const;
    void report_progress(std::size_t index, std::size_t total, const QuestionResult& result) const;
};

} // namespace statbench
