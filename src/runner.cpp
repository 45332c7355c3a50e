#include "../include/statbench/runner.hpp"
#include "../include/statbench/log.hpp"
#include "../include/statbench/prompts.hpp"
#include "../include/statbench/tool_loop.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace statbench {

namespace {

constexpr const char* kComponent = "Runner";

std::string progress_line(std::size_t index, std::size_t total, const QuestionResult& result) {
    std::ostringstream line;
    line << "  [" << index << '/' << total << "] " << result.question_id << ": ";
    if (result.success && result.evaluation) {
        line << "Score " << std::fixed << std::setprecision(2) << result.evaluation->overall_score;
    } else {
        line << "Error: " << result.error.value_or("unknown error");
    }
    return line.str();
}

} // namespace

AdmissionGate::AdmissionGate(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

void AdmissionGate::acquire() {
    std::unique_lock lock(m_mutex);
    m_released.wait(lock, [this] { return m_in_flight < m_capacity; });
    ++m_in_flight;
}

void AdmissionGate::release() {
    {
        std::scoped_lock lock(m_mutex);
        if (m_in_flight > 0) {
            --m_in_flight;
        }
    }
    m_released.notify_one();
}

std::size_t AdmissionGate::in_flight() const {
    std::scoped_lock lock(m_mutex);
    return m_in_flight;
}

Runner::Runner(chat::CompletionClient& client,
               const ToolDispatcher& dispatcher,
               const CompositeEvaluator& evaluator,
               RunnerOptions options)
    : m_client(client), m_dispatcher(dispatcher), m_evaluator(evaluator), m_options(std::move(options)) {}

ModelResponse Runner::attempt(const std::string& model, const Question& question) const {
    const std::vector<ChatMessage> conversation = {ChatMessage::user(format_question(question))};
    if (question.requires_code) {
        ToolLoop loop(m_client, m_dispatcher, m_options.max_tool_iterations);
        return loop.run(conversation, model, m_options.tools, m_options.system_prompt);
    }
    return m_client.complete(conversation, model, nullptr, m_options.system_prompt);
}

QuestionResult Runner::run_question(const std::string& model, const Question& question) const {
    QuestionResult result;
    result.question_id = question.id;
    result.category = question.category;
    result.difficulty = question.difficulty;

    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    try {
        ModelResponse response = attempt(model, question);
        Evaluation evaluation = m_evaluator.evaluate(question, response);
        result.elapsed_seconds = elapsed();
        result.success = true;
        result.response = std::move(response);
        result.evaluation = std::move(evaluation);
    } catch (const std::exception& ex) {
        result.elapsed_seconds = elapsed();
        result.success = false;
        result.response.reset();
        result.evaluation.reset();
        result.error = ex.what();
    }
    return result;
}

void Runner::report_progress(std::size_t index, std::size_t total, const QuestionResult& result) const {
    log_info(kComponent, progress_line(index, total, result));
    if (m_progress) {
        m_progress(index, total, result);
    }
}

std::vector<QuestionResult> Runner::run_model(const std::string& model, const std::vector<Question>& questions) const {
    std::vector<QuestionResult> results(questions.size());
    AdmissionGate gate(m_options.concurrency);
    std::vector<std::thread> workers;
    workers.reserve(questions.size());

    auto join_all = [&workers]() {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    try {
        for (std::size_t i = 0; i < questions.size(); ++i) {
            gate.acquire();
            try {
                workers.emplace_back([this, &gate, &results, &questions, &model, i]() {
                    results[i] = run_question(model, questions[i]);
                    report_progress(i + 1, questions.size(), results[i]);
                    gate.release();
                });
            } catch (...) {
                gate.release();
                throw;
            }
        }
    } catch (const std::system_error& ex) {
        join_all();
        throw std::runtime_error(std::string("[runner] cannot start worker: ") + ex.what());
    }
    join_all();
    return results;
}

BenchmarkResult Runner::run(const std::vector<std::string>& models, const std::vector<Question>& questions) const {
    if (questions.empty()) {
        throw std::runtime_error("No questions found matching the specified filters");
    }
    BenchmarkResult benchmark;
    benchmark.timestamp = std::chrono::system_clock::now();
    log_info(kComponent, "running " + std::to_string(questions.size()) + " questions across " +
                             std::to_string(models.size()) + " models");
    for (const auto& model : models) {
        log_info(kComponent, "testing model " + model);
        benchmark.results.emplace_back(model, run_model(model, questions));
    }
    return benchmark;
}

} // namespace statbench
