#pragma once

#include "statbench/chat/completion.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace statbench::testing {

// Completion client that replays canned responses and records every request.
class ScriptedClient final : public chat::CompletionClient {
public:
    struct Call {
        std::vector<ChatMessage> conversation;
        std::string model;
        bool had_tools = false;
        std::optional<std::string> system_prompt;
    };

    using Responder = std::function<ModelResponse(const Call&)>;

    ScriptedClient() = default;
    explicit ScriptedClient(Responder responder) : m_responder(std::move(responder)) {}

    void push(ModelResponse response) {
        std::scoped_lock lock(m_mutex);
        m_queue.push_back(std::move(response));
    }

    ModelResponse complete(const std::vector<ChatMessage>& conversation,
                           const std::string& model,
                           const JsonArray* tools = nullptr,
                           const std::optional<std::string>& system_prompt = std::nullopt) override {
        Call call{conversation, model, tools != nullptr && !tools->empty(), system_prompt};
        {
            std::scoped_lock lock(m_mutex);
            m_calls.push_back(call);
            if (!m_responder) {
                if (m_queue.empty()) {
                    throw std::runtime_error("scripted client exhausted");
                }
                ModelResponse next = std::move(m_queue.front());
                m_queue.pop_front();
                return next;
            }
        }
        return m_responder(call);
    }

    std::vector<Call> calls() const {
        std::scoped_lock lock(m_mutex);
        return m_calls;
    }

private:
    mutable std::mutex m_mutex;
    Responder m_responder;
    std::deque<ModelResponse> m_queue;
    std::vector<Call> m_calls;
};

inline ModelResponse text_response(std::string content) {
    ModelResponse response;
    response.content = std::move(content);
    response.stop_reason = "stop";
    return response;
}

inline ModelResponse tool_response(std::vector<ToolCall> calls) {
    ModelResponse response;
    response.tool_calls = std::move(calls);
    response.stop_reason = "tool_calls";
    return response;
}

} // namespace statbench::testing
