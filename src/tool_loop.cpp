#include "../include/statbench/tool_loop.hpp"
#include "../include/statbench/log.hpp"

#include <stdexcept>
#include <utility>

namespace statbench {

ToolLoop::ToolLoop(chat::CompletionClient& client, const ToolDispatcher& dispatcher, int max_iterations)
    : m_client(client), m_dispatcher(dispatcher), m_max_iterations(max_iterations) {
    if (m_max_iterations < 0) {
        throw std::invalid_argument("tool loop iteration budget must be non-negative");
    }
}

ModelResponse ToolLoop::run(std::vector<ChatMessage> conversation,
                            const std::string& model,
                            const JsonArray& tools,
                            const std::optional<std::string>& system_prompt) const {
    std::vector<ToolResult> history;
    ModelResponse response;
    LoopState state = LoopState::Requesting;

    for (int iteration = 0; iteration < m_max_iterations && state != LoopState::Done; ++iteration) {
        response = m_client.complete(conversation, model, &tools, system_prompt);
        if (!response.has_tool_calls()) {
            state = LoopState::Done;
            break;
        }
        state = LoopState::Executing;

        ChatMessage assistant;
        assistant.role = "assistant";
        assistant.content = response.content;
        assistant.tool_calls = *response.tool_calls;
        conversation.push_back(std::move(assistant));

        for (const auto& call : *response.tool_calls) {
            ToolResult result = m_dispatcher.dispatch(call.name, call.arguments);

            ChatMessage tool_turn;
            tool_turn.role = "tool";
            tool_turn.content = tool_message_content(result);
            tool_turn.tool_call_id = call.id;
            conversation.push_back(std::move(tool_turn));

            history.push_back(std::move(result));
        }
        state = LoopState::Requesting;
    }

    if (state != LoopState::Done) {
        log_info("ToolLoop", model + ": tool budget of " + std::to_string(m_max_iterations) +
                                 " rounds exhausted, requesting final answer");
        response = m_client.complete(conversation, model, nullptr, system_prompt);
        // No tool can run after this point.
        response.tool_calls.reset();
    }

    response.tool_history = std::move(history);
    return response;
}

} // namespace statbench
