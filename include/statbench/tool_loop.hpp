#pragma once

#include "chat/completion.hpp"
#include "json.hpp"
#include "response.hpp"
#include "tools.hpp"

#include <optional>
#include <string>
#include <vector>

namespace statbench {

enum class LoopState {
    Requesting,
    Executing,
    Done
};

// Drives a model through rounds of tool calls until it answers without
// requesting tools. After `max_iterations` tool rounds one last completion is
// made without tools, so a run makes at most max_iterations + 1 requests.
// The returned response carries every ToolResult in call order and never
// carries pending tool calls.
class ToolLoop {
public:
    ToolLoop(chat::CompletionClient& client, const ToolDispatcher& dispatcher, int max_iterations = 10);

    ModelResponse run(std::vector<ChatMessage> conversation,
                      const std::string& model,
                      const JsonArray& tools,
                      const std::optional<std::string>& system_prompt = std::nullopt) const;

    int max_iterations() const noexcept { return m_max_iterations; }

private:
    chat::CompletionClient& m_client;
    const ToolDispatcher& m_dispatcher;
    int m_max_iterations;
};

} // namespace statbench
