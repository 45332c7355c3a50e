#pragma once

#include "json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace statbench {

struct ToolCall {
    std::string id;
    std::string name;
    Json arguments;
};

// One tool execution, recorded in call order. Never mutated after creation.
struct ToolResult {
    std::string tool_name;
    Json input;
    std::string output;
    bool success = false;
    std::optional<std::string> error;
};

struct ChatMessage {
    std::string role;
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> tool_call_id;

    static ChatMessage user(std::string text) { return ChatMessage{"user", std::move(text), {}, std::nullopt}; }
    static ChatMessage system(std::string text) { return ChatMessage{"system", std::move(text), {}, std::nullopt}; }
};

struct TokenUsage {
    long input_tokens = 0;
    long output_tokens = 0;
};

struct ModelResponse {
    std::string content;
    std::optional<std::vector<ToolCall>> tool_calls;
    std::string model;
    std::string provider;
    TokenUsage usage;
    std::optional<std::string> stop_reason;
    std::vector<ToolResult> tool_history;

    bool has_tool_calls() const noexcept { return tool_calls && !tool_calls->empty(); }
};

} // namespace statbench
