#pragma once

#include "governor.hpp"
#include "json.hpp"
#include "response.hpp"
#include "sandbox.hpp"

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace statbench {

using BlockingToolHandler = std::function<ExecutionResult(const Json&)>;
using AsyncToolHandler = std::function<std::future<ExecutionResult>(const Json&)>;
using ToolHandler = std::variant<BlockingToolHandler, AsyncToolHandler>;

// Maps tool names to handlers. dispatch never throws: unknown tools,
// argument-schema violations and handler exceptions come back as failed
// ToolResults.
class ToolDispatcher {
public:
    void register_tool(const std::string& name, ToolHandler handler, std::optional<Json> parameters = std::nullopt);
    bool has_tool(const std::string& name) const;
    std::vector<std::string> tool_names() const;

    ToolResult dispatch(const std::string& name, const Json& arguments) const;

private:
    struct Entry {
        ToolHandler handler;
        std::optional<Json> parameters;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_tools;
    CodeGovernor m_governor;
};

// Content of the tool turn fed back to the model.
std::string tool_message_content(const ToolResult& result);

// Registers `execute_python` backed by the sandbox. Container-backed
// sandboxes run each call on its own thread; local ones block the caller.
void register_python_tool(ToolDispatcher& dispatcher, Sandbox& sandbox);

} // namespace statbench
