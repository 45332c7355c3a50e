#include "../include/statbench/tools.hpp"
#include "../include/statbench/log.hpp"

#include <sstream>

namespace statbench {

void ToolDispatcher::register_tool(const std::string& name, ToolHandler handler, std::optional<Json> parameters) {
    std::scoped_lock lock(m_mutex);
    m_tools.insert_or_assign(name, Entry{std::move(handler), std::move(parameters)});
}

bool ToolDispatcher::has_tool(const std::string& name) const {
    std::scoped_lock lock(m_mutex);
    return m_tools.find(name) != m_tools.end();
}

std::vector<std::string> ToolDispatcher::tool_names() const {
    std::scoped_lock lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_tools.size());
    for (const auto& [name, entry] : m_tools) {
        names.push_back(name);
    }
    return names;
}

ToolResult ToolDispatcher::dispatch(const std::string& name, const Json& arguments) const {
    ToolResult result;
    result.tool_name = name;
    result.input = arguments;

    std::optional<Entry> entry;
    {
        std::scoped_lock lock(m_mutex);
        auto it = m_tools.find(name);
        if (it != m_tools.end()) {
            entry = it->second;
        }
    }
    if (!entry) {
        result.output = "Unknown tool: " + name;
        result.error = "Tool '" + name + "' not found";
        return result;
    }

    if (entry->parameters) {
        const GovernorReport report = m_governor.inspect_arguments(arguments, *entry->parameters);
        if (!report.allowed) {
            std::ostringstream oss;
            oss << "Invalid arguments for '" << name << "'";
            for (std::size_t i = 0; i < report.violations.size(); ++i) {
                oss << (i == 0 ? ": " : "; ") << report.violations[i];
            }
            result.output = oss.str();
            result.error = oss.str();
            return result;
        }
    }

    try {
        ExecutionResult execution;
        if (const auto* blocking = std::get_if<BlockingToolHandler>(&entry->handler)) {
            execution = (*blocking)(arguments);
        } else {
            std::future<ExecutionResult> pending = std::get<AsyncToolHandler>(entry->handler)(arguments);
            execution = pending.get();
        }
        result.output = std::move(execution.output);
        result.success = execution.success;
        result.error = std::move(execution.error);
    } catch (const std::exception& ex) {
        log_warning("Tools", "'" + name + "' raised: " + ex.what());
        result.output.clear();
        result.success = false;
        result.error = ex.what();
    }
    return result;
}

std::string tool_message_content(const ToolResult& result) {
    if (result.success) {
        return result.output;
    }
    if (result.error && !result.error->empty()) {
        return "Error: " + *result.error;
    }
    if (!result.output.empty()) {
        return "Error: " + result.output;
    }
    return "Error: tool call failed";
}

void register_python_tool(ToolDispatcher& dispatcher, Sandbox& sandbox) {
    if (dynamic_cast<ContainerSandbox*>(&sandbox) != nullptr) {
        dispatcher.register_tool(
            "execute_python",
            AsyncToolHandler([&sandbox](const Json& arguments) {
                return std::async(std::launch::async, [&sandbox, arguments]() { return sandbox.execute(arguments); });
            }),
            python_tool_parameters());
        return;
    }
    dispatcher.register_tool(
        "execute_python",
        BlockingToolHandler([&sandbox](const Json& arguments) { return sandbox.execute(arguments); }),
        python_tool_parameters());
}

} // namespace statbench
