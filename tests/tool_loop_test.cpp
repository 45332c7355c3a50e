#include "statbench/tool_loop.hpp"

#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using statbench::BlockingToolHandler;
using statbench::ChatMessage;
using statbench::ExecutionResult;
using statbench::Json;
using statbench::JsonArray;
using statbench::ToolCall;
using statbench::ToolDispatcher;
using statbench::ToolLoop;
using statbench::testing::ScriptedClient;
using statbench::testing::text_response;
using statbench::testing::tool_response;

namespace {

void add_echo_tool(ToolDispatcher& dispatcher) {
    dispatcher.register_tool("execute_python", BlockingToolHandler([](const Json& args) {
        ExecutionResult result;
        result.success = true;
        result.output = "ran " + statbench::find_string(args.as_object(), "code").value_or("");
        return result;
    }));
}

ToolCall python_call(const std::string& id, const std::string& code) {
    return ToolCall{id, "execute_python", Json::parse("{\"code\": \"" + code + "\"}")};
}

const JsonArray kTools = {Json::parse(R"({"type": "function", "function": {"name": "execute_python"}})")};

} // namespace

TEST(ToolLoopTest, ReturnsImmediatelyWithoutToolCalls) {
    ScriptedClient client;
    client.push(text_response("Answer: 5"));
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);

    const auto response = ToolLoop(client, dispatcher).run({ChatMessage::user("q")}, "m", kTools);
    EXPECT_EQ(response.content, "Answer: 5");
    EXPECT_TRUE(response.tool_history.empty());
    ASSERT_EQ(client.calls().size(), 1u);
    EXPECT_TRUE(client.calls().front().had_tools);
}

TEST(ToolLoopTest, FeedsResultsBackInCallOrder) {
    ScriptedClient client;
    client.push(tool_response({python_call("c1", "a"), python_call("c2", "b")}));
    client.push(tool_response({python_call("c3", "c")}));
    client.push(text_response("The answer is 3"));
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);

    const auto response = ToolLoop(client, dispatcher).run({ChatMessage::user("q")}, "m", kTools, std::string("sys"));

    ASSERT_EQ(response.tool_history.size(), 3u);
    EXPECT_EQ(response.tool_history[0].output, "ran a");
    EXPECT_EQ(response.tool_history[1].output, "ran b");
    EXPECT_EQ(response.tool_history[2].output, "ran c");

    const auto calls = client.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].system_prompt.value(), "sys");
    // user, assistant(c1,c2), tool c1, tool c2, assistant(c3), tool c3
    const auto& conversation = calls[2].conversation;
    ASSERT_EQ(conversation.size(), 6u);
    EXPECT_EQ(conversation[1].role, "assistant");
    EXPECT_EQ(conversation[1].tool_calls.size(), 2u);
    EXPECT_EQ(conversation[2].tool_call_id.value(), "c1");
    EXPECT_EQ(conversation[2].content, "ran a");
    EXPECT_EQ(conversation[3].tool_call_id.value(), "c2");
    EXPECT_EQ(conversation[5].content, "ran c");
}

TEST(ToolLoopTest, UnknownToolIsFedBackAsError) {
    ScriptedClient client;
    client.push(tool_response({ToolCall{"x", "plot", Json::parse("{}")}}));
    client.push(text_response("done"));
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);

    const auto response = ToolLoop(client, dispatcher).run({ChatMessage::user("q")}, "m", kTools);
    ASSERT_EQ(response.tool_history.size(), 1u);
    EXPECT_FALSE(response.tool_history.front().success);
    EXPECT_EQ(client.calls()[1].conversation.back().content, "Error: Tool 'plot' not found");
}

TEST(ToolLoopTest, BudgetExhaustionMakesOneFinalCallWithoutTools) {
    ScriptedClient client([](const ScriptedClient::Call&) { return tool_response({python_call("c", "x")}); });
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);

    const auto response = ToolLoop(client, dispatcher, 2).run({ChatMessage::user("q")}, "m", kTools);

    const auto calls = client.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_TRUE(calls[0].had_tools);
    EXPECT_TRUE(calls[1].had_tools);
    EXPECT_FALSE(calls[2].had_tools);
    EXPECT_FALSE(response.has_tool_calls());
    EXPECT_EQ(response.tool_history.size(), 2u);
}

TEST(ToolLoopTest, ZeroBudgetStillAnswers) {
    ScriptedClient client;
    client.push(text_response("direct"));
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);
    const auto response = ToolLoop(client, dispatcher, 0).run({ChatMessage::user("q")}, "m", kTools);
    EXPECT_EQ(response.content, "direct");
    ASSERT_EQ(client.calls().size(), 1u);
    EXPECT_FALSE(client.calls().front().had_tools);
}

TEST(ToolLoopTest, NegativeBudgetIsRejected) {
    ScriptedClient client;
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);
    EXPECT_THROW(ToolLoop(client, dispatcher, -1), std::invalid_argument);
}

TEST(ToolLoopTest, ClientFailurePropagates) {
    ScriptedClient client;
    ToolDispatcher dispatcher;
    add_echo_tool(dispatcher);
    EXPECT_THROW(ToolLoop(client, dispatcher).run({ChatMessage::user("q")}, "m", kTools), std::runtime_error);
}
