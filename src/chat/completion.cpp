#include "../../include/statbench/chat/completion.hpp"

#include <stdexcept>
#include <utility>

namespace {

using statbench::Json;
using statbench::JsonArray;
using statbench::JsonObject;

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string provider_from_url(const std::string& url) {
    if (url.find("openrouter.ai") != std::string::npos) {
        return "openrouter";
    }
    return "openai";
}

std::string content_text(const Json& content) {
    if (content.is_string()) {
        return content.as_string();
    }
    // Some providers return content as typed parts.
    if (content.is_array()) {
        std::string text;
        for (const auto& part : content.as_array()) {
            if (part.is_string()) {
                text += part.as_string();
            } else if (part.is_object()) {
                if (auto piece = statbench::find_string(part.as_object(), "text")) {
                    text += *piece;
                }
            }
        }
        return text;
    }
    return {};
}

Json parse_arguments(const Json& raw) {
    if (raw.is_object() || raw.is_array()) {
        return raw;
    }
    if (!raw.is_string()) {
        return Json(JsonObject{});
    }
    const std::string& text = raw.as_string();
    try {
        return Json::parse(text);
    } catch (const std::exception&) {
        JsonObject wrapped;
        wrapped["raw"] = Json(text);
        return Json(std::move(wrapped));
    }
}

long token_count(const JsonObject& usage, const std::string& key) {
    if (auto value = statbench::find_number(usage, key)) {
        return static_cast<long>(*value);
    }
    return 0;
}

} // namespace

namespace statbench::chat {

OpenAICompatClient::OpenAICompatClient(ProviderConfig config, Transport transport)
    : m_config(std::move(config)),
      m_transport(std::move(transport)),
      m_endpoint(trim_trailing_slash(m_config.base_url) + "/chat/completions"),
      m_provider(provider_from_url(m_config.base_url)) {
    if (!m_transport) {
        throw std::runtime_error("[completion] transport is required");
    }
}

Json serialize_message(const ChatMessage& message) {
    JsonObject entry;
    entry["role"] = Json(message.role);
    entry["content"] = Json(message.content);
    if (!message.tool_calls.empty()) {
        JsonArray calls;
        for (const auto& call : message.tool_calls) {
            JsonObject function;
            function["name"] = Json(call.name);
            function["arguments"] = Json(call.arguments.dump());

            JsonObject serialized;
            serialized["id"] = Json(call.id);
            serialized["type"] = Json("function");
            serialized["function"] = Json(std::move(function));
            calls.emplace_back(std::move(serialized));
        }
        entry["tool_calls"] = Json(std::move(calls));
    }
    if (message.tool_call_id) {
        entry["tool_call_id"] = Json(*message.tool_call_id);
    }
    return Json(std::move(entry));
}

std::string build_request_body(const std::vector<ChatMessage>& conversation,
                               const std::string& model,
                               const JsonArray* tools,
                               const std::optional<std::string>& system_prompt,
                               int max_tokens,
                               double temperature) {
    JsonArray messages;
    if (system_prompt && !system_prompt->empty()) {
        messages.push_back(serialize_message(ChatMessage::system(*system_prompt)));
    }
    for (const auto& message : conversation) {
        messages.push_back(serialize_message(message));
    }

    JsonObject payload;
    payload["model"] = Json(model);
    payload["messages"] = Json(std::move(messages));
    payload["max_tokens"] = Json(max_tokens);
    payload["temperature"] = Json(temperature);
    if (tools && !tools->empty()) {
        payload["tools"] = Json(*tools);
        payload["tool_choice"] = Json("auto");
    }
    return Json(std::move(payload)).dump();
}

ModelResponse parse_completion(const std::string& body, const std::string& model, const std::string& provider) {
    const Json parsed = Json::parse(body);
    if (!parsed.is_object()) {
        throw std::runtime_error("[completion] " + model + ": response is not a JSON object");
    }
    const auto& obj = parsed.as_object();

    if (const Json* error = find_member(obj, "error"); error && !error->is_null()) {
        std::string message;
        if (error->is_object()) {
            message = find_string(error->as_object(), "message").value_or(error->dump());
        } else if (error->is_string()) {
            message = error->as_string();
        } else {
            message = error->dump();
        }
        throw std::runtime_error("[completion] " + model + ": " + message);
    }

    const Json* choices = find_member(obj, "choices");
    if (!choices || !choices->is_array() || choices->as_array().empty() || !choices->as_array().front().is_object()) {
        throw std::runtime_error("[completion] " + model + ": response has no choices");
    }
    const auto& choice = choices->as_array().front().as_object();

    ModelResponse response;
    response.model = model;
    response.provider = provider;
    response.stop_reason = find_string(choice, "finish_reason");

    if (const Json* message = find_member(choice, "message"); message && message->is_object()) {
        const auto& msg = message->as_object();
        if (const Json* content = find_member(msg, "content")) {
            response.content = content_text(*content);
        }
        if (const Json* calls = find_member(msg, "tool_calls"); calls && calls->is_array() && !calls->as_array().empty()) {
            std::vector<ToolCall> tool_calls;
            for (const auto& entry : calls->as_array()) {
                if (!entry.is_object()) {
                    continue;
                }
                const auto& call_obj = entry.as_object();
                ToolCall call;
                call.id = find_string(call_obj, "id").value_or("");
                if (const Json* function = find_member(call_obj, "function"); function && function->is_object()) {
                    const auto& fn = function->as_object();
                    call.name = find_string(fn, "name").value_or("");
                    if (const Json* args = find_member(fn, "arguments")) {
                        call.arguments = parse_arguments(*args);
                    } else {
                        call.arguments = Json(JsonObject{});
                    }
                }
                tool_calls.push_back(std::move(call));
            }
            if (!tool_calls.empty()) {
                response.tool_calls = std::move(tool_calls);
            }
        }
    } else if (auto text = find_string(choice, "text")) {
        response.content = *text;
    }

    if (const Json* usage = find_member(obj, "usage"); usage && usage->is_object()) {
        response.usage.input_tokens = token_count(usage->as_object(), "prompt_tokens");
        response.usage.output_tokens = token_count(usage->as_object(), "completion_tokens");
    }
    return response;
}

ModelResponse OpenAICompatClient::complete(const std::vector<ChatMessage>& conversation,
                                           const std::string& model,
                                           const JsonArray* tools,
                                           const std::optional<std::string>& system_prompt) {
    const std::string body = build_request_body(conversation,
                                                model,
                                                tools,
                                                system_prompt,
                                                m_config.max_tokens,
                                                m_config.temperature);
    net::Headers headers;
    if (!m_config.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + m_config.api_key);
    }
    const std::string reply = m_transport(m_endpoint, body, headers, m_config.timeout_ms);
    return parse_completion(reply, model, m_provider);
}

CompletionClientPtr make_completion_client(const ProviderConfig& config) {
    if (config.api_key.empty()) {
        throw std::runtime_error("API key is required. Set OPENROUTER_API_KEY or STATBENCH_API_KEY.");
    }
    if (config.base_url.empty()) {
        throw std::runtime_error("completion client requires a base URL");
    }
    return std::make_unique<OpenAICompatClient>(config);
}

} // namespace statbench::chat
