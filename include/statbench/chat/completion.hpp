#pragma once

#include "../config.hpp"
#include "../json.hpp"
#include "../net/http.hpp"
#include "../response.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statbench::chat {

struct CompletionClient {
    virtual ~CompletionClient() = default;

    // Prepends `system_prompt` as a system turn when given. `tools` is sent
    // with tool_choice "auto" when non-null and non-empty. Transport and
    // remote errors throw std::runtime_error.
    virtual ModelResponse complete(const std::vector<ChatMessage>& conversation,
                                   const std::string& model,
                                   const JsonArray* tools = nullptr,
                                   const std::optional<std::string>& system_prompt = std::nullopt) = 0;
};

using CompletionClientPtr = std::unique_ptr<CompletionClient>;

using Transport = std::function<std::string(const std::string& url,
                                            const std::string& body,
                                            const net::Headers& headers,
                                            long timeout_ms)>;

// Chat-completions client for OpenAI-compatible endpoints (OpenRouter by default).
class OpenAICompatClient final : public CompletionClient {
public:
    explicit OpenAICompatClient(ProviderConfig config, Transport transport = net::post_json);

    ModelResponse complete(const std::vector<ChatMessage>& conversation,
                           const std::string& model,
                           const JsonArray* tools = nullptr,
                           const std::optional<std::string>& system_prompt = std::nullopt) override;

    const std::string& provider_label() const noexcept { return m_provider; }

private:
    ProviderConfig m_config;
    Transport m_transport;
    std::string m_endpoint;
    std::string m_provider;
};

Json serialize_message(const ChatMessage& message);
std::string build_request_body(const std::vector<ChatMessage>& conversation,
                               const std::string& model,
                               const JsonArray* tools,
                               const std::optional<std::string>& system_prompt,
                               int max_tokens,
                               double temperature);
ModelResponse parse_completion(const std::string& body, const std::string& model, const std::string& provider);

// Throws when the provider configuration cannot make requests (no API key).
CompletionClientPtr make_completion_client(const ProviderConfig& config);

} // namespace statbench::chat
