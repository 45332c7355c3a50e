#include "../include/statbench/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace statbench {

namespace {

std::string lowercase(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

} // namespace

std::optional<std::string> read_env(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<std::size_t> parse_size_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return static_cast<std::size_t>(std::stoull(*value));
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

std::optional<long> parse_long_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return std::stol(*value);
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

std::optional<double> parse_double_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return std::stod(*value);
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

std::optional<bool> parse_bool_env(const char* name) {
    if (auto value = read_env(name)) {
        const std::string lowered = lowercase(trim(*value));
        if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> parse_list_env(const char* name) {
    auto value = read_env(name);
    if (!value) {
        return std::nullopt;
    }
    std::vector<std::string> items;
    std::istringstream stream(*value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    if (items.empty()) {
        return std::nullopt;
    }
    return items;
}

SandboxMode parse_sandbox_mode(const std::string& name) {
    const std::string lowered = lowercase(trim(name));
    if (lowered.empty() || lowered == "auto") return SandboxMode::Auto;
    if (lowered == "local" || lowered == "subprocess") return SandboxMode::Local;
    if (lowered == "docker" || lowered == "container") return SandboxMode::Container;
    throw std::runtime_error("unknown sandbox mode: " + name);
}

std::string sandbox_mode_to_string(SandboxMode mode) {
    switch (mode) {
    case SandboxMode::Auto: return "auto";
    case SandboxMode::Local: return "local";
    case SandboxMode::Container: return "docker";
    }
    return "unknown";
}

BenchmarkConfig resolve_benchmark_config() {
    BenchmarkConfig config;

    if (auto key = read_env("STATBENCH_API_KEY"); key && !key->empty()) {
        config.provider.api_key = *key;
    } else if (auto fallback = read_env("OPENROUTER_API_KEY")) {
        config.provider.api_key = *fallback;
    }
    if (auto url = read_env("STATBENCH_BASE_URL"); url && !url->empty()) {
        config.provider.base_url = *url;
    }
    if (auto tokens = parse_long_env("STATBENCH_MAX_TOKENS"); tokens && *tokens > 0) {
        config.provider.max_tokens = static_cast<int>(*tokens);
    }
    if (auto temperature = parse_double_env("STATBENCH_TEMPERATURE")) {
        config.provider.temperature = *temperature;
    }
    if (auto timeout = parse_long_env("STATBENCH_HTTP_TIMEOUT_MS"); timeout && *timeout > 0) {
        config.provider.timeout_ms = *timeout;
    }

    if (auto mode = read_env("STATBENCH_SANDBOX")) {
        config.sandbox.mode = parse_sandbox_mode(*mode);
    }
    if (auto timeout = parse_long_env("STATBENCH_SANDBOX_TIMEOUT_S"); timeout && *timeout > 0) {
        config.sandbox.timeout_seconds = static_cast<int>(*timeout);
    }
    if (auto memory = parse_size_env("STATBENCH_SANDBOX_MEMORY_MB"); memory && *memory > 0) {
        config.sandbox.memory_limit_mb = *memory;
    }
    if (auto image = read_env("STATBENCH_SANDBOX_IMAGE"); image && !image->empty()) {
        config.sandbox.image = *image;
    }
    if (auto python = read_env("STATBENCH_PYTHON"); python && !python->empty()) {
        config.sandbox.python_executable = *python;
    }

    if (auto judge = read_env("STATBENCH_JUDGE_MODEL"); judge && !judge->empty()) {
        config.evaluation.judge_model = *judge;
    }
    if (auto weight = parse_double_env("STATBENCH_NUMERIC_WEIGHT")) {
        config.evaluation.numeric_weight = std::clamp(*weight, 0.0, 1.0);
    }
    if (auto weight = parse_double_env("STATBENCH_EXPLANATION_WEIGHT")) {
        config.evaluation.explanation_weight = std::clamp(*weight, 0.0, 1.0);
    }

    if (auto iterations = parse_long_env("STATBENCH_MAX_ITERATIONS"); iterations && *iterations > 0) {
        config.runner.max_tool_iterations = static_cast<int>(*iterations);
    }
    if (auto concurrency = parse_size_env("STATBENCH_CONCURRENCY"); concurrency && *concurrency > 0) {
        config.runner.concurrency = *concurrency;
    }

    if (auto dir = read_env("STATBENCH_QUESTIONS_DIR"); dir && !dir->empty()) {
        config.questions_dir = *dir;
    }
    if (auto dir = read_env("STATBENCH_PROMPTS_DIR"); dir && !dir->empty()) {
        config.prompts_dir = *dir;
    }
    if (auto dir = read_env("STATBENCH_RESULTS_DIR"); dir && !dir->empty()) {
        config.results_dir = *dir;
    }
    if (auto models = parse_list_env("STATBENCH_MODELS")) {
        config.models = std::move(*models);
    }
    return config;
}

} // namespace statbench
