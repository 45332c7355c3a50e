#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace statbench {

enum class SandboxMode {
    Auto,
    Local,
    Container
};

struct SandboxConfig {
    SandboxMode mode = SandboxMode::Auto;
    int timeout_seconds = 30;
    std::size_t memory_limit_mb = 512;
    std::size_t max_output_bytes = 1024 * 1024;
    std::string image = "statbench-sandbox:latest";
    std::string base_image = "python:3.11-slim";
    std::string python_executable = "python3";
    std::string container_runtime = "docker";
    int image_build_timeout_seconds = 900;
};

struct ProviderConfig {
    std::string api_key;
    std::string base_url = "https://openrouter.ai/api/v1";
    int max_tokens = 4096;
    double temperature = 0.0;
    long timeout_ms = 120000;
};

struct EvaluationConfig {
    std::string judge_model = "tngtech/deepseek-r1t2-chimera:free";
    double numeric_weight = 0.7;
    double explanation_weight = 0.3;
};

struct RunnerConfig {
    std::size_t concurrency = 3;
    int max_tool_iterations = 10;
};

struct BenchmarkConfig {
    std::filesystem::path questions_dir = "questions";
    std::filesystem::path prompts_dir = "prompts";
    std::filesystem::path results_dir = "results";

    SandboxConfig sandbox;
    ProviderConfig provider;
    EvaluationConfig evaluation;
    RunnerConfig runner;

    std::vector<std::string> categories;
    std::vector<std::string> difficulties;
    std::vector<std::string> models = {
        "tngtech/deepseek-r1t2-chimera:free",
        "z-ai/glm-4.5-air:free",
        "nvidia/nemotron-3-nano-30b-a3b:free",
        "google/gemma-3-27b-it:free",
    };
};

std::optional<std::string> read_env(const char* name);
std::optional<std::size_t> parse_size_env(const char* name);
std::optional<long> parse_long_env(const char* name);
std::optional<double> parse_double_env(const char* name);
std::optional<bool> parse_bool_env(const char* name);
std::optional<std::vector<std::string>> parse_list_env(const char* name);

SandboxMode parse_sandbox_mode(const std::string& name);
std::string sandbox_mode_to_string(SandboxMode mode);

// Defaults overridden by STATBENCH_* (and OPENROUTER_API_KEY) variables.
BenchmarkConfig resolve_benchmark_config();

} // namespace statbench
