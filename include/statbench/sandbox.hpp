#pragma once

#include "config.hpp"
#include "governor.hpp"
#include "json.hpp"
#include "process.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace statbench {

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    bool timed_out = false;

    static ExecutionResult failure(std::string message) {
        ExecutionResult result;
        result.error = std::move(message);
        return result;
    }
};

// Writes a script to a fresh temporary file and removes it on destruction.
class TempScript {
public:
    explicit TempScript(const std::string& contents);
    ~TempScript();

    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

// Embeds `code` as a string literal in the harness script: pre-imported
// numeric libraries, captured stdout returned as the sole channel, and
// "Error: <Type>: <message>" on stderr with exit status 1 on failure.
std::string wrap_code(const std::string& code);

// The `execute_python` function tool advertised to models.
Json python_tool_definition();
Json python_tool_parameters();

// Executes short Python snippets under a wall-clock limit and a memory
// ceiling. Validation failures and execution failures are reported in the
// returned value, never thrown. Each call is independent.
class Sandbox {
public:
    explicit Sandbox(SandboxConfig config);
    virtual ~Sandbox() = default;

    ExecutionResult execute(const std::string& code);
    // Tool-facing form; reads the "code" string member.
    ExecutionResult execute(const Json& arguments);

    // Returns the rejection for empty or denylisted code, if any.
    std::optional<ExecutionResult> validate_code(const std::string& code) const;

    virtual std::string name() const = 0;

    const SandboxConfig& config() const noexcept { return m_config; }

protected:
    virtual ExecutionResult run_script(const std::filesystem::path& script) = 0;

    ExecutionResult timed_out_result() const;
    static ExecutionResult from_process(const ProcessResult& process);

    SandboxConfig m_config;
    CodeGovernor m_governor;
};

// Subprocess on the host: RLIMIT_AS for memory, no network isolation.
class LocalSandbox final : public Sandbox {
public:
    explicit LocalSandbox(SandboxConfig config);

    std::string name() const override { return "local"; }

protected:
    ExecutionResult run_script(const std::filesystem::path& script) override;
};

// One auto-removed container per call through the docker CLI, with the
// network disabled and the memory limit passed to the runtime. The image is
// built from an inline Dockerfile on first use.
class ContainerSandbox final : public Sandbox {
public:
    explicit ContainerSandbox(SandboxConfig config);

    std::string name() const override { return "docker"; }

    static std::string dockerfile(const std::string& base_image);

    // Idempotent; concurrent first callers wait for a single build.
    void ensure_image();

protected:
    ExecutionResult run_script(const std::filesystem::path& script) override;

private:
    std::mutex m_image_mutex;
    bool m_image_ready{false};

    std::string container_name() const;
    void kill_container(const std::string& name) const;
};

// Checks the container runtime once ("docker info") in auto mode.
bool container_runtime_available(const SandboxConfig& config);
std::unique_ptr<Sandbox> make_sandbox(const SandboxConfig& config);

} // namespace statbench
