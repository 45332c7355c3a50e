#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statbench {

// Owns a file descriptor; closes it on scope exit.
class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) noexcept : m_fd(fd) {}
    ~ScopedFd();

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
    ScopedFd& operator=(ScopedFd&& other) noexcept;

    int get() const noexcept { return m_fd; }
    bool valid() const noexcept { return m_fd >= 0; }
    void reset(int fd = -1) noexcept;

private:
    int m_fd = -1;
};

struct ProcessRequest {
    std::vector<std::string> argv;
    std::string stdin_data;
    std::chrono::milliseconds timeout{30000};
    // RLIMIT_AS applied in the child before exec.
    std::optional<std::size_t> memory_limit_bytes;
    std::size_t max_output_bytes = 1024 * 1024;
    std::vector<std::pair<std::string, std::string>> extra_env;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool truncated = false;
    std::string stdout_data;
    std::string stderr_data;
};

// Runs argv[0] (PATH lookup) in its own process group. Past the deadline the
// whole group is killed with SIGKILL and timed_out is set. Output beyond
// max_output_bytes per stream is dropped. Throws std::runtime_error when the
// process cannot be started.
ProcessResult run_process(const ProcessRequest& request);

} // namespace statbench
