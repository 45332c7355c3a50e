#include "../include/statbench/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

extern char** environ;

namespace statbench {

ScopedFd::~ScopedFd() {
    reset();
}

ScopedFd& ScopedFd::operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
        reset(other.m_fd);
        other.m_fd = -1;
    }
    return *this;
}

void ScopedFd::reset(int fd) noexcept {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = fd;
}

namespace {

struct Pipe {
    ScopedFd read_end;
    ScopedFd write_end;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("[process] pipe failed: ") + std::strerror(errno));
    }
    return Pipe{ScopedFd(fds[0]), ScopedFd(fds[1])};
}

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// A child that exits before draining stdin must not take the harness down.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void child_fail(const char* what) {
    const char* reason = std::strerror(errno);
    ::write(STDERR_FILENO, what, std::strlen(what));
    ::write(STDERR_FILENO, ": ", 2);
    ::write(STDERR_FILENO, reason, std::strlen(reason));
    ::write(STDERR_FILENO, "\n", 1);
    ::_exit(127);
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void append_capped(std::string& buffer, const char* data, std::size_t size, std::size_t cap, bool& truncated) {
    if (buffer.size() >= cap) {
        truncated = true;
        return;
    }
    const std::size_t room = cap - buffer.size();
    if (size > room) {
        buffer.append(data, room);
        truncated = true;
    } else {
        buffer.append(data, size);
    }
}

} // namespace

ProcessResult run_process(const ProcessRequest& request) {
    if (request.argv.empty()) {
        throw std::runtime_error("[process] empty argv");
    }
    ignore_sigpipe();

    // Everything the child needs is prepared before fork; only
    // async-signal-safe calls happen between fork and exec.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string line(*entry);
        bool overridden = false;
        for (const auto& [key, value] : request.extra_env) {
            if (line.compare(0, key.size() + 1, key + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env_storage.push_back(std::move(line));
        }
    }
    for (const auto& [key, value] : request.extra_env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& line : env_storage) {
        envp.push_back(line.data());
    }
    envp.push_back(nullptr);

    Pipe in = make_pipe();
    Pipe out = make_pipe();
    Pipe err = make_pipe();

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("[process] fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (::dup2(in.read_end.get(), STDIN_FILENO) < 0 ||
            ::dup2(out.write_end.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write_end.get(), STDERR_FILENO) < 0) {
            child_fail("dup2");
        }
        if (request.memory_limit_bytes) {
            struct rlimit limit;
            limit.rlim_cur = static_cast<rlim_t>(*request.memory_limit_bytes);
            limit.rlim_max = static_cast<rlim_t>(*request.memory_limit_bytes);
            if (::setrlimit(RLIMIT_AS, &limit) != 0) {
                child_fail("setrlimit");
            }
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        child_fail(argv[0]);
    }

    ::setpgid(pid, pid);
    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();

    set_nonblocking(in.write_end.get());
    set_nonblocking(out.read_end.get());
    set_nonblocking(err.read_end.get());

    ProcessResult result;
    std::size_t stdin_offset = 0;
    if (request.stdin_data.empty()) {
        in.write_end.reset();
    }

    auto kill_group = [&]() {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        result.timed_out = true;
    };

    char buffer[8192];
    while (out.read_end.valid() || err.read_end.valid()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill_group();
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        std::vector<pollfd> fds;
        if (out.read_end.valid()) fds.push_back({out.read_end.get(), POLLIN, 0});
        if (err.read_end.valid()) fds.push_back({err.read_end.get(), POLLIN, 0});
        if (in.write_end.valid()) fds.push_back({in.write_end.get(), POLLOUT, 0});

        const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()) + 1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill_group();
            ::waitpid(pid, nullptr, 0);
            throw std::runtime_error(std::string("[process] poll failed: ") + std::strerror(errno));
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }
            if (entry.fd == in.write_end.get()) {
                const std::size_t left = request.stdin_data.size() - stdin_offset;
                const ssize_t written = ::write(entry.fd, request.stdin_data.data() + stdin_offset, left);
                if (written > 0) {
                    stdin_offset += static_cast<std::size_t>(written);
                }
                if ((written < 0 && errno != EAGAIN && errno != EINTR) || stdin_offset >= request.stdin_data.size()) {
                    in.write_end.reset();
                }
                continue;
            }
            const bool is_stdout = entry.fd == out.read_end.get();
            const ssize_t count = ::read(entry.fd, buffer, sizeof(buffer));
            if (count > 0) {
                append_capped(is_stdout ? result.stdout_data : result.stderr_data,
                              buffer,
                              static_cast<std::size_t>(count),
                              request.max_output_bytes,
                              result.truncated);
            } else if (count == 0 || (errno != EAGAIN && errno != EINTR)) {
                (is_stdout ? out.read_end : err.read_end).reset();
            }
        }
    }
    in.write_end.reset();

    // The streams can close before the process exits; keep honouring the deadline.
    int status = 0;
    while (true) {
        const pid_t waited = ::waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("[process] waitpid failed: ") + std::strerror(errno));
        }
        if (waited == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                kill_group();
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    result.exit_code = decode_status(status);
    if (result.timed_out) {
        result.stdout_data.clear();
        result.stderr_data.clear();
    }
    return result;
}

} // namespace statbench
