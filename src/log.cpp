#include "../include/statbench/log.hpp"
#include "../include/statbench/config.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace statbench {

namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> quiet{parse_bool_env("STATBENCH_QUIET").value_or(false)};
    return quiet;
}

void write_line(std::ostream& out, std::string_view component, std::string_view level, std::string_view message) {
    std::ostringstream line;
    line << '[' << component << ' ' << timestamp_now() << "] ";
    if (!level.empty()) {
        line << level << ": ";
    }
    line << message << '\n';
    std::scoped_lock lock(log_mutex());
    out << line.str();
    out.flush();
}

} // namespace

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
    localtime_r(&time, &tm);
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

void log_info(std::string_view component, std::string_view message) {
    if (quiet_flag().load()) {
        return;
    }
    write_line(std::cout, component, {}, message);
}

void log_warning(std::string_view component, std::string_view message) {
    write_line(std::cerr, component, "warning", message);
}

void log_error(std::string_view component, std::string_view message) {
    write_line(std::cerr, component, "error", message);
}

void set_log_quiet(bool quiet) noexcept {
    quiet_flag().store(quiet);
}

} // namespace statbench
