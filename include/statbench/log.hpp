#pragma once

#include <string>
#include <string_view>

namespace statbench {

// "YYYY-mm-dd HH:MM:SS.mmm", local time.
std::string timestamp_now();

// Console lines tagged "[<component> <timestamp>] message". Info goes to
// stdout, warnings and errors to stderr. Safe to call from worker threads.
void log_info(std::string_view component, std::string_view message);
void log_warning(std::string_view component, std::string_view message);
void log_error(std::string_view component, std::string_view message);

void set_log_quiet(bool quiet) noexcept;

} // namespace statbench
