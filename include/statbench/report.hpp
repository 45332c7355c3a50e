#pragma once

#include "json.hpp"
#include "result.hpp"

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace statbench {

enum class ReportFormat {
    Json,
    Markdown,
    Csv
};

ReportFormat parse_report_format(const std::string& name);

// Means are taken over successful attempts; "vendor/name" ids split into
// provider and model.
ModelSummary summarize(const std::string& model, const std::vector<QuestionResult>& results);

std::string iso_timestamp(std::chrono::system_clock::time_point when);
std::string file_stamp(std::chrono::system_clock::time_point when);

Json to_json(const BenchmarkResult& result);
std::string to_markdown(const BenchmarkResult& result);
std::string to_csv(const BenchmarkResult& result);
void print_summary(const BenchmarkResult& result, std::ostream& out);

// Writes results_<stamp>.<ext> per format into `directory`, creating it when
// needed. Returns the written paths; throws std::runtime_error on I/O failure.
std::vector<std::filesystem::path> write_reports(const BenchmarkResult& result,
                                                 const std::filesystem::path& directory,
                                                 const std::vector<ReportFormat>& formats);

} // namespace statbench
