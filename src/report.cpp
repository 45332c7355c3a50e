#include "../include/statbench/report.hpp"

#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace statbench {

namespace {

const char* const kDifficultyOrder[] = {"easy", "medium", "hard", "expert"};

double round_to(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << '%';
    return oss.str();
}

std::string fixed(double value, int places) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << value;
    return oss.str();
}

std::string format_utc(std::chrono::system_clock::time_point when, const char* pattern) {
    const std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm tm {};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

Json optional_number(const std::optional<double>& value, int places) {
    if (!value) {
        return Json(nullptr);
    }
    return Json(round_to(*value, places));
}

Json summary_json(const ModelSummary& summary) {
    JsonObject by_category;
    for (const auto& [category, score] : summary.by_category) {
        by_category[category] = Json(round_to(score, 4));
    }
    JsonObject by_difficulty;
    for (const auto& [difficulty, score] : summary.by_difficulty) {
        by_difficulty[difficulty] = Json(round_to(score, 4));
    }

    JsonObject obj;
    obj["provider"] = Json(summary.provider);
    obj["model"] = Json(summary.model);
    obj["overall_accuracy"] = Json(round_to(summary.overall_accuracy, 4));
    obj["numeric_accuracy"] = Json(round_to(summary.numeric_accuracy, 4));
    obj["by_category"] = Json(std::move(by_category));
    obj["by_difficulty"] = Json(std::move(by_difficulty));
    obj["total_questions"] = Json(static_cast<double>(summary.total_questions));
    obj["successful"] = Json(static_cast<double>(summary.successful));
    obj["failed"] = Json(static_cast<double>(summary.failed));
    obj["total_tokens"] = Json(static_cast<double>(summary.total_tokens));
    obj["total_time_seconds"] = Json(round_to(summary.total_time_seconds, 2));
    return Json(std::move(obj));
}

Json result_json(const QuestionResult& result) {
    JsonObject obj;
    obj["question_id"] = Json(result.question_id);
    obj["category"] = Json(result.category);
    obj["difficulty"] = Json(difficulty_to_string(result.difficulty));
    obj["success"] = Json(result.success);
    if (result.evaluation) {
        const Evaluation& evaluation = *result.evaluation;
        obj["overall_score"] = Json(round_to(evaluation.overall_score, 4));
        obj["numeric_score"] = Json(round_to(evaluation.numeric_score, 4));
        obj["explanation_score"] = Json(round_to(evaluation.explanation_score, 4));
        obj["extracted_value"] = evaluation.numeric ? optional_number(evaluation.numeric->extracted, 6) : Json(nullptr);
        obj["judge_reasoning"] = evaluation.judge ? Json(evaluation.judge->reasoning) : Json(nullptr);
    } else {
        obj["overall_score"] = Json(nullptr);
        obj["numeric_score"] = Json(nullptr);
        obj["explanation_score"] = Json(nullptr);
    }
    if (result.response) {
        obj["tool_calls"] = Json(static_cast<double>(result.response->tool_history.size()));
    }
    obj["elapsed_seconds"] = Json(round_to(result.elapsed_seconds, 2));
    obj["error"] = result.error ? Json(*result.error) : Json(nullptr);
    return Json(std::move(obj));
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("[report] cannot open " + path.string());
    }
    file << contents;
    if (!file) {
        throw std::runtime_error("[report] write failed for " + path.string());
    }
}

} // namespace

ReportFormat parse_report_format(const std::string& name) {
    if (name == "json") return ReportFormat::Json;
    if (name == "markdown" || name == "md") return ReportFormat::Markdown;
    if (name == "csv") return ReportFormat::Csv;
    throw std::runtime_error("unknown report format: " + name);
}

ModelSummary summarize(const std::string& model, const std::vector<QuestionResult>& results) {
    ModelSummary summary;
    const auto slash = model.find('/');
    if (slash != std::string::npos) {
        summary.provider = model.substr(0, slash);
        summary.model = model.substr(slash + 1);
    } else {
        summary.provider = "unknown";
        summary.model = model;
    }
    summary.total_questions = results.size();

    double overall_total = 0.0;
    double numeric_total = 0.0;
    std::map<std::string, std::pair<double, std::size_t>> categories;
    std::map<std::string, std::pair<double, std::size_t>> difficulties;

    for (const auto& result : results) {
        summary.total_time_seconds += result.elapsed_seconds;
        if (result.response) {
            summary.total_tokens += result.response->usage.input_tokens + result.response->usage.output_tokens;
        }
        if (!result.success || !result.evaluation) {
            continue;
        }
        ++summary.successful;
        const double score = result.evaluation->overall_score;
        overall_total += score;
        numeric_total += result.evaluation->numeric_score;

        auto& category = categories[result.category];
        category.first += score;
        ++category.second;
        auto& difficulty = difficulties[difficulty_to_string(result.difficulty)];
        difficulty.first += score;
        ++difficulty.second;
    }
    summary.failed = summary.total_questions - summary.successful;
    if (summary.successful > 0) {
        summary.overall_accuracy = overall_total / static_cast<double>(summary.successful);
        summary.numeric_accuracy = numeric_total / static_cast<double>(summary.successful);
    }
    for (const auto& [name, totals] : categories) {
        summary.by_category[name] = totals.first / static_cast<double>(totals.second);
    }
    for (const auto& [name, totals] : difficulties) {
        summary.by_difficulty[name] = totals.first / static_cast<double>(totals.second);
    }
    return summary;
}

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    return format_utc(when, "%Y-%m-%dT%H:%M:%SZ");
}

std::string file_stamp(std::chrono::system_clock::time_point when) {
    return format_utc(when, "%Y%m%d_%H%M%S");
}

Json to_json(const BenchmarkResult& result) {
    JsonObject summaries;
    JsonObject detailed;
    for (const auto& [model, results] : result.results) {
        summaries[model] = summary_json(summarize(model, results));
        JsonArray rows;
        rows.reserve(results.size());
        for (const auto& row : results) {
            rows.push_back(result_json(row));
        }
        detailed[model] = Json(std::move(rows));
    }

    JsonObject root;
    root["timestamp"] = Json(iso_timestamp(result.timestamp));
    root["summaries"] = Json(std::move(summaries));
    root["detailed_results"] = Json(std::move(detailed));
    return Json(std::move(root));
}

std::string to_markdown(const BenchmarkResult& result) {
    std::ostringstream md;
    md << "# A/B Testing Statistics Benchmark Results\n\n";
    md << "Generated: " << format_utc(result.timestamp, "%Y-%m-%d %H:%M:%S UTC") << "\n\n";

    std::vector<ModelSummary> summaries;
    summaries.reserve(result.results.size());
    for (const auto& [model, results] : result.results) {
        summaries.push_back(summarize(model, results));
    }

    md << "## Summary\n\n";
    md << "| Model | Overall | Numeric | Questions |\n";
    md << "|-------|---------|---------|-----------|\n";
    for (std::size_t i = 0; i < summaries.size(); ++i) {
        const auto& summary = summaries[i];
        md << "| " << result.results[i].first << " | " << percent(summary.overall_accuracy) << " | "
           << percent(summary.numeric_accuracy) << " | " << summary.successful << '/' << summary.total_questions
           << " |\n";
    }

    md << "\n## Results by Category\n";
    for (std::size_t i = 0; i < summaries.size(); ++i) {
        md << "\n### " << result.results[i].first << "\n\n";
        md << "| Category | Accuracy |\n";
        md << "|----------|----------|\n";
        for (const auto& [category, score] : summaries[i].by_category) {
            md << "| " << category << " | " << percent(score) << " |\n";
        }
    }

    md << "\n## Results by Difficulty\n";
    for (std::size_t i = 0; i < summaries.size(); ++i) {
        md << "\n### " << result.results[i].first << "\n\n";
        md << "| Difficulty | Accuracy |\n";
        md << "|------------|----------|\n";
        for (const char* difficulty : kDifficultyOrder) {
            auto it = summaries[i].by_difficulty.find(difficulty);
            if (it != summaries[i].by_difficulty.end()) {
                md << "| " << difficulty << " | " << percent(it->second) << " |\n";
            }
        }
    }

    md << "\n## Detailed Results\n";
    for (const auto& [model, results] : result.results) {
        md << "\n### " << model << "\n\n";
        md << "| Question | Category | Difficulty | Score | Time |\n";
        md << "|----------|----------|------------|-------|------|\n";
        for (const auto& row : results) {
            const std::string score = row.evaluation ? fixed(row.evaluation->overall_score, 2) : "ERROR";
            md << "| " << row.question_id << " | " << row.category << " | " << difficulty_to_string(row.difficulty)
               << " | " << score << " | " << fixed(row.elapsed_seconds, 1) << "s |\n";
        }
    }
    return md.str();
}

std::string to_csv(const BenchmarkResult& result) {
    std::ostringstream csv;
    csv << "model,question_id,category,difficulty,overall_score,numeric_score,success,elapsed_seconds,error\n";
    for (const auto& [model, results] : result.results) {
        for (const auto& row : results) {
            csv << csv_field(model) << ',' << csv_field(row.question_id) << ',' << csv_field(row.category) << ','
                << difficulty_to_string(row.difficulty) << ',';
            if (row.evaluation) {
                csv << round_to(row.evaluation->overall_score, 4) << ',' << round_to(row.evaluation->numeric_score, 4);
            } else {
                csv << ',';
            }
            csv << ',' << (row.success ? "true" : "false") << ',' << fixed(row.elapsed_seconds, 2) << ','
                << csv_field(row.error.value_or("")) << '\n';
        }
    }
    return csv.str();
}

void print_summary(const BenchmarkResult& result, std::ostream& out) {
    out << '\n' << std::string(60, '=') << '\n';
    out << "BENCHMARK RESULTS\n";
    out << std::string(60, '=') << '\n';
    for (const auto& [model, results] : result.results) {
        const ModelSummary summary = summarize(model, results);
        out << '\n' << model << ":\n";
        out << "  Overall Accuracy:    " << percent(summary.overall_accuracy) << '\n';
        out << "  Numeric Accuracy:    " << percent(summary.numeric_accuracy) << '\n';
        out << "  Questions: " << summary.successful << '/' << summary.total_questions << '\n';
        out << "  Tokens: " << summary.total_tokens << '\n';
        out << "  Time: " << fixed(summary.total_time_seconds, 1) << "s\n";
        if (!summary.by_category.empty()) {
            out << "\n  By Category:\n";
            for (const auto& [category, score] : summary.by_category) {
                out << "    " << category << ": " << percent(score) << '\n';
            }
        }
        if (!summary.by_difficulty.empty()) {
            out << "\n  By Difficulty:\n";
            for (const char* difficulty : kDifficultyOrder) {
                auto it = summary.by_difficulty.find(difficulty);
                if (it != summary.by_difficulty.end()) {
                    out << "    " << difficulty << ": " << percent(it->second) << '\n';
                }
            }
        }
    }
    out.flush();
}

std::vector<std::filesystem::path> write_reports(const BenchmarkResult& result,
                                                 const std::filesystem::path& directory,
                                                 const std::vector<ReportFormat>& formats) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("[report] cannot create " + directory.string() + ": " + ec.message());
    }
    const std::string stamp = file_stamp(result.timestamp);
    std::vector<std::filesystem::path> written;
    for (ReportFormat format : formats) {
        std::filesystem::path path;
        switch (format) {
        case ReportFormat::Json:
            path = directory / ("results_" + stamp + ".json");
            write_file(path, to_json(result).dump());
            break;
        case ReportFormat::Markdown:
            path = directory / ("results_" + stamp + ".md");
            write_file(path, to_markdown(result));
            break;
        case ReportFormat::Csv:
            path = directory / ("results_" + stamp + ".csv");
            write_file(path, to_csv(result));
            break;
        }
        written.push_back(path);
    }
    return written;
}

} // namespace statbench
