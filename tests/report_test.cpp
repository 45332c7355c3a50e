#include "statbench/report.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>

using statbench::BenchmarkResult;
using statbench::QuestionResult;

namespace {

QuestionResult scored(const std::string& id, const std::string& category, statbench::Difficulty difficulty,
                      double overall, double numeric) {
    QuestionResult result;
    result.question_id = id;
    result.category = category;
    result.difficulty = difficulty;
    result.success = true;
    result.evaluation = statbench::make_evaluation(overall, numeric, 0.0);
    statbench::ModelResponse response;
    response.usage.input_tokens = 100;
    response.usage.output_tokens = 20;
    result.response = response;
    result.elapsed_seconds = 1.5;
    return result;
}

QuestionResult failed(const std::string& id, const std::string& error) {
    QuestionResult result;
    result.question_id = id;
    result.category = "sample_size";
    result.difficulty = statbench::Difficulty::Easy;
    result.error = error;
    result.elapsed_seconds = 0.5;
    return result;
}

BenchmarkResult sample_result() {
    BenchmarkResult result;
    result.timestamp = std::chrono::system_clock::from_time_t(1700000000);
    result.results.emplace_back(
        "vendor/model-a",
        std::vector<QuestionResult>{
            scored("power_001", "power_analysis", statbench::Difficulty::Medium, 1.0, 1.0),
            scored("ss_002", "sample_size", statbench::Difficulty::Hard, 0.5, 0.0),
            failed("ss_003", "timeout, retry later"),
        });
    return result;
}

} // namespace

TEST(ReportTest, SummaryAveragesSuccessfulAttempts) {
    const auto summary = statbench::summarize("vendor/model-a", sample_result().results.front().second);
    EXPECT_EQ(summary.provider, "vendor");
    EXPECT_EQ(summary.model, "model-a");
    EXPECT_EQ(summary.total_questions, 3u);
    EXPECT_EQ(summary.successful, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_DOUBLE_EQ(summary.overall_accuracy, 0.75);
    EXPECT_DOUBLE_EQ(summary.numeric_accuracy, 0.5);
    EXPECT_DOUBLE_EQ(summary.by_category.at("sample_size"), 0.5);
    EXPECT_DOUBLE_EQ(summary.by_difficulty.at("medium"), 1.0);
    EXPECT_EQ(summary.total_tokens, 240);
    EXPECT_DOUBLE_EQ(summary.total_time_seconds, 3.5);

    EXPECT_EQ(statbench::summarize("local-model", {}).provider, "unknown");
}

TEST(ReportTest, TimestampsAreUtc) {
    const auto when = std::chrono::system_clock::from_time_t(1700000000);
    EXPECT_EQ(statbench::iso_timestamp(when), "2023-11-14T22:13:20Z");
    EXPECT_EQ(statbench::file_stamp(when), "20231114_221320");
}

TEST(ReportTest, CsvQuotesFieldsWithCommas) {
    const std::string csv = statbench::to_csv(sample_result());
    std::istringstream lines(csv);
    std::string header;
    std::getline(lines, header);
    EXPECT_EQ(header, "model,question_id,category,difficulty,overall_score,numeric_score,success,elapsed_seconds,error");
    std::string first;
    std::getline(lines, first);
    EXPECT_EQ(first, "vendor/model-a,power_001,power_analysis,medium,1,1,true,1.50,");
    std::string second;
    std::getline(lines, second);
    std::string third;
    std::getline(lines, third);
    EXPECT_EQ(third, "vendor/model-a,ss_003,sample_size,easy,,,false,0.50,\"timeout, retry later\"");
}

TEST(ReportTest, MarkdownMarksFailures) {
    const std::string md = statbench::to_markdown(sample_result());
    EXPECT_NE(md.find("## Summary"), std::string::npos);
    EXPECT_NE(md.find("| vendor/model-a | 75.0% | 50.0% | 2/3 |"), std::string::npos);
    EXPECT_NE(md.find("| ss_003 | sample_size | easy | ERROR | 0.5s |"), std::string::npos);
}

TEST(ReportTest, JsonCarriesSummariesAndDetails) {
    const statbench::Json doc = statbench::to_json(sample_result());
    const auto& root = doc.as_object();
    EXPECT_EQ(statbench::find_string(root, "timestamp").value(), "2023-11-14T22:13:20Z");
    const auto& details = statbench::find_member(root, "detailed_results")->as_object();
    EXPECT_EQ(details.at("vendor/model-a").as_array().size(), 3u);
    EXPECT_TRUE(statbench::find_member(root, "summaries")->as_object().count("vendor/model-a"));
}

TEST(ReportTest, PrintedSummaryNamesEachModel) {
    std::ostringstream out;
    statbench::print_summary(sample_result(), out);
    EXPECT_NE(out.str().find("vendor/model-a:"), std::string::npos);
    EXPECT_NE(out.str().find("Overall Accuracy:    75.0%"), std::string::npos);
}

TEST(ReportTest, WritesOneFilePerFormat) {
    const auto dir = std::filesystem::temp_directory_path() / "statbench-report-test";
    std::filesystem::remove_all(dir);
    const auto paths = statbench::write_reports(sample_result(), dir,
                                                {statbench::ReportFormat::Json, statbench::ReportFormat::Csv});
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].filename(), "results_20231114_221320.json");
    EXPECT_EQ(paths[1].filename(), "results_20231114_221320.csv");
    for (const auto& path : paths) {
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    std::filesystem::remove_all(dir);
}

TEST(ReportTest, UnknownFormatThrows) {
    EXPECT_EQ(statbench::parse_report_format("md"), statbench::ReportFormat::Markdown);
    EXPECT_THROW(statbench::parse_report_format("xml"), std::runtime_error);
}
