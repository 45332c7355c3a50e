#pragma once

#include "config.hpp"
#include "json.hpp"
#include "question.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace statbench {

// Empty lists do not filter.
struct QuestionFilter {
    std::vector<std::string> categories;
    std::vector<std::string> difficulties;
    std::vector<std::string> ids;
};

struct QuestionStatistics {
    std::size_t total = 0;
    std::map<std::string, std::size_t> by_category;
    std::map<std::string, std::size_t> by_difficulty;
};

// Builds a Question from one JSON record; throws std::runtime_error naming
// the offending field. Policy weights not given fall back to `defaults`.
Question parse_question(const Json& record, const EvaluationConfig& defaults = {});

// One record per non-blank line. Invalid records are logged and skipped.
std::vector<Question> parse_question_lines(std::istream& input,
                                           const std::string& source_name,
                                           const EvaluationConfig& defaults = {});

std::vector<Question> filter_questions(const std::vector<Question>& questions, const QuestionFilter& filter);
QuestionStatistics summarize_questions(const std::vector<Question>& questions);

// Question bank stored as *.jsonl files in one directory, read in file-name
// order. Later duplicates of an id are dropped.
class QuestionBank {
public:
    explicit QuestionBank(std::filesystem::path directory, EvaluationConfig defaults = {});

    std::vector<Question> load_all() const;
    std::vector<Question> load(const QuestionFilter& filter) const;
    QuestionStatistics statistics() const;

    const std::filesystem::path& directory() const noexcept { return m_directory; }

private:
    std::filesystem::path m_directory;
    EvaluationConfig m_defaults;
};

} // namespace statbench
