#pragma once

#include "response.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace statbench {

// Pulls the numeric answer out of free text. Patterns are tried in order
// (answer/equals phrasing, approximations, bold numbers, trailing ": N",
// percentages, sample sizes, p-values); the first one that matches decides,
// and its last match wins. Otherwise the last number that is not a
// year-like integer in [1900, 2100] is taken.
class AnswerExtractor {
public:
    AnswerExtractor();

    std::optional<double> extract(const std::string& text) const;

    // Response text first, then each tool output in call order.
    std::optional<double> extract(const ModelResponse& response) const;

private:
    std::vector<std::regex> m_patterns;
    std::regex m_any_number;
};

} // namespace statbench
