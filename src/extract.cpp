#include "../include/statbench/extract.hpp"

#include <cmath>
#include <stdexcept>

namespace statbench {

namespace {

constexpr const char* kNumber = R"(([+-]?\d+\.?\d*))";

std::optional<double> to_number(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed == 0 || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool looks_like_year(double value) {
    return value >= 1900.0 && value <= 2100.0 && value == std::floor(value);
}

} // namespace

AnswerExtractor::AnswerExtractor() {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    const std::string number = kNumber;
    const std::vector<std::string> sources = {
        R"((?:final answer|answer is|result is|equals?|=)[:\s]*\$?)" + number,
        R"((?:approximately|≈|about)[:\s]*\$?)" + number,
        R"(\*\*\$?)" + number + R"(\*\*)",
        R"(:\s*\$?)" + number + R"(\s*$)",
        number + R"(\s*%)",
        R"((?:sample size|n\s*=)[:\s]*)" + number,
        R"((?:p-value|p\s*=)[:\s]*)" + number,
    };
    m_patterns.reserve(sources.size());
    for (const auto& source : sources) {
        m_patterns.emplace_back(source, flags);
    }
    m_any_number = std::regex(number, std::regex::ECMAScript);
}

std::optional<double> AnswerExtractor::extract(const std::string& text) const {
    if (text.empty()) {
        return std::nullopt;
    }

    for (const auto& pattern : m_patterns) {
        std::optional<std::string> last;
        for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
            last = (*it)[1].str();
        }
        if (last) {
            if (auto value = to_number(*last)) {
                return value;
            }
        }
    }

    std::optional<double> fallback;
    for (std::sregex_iterator it(text.begin(), text.end(), m_any_number), end; it != end; ++it) {
        auto value = to_number((*it)[1].str());
        if (value && !looks_like_year(*value)) {
            fallback = value;
        }
    }
    return fallback;
}

std::optional<double> AnswerExtractor::extract(const ModelResponse& response) const {
    if (auto value = extract(response.content)) {
        return value;
    }
    for (const auto& result : response.tool_history) {
        if (auto value = extract(result.output)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace statbench
