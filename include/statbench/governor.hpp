#pragma once

#include "json.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace statbench {

struct GovernorReport {
    bool allowed{true};
    // First blocked pattern, when any.
    std::optional<std::string> blocked_pattern;
    std::vector<std::string> violations;
};

// Textual gate in front of the sandbox. A case-insensitive substring match
// against a denylist is conservative and trivially bypassable by obfuscation;
// it is not an isolation boundary. Isolation comes from the process/container
// limits around execution.
class CodeGovernor {
public:
    CodeGovernor();
    explicit CodeGovernor(std::vector<std::string> denylist);

    static const std::vector<std::string>& default_denylist();

    GovernorReport inspect_code(const std::string& code) const;

    // Checks `arguments` against a JSON-schema subset: object type, required
    // members and primitive member types.
    GovernorReport inspect_arguments(const Json& arguments, const Json& schema) const;

    void add_pattern(std::string pattern);

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_denylist;

    std::optional<std::string> first_match(const std::string& code) const;
    static bool matches_type(const Json& value, const std::string& type);
};

} // namespace statbench
