#include "../include/statbench/governor.hpp"

#include <algorithm>
#include <cctype>

namespace statbench {

CodeGovernor::CodeGovernor() : m_denylist(default_denylist()) {}

CodeGovernor::CodeGovernor(std::vector<std::string> denylist) : m_denylist(std::move(denylist)) {}

const std::vector<std::string>& CodeGovernor::default_denylist() {
    static const std::vector<std::string> patterns = {
        "os.system",
        "subprocess",
        "eval(",
        "exec(",
        "__import__",
        "open(",
        "file(",
        "input(",
        "quit(",
        "exit(",
        "os.remove",
        "os.unlink",
        "shutil.rmtree",
        "import os",
        "from os",
    };
    return patterns;
}

void CodeGovernor::add_pattern(std::string pattern) {
    std::scoped_lock lock(m_mutex);
    m_denylist.push_back(std::move(pattern));
}

GovernorReport CodeGovernor::inspect_code(const std::string& code) const {
    GovernorReport report;
    if (auto hit = first_match(code)) {
        report.allowed = false;
        report.violations.push_back("denylist");
        report.blocked_pattern = std::move(hit);
    }
    return report;
}

std::optional<std::string> CodeGovernor::first_match(const std::string& code) const {
    std::scoped_lock lock(m_mutex);
    for (const auto& pattern : m_denylist) {
        if (pattern.empty()) {
            continue;
        }
        auto it = std::search(code.begin(), code.end(), pattern.begin(), pattern.end(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
        if (it != code.end()) {
            return pattern;
        }
    }
    return std::nullopt;
}

bool CodeGovernor::matches_type(const Json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        return value.is_number() && value.as_number() == static_cast<double>(static_cast<long long>(value.as_number()));
    }
    if (type == "boolean") return value.is_bool();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

GovernorReport CodeGovernor::inspect_arguments(const Json& arguments, const Json& schema) const {
    GovernorReport report;
    if (!schema.is_object()) {
        return report;
    }
    const auto& schema_obj = schema.as_object();
    if (auto type = find_string(schema_obj, "type"); type && *type != "object") {
        if (!matches_type(arguments, *type)) {
            report.allowed = false;
            report.violations.push_back("expected " + *type);
        }
        return report;
    }
    if (!arguments.is_object()) {
        report.allowed = false;
        report.violations.push_back("expected object");
        return report;
    }
    const auto& args = arguments.as_object();

    if (const Json* required = find_member(schema_obj, "required"); required && required->is_array()) {
        for (const auto& field : required->as_array()) {
            if (field.is_string() && args.find(field.as_string()) == args.end()) {
                report.allowed = false;
                report.violations.push_back("missing required field '" + field.as_string() + "'");
            }
        }
    }

    if (const Json* properties = find_member(schema_obj, "properties"); properties && properties->is_object()) {
        for (const auto& [name, property] : properties->as_object()) {
            auto arg = args.find(name);
            if (arg == args.end() || !property.is_object()) {
                continue;
            }
            if (auto type = find_string(property.as_object(), "type"); type && !matches_type(arg->second, *type)) {
                report.allowed = false;
                report.violations.push_back("field '" + name + "' must be " + *type);
            }
        }
    }
    return report;
}

} // namespace statbench
