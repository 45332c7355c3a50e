#include "statbench/governor.hpp"
#include "statbench/sandbox.hpp"

#include <gtest/gtest.h>

using statbench::CodeGovernor;
using statbench::Json;

TEST(GovernorTest, AllowsPlainStatisticsCode) {
    CodeGovernor governor;
    const auto report = governor.inspect_code("import numpy as np\nprint(np.mean([1, 2, 3]))");
    EXPECT_TRUE(report.allowed);
    EXPECT_FALSE(report.blocked_pattern.has_value());
}

TEST(GovernorTest, BlocksDenylistedPatternCaseInsensitively) {
    CodeGovernor governor;
    const auto report = governor.inspect_code("IMPORT OS\nos.listdir('.')");
    EXPECT_FALSE(report.allowed);
    EXPECT_EQ(report.blocked_pattern.value(), "import os");
}

TEST(GovernorTest, ReportsFirstPatternInDenylistOrder) {
    CodeGovernor governor;
    const auto report = governor.inspect_code("import subprocess; os.system('ls')");
    EXPECT_EQ(report.blocked_pattern.value(), "os.system");
}

TEST(GovernorTest, AddedPatternIsEnforced) {
    CodeGovernor governor(std::vector<std::string>{});
    EXPECT_TRUE(governor.inspect_code("import socket").allowed);
    governor.add_pattern("socket");
    EXPECT_FALSE(governor.inspect_code("import socket").allowed);
}

TEST(GovernorTest, ArgumentsCheckedAgainstSchema) {
    CodeGovernor governor;
    const Json schema = statbench::python_tool_parameters();

    EXPECT_TRUE(governor.inspect_arguments(Json::parse(R"json({"code": "print(1)"})json"), schema).allowed);

    const auto missing = governor.inspect_arguments(Json::parse("{}"), schema);
    EXPECT_FALSE(missing.allowed);
    ASSERT_EQ(missing.violations.size(), 1u);
    EXPECT_EQ(missing.violations.front(), "missing required field 'code'");

    const auto wrong_type = governor.inspect_arguments(Json::parse(R"({"code": 5})"), schema);
    EXPECT_FALSE(wrong_type.allowed);
    EXPECT_EQ(wrong_type.violations.front(), "field 'code' must be string");

    EXPECT_FALSE(governor.inspect_arguments(Json("print(1)"), schema).allowed);
}
