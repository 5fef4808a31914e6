#include "analysis/logic_matcher.hpp"
#include <fmt/core.h>

namespace tutor {
using namespace std;

const vector<logic_pattern> LOGIC_PATTERNS = {
    {"NameError", "Variable not defined before use"},
    {"TypeError", "Incorrect data type usage"},
    {"IndentationError", "Incorrect indentation"}};

const char *match_logic_pattern(const string &error_message) {
    for (auto &pattern : LOGIC_PATTERNS)
        if (error_message.find(pattern.pattern) != string::npos)
            return pattern.label;
    return nullptr;
}

logic_findings match_logic(const execution_response &response) {
    logic_findings logic;
    logic.tests_passed = response.passed_tests;
    logic.execution_successful = response.success;

    for (auto &result : response.test_results) {
        if (result.passed) continue;
        ++logic.tests_failed;

        if (result.error_message) {
            if (const char *label = match_logic_pattern(*result.error_message))
                logic.logic_issues.push_back(label);
        } else if (result.actual_output && *result.actual_output != result.expected_output) {
            logic.output_patterns.push_back(fmt::format("Expected '{}' but got '{}'", result.expected_output, *result.actual_output));
        }
    }
    return logic;
}

}  // namespace tutor
