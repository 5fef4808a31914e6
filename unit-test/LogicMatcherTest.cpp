#include "analysis/logic_matcher.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace tutor;

static test_result make_result(size_t id, bool passed, const string &expected,
                               optional<string> actual, optional<string> error = nullopt) {
    test_result result;
    result.test_id = id;
    result.passed = passed;
    result.status = passed ? status::ACCEPTED : (error ? status::RUNTIME_ERROR : status::WRONG_ANSWER);
    result.expected_output = expected;
    result.actual_output = move(actual);
    result.error_message = move(error);
    return result;
}

TEST(LogicMatcherTest, PatternTableTest) {
    EXPECT_STREQ(match_logic_pattern("NameError: name 'y' is not defined"), "Variable not defined before use");
    EXPECT_STREQ(match_logic_pattern("TypeError: can only concatenate str (not \"int\") to str"), "Incorrect data type usage");
    EXPECT_STREQ(match_logic_pattern("IndentationError: unexpected indent"), "Incorrect indentation");
    EXPECT_EQ(match_logic_pattern("ZeroDivisionError: division by zero"), nullptr);
    EXPECT_EQ(match_logic_pattern("Code execution timed out after 1s"), nullptr);
}

TEST(LogicMatcherTest, MatchLogicTest) {
    vector<test_result> results = {
        make_result(0, true, "1", "1"),
        make_result(1, false, "2", "", "Traceback (most recent call last):\nNameError: name 'x' is not defined"),
        make_result(2, false, "25", "10"),
        make_result(3, false, "3", "3", "TypeError: unsupported operand"),
        make_result(4, false, "4", nullopt, "Code execution timed out after 1s")};
    execution_response response = execution_response::aggregate(results, 5, 0);

    logic_findings logic = match_logic(response);
    EXPECT_EQ(logic.tests_passed, 1u);
    EXPECT_EQ(logic.tests_failed, 4u);
    EXPECT_TRUE(logic.execution_successful);
    EXPECT_EQ(logic.logic_issues, (vector<string>{"Variable not defined before use", "Incorrect data type usage"}));
    EXPECT_EQ(logic.output_patterns, vector<string>{"Expected '25' but got '10'"});
}

TEST(LogicMatcherTest, EmptyOutputMismatchTest) {
    execution_response response = execution_response::aggregate({make_result(0, false, "Hello", "")}, 1, 0);
    logic_findings logic = match_logic(response);
    EXPECT_EQ(logic.output_patterns, vector<string>{"Expected 'Hello' but got ''"});
    EXPECT_TRUE(logic.logic_issues.empty());
}

TEST(LogicMatcherTest, FailedRequestTest) {
    execution_response response = execution_response::failure("Invalid timeout: 0", 2, 0);
    logic_findings logic = match_logic(response);
    EXPECT_FALSE(logic.execution_successful);
    EXPECT_EQ(logic.tests_passed, 0u);
    EXPECT_EQ(logic.tests_failed, 0u);
    EXPECT_TRUE(logic.logic_issues.empty());
    EXPECT_TRUE(logic.output_patterns.empty());
}
