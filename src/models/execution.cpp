#include "models/execution.hpp"
#include <boost/algorithm/string/join.hpp>
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace tutor {
using namespace std;
using namespace nlohmann;

execution_request::execution_request()
    : timeout_seconds(DEFAULT_TIMEOUT_SECONDS), memory_limit_mb(DEFAULT_MEMORY_LIMIT_MB) {}

execution_response execution_response::aggregate(vector<test_result> results, size_t total_tests, double total_ms) {
    execution_response response;
    response.success = !results.empty();
    response.total_tests = total_tests;
    response.execution_time_total_ms = total_ms;

    vector<string> outputs;
    for (auto &result : results) {
        if (result.passed) ++response.passed_tests;
        if (result.actual_output && !result.actual_output->empty())
            outputs.push_back(*result.actual_output);
        if (result.error_message)
            response.runtime_errors.push_back(*result.error_message);
    }
    if (!outputs.empty())
        response.overall_output = boost::algorithm::join(outputs, "\n");

    response.test_results = move(results);
    return response;
}

execution_response execution_response::failure(const string &error, size_t total_tests, double total_ms) {
    execution_response response;
    response.success = false;
    response.total_tests = total_tests;
    response.runtime_errors.push_back(error);
    response.execution_time_total_ms = total_ms;
    return response;
}

void from_json(const json &j, test_case &tc) {
    // 兼容两种输入格式：字符串数组，或者以换行分隔的单个字符串
    json input = access_optional(j, "input");
    if (input.is_array())
        input.get_to(tc.input);
    else if (input.is_string() && !input.get<string>().empty())
        tc.input = split_lines(input.get<string>());
    else if (input.is_null() || input.is_string())
        tc.input.clear();
    else
        throw build_invalid_argument(j, "input");

    if (exists(j, "expectedOutput"))
        j.at("expectedOutput").get_to(tc.expected_output);
    else
        j.at("expected_output").get_to(tc.expected_output);
}

void to_json(json &j, const test_case &tc) {
    j = {{"input", tc.input},
         {"expectedOutput", tc.expected_output}};
}

void from_json(const json &j, execution_request &request) {
    j.at("code").get_to(request.code);
    request.lesson_id = get_value_def<string>(j, "", "lessonId");
    j.at("testCases").get_to(request.test_cases);
    request.timeout_seconds = get_value_def<double>(j, DEFAULT_TIMEOUT_SECONDS, "timeoutSeconds");
    request.memory_limit_mb = get_value_def<int>(j, DEFAULT_MEMORY_LIMIT_MB, "memoryLimitMb");
}

void to_json(json &j, const execution_request &request) {
    j = {{"code", request.code},
         {"lessonId", request.lesson_id},
         {"testCases", request.test_cases},
         {"timeoutSeconds", request.timeout_seconds},
         {"memoryLimitMb", request.memory_limit_mb}};
}

void from_json(const json &j, test_result &result) {
    j.at("testId").get_to(result.test_id);
    j.at("passed").get_to(result.passed);
    result.status = parse_status(j.at("status").get<string>());
    assign_optional(j, result.input, "input");
    j.at("expectedOutput").get_to(result.expected_output);
    assign_optional(j, result.actual_output, "actualOutput");
    assign_optional(j, result.error_message, "errorMessage");
    result.execution_time_ms = get_value_def<double>(j, 0, "executionTimeMs");
    assign_optional(j, result.exit_code, "exitCode");
}

void to_json(json &j, const test_result &result) {
    j = {{"testId", result.test_id},
         {"passed", result.passed},
         {"status", get_display_message(result.status)},
         {"input", optional_to_json(result.input)},
         {"expectedOutput", result.expected_output},
         {"actualOutput", optional_to_json(result.actual_output)},
         {"errorMessage", optional_to_json(result.error_message)},
         {"executionTimeMs", result.execution_time_ms},
         {"exitCode", optional_to_json(result.exit_code)}};
}

void from_json(const json &j, execution_response &response) {
    j.at("success").get_to(response.success);
    j.at("totalTests").get_to(response.total_tests);
    j.at("passedTests").get_to(response.passed_tests);
    j.at("testResults").get_to(response.test_results);
    assign_optional(j, response.overall_output, "overallOutput");
    response.runtime_errors = get_value_def<vector<string>>(j, {}, "runtimeErrors");
    response.execution_time_total_ms = get_value_def<double>(j, 0, "executionTimeTotalMs");
}

void to_json(json &j, const execution_response &response) {
    j = {{"success", response.success},
         {"totalTests", response.total_tests},
         {"passedTests", response.passed_tests},
         {"testResults", response.test_results},
         {"overallOutput", optional_to_json(response.overall_output)},
         {"runtimeErrors", response.runtime_errors},
         {"executionTimeTotalMs", response.execution_time_total_ms}};
}

}  // namespace tutor
