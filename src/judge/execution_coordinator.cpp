#include "judge/execution_coordinator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <cmath>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "runner/input_virtualizer.hpp"

namespace tutor {
using namespace std;

execution_coordinator::execution_coordinator(process_runner &runner)
    : runner(runner) {}

/**
 * @brief 测试结果中展示的输入：所有输入以换行连接，去掉首尾的换行
 */
static optional<string> display_input(const test_case &tc) {
    string input = boost::algorithm::trim_copy_if(boost::algorithm::join(tc.input, "\n"), boost::is_any_of("\n"));
    if (input.empty()) return nullopt;
    return input;
}

static test_result cancelled_result(size_t test_id, const test_case &tc) {
    test_result result;
    result.test_id = test_id;
    result.passed = false;
    result.status = status::CANCELLED;
    result.input = display_input(tc);
    result.expected_output = trim_whitespace(tc.expected_output);
    result.error_message = "Execution cancelled";
    return result;
}

test_result execution_coordinator::judge_outcome(size_t test_id, const test_case &tc, const run_outcome &outcome, double timeout_seconds) {
    test_result result;
    result.test_id = test_id;
    result.input = display_input(tc);
    result.expected_output = trim_whitespace(tc.expected_output);
    result.execution_time_ms = outcome.wall_time_ms;
    result.passed = false;

    switch (outcome.status) {
        case status::TIME_LIMIT_EXCEEDED:
            result.status = status::TIME_LIMIT_EXCEEDED;
            result.error_message = fmt::format("Code execution timed out after {:g}s", timeout_seconds);
            break;
        case status::CANCELLED:
            result.status = status::CANCELLED;
            result.error_message = "Execution cancelled";
            break;
        case status::ACCEPTED: {
            result.actual_output = trim_whitespace(outcome.stdout_text);
            result.exit_code = outcome.exit_code;
            bool matched = *result.actual_output == result.expected_output;
            if (!outcome.stderr_text.empty()) {
                result.status = status::RUNTIME_ERROR;
                result.error_message = trim_whitespace(outcome.stderr_text);
            } else if (matched) {
                result.status = status::ACCEPTED;
                result.passed = true;
            } else {
                result.status = status::WRONG_ANSWER;
            }
            break;
        }
        default:
            result.status = status::SYSTEM_ERROR;
            result.error_message = "Execution error: " + outcome.error;
            break;
    }
    return result;
}

test_result execution_coordinator::run_test_case(size_t test_id, const string &code, const test_case &tc,
                                                 double timeout_seconds, const cancellation_token &cancel) {
    string program = virtualize_input(code, tc.input);
    run_outcome outcome = runner.run(program, timeout_seconds, cancel);
    if (outcome.cleanup_error)
        LOG(WARNING) << "Test case " << test_id << ": " << *outcome.cleanup_error;
    return judge_outcome(test_id, tc, outcome, timeout_seconds);
}

execution_response execution_coordinator::execute(const execution_request &request, const cancellation_token &cancel) {
    elapsed_time timer;
    size_t total = request.test_cases.size();

    if (!isfinite(request.timeout_seconds) || request.timeout_seconds <= 0) {
        LOG(WARNING) << "Lesson " << request.lesson_id << ": rejecting request with invalid timeout " << request.timeout_seconds;
        return execution_response::failure(fmt::format("Invalid timeout: {}", request.timeout_seconds), total, timer.milliseconds());
    }

    LOG(INFO) << "Lesson " << request.lesson_id << ": executing " << total << " test case(s) with "
              << runner.name() << " runner, timeout " << request.timeout_seconds << "s";

    vector<test_result> results;
    try {
        for (size_t i = 0; i < total; ++i) {
            const test_case &tc = request.test_cases[i];
            if (cancel.is_cancelled()) {
                results.push_back(cancelled_result(i, tc));
                continue;
            }

            test_result result = run_test_case(i, request.code, tc, request.timeout_seconds, cancel);
            LOG(INFO) << "Lesson " << request.lesson_id << ": test case " << i << " "
                      << get_display_message(result.status) << " in " << result.execution_time_ms << "ms";
            results.push_back(move(result));
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Lesson " << request.lesson_id << ": execution failed, " << boost::diagnostic_information(e);
        return execution_response::failure(fmt::format("Execution error: {}", e.what()), total, timer.milliseconds());
    }

    execution_response response = execution_response::aggregate(move(results), total, timer.milliseconds());
    LOG(INFO) << "Lesson " << request.lesson_id << ": " << response.passed_tests << "/" << response.total_tests
              << " test case(s) passed in " << response.execution_time_total_ms << "ms";
    return response;
}

}  // namespace tutor
