#include <set>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/execution_coordinator.hpp"
#include "runner/thread_process_runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace tutor;

/**
 * @brief 第 fault_at 次运行时模拟子进程无法启动，并记录每次运行的临时文件
 */
class faulty_process_runner : public thread_process_runner {
public:
    faulty_process_runner(const runner_options &options, size_t fault_at)
        : thread_process_runner(options), fault_at(fault_at) {}

    vector<filesystem::path> programs;
    size_t calls = 0;

protected:
    run_outcome spawn(const filesystem::path &program, double timeout_seconds, const cancellation_token &cancel) override {
        EXPECT_TRUE(filesystem::exists(program));
        programs.push_back(program);
        if (calls++ == fault_at)
            throw spawn_error("injected fault");
        return thread_process_runner::spawn(program, timeout_seconds, cancel);
    }

private:
    size_t fault_at;
};

class ExecutionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = make_process_runner();
    }

    void TearDown() override {
        EXPECT_EQ(count_files(test_temp_dir()), 0u);
    }

    execution_response execute(const string &code, vector<test_case> test_cases, double timeout_seconds = 5) {
        execution_coordinator coordinator(*runner);
        return coordinator.execute(make_request(code, move(test_cases), timeout_seconds));
    }

    unique_ptr<process_runner> runner;
};

TEST_F(ExecutionCoordinatorTest, PrintInputTest) {
    auto response = execute("print(input())", {make_test_case({"Hello"}, "Hello")});
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.total_tests, 1u);
    EXPECT_EQ(response.passed_tests, 1u);
    ASSERT_EQ(response.test_results.size(), 1u);

    auto &result = response.test_results[0];
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.input, "Hello");
    EXPECT_EQ(result.actual_output, "Hello");
    EXPECT_FALSE(result.error_message);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(response.overall_output, "Hello");
    EXPECT_TRUE(response.runtime_errors.empty());
}

TEST_F(ExecutionCoordinatorTest, TrailingNewlineTest) {
    auto response = execute("print('Hello')", {make_test_case({}, "Hello\n")});
    ASSERT_EQ(response.test_results.size(), 1u);
    EXPECT_TRUE(response.test_results[0].passed);
    EXPECT_EQ(response.test_results[0].expected_output, "Hello");
}

TEST_F(ExecutionCoordinatorTest, SurroundingWhitespaceTest) {
    auto response = execute("print('  a  b  ')\nprint()", {make_test_case({}, "a  b"), make_test_case({}, "a b")});
    ASSERT_EQ(response.test_results.size(), 2u);
    EXPECT_TRUE(response.test_results[0].passed);
    // 只去掉首尾空白字符，中间的空白必须一致
    EXPECT_FALSE(response.test_results[1].passed);
    EXPECT_EQ(response.test_results[1].status, status::WRONG_ANSWER);
}

TEST_F(ExecutionCoordinatorTest, NonzeroExitCodePassesTest) {
    auto response = execute("import sys\nprint('ok')\nsys.exit(1)", {make_test_case({}, "ok")});
    ASSERT_EQ(response.test_results.size(), 1u);
    EXPECT_TRUE(response.test_results[0].passed);
    EXPECT_EQ(response.test_results[0].status, status::ACCEPTED);
    EXPECT_EQ(response.test_results[0].exit_code, 1);
}

TEST_F(ExecutionCoordinatorTest, StderrFailsTest) {
    auto response = execute("import sys\nprint('ok')\nsys.stderr.write('warning')", {make_test_case({}, "ok")});
    ASSERT_EQ(response.test_results.size(), 1u);

    auto &result = response.test_results[0];
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.actual_output, "ok");
    EXPECT_EQ(result.error_message, "warning");
    EXPECT_EQ(response.runtime_errors, vector<string>{"warning"});
}

TEST_F(ExecutionCoordinatorTest, RuntimeErrorTest) {
    auto response = execute("x = 1\nprint(y)", {make_test_case({}, "1")});
    ASSERT_EQ(response.test_results.size(), 1u);

    auto &result = response.test_results[0];
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    ASSERT_TRUE(result.error_message);
    EXPECT_NE(result.error_message->find("NameError"), string::npos);
    // 行号与选手代码一致
    EXPECT_NE(result.error_message->find("File \"<submission>\", line 2"), string::npos) << *result.error_message;
    EXPECT_EQ(result.error_message->back(), 'd');
    EXPECT_EQ(response.runtime_errors, vector<string>{*result.error_message});
}

TEST_F(ExecutionCoordinatorTest, InputQueueTest) {
    auto response = execute("a = input()\nb = input()\nc = input()\nprint(a, b, repr(c))",
                            {make_test_case({"A", "B"}, "A B ''"), make_test_case({}, "'' '' ''")});
    ASSERT_EQ(response.test_results.size(), 2u);
    EXPECT_TRUE(response.test_results[0].passed);
    EXPECT_EQ(response.test_results[0].input, "A\nB");
    EXPECT_TRUE(response.test_results[1].passed);
    EXPECT_FALSE(response.test_results[1].input);
}

TEST_F(ExecutionCoordinatorTest, WrongAnswerTest) {
    auto response = execute("print(int(input()) * 2)", {make_test_case({"5"}, "25"), make_test_case({"3"}, "6")});
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.passed_tests, 1u);
    ASSERT_EQ(response.test_results.size(), 2u);
    EXPECT_EQ(response.test_results[0].status, status::WRONG_ANSWER);
    EXPECT_EQ(response.test_results[0].actual_output, "10");
    EXPECT_FALSE(response.test_results[0].error_message);
    EXPECT_EQ(response.overall_output, "10\n6");
}

TEST_F(ExecutionCoordinatorTest, TimeLimitExceededTest) {
    auto start = chrono::steady_clock::now();
    auto response = execute("if input() == 'loop':\n    while True:\n        pass\nprint('done')",
                            {make_test_case({"loop"}, "done"), make_test_case({"stop"}, "done")}, 1);
    auto elapsed = chrono::steady_clock::now() - start;

    ASSERT_EQ(response.test_results.size(), 2u);
    auto &timed_out = response.test_results[0];
    EXPECT_FALSE(timed_out.passed);
    EXPECT_EQ(timed_out.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(timed_out.error_message, "Code execution timed out after 1s");
    EXPECT_FALSE(timed_out.actual_output);

    // 超时不影响后续的测试用例
    EXPECT_TRUE(response.test_results[1].passed);
    EXPECT_EQ(response.passed_tests, 1u);
    EXPECT_LT(elapsed, chrono::seconds(4));
}

TEST_F(ExecutionCoordinatorTest, SyntaxErrorTest) {
    auto response = execute("print('a'", {make_test_case({}, "a")});
    ASSERT_EQ(response.test_results.size(), 1u);
    EXPECT_FALSE(response.test_results[0].passed);
    EXPECT_EQ(response.test_results[0].status, status::RUNTIME_ERROR);
    ASSERT_TRUE(response.test_results[0].error_message);
    EXPECT_NE(response.test_results[0].error_message->find("SyntaxError"), string::npos);
}

TEST_F(ExecutionCoordinatorTest, InvalidTimeoutTest) {
    auto response = execute("print(1)", {make_test_case({}, "1")}, 0);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.total_tests, 1u);
    EXPECT_TRUE(response.test_results.empty());
    ASSERT_EQ(response.runtime_errors.size(), 1u);
    EXPECT_NE(response.runtime_errors[0].find("Invalid timeout"), string::npos);
}

TEST_F(ExecutionCoordinatorTest, NoTestCaseTest) {
    auto response = execute("print(1)", {});
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.total_tests, 0u);
    EXPECT_FALSE(response.overall_output);
}

TEST_F(ExecutionCoordinatorTest, CancelledBeforeStartTest) {
    execution_coordinator coordinator(*runner);
    cancellation_token token;
    token.cancel();
    auto response = coordinator.execute(make_request("print(1)", {make_test_case({}, "1"), make_test_case({}, "1")}), token);

    ASSERT_EQ(response.test_results.size(), 2u);
    for (auto &result : response.test_results) {
        EXPECT_FALSE(result.passed);
        EXPECT_EQ(result.status, status::CANCELLED);
    }
    EXPECT_EQ(response.passed_tests, 0u);
}

TEST_F(ExecutionCoordinatorTest, SpawnFaultCleanupTest) {
    faulty_process_runner faulty(runner_options(), 1);
    execution_coordinator coordinator(faulty);
    auto response = coordinator.execute(make_request("print(input())", {make_test_case({"a"}, "a"),
                                                                        make_test_case({"b"}, "b"),
                                                                        make_test_case({"c"}, "c")}));

    EXPECT_TRUE(response.success);
    ASSERT_EQ(response.test_results.size(), 3u);
    EXPECT_TRUE(response.test_results[0].passed);
    EXPECT_EQ(response.test_results[1].status, status::SYSTEM_ERROR);
    EXPECT_EQ(response.test_results[1].error_message, "Execution error: SpawnError: injected fault");
    EXPECT_TRUE(response.test_results[2].passed);
    EXPECT_EQ(response.passed_tests, 2u);

    // 每个测试用例使用不同的临时文件，全部都被删除
    ASSERT_EQ(faulty.programs.size(), 3u);
    EXPECT_EQ(set<filesystem::path>(faulty.programs.begin(), faulty.programs.end()).size(), 3u);
    for (auto &program : faulty.programs)
        EXPECT_FALSE(filesystem::exists(program)) << program;
}

TEST(JudgeOutcomeTest, SystemErrorTest) {
    run_outcome outcome;
    outcome.status = status::SYSTEM_ERROR;
    outcome.error = "TempFileError: unable to create /tmp/x";
    outcome.wall_time_ms = 3;

    test_result result = execution_coordinator::judge_outcome(4, make_test_case({"1", ""}, " 2 "), outcome, 10);
    EXPECT_EQ(result.test_id, 4u);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.status, status::SYSTEM_ERROR);
    EXPECT_EQ(result.error_message, "Execution error: TempFileError: unable to create /tmp/x");
    EXPECT_EQ(result.expected_output, "2");
    EXPECT_EQ(result.input, "1");
    EXPECT_FALSE(result.actual_output);
}

TEST(JudgeOutcomeTest, TracebackMessageTest) {
    run_outcome outcome;
    outcome.status = status::ACCEPTED;
    outcome.stdout_text = "1\n";
    outcome.stderr_text = "Traceback (most recent call last):\nNameError: name 'y' is not defined\n";
    outcome.exit_code = 1;
    test_result result = execution_coordinator::judge_outcome(0, make_test_case({}, "1"), outcome, 1);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.error_message, "Traceback (most recent call last):\nNameError: name 'y' is not defined");

    // 只有空白的 stderr 也使测试失败
    outcome.stderr_text = "\n";
    result = execution_coordinator::judge_outcome(0, make_test_case({}, "1"), outcome, 1);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.error_message, "");
}

TEST(JudgeOutcomeTest, FractionalTimeoutMessageTest) {
    run_outcome outcome;
    outcome.status = status::TIME_LIMIT_EXCEEDED;
    test_result result = execution_coordinator::judge_outcome(0, make_test_case({}, ""), outcome, 2.5);
    EXPECT_EQ(result.error_message, "Code execution timed out after 2.5s");
}

TEST(JudgeOutcomeTest, SignalledProcessTest) {
    run_outcome outcome;
    outcome.status = status::ACCEPTED;
    outcome.stdout_text = "42\n";
    outcome.signal = 9;
    test_result result = execution_coordinator::judge_outcome(0, make_test_case({}, "42"), outcome, 1);
    EXPECT_TRUE(result.passed);
    EXPECT_FALSE(result.exit_code);
}
