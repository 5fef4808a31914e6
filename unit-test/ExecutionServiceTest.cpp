#include <fmt/core.h>
#include "gtest/gtest.h"
#include "judge/execution_service.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace tutor;

class ExecutionServiceTest : public ::testing::Test {
protected:
    static unique_ptr<process_runner> runner;

    static void SetUpTestCase() {
        runner = make_process_runner();
    }

    static void TearDownTestCase() {
        runner.reset();
    }

    void TearDown() override {
        EXPECT_EQ(count_files(test_temp_dir()), 0u);
    }
};

unique_ptr<process_runner> ExecutionServiceTest::runner;

TEST_F(ExecutionServiceTest, ConcurrentSubmissionTest) {
    execution_service service(*runner, 4);

    vector<submission_handle> handles;
    for (int i = 0; i < 8; ++i) {
        string value = to_string(i);
        handles.push_back(service.submit(make_request("print(int(input()) + 1)", {make_test_case({value}, to_string(i + 1)),
                                                                                 make_test_case({value}, value)})));
    }

    for (size_t i = 0; i < handles.size(); ++i) {
        execution_response response = handles[i].response.get();
        EXPECT_TRUE(response.success);
        EXPECT_EQ(response.total_tests, 2u);
        EXPECT_EQ(response.passed_tests, 1u);
        ASSERT_EQ(response.test_results.size(), 2u);
        EXPECT_EQ(response.test_results[0].test_id, 0u);
        EXPECT_TRUE(response.test_results[0].passed);
        EXPECT_EQ(response.test_results[1].test_id, 1u);
        EXPECT_EQ(response.test_results[1].status, status::WRONG_ANSWER);
        EXPECT_EQ(response.overall_output, fmt::format("{0}\n{0}", i + 1));
    }
}

TEST_F(ExecutionServiceTest, CancelTest) {
    execution_service service(*runner, 1);

    auto start = chrono::steady_clock::now();
    submission_handle handle = service.submit(make_request("while True:\n    pass", {make_test_case({}, ""),
                                                                                    make_test_case({}, ""),
                                                                                    make_test_case({}, "")},
                                                           30));
    this_thread::sleep_for(chrono::milliseconds(300));
    handle.cancel();

    ASSERT_EQ(handle.response.wait_for(chrono::seconds(5)), future_status::ready);
    execution_response response = handle.response.get();
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(5));

    ASSERT_EQ(response.test_results.size(), 3u);
    for (auto &result : response.test_results) {
        EXPECT_FALSE(result.passed);
        EXPECT_EQ(result.status, status::CANCELLED);
        EXPECT_EQ(result.error_message, "Execution cancelled");
    }
}

TEST_F(ExecutionServiceTest, StoppedServiceTest) {
    execution_service service(*runner, 2);
    service.stop();

    submission_handle handle = service.submit(make_request("print(1)", {make_test_case({}, "1")}));
    ASSERT_EQ(handle.response.wait_for(chrono::seconds(0)), future_status::ready);
    execution_response response = handle.response.get();
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.total_tests, 1u);
    EXPECT_EQ(response.runtime_errors, vector<string>{"Execution error: service is stopped"});
}

TEST_F(ExecutionServiceTest, DrainOnStopTest) {
    vector<submission_handle> handles;
    {
        execution_service service(*runner, 1);
        for (int i = 0; i < 3; ++i)
            handles.push_back(service.submit(make_request("print('x')", {make_test_case({}, "x")})));
        // 析构时等待队列中剩余的请求执行完毕
    }

    for (auto &handle : handles) {
        ASSERT_EQ(handle.response.wait_for(chrono::seconds(0)), future_status::ready);
        EXPECT_EQ(handle.response.get().passed_tests, 1u);
    }
}
