#pragma once

#include "models/execution.hpp"
#include "runner/cancellation.hpp"
#include "runner/process_runner.hpp"

namespace tutor {

/**
 * @brief 逐个运行测试用例并汇总结果
 * 
 * 每个测试用例都使用全新的临时文件和全新的子进程运行，
 * 一个测试用例失败或超时不会影响后续的测试用例。
 * 测试用例按顺序执行，test_results 的顺序与 test_cases 一致。
 * 
 * 判定规则：去掉首尾空白字符后 stdout 与期望输出一致，且 stderr 为空时通过。
 * 程序的返回值不参与判定。
 */
class execution_coordinator {
public:
    /**
     * @param runner 运行程序的执行器，可以被多个 coordinator 共享
     */
    explicit execution_coordinator(process_runner &runner);

    /**
     * @brief 执行一个请求的所有测试用例
     * 不会抛出异常，请求不合法时返回 execution_response::failure
     * @param cancel 取消后正在运行的子进程被杀死，剩余的测试用例标记为 CANCELLED
     */
    execution_response execute(const execution_request &request, const cancellation_token &cancel = cancellation_token());

    /**
     * @brief 运行一个测试用例
     */
    test_result run_test_case(std::size_t test_id, const std::string &code, const test_case &tc,
                              double timeout_seconds, const cancellation_token &cancel);

    /**
     * @brief 根据程序的运行结果判定测试用例是否通过
     */
    static test_result judge_outcome(std::size_t test_id, const test_case &tc, const run_outcome &outcome, double timeout_seconds);

private:
    process_runner &runner;
};

}  // namespace tutor
