#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含代码执行相关的数据结构及其 JSON 序列化函数
 * 1. test_case 类（表示一组输入与期望输出）
 * 2. execution_request 类（表示一次代码执行请求）
 * 3. test_result 类（表示一个测试用例的执行结果）
 * 4. execution_response 类（表示整个请求的执行结果）
 */
namespace tutor {

/**
 * @brief 表示一个测试用例
 */
struct test_case {
    /**
     * @brief 依次提供给选手程序 input() 调用的字符串
     * 可以为空，此时所有 input() 调用都返回空字符串
     * @code{.json}
     * ["Alice", "18"]
     * @endcode
     */
    std::vector<std::string> input;

    /**
     * @brief 期望的标准输出
     * 比较时会去掉首尾空白字符
     */
    std::string expected_output;
};

/**
 * @brief 一次代码执行请求
 */
struct execution_request {
    /**
     * @brief 选手提交的 Python 代码
     */
    std::string code;

    /**
     * @brief 课程或者挑战的 id，仅用于日志
     */
    std::string lesson_id;

    /**
     * @brief 所有测试用例，按顺序执行
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 每个测试用例的墙上时钟时间限制，单位为秒，必须大于 0
     */
    double timeout_seconds;

    /**
     * @brief 内存限制，单位为 MB
     * @note 只是建议值，目前不会被强制执行
     */
    int memory_limit_mb;

    execution_request();
};

/**
 * @brief 一个测试用例的执行结果，构造之后不再修改
 */
struct test_result {
    /**
     * @brief 测试用例的下标，与 execution_request.test_cases 的顺序一致
     */
    std::size_t test_id = 0;

    bool passed = false;

    tutor::status status = status::PENDING;

    /**
     * @brief 提供给程序的输入（以换行连接，去掉首尾换行），没有输入时为空
     */
    std::optional<std::string> input;

    /**
     * @brief 去掉首尾空白字符后的期望输出
     */
    std::string expected_output;

    /**
     * @brief 去掉首尾空白字符后的实际输出，程序没有运行结束（超时、无法启动）时为空
     */
    std::optional<std::string> actual_output;

    /**
     * @brief 错误信息，比如程序的 stderr 输出、超时信息
     */
    std::optional<std::string> error_message;

    /**
     * @brief 程序运行用时，单位为毫秒
     */
    double execution_time_ms = 0;

    /**
     * @brief 程序的返回值，被信号终止或者没有运行时为空
     */
    std::optional<int> exit_code;
};

/**
 * @brief 一次代码执行请求的结果
 * 所有字段都由 test_results 计算得到，通过 aggregate 构造
 */
struct execution_response {
    bool success = false;

    std::size_t total_tests = 0;

    std::size_t passed_tests = 0;

    std::vector<test_result> test_results;

    /**
     * @brief 所有非空实际输出，按测试顺序以换行连接，没有输出时为空
     */
    std::optional<std::string> overall_output;

    /**
     * @brief 所有测试用例的错误信息，按测试顺序排列
     */
    std::vector<std::string> runtime_errors;

    double execution_time_total_ms = 0;

    /**
     * @brief 根据测试结果统计整个请求的执行结果
     * @param results 按测试顺序排列的测试结果
     * @param total_tests 请求中的测试用例个数
     * @param total_ms 整个请求的执行用时
     */
    static execution_response aggregate(std::vector<test_result> results, std::size_t total_tests, double total_ms);

    /**
     * @brief 请求无法执行时（参数不合法、内部错误）返回的结果
     */
    static execution_response failure(const std::string &error, std::size_t total_tests, double total_ms);
};

void from_json(const nlohmann::json &j, test_case &tc);
void to_json(nlohmann::json &j, const test_case &tc);

void from_json(const nlohmann::json &j, execution_request &request);
void to_json(nlohmann::json &j, const execution_request &request);

void from_json(const nlohmann::json &j, test_result &result);
void to_json(nlohmann::json &j, const test_result &result);

void from_json(const nlohmann::json &j, execution_response &response);
void to_json(nlohmann::json &j, const execution_response &response);

}  // namespace tutor
