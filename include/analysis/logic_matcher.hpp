#pragma once

#include <string>
#include <vector>
#include "models/analysis.hpp"
#include "models/execution.hpp"

namespace tutor {

/**
 * @brief 错误信息中的关键字与对应的问题描述
 */
struct logic_pattern {
    const char *pattern;
    const char *label;
};

/**
 * @brief 按顺序匹配，第一个匹配的规则生效
 */
extern const std::vector<logic_pattern> LOGIC_PATTERNS;

/**
 * @brief 在错误信息中查找第一个匹配的问题描述
 * @return 问题描述，没有任何规则匹配时返回 nullptr
 */
const char *match_logic_pattern(const std::string &error_message);

/**
 * @brief 根据执行结果推测代码的逻辑问题
 * 对于每个未通过的测试用例：
 * 1. 有错误信息时，输出第一个匹配的问题描述；
 * 2. 没有错误信息但是输出不一致时，输出 "Expected 'X' but got 'Y'"。
 */
logic_findings match_logic(const execution_response &response);

}  // namespace tutor
