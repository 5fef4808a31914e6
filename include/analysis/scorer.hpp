#pragma once

#include "models/analysis.hpp"
#include "models/execution.hpp"

namespace tutor {

/**
 * @brief 计算代码的总分，0~100
 * 
 * 总分由四部分组成：
 * 1. 测试：通过比例 × 40；
 * 2. 语法：代码能被解析时 30 分；
 * 3. 执行：请求执行成功时 20 分，否则 10 分；
 * 4. 风格：每个好习惯 2 分，最多 10 分。
 * 四部分相加后向下取整。相同的输入总是得到相同的总分。
 */
int compute_score(const execution_response &response, const structural_facts &syntax, const style_findings &style);

}  // namespace tutor
