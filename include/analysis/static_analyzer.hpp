#pragma once

#include <string>
#include "models/analysis.hpp"

namespace tutor {

/**
 * @brief 使用 Python 自带的 ast 模块解析代码，统计代码结构
 * 
 * 调用时会获取 GIL，因此可以在任意线程调用，但是同一时刻只有一个线程在解析代码。
 * 调用前必须已经构造了 python_interpreter。
 * 
 * 代码无法解析时（SyntaxError，包括 IndentationError）不会抛出异常，
 * 而是返回 is_valid = false 的结果，各项统计均为 0，复杂度为 1。
 * 
 * @param code 选手提交的代码
 * @throw analysis_error Python 解释器出现了语法错误以外的错误
 */
structural_facts analyze_structure(const std::string &code);

/**
 * @brief 检查代码风格，不需要代码能被解析
 * 1. 超过 100 个字符的非空行记为风格问题；
 * 2. 每一行注释记为一个好习惯；
 * 3. 存在长度大于 2 且不以下划线开头的赋值目标时，记为一个好习惯。
 * 可读性评分为 10 减去风格问题个数，限制在 1~10 之间。
 */
style_findings check_style(const std::string &code);

}  // namespace tutor
