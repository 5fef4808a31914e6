#pragma once

#include <string>
#include <vector>

namespace tutor {

/**
 * @brief 生成替换了 input() 的 Python 启动程序
 * 
 * 生成的程序构造一个按顺序返回 inputs 的输入队列，然后在一个全新的
 * __main__ 命名空间中执行未经修改的选手代码，该命名空间中的 input
 * 被替换为输入队列的读取函数：
 * 1. 队列非空时返回下一个字符串；
 * 2. 队列耗尽后返回空字符串，永远不会阻塞。
 * 
 * 选手代码以 "<submission>" 为文件名编译，因此错误信息中的行号与选手代码一致。
 * 选手代码和输入队列都以 JSON 字符串的形式嵌入，Python 可以直接将其解析为字面量。
 * 
 * @param source 选手提交的代码
 * @param inputs 依次提供给 input() 的字符串
 * @return 可以直接交给 Python 解释器执行的程序
 */
std::string virtualize_input(const std::string &source, const std::vector<std::string> &inputs);

}  // namespace tutor
