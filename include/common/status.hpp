#pragma once

#include <string>

namespace tutor {

/**
 * @brief 表示一个测试用例的评测结果
 */
enum class status {
    /**
     * @brief 测试用例还未执行
     */
    PENDING = 0,

    /**
     * @brief 测试通过
     * 去掉首尾空白字符后标准输出与期望输出一致，且标准错误输出为空。
     * 注意程序的返回值不参与判断，返回值非 0 但输出正确时仍然为 ACCEPTED。
     */
    ACCEPTED = 1,

    /**
     * @brief 答案错误
     * 程序正常结束且没有错误输出，但是标准输出与期望输出不一致
     */
    WRONG_ANSWER = 2,

    /**
     * @brief 运行时错误
     * 程序向标准错误输出写入了内容（比如 Python 的 Traceback），
     * 无论标准输出是否与期望输出一致都判定为失败。
     * 语法错误也会以这种方式表现，因为解释器会在 stderr 输出 SyntaxError。
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 运行时间超出限制
     * 程序在墙上时钟时间限制内没有结束，整个进程组被 SIGKILL 强制终止
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 内部错误，评测系统出错
     * 比如临时文件无法创建、子进程无法启动
     */
    SYSTEM_ERROR = 5,

    /**
     * @brief 评测被调用者取消
     * 子进程已经被强制终止并回收
     */
    CANCELLED = 6
};

const char *get_display_message(status);

/**
 * @brief 将 JSON 中的状态字符串转换回 status
 * @throw std::out_of_range 无法识别的状态字符串
 */
status parse_status(const std::string &str);

}  // namespace tutor
