#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = scoped_guard() + [&]

/**
 * @brief 在作用域退出时执行清理函数
 * 子进程回收、管道关闭、临时文件删除等动作必须在所有退出路径（正常返回、
 * 超时、异常展开）上执行，因此析构函数不会向外抛出异常，清理函数抛出的异常
 * 只会被记录到日志中。
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};
