#pragma once

#include <Python.h>

namespace tutor {

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 任何调用 Python C API 或 boost::python 的代码都必须持有 GIL，
 * 评测 worker 是并发运行的，因此每次分析代码前都需要构造该对象。
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

    GIL_guard(const GIL_guard &) = delete;
    GIL_guard &operator=(const GIL_guard &) = delete;

private:
    PyGILState_STATE state;
};

/**
 * @brief 初始化嵌入的 Python 解释器
 * 静态分析使用 Python 自带的 ast 模块解析选手代码，因此进程启动时
 * 需要构造一个该对象（main 函数或测试的全局环境）。构造完成后主线程
 * 不再持有 GIL，其他线程通过 GIL_guard 使用解释器。
 * 
 * 由于 boost::python 不支持 Py_Finalize，析构时只会恢复主线程状态，不会销毁解释器。
 */
class python_interpreter {
public:
    explicit python_interpreter(const char *program_name);
    ~python_interpreter();

    python_interpreter(const python_interpreter &) = delete;
    python_interpreter &operator=(const python_interpreter &) = delete;

private:
    PyThreadState *main_state;
};

}  // namespace tutor
