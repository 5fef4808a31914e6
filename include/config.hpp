#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace tutor {

/**
 * @brief 运行选手代码的 Python 解释器
 * 可以是绝对路径，也可以是在 PATH 中查找的程序名
 * @defaultValue python3
 */
extern std::string PYTHON_EXECUTABLE;

/**
 * @brief 存放选手代码临时文件的文件夹
 * 每个测试用例都会在这里创建一个以 UUID 命名的 .py 文件，测试结束后立即删除。
 * 若将这个文件夹放进内存盘，可以加速评测。
 * @defaultValue /tmp，或者环境变量 TMPDIR
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief 子进程的运行方式
 * auto: 根据内核是否支持 pidfd_open 自动选择
 * poll: 基于 pidfd 和 poll 的事件驱动方式
 * thread: 基于辅助线程阻塞等待的方式
 */
extern std::string RUNNER_STRATEGY;

/**
 * @brief 子进程每个输出流最多保存多少字节，超出部分会被读取并丢弃
 */
extern std::size_t MAX_OUTPUT_BYTES;

/**
 * @brief 请求未指定时使用的时间限制，单位为秒
 */
extern double DEFAULT_TIMEOUT_SECONDS;

/**
 * @brief 请求未指定时使用的内存限制，单位为 MB
 * @note 只是建议值，评测系统不会限制子进程的内存
 */
extern int DEFAULT_MEMORY_LIMIT_MB;

/**
 * @brief 并发处理提交的 worker 线程数
 */
extern std::size_t WORKER_COUNT;

/**
 * @brief 文本生成服务的地址，兼容 OpenAI 的 chat completions 接口
 */
extern std::string LLM_BASE_URL;

/**
 * @brief 文本生成服务使用的模型
 */
extern std::string LLM_MODEL;

/**
 * @brief 文本生成服务的 API Key，为空时不调用文本生成服务
 */
extern std::string LLM_API_KEY;

extern double LLM_TEMPERATURE;

/**
 * @brief 调用文本生成服务的超时时间，单位为秒
 */
extern long LLM_TIMEOUT_SECONDS;

/**
 * @brief 是否开启 DEBUG 模式
 * DEBUG 模式下会输出更详细的日志
 */
extern bool DEBUG;

}  // namespace tutor
