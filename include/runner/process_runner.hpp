#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "runner/cancellation.hpp"

namespace tutor {

/**
 * @brief 运行一次程序的结果
 */
struct run_outcome {
    /**
     * @brief 运行状态
     * ACCEPTED: 程序自行结束（不论返回值和输出，由调用者判断是否通过）
     * TIME_LIMIT_EXCEEDED: 超时，进程组被杀死
     * CANCELLED: 被调用者取消，进程组被杀死
     * SYSTEM_ERROR: 评测系统出错，error 中保存错误信息
     */
    tutor::status status = status::PENDING;

    /**
     * @brief 标准输出，非法的 UTF-8 序列被替换为 U+FFFD
     */
    std::string stdout_text;

    /**
     * @brief 标准错误输出，非法的 UTF-8 序列被替换为 U+FFFD
     */
    std::string stderr_text;

    std::optional<int> exit_code;

    /**
     * @brief 导致程序结束的信号，程序正常退出时为空
     */
    std::optional<int> signal;

    double wall_time_ms = 0;

    /**
     * @brief 错误信息，形如 "SpawnError: unable to fork: ..."
     */
    std::string error;

    /**
     * @brief 清理资源（删除临时文件）失败的原因
     * 清理失败不影响运行结果，只会被记录下来
     */
    std::optional<std::string> cleanup_error;
};

/**
 * @brief process_runner 的配置，默认值来自 config.hpp
 */
struct runner_options {
    std::string interpreter;
    std::filesystem::path temp_dir;
    std::size_t max_output_bytes;

    /**
     * @brief auto, poll 或者 thread
     */
    std::string strategy;

    runner_options();
};

/**
 * @brief 运行 Python 程序的执行器
 * 
 * run 的流程：
 * 1. 将程序写入临时目录中的 submission-<uuid>.py；
 * 2. 在独立的进程组中运行解释器，捕获 stdout 和 stderr；
 * 3. 超时或者被取消时杀死整个进程组；
 * 4. 删除临时文件。
 * 
 * 其中第 2、3 步由子类实现，不同的子类使用不同的方式等待子进程。
 * run 不会抛出异常，任何错误都会转换为 SYSTEM_ERROR 的运行结果。
 */
class process_runner {
public:
    explicit process_runner(const runner_options &options);
    virtual ~process_runner();

    /**
     * @brief 运行程序
     * @param program 完整的 Python 程序
     * @param timeout_seconds 墙上时钟时间限制
     * @param cancel 取消标志，每隔一小段时间检查一次
     */
    run_outcome run(const std::string &program, double timeout_seconds, const cancellation_token &cancel);

    /**
     * @brief 策略名，用于日志
     */
    virtual const char *name() const noexcept = 0;

protected:
    /**
     * @brief 运行已经写入磁盘的程序文件
     * @throw infrastructure_error 无法启动子进程
     * @throw std::system_error 等待子进程或读取管道失败
     */
    virtual run_outcome spawn(const std::filesystem::path &program, double timeout_seconds, const cancellation_token &cancel) = 0;

    /**
     * @brief 运行程序的命令行
     */
    std::vector<std::string> command_line(const std::filesystem::path &program) const;

    /**
     * @brief 子进程额外的环境变量
     */
    std::vector<std::string> environment() const;

    /**
     * @brief 根据子进程的结束状态构造运行结果
     */
    static run_outcome finish(int wait_status, bool timed_out, bool cancelled,
                              const std::string &out, const std::string &err, double wall_time_ms);

    runner_options options;
};

/**
 * @brief 保存子进程的输出，超出上限的部分被丢弃
 */
struct captured_stream {
    explicit captured_stream(std::size_t limit);

    void append(const char *data, std::size_t size);

    std::string data;
    std::size_t limit;
    std::size_t discarded = 0;
};

/**
 * @brief 从管道读取一次数据并保存到 stream 中
 * @return 读取的字节数；0 表示 EOF；-1 表示被信号中断或者暂时没有数据，可以重试
 * @throw std::system_error 读取失败
 */
long pump_pipe(int fd, captured_stream &stream);

/**
 * @brief 每次检查取消标志和时间限制的间隔
 */
extern const std::chrono::milliseconds POLL_SLICE;

/**
 * @brief 杀死子进程之后，最多再等待多久读取管道中剩余的输出
 */
extern const std::chrono::milliseconds DRAIN_TIMEOUT;

/**
 * @brief 内核是否支持 pidfd_open（Linux 5.3+）
 */
bool supports_pidfd() noexcept;

/**
 * @brief 根据 options.strategy 创建 process_runner
 * auto 时，内核支持 pidfd_open 则使用 poll_process_runner，否则使用 thread_process_runner
 * @throw std::invalid_argument 无法识别的策略，或者强制使用 poll 但内核不支持
 */
std::unique_ptr<process_runner> make_process_runner(const runner_options &options = runner_options());

}  // namespace tutor
