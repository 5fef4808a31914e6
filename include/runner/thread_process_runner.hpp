#pragma once

#include <atomic>
#include <future>
#include "runner/process_runner.hpp"

namespace tutor {

/**
 * @brief 基于辅助线程的 process_runner
 * 每次运行使用三个辅助线程：两个线程分别读取 stdout 和 stderr，
 * 一个线程阻塞等待子进程退出。调用者所在线程等待退出事件，
 * 同时检查时间限制和取消标志。
 * 不依赖 pidfd，因此可以在较旧的内核上使用。
 */
class thread_process_runner : public process_runner {
public:
    explicit thread_process_runner(const runner_options &options);

    const char *name() const noexcept override;

protected:
    /**
     * @brief 启动读取管道 fd 的辅助线程，直到 EOF 或 stop 被设置
     */
    virtual std::future<captured_stream> start_reader(int fd, std::size_t limit, const std::atomic<bool> &stop);

    run_outcome spawn(const std::filesystem::path &program, double timeout_seconds, const cancellation_token &cancel) override;
};

}  // namespace tutor
