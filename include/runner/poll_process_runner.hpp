#pragma once

#include "runner/process_runner.hpp"

namespace tutor {

/**
 * @brief 事件驱动的 process_runner
 * 通过 pidfd_open 获得子进程的文件描述符，与 stdout、stderr 管道一起交给 poll(2) 等待，
 * 整个过程只使用调用者所在的线程。需要 Linux 5.3 以上的内核。
 */
class poll_process_runner final : public process_runner {
public:
    explicit poll_process_runner(const runner_options &options);

    const char *name() const noexcept override;

protected:
    run_outcome spawn(const std::filesystem::path &program, double timeout_seconds, const cancellation_token &cancel) override;
};

}  // namespace tutor
