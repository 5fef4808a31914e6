#pragma once

#include <atomic>
#include <memory>

namespace tutor {

/**
 * @brief 取消标志，可以在多个线程之间复制传递
 * 调用者持有一份拷贝，评测线程持有另一份拷贝；调用者 cancel 之后，
 * process_runner 会在下一次检查时杀死正在运行的子进程。
 */
struct cancellation_token {
    cancellation_token()
        : flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept {
        flag->store(true);
    }

    bool is_cancelled() const noexcept {
        return flag->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace tutor
