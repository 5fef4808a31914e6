#include "runner/thread_process_runner.hpp"
#include <glog/logging.h>
#include <poll.h>
#include <atomic>
#include <cerrno>
#include <future>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "runner/child_process.hpp"

namespace tutor {
using namespace std;
namespace fs = std::filesystem;
using clock_type = chrono::steady_clock;

thread_process_runner::thread_process_runner(const runner_options &options)
    : process_runner(options) {}

const char *thread_process_runner::name() const noexcept {
    return "thread";
}

/**
 * @brief 在辅助线程中读取管道直到 EOF
 * 每次最多阻塞 POLL_SLICE，以便 stop 被设置后能及时退出
 */
static captured_stream read_until_eof(int fd, size_t limit, const atomic<bool> &stop) {
    captured_stream stream(limit);
    while (!stop) {
        pollfd pfd = {fd, POLLIN, 0};
        int r = poll(&pfd, 1, (int)POLL_SLICE.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting for child data");
        }
        if (r > 0 && pump_pipe(fd, stream) == 0) break;
    }
    return stream;
}

future<captured_stream> thread_process_runner::start_reader(int fd, size_t limit, const atomic<bool> &stop) {
    return async(launch::async, read_until_eof, fd, limit, cref(stop));
}

run_outcome thread_process_runner::spawn(const fs::path &program, double timeout_seconds, const cancellation_token &cancel) {
    child_process child(command_line(program), environment());
    elapsed_time timer;

    atomic<bool> stop_reading(false);
    future<captured_stream> out_future, err_future;
    future<void> exit_future;

    // 在 future 析构（等待辅助线程结束）之前执行，保证辅助线程一定能结束，
    // 包括后面某个辅助线程启动失败的情况
    defer {
        child.kill_group();
        stop_reading = true;
    };

    size_t limit = options.max_output_bytes;
    out_future = start_reader(child.stdout_fd(), limit, stop_reading);
    err_future = start_reader(child.stderr_fd(), limit, stop_reading);
    exit_future = async(launch::async, [&child] { child.wait_exit(); });

    auto deadline = clock_type::now() + chrono::duration_cast<clock_type::duration>(chrono::duration<double>(timeout_seconds));
    bool timed_out = false, cancelled = false;
    while (exit_future.wait_for(POLL_SLICE) != future_status::ready) {
        if (timed_out || cancelled) continue;
        if (cancel.is_cancelled()) {
            cancelled = true;
            LOG(INFO) << "[thread] Cancelling child process " << child.get_pid();
            child.kill_group();
        } else if (clock_type::now() >= deadline) {
            timed_out = true;
            LOG(INFO) << "[thread] Child process " << child.get_pid() << " exceeded " << timeout_seconds << "s, killing";
            child.kill_group();
        }
    }
    exit_future.get();

    auto drain_deadline = clock_type::now() + DRAIN_TIMEOUT;
    if (out_future.wait_until(drain_deadline) != future_status::ready ||
        err_future.wait_until(drain_deadline) != future_status::ready) {
        LOG(WARNING) << "[thread] Pipes of child " << child.get_pid() << " are still open after draining, giving up";
        stop_reading = true;
    }
    captured_stream out = out_future.get();
    captured_stream err = err_future.get();

    int wait_status = child.reap();
    double wall_time_ms = timer.milliseconds();

    if (out.discarded || err.discarded)
        LOG(INFO) << "[thread] Output of child " << child.get_pid() << " truncated, discarded "
                  << out.discarded << " bytes of stdout and " << err.discarded << " bytes of stderr";
    DLOG(INFO) << "[thread] Child " << child.get_pid() << " finished in " << wall_time_ms << "ms";

    return finish(wait_status, timed_out, cancelled, out.data, err.data, wall_time_ms);
}

}  // namespace tutor
