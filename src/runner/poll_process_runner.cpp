#include "runner/poll_process_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "runner/child_process.hpp"

namespace tutor {
using namespace std;
namespace fs = std::filesystem;
using clock_type = chrono::steady_clock;

poll_process_runner::poll_process_runner(const runner_options &options)
    : process_runner(options) {}

const char *poll_process_runner::name() const noexcept {
    return "poll";
}

static int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    int fd = (int)syscall(SYS_pidfd_open, pid, 0);
    if (fd < 0)
        throw spawn_error(fmt::format("unable to open pidfd of child {}: {}", pid, strerror(errno)));
    return fd;
#else
    throw spawn_error("pidfd_open is not available on this platform");
#endif
}

static int poll_timeout(clock_type::time_point now, clock_type::time_point until) {
    auto left = chrono::duration_cast<chrono::milliseconds>(until - now);
    return (int)max<chrono::milliseconds::rep>(0, min(left, POLL_SLICE).count());
}

run_outcome poll_process_runner::spawn(const fs::path &program, double timeout_seconds, const cancellation_token &cancel) {
    child_process child(command_line(program), environment());
    elapsed_time timer;

    int pidfd = open_pidfd(child.get_pid());
    defer { close(pidfd); };

    captured_stream out(options.max_output_bytes), err(options.max_output_bytes);
    auto deadline = clock_type::now() + chrono::duration_cast<clock_type::duration>(chrono::duration<double>(timeout_seconds));
    clock_type::time_point drain_deadline = clock_type::time_point::max();
    bool timed_out = false, cancelled = false, exited = false;

    while (child.stdout_fd() >= 0 || child.stderr_fd() >= 0 || !exited) {
        auto now = clock_type::now();
        if (!exited && !timed_out && !cancelled) {
            if (cancel.is_cancelled()) {
                cancelled = true;
                LOG(INFO) << "[poll] Cancelling child process " << child.get_pid();
                child.kill_group();
            } else if (now >= deadline) {
                timed_out = true;
                LOG(INFO) << "[poll] Child process " << child.get_pid() << " exceeded " << timeout_seconds << "s, killing";
                child.kill_group();
            }
        }

        if ((exited || timed_out || cancelled) && drain_deadline == clock_type::time_point::max())
            drain_deadline = now + DRAIN_TIMEOUT;
        if (now >= drain_deadline) {
            LOG(WARNING) << "[poll] Pipes of child " << child.get_pid() << " are still open after draining, giving up";
            break;
        }

        pollfd fds[3];
        int nfds = 0;
        if (child.stdout_fd() >= 0) fds[nfds++] = {child.stdout_fd(), POLLIN, 0};
        if (child.stderr_fd() >= 0) fds[nfds++] = {child.stderr_fd(), POLLIN, 0};
        if (!exited) fds[nfds++] = {pidfd, POLLIN, 0};

        auto until = drain_deadline != clock_type::time_point::max() ? drain_deadline : deadline;
        int r = poll(fds, nfds, poll_timeout(now, until));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting for child data");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == pidfd) {
                exited = true;
            } else {
                captured_stream &stream = fds[i].fd == child.stdout_fd() ? out : err;
                if (pump_pipe(fds[i].fd, stream) == 0)
                    child.close_pipe(fds[i].fd);
            }
        }
    }

    int wait_status = child.reap();
    double wall_time_ms = timer.milliseconds();

    if (out.discarded || err.discarded)
        LOG(INFO) << "[poll] Output of child " << child.get_pid() << " truncated, discarded "
                  << out.discarded << " bytes of stdout and " << err.discarded << " bytes of stderr";
    DLOG(INFO) << "[poll] Child " << child.get_pid() << " finished in " << wall_time_ms << "ms";

    return finish(wait_status, timed_out, cancelled, out.data, err.data, wall_time_ms);
}

}  // namespace tutor
