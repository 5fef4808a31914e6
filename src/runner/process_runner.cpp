#include "runner/process_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runner/poll_process_runner.hpp"
#include "runner/thread_process_runner.hpp"

namespace tutor {
using namespace std;
namespace fs = std::filesystem;

const chrono::milliseconds POLL_SLICE(50);
const chrono::milliseconds DRAIN_TIMEOUT(500);

const int BUF_SIZE = 4096;

runner_options::runner_options()
    : interpreter(PYTHON_EXECUTABLE),
      temp_dir(TEMP_DIR),
      max_output_bytes(MAX_OUTPUT_BYTES),
      strategy(RUNNER_STRATEGY) {}

captured_stream::captured_stream(size_t limit)
    : limit(limit) {}

void captured_stream::append(const char *buf, size_t size) {
    size_t room = data.size() < limit ? limit - data.size() : 0;
    size_t taken = min(room, size);
    data.append(buf, taken);
    discarded += size - taken;
}

long pump_pipe(int fd, captured_stream &stream) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return -1;
        throw system_error(errno, system_category(), fmt::format("reading pipe fd {}", fd));
    }
    // 超出上限后仍然读取管道，避免子进程因为管道写满而阻塞
    stream.append(buf, nread);
    return nread;
}

process_runner::process_runner(const runner_options &options)
    : options(options) {}

process_runner::~process_runner() = default;

vector<string> process_runner::command_line(const fs::path &program) const {
    return {options.interpreter, program.string()};
}

vector<string> process_runner::environment() const {
    return {"PYTHONIOENCODING=utf-8", "PYTHONDONTWRITEBYTECODE=1"};
}

run_outcome process_runner::finish(int wait_status, bool timed_out, bool cancelled,
                                   const string &out, const string &err, double wall_time_ms) {
    run_outcome outcome;
    if (cancelled)
        outcome.status = status::CANCELLED;
    else if (timed_out)
        outcome.status = status::TIME_LIMIT_EXCEEDED;
    else
        outcome.status = status::ACCEPTED;

    if (WIFEXITED(wait_status)) {
        outcome.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        outcome.signal = WTERMSIG(wait_status);
    }

    outcome.stdout_text = utf8_sanitize(out);
    outcome.stderr_text = utf8_sanitize(err);
    outcome.wall_time_ms = wall_time_ms;
    return outcome;
}

static run_outcome system_error_outcome(const string &category, const string &message) {
    run_outcome outcome;
    outcome.status = status::SYSTEM_ERROR;
    outcome.error = fmt::format("{}: {}", category, message);
    return outcome;
}

run_outcome process_runner::run(const string &program, double timeout_seconds, const cancellation_token &cancel) {
    elapsed_time timer;
    run_outcome outcome;
    optional<string> cleanup_error;
    try {
        // 异常展开时由 scoped_temp_file 的析构函数删除临时文件
        scoped_temp_file file(options.temp_dir, ".py", program);
        outcome = spawn(file.path(), timeout_seconds, cancel);

        error_code ec;
        if (!file.remove(ec)) {
            LOG(ERROR) << "Unable to remove temp file " << file.path() << ": " << ec.message();
            cleanup_error = fmt::format("unable to remove {}: {}", file.path().string(), ec.message());
        }
    } catch (infrastructure_error &e) {
        LOG(ERROR) << "[" << name() << "] " << e.category() << ": " << e.what();
        outcome = system_error_outcome(e.category(), e.what());
    } catch (std::system_error &e) {
        LOG(ERROR) << "[" << name() << "] " << e.what();
        outcome = system_error_outcome("InfrastructureError", e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << "[" << name() << "] Unexpected error while running program: " << e.what();
        outcome = system_error_outcome("InternalError", e.what());
    }

    outcome.cleanup_error = cleanup_error;
    if (outcome.status == status::SYSTEM_ERROR)
        outcome.wall_time_ms = timer.milliseconds();
    return outcome;
}

bool supports_pidfd() noexcept {
#ifdef SYS_pidfd_open
    int fd = (int)syscall(SYS_pidfd_open, getpid(), 0);
    if (fd >= 0) {
        close(fd);
        return true;
    }
#endif
    return false;
}

unique_ptr<process_runner> make_process_runner(const runner_options &options) {
    unique_ptr<process_runner> runner;
    if (options.strategy == "poll") {
        if (!supports_pidfd())
            throw invalid_argument("runner strategy poll requires pidfd_open, which is not supported by this kernel");
        runner = make_unique<poll_process_runner>(options);
    } else if (options.strategy == "thread") {
        runner = make_unique<thread_process_runner>(options);
    } else if (options.strategy == "auto" || options.strategy.empty()) {
        if (supports_pidfd())
            runner = make_unique<poll_process_runner>(options);
        else
            runner = make_unique<thread_process_runner>(options);
    } else {
        throw invalid_argument("Unrecognized runner strategy " + options.strategy);
    }

    LOG(INFO) << "Using " << runner->name() << " process runner, interpreter " << options.interpreter
              << ", temp directory " << options.temp_dir;
    return runner;
}

}  // namespace tutor
