#include "runner/child_process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <cerrno>
#include <cstring>
#include <map>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace tutor {
using namespace std;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

template <typename... Args>
static spawn_error error(int err, fmt::format_string<Args...> format, Args &&... args) {
    return spawn_error(fmt::format(format, std::forward<Args>(args)...) + ": " + strerror(err));
}

string resolve_executable(const string &name) {
    if (name.empty()) throw spawn_error("interpreter path is empty");
    if (name.find('/') != string::npos) return name;

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, [](char c) { return c == ':'; });
    for (auto &dir : dirs) {
        string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    throw spawn_error(fmt::format("unable to find {} in PATH", name));
}

/**
 * @brief 子进程的环境变量：继承父进程的环境变量，并用 overrides 覆盖
 */
static vector<string> build_environment(const vector<string> &overrides) {
    map<string, string> vars;
    for (char **e = environ; e && *e; ++e) {
        string entry = *e;
        size_t eq = entry.find('=');
        if (eq == string::npos) continue;
        vars[entry.substr(0, eq)] = entry;
    }
    for (auto &entry : overrides) {
        vars[entry.substr(0, entry.find('='))] = entry;
    }

    vector<string> result;
    for (auto &[key, entry] : vars) result.push_back(entry);
    return result;
}

static void close_if_open(int &fd) noexcept {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// fork 之后子进程中只能调用 async-signal-safe 的函数，
// 因此所有内存分配都在 fork 之前完成。
[[noreturn]] static void exec_child(const char *file, char *const argv[], char *const envp[],
                                    int stdout_pipe, int stderr_pipe, int error_pipe) {
    setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0 ||
        dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_pipe, STDOUT_FILENO) < 0 ||
        dup2(stderr_pipe, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!write(error_pipe, &err, sizeof(err));
        _exit(127);
    }

    execve(file, argv, envp);

    int err = errno;
    (void)!write(error_pipe, &err, sizeof(err));
    _exit(127);
}

child_process::child_process(const vector<string> &args, const vector<string> &env) {
    if (args.empty()) throw spawn_error("empty command line");

    string file = resolve_executable(args[0]);

    vector<string> environment = build_environment(env);
    vector<char *> argv, envp;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : environment) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    int stdout_pipe[2], stderr_pipe[2], error_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0)
        throw error(errno, "creating pipe for stdout");
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(stdout_pipe[0]), close(stdout_pipe[1]);
        throw error(err, "creating pipe for stderr");
    }
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(stdout_pipe[0]), close(stdout_pipe[1]);
        close(stderr_pipe[0]), close(stderr_pipe[1]);
        throw error(err, "creating pipe for exec status");
    }

    pid = fork();
    if (pid == 0) {
        exec_child(file.c_str(), argv.data(), envp.data(),
                   stdout_pipe[PIPE_IN], stderr_pipe[PIPE_IN], error_pipe[PIPE_IN]);
    }

    int fork_errno = errno;
    close(stdout_pipe[PIPE_IN]);
    close(stderr_pipe[PIPE_IN]);
    close(error_pipe[PIPE_IN]);
    out_fd = stdout_pipe[PIPE_OUT];
    err_fd = stderr_pipe[PIPE_OUT];

    if (pid < 0) {
        close(error_pipe[PIPE_OUT]);
        close_if_open(out_fd);
        close_if_open(err_fd);
        throw error(fork_errno, "unable to fork");
    }

    // 父进程也设置一次进程组，保证在子进程执行 setpgid 之前 kill_group 也能生效
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        PLOG(WARNING) << "Unable to set process group of child " << pid;

    // exec 成功时 error_pipe 因为 O_CLOEXEC 被关闭，read 返回 0
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[PIPE_OUT], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(error_pipe[PIPE_OUT]);

    if (n > 0) {
        reap();
        close_if_open(out_fd);
        close_if_open(err_fd);
        throw error(exec_errno, "unable to start command {}", file);
    }

    DLOG(INFO) << "Started child process " << pid << ": " << file;
}

child_process::~child_process() {
    close_if_open(out_fd);
    close_if_open(err_fd);
    if (pid > 0 && !reaped) {
        kill_group();
        try {
            reap();
        } catch (std::exception &e) {
            LOG(ERROR) << "Unable to reap child process " << pid << ": " << e.what();
        }
    }
}

pid_t child_process::get_pid() const noexcept {
    return pid;
}

int child_process::stdout_fd() const noexcept {
    return out_fd;
}

int child_process::stderr_fd() const noexcept {
    return err_fd;
}

void child_process::close_pipe(int fd) noexcept {
    if (fd == out_fd) close_if_open(out_fd);
    if (fd == err_fd) close_if_open(err_fd);
}

void child_process::kill_group() noexcept {
    if (pid <= 0 || reaped) return;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        PLOG(ERROR) << "Unable to send SIGKILL to process group " << pid;
        // 进程组可能还没有建立，至少杀死子进程本身
        kill(pid, SIGKILL);
    }
}

void child_process::wait_exit() {
    if (reaped) return;
    siginfo_t info;
    while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), fmt::format("waiting on child {}", pid));
    }
}

int child_process::reap() {
    if (reaped) return wait_status;
    kill_group();
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), fmt::format("reaping child {}", pid));
    }
    reaped = true;
    DLOG(INFO) << "Reaped child process " << pid << " with status " << wait_status;
    return wait_status;
}

bool child_process::is_reaped() const noexcept {
    return reaped;
}

}  // namespace tutor
