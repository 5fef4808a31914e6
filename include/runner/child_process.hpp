#pragma once

#include <sys/types.h>
#include <string>
#include <vector>

namespace tutor {

/**
 * @brief 运行在独立进程组中的子进程
 * 
 * 子进程的 stdin 被重定向到 /dev/null，stdout 和 stderr 分别连接到管道，
 * 父进程通过 stdout_fd() 和 stderr_fd() 读取。
 * 
 * 对象析构时若子进程还未被回收，会向整个进程组发送 SIGKILL 并回收子进程，
 * 因此任何退出路径（包括异常展开）都不会留下孤儿进程或僵尸进程。
 */
class child_process {
public:
    /**
     * @brief 启动子进程
     * @param args 命令行参数，args[0] 为可执行文件，可以是 PATH 中的程序名
     * @param env 额外的环境变量，形如 KEY=VALUE，覆盖从父进程继承的同名变量
     * @throw spawn_error 找不到可执行文件、无法创建管道、fork 失败或者 exec 失败
     */
    child_process(const std::vector<std::string> &args, const std::vector<std::string> &env);
    ~child_process();

    child_process(const child_process &) = delete;
    child_process &operator=(const child_process &) = delete;

    pid_t get_pid() const noexcept;

    /**
     * @brief 子进程 stdout 管道的读端，关闭后为 -1
     */
    int stdout_fd() const noexcept;

    /**
     * @brief 子进程 stderr 管道的读端，关闭后为 -1
     */
    int stderr_fd() const noexcept;

    /**
     * @brief 关闭管道读端，fd 必须是 stdout_fd() 或者 stderr_fd()
     */
    void close_pipe(int fd) noexcept;

    /**
     * @brief 向子进程所在的整个进程组发送 SIGKILL
     * 子进程已经被回收时不做任何事，避免误杀复用了该进程号的其他进程
     */
    void kill_group() noexcept;

    /**
     * @brief 阻塞等待子进程退出，但不回收子进程
     * 子进程退出后保持僵尸状态，进程号不会被复用，此时仍然可以安全地 kill_group。
     * 可以在辅助线程中调用。
     */
    void wait_exit();

    /**
     * @brief 回收子进程
     * 回收之前会向整个进程组发送 SIGKILL，清理残留的进程（比如选手程序创建的后台进程），
     * 子进程还未退出时也会被杀死。
     * @return waitpid 得到的 wait status
     */
    int reap();

    bool is_reaped() const noexcept;

private:
    pid_t pid = -1;
    int out_fd = -1;
    int err_fd = -1;
    bool reaped = false;
    int wait_status = 0;
};

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 程序名，若包含 '/' 则直接返回
 * @throw spawn_error 找不到可执行文件
 */
std::string resolve_executable(const std::string &name);

}  // namespace tutor
