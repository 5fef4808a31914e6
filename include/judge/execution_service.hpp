#pragma once

#include <future>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/execution_coordinator.hpp"

/**
 * 评测服务
 * 调用者通过 submit 提交执行请求，请求被放入内部的评测队列，
 * 由若干个 worker 线程取出并交给 execution_coordinator 执行。
 * 
 * 同一个请求的测试用例在同一个 worker 中按顺序执行，
 * 不同请求之间没有顺序保证。
 */
namespace tutor {

/**
 * @brief 已提交请求的句柄
 */
struct submission_handle {
    /**
     * @brief 执行结果，执行结束后就绪，不会保存异常
     */
    std::future<execution_response> response;

    /**
     * @brief 取消执行
     * 正在运行的子进程会被杀死，还未运行的测试用例标记为 CANCELLED
     */
    void cancel() noexcept;

    cancellation_token token;
};

class execution_service {
public:
    /**
     * @brief 启动 worker 线程
     * @param runner 所有 worker 共享的执行器，生命周期必须长于 execution_service
     * @param worker_count worker 线程数，至少为 1
     */
    execution_service(process_runner &runner, std::size_t worker_count);

    /**
     * @brief 停止服务，等待所有已提交的请求执行完毕
     */
    ~execution_service();

    execution_service(const execution_service &) = delete;
    execution_service &operator=(const execution_service &) = delete;

    /**
     * @brief 提交执行请求
     * 服务已经停止时，返回的 response 立即就绪，结果为 execution_response::failure
     */
    submission_handle submit(execution_request request);

    /**
     * @brief 停止接受新的请求，队列中剩余的请求仍然会被执行，然后等待所有 worker 退出
     */
    void stop();

private:
    struct job {
        execution_request request;
        std::promise<execution_response> promise;
        cancellation_token token;
    };

    void worker_loop(std::size_t worker_id);

    execution_coordinator coordinator;
    concurrent_queue<job> job_queue;
    std::vector<std::thread> workers;
};

}  // namespace tutor
