#include "judge/execution_service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace tutor {
using namespace std;

void submission_handle::cancel() noexcept {
    token.cancel();
}

execution_service::execution_service(process_runner &runner, size_t worker_count)
    : coordinator(runner) {
    if (worker_count == 0) worker_count = 1;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " execution worker(s)";
}

execution_service::~execution_service() {
    stop();
}

submission_handle execution_service::submit(execution_request request) {
    submission_handle handle;
    job j;
    j.token = handle.token;
    handle.response = j.promise.get_future();
    size_t total = request.test_cases.size();
    j.request = move(request);

    if (!job_queue.push(move(j))) {
        // push 失败时 j 没有被移动
        LOG(WARNING) << "Execution service is stopped, rejecting request";
        j.promise.set_value(execution_response::failure("Execution error: service is stopped", total, 0));
    }
    return handle;
}

void execution_service::stop() {
    job_queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

/**
 * @brief worker 线程函数
 * 不断从评测队列中取出请求并执行，队列关闭且为空时退出。
 * execution_coordinator::execute 不会抛出异常，这里仍然捕获异常，
 * 确保 promise 一定被设置，调用者不会永远等待。
 */
void execution_service::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (auto j = job_queue.pop()) {
        DLOG(INFO) << "Worker " << worker_id << " executing lesson " << j->request.lesson_id;
        execution_response response;
        try {
            response = coordinator.execute(j->request, j->token);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << boost::diagnostic_information(ex);
            response = execution_response::failure(string("Execution error: ") + ex.what(), j->request.test_cases.size(), 0);
        }
        j->promise.set_value(move(response));
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace tutor
