#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"

namespace execjudge {
using namespace std;

job_queue::job_queue(size_t worker_count, size_t capacity) : queue(capacity) {
    if (worker_count == 0) worker_count = 1;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " workers, queue capacity " << capacity;
}

job_queue::~job_queue() {
    stop();
}

void job_queue::enqueue(job &j) {
    if (!queue.try_push(j)) {
        ++rejected;
        throw overloaded_error();
    }
    ++accepted;
}

void job_queue::stop() {
    queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

job_stats job_queue::stats() const {
    job_stats s;
    s.accepted = accepted.load();
    s.rejected = rejected.load();
    s.completed = completed.load();
    s.in_flight = in_flight.load();
    return s;
}

/**
 * @brief worker 线程函数
 * 队列关闭后，worker 取完剩余的任务再退出。
 */
void job_queue::worker_loop(size_t worker_id) {
    job j;
    while (queue.pop(j)) {
        defer { ++completed; };

        if (j.cancel->cancelled()) {
            // 调用者已经放弃等待，不再执行
            LOG(INFO) << "Worker " << worker_id << " dropped a job cancelled before it started";
            j.abandon();
            continue;
        }

        j.cancel->start_deadline(j.budget);
        ++in_flight;
        defer { --in_flight; };
        try {
            j.run();
        } catch (std::exception &ex) {
            // run 已经把任务函数的异常交给了 future，这里只有 promise 自身的错误
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace execjudge
