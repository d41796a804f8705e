#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "sandbox/cancellation.hpp"

/**
 * 评测任务队列
 * 固定数量的 worker 线程从有界的 FIFO 队列中取出评测任务，每个 worker 同一时间只执行一个任务
 * （编译并运行所有测试点）。队列已满时新的任务立刻被拒绝（overloaded_error），而不是无限排队。
 * 
 * 每个任务带有取消标记，worker 开始执行任务时才开始计算总截止时间，
 * 因此排队时间不会计入任务的截止时间。
 * 在开始执行之前就被取消的任务不会执行，调用者得到 overloaded_error。
 */
namespace execjudge {

struct job_stats {
    /**
     * @brief 被接受进入队列的任务数
     */
    std::size_t accepted = 0;

    /**
     * @brief 因为队列已满被拒绝的任务数
     */
    std::size_t rejected = 0;

    /**
     * @brief 已经结束的任务数（包括开始前被取消的任务）
     */
    std::size_t completed = 0;

    /**
     * @brief 正在被 worker 执行的任务数
     */
    std::size_t in_flight = 0;
};

struct job_queue {
    /**
     * @param workers worker 线程数，至少为 1
     * @param capacity 等待队列的最大长度，0 表示不限制
     */
    job_queue(std::size_t workers, std::size_t capacity);
    job_queue(const job_queue &) = delete;
    ~job_queue();

    /**
     * @brief 提交一个评测任务
     * @param fn 任务函数，参数为任务的取消标记，在 worker 线程中执行
     * @param cancel 任务的取消标记，调用者可以通过它取消任务
     * @param budget 任务的总截止时间，从 worker 开始执行时计算
     * @return 任务结果，fn 抛出的异常也通过 future 传递
     * @throw overloaded_error 如果队列已满或者已经停止
     */
    template <typename Fn>
    auto submit(Fn fn, cancellation_ptr cancel, std::chrono::steady_clock::duration budget)
        -> std::future<decltype(fn(std::declval<const cancellation_token &>()))> {
        using result_type = decltype(fn(std::declval<const cancellation_token &>()));
        auto promise = std::make_shared<std::promise<result_type>>();
        auto future = promise->get_future();

        job j;
        j.cancel = cancel;
        j.budget = budget;
        j.run = [promise, fn = std::move(fn), cancel]() mutable {
            try {
                promise->set_value(fn(*cancel));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };
        j.abandon = [promise]() {
            promise->set_exception(std::make_exception_ptr(overloaded_error("Job was cancelled before it started")));
        };
        enqueue(j);
        return future;
    }

    /**
     * @brief 停止接受新任务，等待已排队的任务执行完毕后回收所有 worker
     * 可以重复调用
     */
    void stop();

    job_stats stats() const;

private:
    struct job {
        cancellation_ptr cancel;
        std::chrono::steady_clock::duration budget;
        std::function<void()> run;
        std::function<void()> abandon;
    };

    void enqueue(job &j);

    void worker_loop(std::size_t worker_id);

    concurrent_queue<job> queue;
    std::vector<std::thread> workers;
    std::atomic<std::size_t> accepted{0}, rejected{0}, completed{0}, in_flight{0};
};

}  // namespace execjudge
