#include <chrono>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "worker.hpp"

using namespace std;
using namespace execjudge;

static const auto BUDGET = chrono::seconds(30);

/**
 * @brief 等待直到 pred 成立，最多等待 timeout
 */
template <typename Pred>
static bool wait_until(Pred pred, chrono::milliseconds timeout = chrono::seconds(10)) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (chrono::steady_clock::now() > deadline) return false;
        this_thread::sleep_for(chrono::milliseconds(5));
    }
    return true;
}

TEST(JobQueueTest, ReturnsResultThroughFuture) {
    job_queue jobs(2, 4);
    auto result = jobs.submit([](const cancellation_token &) { return 42; }, make_shared<cancellation_token>(), BUDGET);
    EXPECT_EQ(result.get(), 42);

    auto failure = jobs.submit([](const cancellation_token &) -> int { throw runtime_error("boom"); },
                               make_shared<cancellation_token>(), BUDGET);
    EXPECT_THROW(failure.get(), runtime_error);
}

TEST(JobQueueTest, RejectsWhenQueueIsFull) {
    // 4 个 worker，队列最多排 10 个任务
    job_queue jobs(4, 10);
    promise<void> gate;
    shared_future<void> opened = gate.get_future().share();

    vector<future<int>> results;
    for (int i = 0; i < 4; ++i)
        results.push_back(jobs.submit([opened, i](const cancellation_token &) { opened.wait(); return i; },
                                      make_shared<cancellation_token>(), BUDGET));
    ASSERT_TRUE(wait_until([&] { return jobs.stats().in_flight == 4; }));

    // 4 个正在执行，再提交 46 个：10 个进入队列，36 个立刻被拒绝
    int overloaded = 0;
    for (int i = 4; i < 50; ++i) {
        try {
            results.push_back(jobs.submit([opened, i](const cancellation_token &) { opened.wait(); return i; },
                                          make_shared<cancellation_token>(), BUDGET));
        } catch (overloaded_error &) {
            ++overloaded;
        }
    }
    EXPECT_EQ(overloaded, 36);
    EXPECT_EQ(results.size(), 14u);

    gate.set_value();
    for (size_t i = 0; i < results.size(); ++i)
        EXPECT_EQ(results[i].get(), (int)i);

    jobs.stop();
    job_stats stats = jobs.stats();
    EXPECT_EQ(stats.accepted, 14u);
    EXPECT_EQ(stats.rejected, 36u);
    EXPECT_EQ(stats.completed, 14u);
    EXPECT_EQ(stats.in_flight, 0u);
}

TEST(JobQueueTest, DeadlineStartsWhenWorkerPicksUpJob) {
    job_queue jobs(1, 4);
    promise<void> gate;
    shared_future<void> opened = gate.get_future().share();
    auto first = jobs.submit([opened](const cancellation_token &) { opened.wait(); return true; },
                             make_shared<cancellation_token>(), BUDGET);

    // 第二个任务的截止时间只有 200ms，但排队时间不计入截止时间
    auto second = jobs.submit([](const cancellation_token &token) { return token.cancelled(); },
                              make_shared<cancellation_token>(), chrono::milliseconds(200));
    this_thread::sleep_for(chrono::milliseconds(400));
    gate.set_value();
    EXPECT_TRUE(first.get());
    EXPECT_FALSE(second.get());
}

TEST(JobQueueTest, DeadlineCancelsRunningJob) {
    job_queue jobs(1, 4);
    auto start = chrono::steady_clock::now();
    auto result = jobs.submit([](const cancellation_token &token) {
        while (!token.cancelled()) this_thread::sleep_for(chrono::milliseconds(5));
        return string("cancelled");
    }, make_shared<cancellation_token>(), chrono::milliseconds(100));
    EXPECT_EQ(result.get(), "cancelled");
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(5));
}

TEST(JobQueueTest, CancelledBeforeStartIsOverloaded) {
    job_queue jobs(1, 4);
    promise<void> gate;
    shared_future<void> opened = gate.get_future().share();
    auto first = jobs.submit([opened](const cancellation_token &) { opened.wait(); return 1; },
                             make_shared<cancellation_token>(), BUDGET);
    ASSERT_TRUE(wait_until([&] { return jobs.stats().in_flight == 1; }));

    bool executed = false;
    auto cancel = make_shared<cancellation_token>();
    auto second = jobs.submit([&executed](const cancellation_token &) { executed = true; return 2; }, cancel, BUDGET);
    cancel->cancel();
    gate.set_value();

    EXPECT_EQ(first.get(), 1);
    EXPECT_THROW(second.get(), overloaded_error);
    EXPECT_FALSE(executed);
}

TEST(JobQueueTest, StopDrainsQueuedJobs) {
    job_queue jobs(1, 0);
    vector<future<int>> results;
    for (int i = 0; i < 5; ++i)
        results.push_back(jobs.submit([i](const cancellation_token &) {
            this_thread::sleep_for(chrono::milliseconds(10));
            return i * i;
        }, make_shared<cancellation_token>(), BUDGET));
    jobs.stop();

    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(results[i].wait_for(chrono::seconds(0)), future_status::ready);
        EXPECT_EQ(results[i].get(), i * i);
    }
    EXPECT_EQ(jobs.stats().completed, 5u);

    // 停止后不再接受新任务
    EXPECT_THROW(jobs.submit([](const cancellation_token &) { return 0; }, make_shared<cancellation_token>(), BUDGET),
                 overloaded_error);
}
