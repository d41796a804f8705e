#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace execjudge {

/**
 * @brief 评测任务的取消标记
 * 由 job_queue 创建，worker 开始执行任务时设置总截止时间。
 * 调用者等待超时、或者截止时间已过，都视为取消，
 * 正在运行的沙箱进程组会被强制终止。
 * 所有方法都可以并发调用。
 */
struct cancellation_token {
    using clock = std::chrono::steady_clock;

    void cancel() noexcept {
        flag.store(true);
    }

    /**
     * @brief 从现在开始计算截止时间
     */
    void start_deadline(clock::duration budget) {
        deadline.store((clock::now() + budget).time_since_epoch().count());
    }

    /**
     * @brief 是否被显式取消，或者超出截止时间
     */
    bool cancelled() const {
        if (flag.load()) return true;
        auto d = deadline.load();
        return d != 0 && clock::now().time_since_epoch().count() >= d;
    }

    /**
     * @brief 距离截止时间还有多久，没有截止时间时返回 duration::max()
     */
    clock::duration remaining() const {
        auto d = deadline.load();
        if (d == 0) return clock::duration::max();
        auto left = clock::duration(d) - clock::now().time_since_epoch();
        return left < clock::duration::zero() ? clock::duration::zero() : left;
    }

private:
    std::atomic<bool> flag{false};
    std::atomic<clock::rep> deadline{0};
};

typedef std::shared_ptr<cancellation_token> cancellation_ptr;

}  // namespace execjudge
