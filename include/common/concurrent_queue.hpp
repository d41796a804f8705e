#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace execjudge {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列可以被关闭：关闭后不再接受新元素，读者取完剩余元素后 pop 返回 false。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列最多容纳多少个元素，0 表示不限制
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @param element 保存队头元素
     * @return 队列被关闭且为空时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) cond.wait(mlock);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 尝试向队列中插入一个新元素
     * @return 队列已满或者已关闭时返回 false，value 保持不变
     */
    bool try_push(T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || (capacity > 0 && q.size() >= capacity)) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    std::size_t capacity;
    bool closed = false;
};

}  // namespace execjudge
