#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 队列可以被关闭，关闭后不再接受新元素，读者取完剩余元素后退出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @param element 保存队头元素
     * @return false 若队列已关闭且已经为空
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return false 若队列已关闭
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     */
    void close() {
        {
            std::unique_lock<std::mutex> mlock(mut);
            closed = true;
        }
        cond.notify_all();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
