#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace grader {

/**
 * @brief 评测线程池的计数器快照
 */
struct pool_stats {
    /**
     * @brief 被接受的任务总数
     */
    std::size_t accepted = 0;

    /**
     * @brief 因为队列已满被拒绝的任务总数
     */
    std::size_t rejected = 0;

    /**
     * @brief 正在执行的任务数
     */
    std::size_t running = 0;

    /**
     * @brief 已经执行结束的任务总数
     */
    std::size_t completed = 0;

    /**
     * @brief 已接受但还没有结束的任务数，包括排队中和执行中
     */
    std::size_t in_flight = 0;
};

/**
 * @brief 固定大小的评测线程池
 * 最多同时容纳 workers + queue_capacity 个任务，其中 workers 个在执行，其余按先进先出顺序排队。
 * 超出容量的任务会被直接拒绝而不是阻塞调用方。
 *
 * 析构时不再接受新任务，但是已经接受的任务会全部执行完成，然后再回收线程。
 */
struct worker_pool {
    worker_pool(std::size_t workers, std::size_t queue_capacity);
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 尝试提交任务
     * 任务抛出的异常会被记录到日志，不会导致 worker 退出
     * @param then 任务占用的名额释放之后才调用，调用方在这里通知结果，
     *             收到结果后立即再次提交不会因为名额还没释放而被拒绝
     * @return false 若线程池已满，此时任务不会被执行
     */
    bool try_submit(std::function<void()> task, std::function<void()> then = nullptr);

    pool_stats stats() const;

    std::size_t workers() const;

    std::size_t capacity() const;

private:
    struct pool_task {
        std::function<void()> run;
        std::function<void()> then;
    };

    void worker_loop(std::size_t worker_id);

    std::size_t worker_count;
    std::size_t queue_capacity;
    concurrent_queue<pool_task> tasks;
    std::vector<std::thread> threads;

    std::atomic<std::size_t> in_flight{0};
    std::atomic<std::size_t> accepted{0};
    std::atomic<std::size_t> rejected{0};
    std::atomic<std::size_t> running{0};
    std::atomic<std::size_t> completed{0};
};

}  // namespace grader
