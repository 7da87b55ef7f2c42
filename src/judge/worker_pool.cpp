#include "judge/worker_pool.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"

namespace grader {
using namespace std;

worker_pool::worker_pool(size_t workers, size_t queue_capacity)
    : worker_count(workers), queue_capacity(queue_capacity) {
    if (worker_count == 0) worker_count = 1;
    for (size_t i = 0; i < worker_count; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " workers, queue capacity " << queue_capacity;
}

worker_pool::~worker_pool() {
    // 关闭队列后 worker 会取完剩余任务再退出
    tasks.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

bool worker_pool::try_submit(function<void()> task, function<void()> then) {
    size_t limit = capacity();
    size_t current = in_flight.load();
    do {
        if (current >= limit) {
            ++rejected;
            return false;
        }
    } while (!in_flight.compare_exchange_weak(current, current + 1));

    if (!tasks.push(pool_task{move(task), move(then)})) {
        --in_flight;
        ++rejected;
        return false;
    }
    ++accepted;
    return true;
}

pool_stats worker_pool::stats() const {
    pool_stats result;
    result.accepted = accepted.load();
    result.rejected = rejected.load();
    result.running = running.load();
    result.completed = completed.load();
    result.in_flight = in_flight.load();
    return result;
}

size_t worker_pool::workers() const {
    return worker_count;
}

size_t worker_pool::capacity() const {
    return worker_count + queue_capacity;
}

void worker_pool::worker_loop(size_t worker_id) {
    pool_task task;
    while (tasks.pop(task)) {
        ++running;
        {
            defer {
                --running;
                ++completed;
                --in_flight;
            };

            try {
                task.run();
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                           << boost::diagnostic_information(ex);
            }
            task.run = nullptr;
        }

        // 名额已经释放
        if (task.then) {
            try {
                task.then();
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " failed to deliver result, " << ex.what();
            }
        }
        task.then = nullptr;
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace grader
