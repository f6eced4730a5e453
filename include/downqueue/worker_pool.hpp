#pragma once

#include "event_bus.hpp"
#include "job.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace downqueue {

// Bounded FIFO dispatcher. The pool alone decides how many jobs run at once.
class WorkerPool {
public:
    using Handler = std::function<void(const JobPtr&)>;

    WorkerPool(EventBus& events, Handler handler, int capacity = 3);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(JobPtr job);

    // Running jobs are never interrupted; a smaller capacity only holds
    // back new dispatches.
    void resize(int capacity);

    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] std::size_t pendingCount() const;

    void waitIdle();
    // Lets running jobs finish, then stops every worker. Jobs never dispatched
    // are marked cancelled.
    void shutdown();

private:
    void workerLoop();
    void spawnWorkersLocked();
    void runJob(const JobPtr& job);
    void skipCancelled(const JobPtr& job);
    [[nodiscard]] bool idleLocked() const noexcept;

    EventBus& events_;
    Handler handler_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<JobPtr> pending_;
    std::vector<std::thread> workers_;
    std::size_t capacity_;
    std::size_t active_{0};
    std::size_t skipping_{0};
    bool stopping_{false};
};

} // namespace downqueue
