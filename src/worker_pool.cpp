#include "downqueue/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace downqueue {

namespace {

std::size_t clampCapacity(int capacity) {
    return static_cast<std::size_t>(std::max(1, capacity));
}

} // namespace

WorkerPool::WorkerPool(EventBus& events, Handler handler, int capacity)
    : events_(events), handler_(std::move(handler)), capacity_(clampCapacity(capacity)) {
    std::lock_guard<std::mutex> lock(mutex_);
    spawnWorkersLocked();
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(JobPtr job) {
    if (!job) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Worker pool is shut down");
        }
        pending_.push_back(std::move(job));
    }
    work_cv_.notify_one();
}

void WorkerPool::resize(int capacity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = clampCapacity(capacity);
        spawnWorkersLocked();
        spdlog::debug("Worker pool capacity set to {} ({} running)", capacity_, active_);
    }
    work_cv_.notify_all();
}

std::size_t WorkerPool::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

std::size_t WorkerPool::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t WorkerPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return idleLocked() || stopping_; });
}

void WorkerPool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    // 未被调度的任务不会再运行
    std::deque<JobPtr> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(pending_);
    }
    for (const auto& job : leftover) {
        skipCancelled(job);
    }
}

void WorkerPool::spawnWorkersLocked() {
    // 线程数只增不减, 多余的线程在条件变量上空闲等待
    while (workers_.size() < capacity_ && !stopping_) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

bool WorkerPool::idleLocked() const noexcept {
    return pending_.empty() && active_ == 0 && skipping_ == 0;
}

void WorkerPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || (!pending_.empty() && active_ < capacity_); });
        if (stopping_) {
            return;
        }

        JobPtr job = std::move(pending_.front());
        pending_.pop_front();

        const bool cancelled = job->isCancelled();
        if (cancelled) {
            ++skipping_;
        } else {
            ++active_;
        }
        lock.unlock();

        if (cancelled) {
            skipCancelled(job);
        } else {
            runJob(job);
        }

        lock.lock();
        if (cancelled) {
            --skipping_;
        } else {
            --active_;
        }
        if (idleLocked()) {
            idle_cv_.notify_all();
        }
        // 释放了一个槽位
        work_cv_.notify_all();
    }
}

void WorkerPool::runJob(const JobPtr& job) {
    try {
        handler_(job);
    } catch (const std::exception& ex) {
        spdlog::error("[{}] unhandled error in job handler: {}", shortId(job->id()), ex.what());
        if (job->markFailed(ex.what())) {
            JobEvent event;
            event.job_id = job->id();
            event.kind = EventKind::Error;
            event.progress = job->progress();
            event.status_text = job->state().status_text;
            event.message = ex.what();
            events_.publish(event);
        }
    }
}

void WorkerPool::skipCancelled(const JobPtr& job) {
    if (!job->markCancelled()) {
        return;
    }
    spdlog::info("[{}] cancelled before start", shortId(job->id()));

    JobEvent event;
    event.job_id = job->id();
    event.kind = EventKind::Status;
    event.status_text = job->state().status_text;
    event.message = "Cancelled by user.";
    events_.publish(event);
}

} // namespace downqueue
