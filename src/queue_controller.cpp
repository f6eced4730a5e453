#include "downqueue/queue_controller.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace downqueue {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

JobEvent statusEvent(const Job& job) {
    const auto state = job.state();
    JobEvent event;
    event.job_id = job.id();
    event.kind = EventKind::Status;
    event.progress = state.progress;
    event.status_text = state.status_text;
    return event;
}

} // namespace

const char* toString(BulkOutcome outcome) noexcept {
    switch (outcome) {
    case BulkOutcome::Applied:
        return "applied";
    case BulkOutcome::NotFound:
        return "not found";
    case BulkOutcome::AlreadyFinished:
        return "already finished";
    case BulkOutcome::Error:
        return "error";
    }
    return "error";
}

QueueController::QueueController(EventBus& events, FetchCapability& fetcher, InstallCapability& installer,
                                 ControllerOptions options, StateStore* store)
    : events_(events),
      fetcher_(fetcher),
      executors_(makeExecutors(fetcher, installer, options.weights)),
      store_(store),
      defaults_(std::move(options.defaults)) {
    subscription_ = events_.subscribe([this](const JobEvent& event) { onEvent(event); });
    pool_ = std::make_unique<WorkerPool>(events_, [this](const JobPtr& job) { execute(job); }, options.concurrency);
}

QueueController::~QueueController() {
    shutdown();
    events_.unsubscribe(subscription_);
}

std::vector<JobPtr> QueueController::add(const AddRequest& request) {
    const std::string url = trim(request.url);
    if (url.empty()) {
        return {};
    }
    if (isClosing()) {
        spdlog::warn("Queue is shut down, not adding {}", url);
        return {};
    }

    std::vector<std::string> refs{url};
    if (request.kind != JobKind::Install) {
        try {
            auto expanded = fetcher_.expand(url);
            if (!expanded.empty()) {
                refs = std::move(expanded);
            }
        } catch (const std::exception& ex) {
            // 展开失败时按单个任务处理
            spdlog::warn("Playlist expansion failed for {}: {}", url, ex.what());
            refs = {url};
        }
    }

    const std::string dest_dir = request.dest_dir.empty() ? defaultDirFor(request.kind) : request.dest_dir;

    std::vector<JobPtr> created;
    created.reserve(refs.size());
    for (const auto& ref : refs) {
        JobSpec spec = request;
        spec.url = ref;
        spec.dest_dir = dest_dir;
        if (refs.size() > 1) {
            spec.title.clear();
        }

        auto job = std::make_shared<Job>(std::move(spec));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // 展开期间可能已经关闭
            if (closing_) {
                break;
            }
            jobs_.emplace(job->id(), job);
            order_.push_back(job->id());
        }

        JobEvent queued;
        queued.job_id = job->id();
        queued.kind = EventKind::Queued;
        queued.status_text = job->state().status_text;
        queued.title = job->spec().title;
        events_.publish(queued);

        try {
            pool_->submit(job);
        } catch (const std::runtime_error& ex) {
            // shutdown() 恰好发生在登记之后
            spdlog::warn("[{}] not scheduled: {}", shortId(job->id()), ex.what());
            if (job->markCancelled()) {
                events_.publish(statusEvent(*job));
            }
            break;
        }
        created.push_back(std::move(job));
    }

    spdlog::info("Added {} {} job(s) from {}", created.size(), toString(request.kind), url);
    persist();
    return created;
}

bool QueueController::pause(const std::string& id) {
    return applyOne(id, [](Job& job) { return job.pause(); }) == BulkOutcome::Applied;
}

bool QueueController::resume(const std::string& id) {
    return applyOne(id, [](Job& job) { return job.resume(); }) == BulkOutcome::Applied;
}

bool QueueController::cancel(const std::string& id) {
    return applyOne(id, [](Job& job) { return job.cancel(); }) == BulkOutcome::Applied;
}

bool QueueController::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.erase(id) == 0) {
            return false;
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    JobEvent removed;
    removed.job_id = id;
    removed.kind = EventKind::Removed;
    events_.publish(removed);

    persist();
    return true;
}

BulkResult QueueController::pauseAll() {
    return applyBulk(liveIds(), [](Job& job) { return job.pause(); });
}

BulkResult QueueController::resumeAll() {
    return applyBulk(liveIds(), [](Job& job) { return job.resume(); });
}

BulkResult QueueController::cancel(const std::vector<std::string>& ids) {
    return applyBulk(ids, [](Job& job) { return job.cancel(); });
}

BulkOutcome QueueController::applyOne(const std::string& id, const JobOperation& operation) {
    const JobPtr job = find(id);
    if (!job) {
        return BulkOutcome::NotFound;
    }

    try {
        if (!operation(*job)) {
            return BulkOutcome::AlreadyFinished;
        }
        events_.publish(statusEvent(*job));
        return BulkOutcome::Applied;
    } catch (const std::exception& ex) {
        spdlog::error("[{}] control operation failed: {}", shortId(id), ex.what());
        return BulkOutcome::Error;
    }
}

BulkResult QueueController::applyBulk(const std::vector<std::string>& ids, const JobOperation& operation) {
    BulkResult result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        result.emplace_back(id, applyOne(id, operation));
    }
    return result;
}

void QueueController::setConcurrency(int n) {
    pool_->resize(n);
}

std::size_t QueueController::concurrency() const {
    return pool_->capacity();
}

void QueueController::setDefaults(SnapshotDefaults defaults) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        defaults_ = std::move(defaults);
    }
    persist();
}

SnapshotDefaults QueueController::defaults() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaults_;
}

std::vector<JobPtr> QueueController::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobPtr> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(jobs_.at(id));
    }
    return out;
}

JobPtr QueueController::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::vector<std::string> QueueController::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

QueueSnapshot QueueController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueSnapshot snapshot;
    for (const auto& id : order_) {
        const auto& job = jobs_.at(id);
        const auto state = job->state();
        if (isTerminal(state.status)) {
            continue;
        }
        JobSpec spec = job->spec();
        if (!state.title.empty()) {
            spec.title = state.title;
        }
        snapshot.queue.push_back(std::move(spec));
    }
    snapshot.completed = completed_;
    snapshot.defaults = defaults_;
    return snapshot;
}

std::string QueueController::exportSnapshot() const {
    return toJson(snapshot());
}

std::size_t QueueController::importSnapshot(const std::string& text) {
    const QueueSnapshot imported = snapshotFromJson(text);
    std::size_t added = 0;
    for (const auto& spec : imported.queue) {
        added += add(spec).size();
    }
    spdlog::info("Imported {} job(s) from {} queue record(s)", added, imported.queue.size());
    return added;
}

std::size_t QueueController::restore(const QueueSnapshot& snapshot, bool requeue) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_.insert(completed_.end(), snapshot.completed.begin(), snapshot.completed.end());
    }

    std::size_t added = 0;
    if (requeue) {
        for (const auto& spec : snapshot.queue) {
            added += add(spec).size();
        }
    }
    persist();
    return added;
}

void QueueController::waitIdle() {
    pool_->waitIdle();
}

void QueueController::shutdown() {
    // 先保存队列, 取消之后的状态不写入
    persist();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
    }

    for (const auto& job : jobs()) {
        job->cancel();
    }
    pool_->shutdown();
}

void QueueController::execute(const JobPtr& job) {
    const auto it = executors_.find(job->spec().kind);
    if (it == executors_.end()) {
        throw std::runtime_error(fmt::format("No executor for job kind '{}'", toString(job->spec().kind)));
    }
    it->second->run(*job, events_);
}

void QueueController::onEvent(const JobEvent& event) {
    bool should_persist = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(event.job_id);
        if (it == jobs_.end()) {
            // 已移除任务的迟到事件
            return;
        }

        switch (event.kind) {
        case EventKind::Completed: {
            std::string text = event.output_path;
            if (text.empty()) {
                text = event.title.empty() ? it->second->spec().url : event.title;
            }
            completed_.push_back(std::move(text));
            should_persist = true;
            break;
        }
        case EventKind::Error:
            should_persist = true;
            break;
        case EventKind::Status:
            should_persist = it->second->isTerminal();
            break;
        default:
            break;
        }
    }

    if (should_persist) {
        persist();
    }
}

void QueueController::persist() {
    if (!store_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
    }

    std::lock_guard<std::mutex> lock(persist_mutex_);
    if (!store_->save(snapshot())) {
        spdlog::debug("Queue state was not persisted");
    }
}

bool QueueController::isClosing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closing_;
}

std::vector<std::string> QueueController::liveIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::string QueueController::defaultDirFor(JobKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
    case JobKind::Audio:
        if (!defaults_.audio_dir.empty()) {
            return defaults_.audio_dir;
        }
        break;
    case JobKind::Video:
        if (!defaults_.video_dir.empty()) {
            return defaults_.video_dir;
        }
        break;
    case JobKind::Install:
        break;
    }
    return std::filesystem::current_path().string();
}

} // namespace downqueue
