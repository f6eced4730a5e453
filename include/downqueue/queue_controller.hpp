#pragma once

#include "capabilities.hpp"
#include "event_bus.hpp"
#include "job.hpp"
#include "progress.hpp"
#include "snapshot.hpp"
#include "stage_executor.hpp"
#include "state_store.hpp"
#include "worker_pool.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace downqueue {

// One logical add request; an empty dest_dir selects the default directory
// of its kind. Video and audio urls may expand into several jobs.
using AddRequest = JobSpec;

enum class BulkOutcome { Applied, NotFound, AlreadyFinished, Error };

const char* toString(BulkOutcome outcome) noexcept;

using BulkResult = std::vector<std::pair<std::string, BulkOutcome>>;

struct ControllerOptions {
    int concurrency{3};
    SnapshotDefaults defaults;
    WeightTable weights{WeightTable::defaults()};
};

class QueueController {
public:
    QueueController(EventBus& events, FetchCapability& fetcher, InstallCapability& installer,
                    ControllerOptions options = {}, StateStore* store = nullptr);
    ~QueueController();

    QueueController(const QueueController&) = delete;
    QueueController& operator=(const QueueController&) = delete;

    // Returns no jobs for a blank url or after shutdown().
    std::vector<JobPtr> add(const AddRequest& request);

    bool pause(const std::string& id);
    bool resume(const std::string& id);
    bool cancel(const std::string& id);
    bool remove(const std::string& id);

    BulkResult pauseAll();
    BulkResult resumeAll();
    BulkResult cancel(const std::vector<std::string>& ids);

    void setConcurrency(int n);
    [[nodiscard]] std::size_t concurrency() const;

    void setDefaults(SnapshotDefaults defaults);
    [[nodiscard]] SnapshotDefaults defaults() const;

    [[nodiscard]] std::vector<JobPtr> jobs() const;
    [[nodiscard]] JobPtr find(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> completed() const;

    [[nodiscard]] QueueSnapshot snapshot() const;
    [[nodiscard]] std::string exportSnapshot() const;
    // Each queue record becomes a fresh add with a new id.
    std::size_t importSnapshot(const std::string& text);
    std::size_t restore(const QueueSnapshot& snapshot, bool requeue = true);

    void waitIdle();
    // Saves the snapshot, cancels every live job and waits for running ones.
    void shutdown();

private:
    using JobOperation = std::function<bool(Job&)>;

    void execute(const JobPtr& job);
    void onEvent(const JobEvent& event);
    void persist();
    BulkOutcome applyOne(const std::string& id, const JobOperation& operation);
    BulkResult applyBulk(const std::vector<std::string>& ids, const JobOperation& operation);
    [[nodiscard]] std::vector<std::string> liveIds() const;
    [[nodiscard]] bool isClosing() const;
    [[nodiscard]] std::string defaultDirFor(JobKind kind) const;

    EventBus& events_;
    FetchCapability& fetcher_;
    ExecutorMap executors_;
    StateStore* store_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobPtr> jobs_;
    std::vector<std::string> order_;
    std::vector<std::string> completed_;
    SnapshotDefaults defaults_;
    bool closing_{false};

    std::mutex persist_mutex_;
    EventBus::SubscriptionId subscription_{0};
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace downqueue
