#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace downqueue {

enum class EventKind { Queued, Metadata, Progress, Status, Completed, Error, Removed };

const char* toString(EventKind kind) noexcept;

struct JobEvent {
    std::string job_id;
    EventKind kind{EventKind::Status};
    double progress{0.0};
    std::string speed;
    std::string eta;
    std::string status_text;
    std::string title;
    std::string output_path;
    std::string message;
};

// Fan-out of job events. Handlers run on the publishing thread.
class EventBus {
public:
    using Handler = std::function<void(const JobEvent&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const JobEvent& event);

private:
    std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    SubscriptionId next_id_{1};
};

// Buffer for observers that poll from their own thread.
class EventQueue {
public:
    void push(const JobEvent& event);
    std::vector<JobEvent> popAll();

private:
    std::mutex mutex_;
    std::vector<JobEvent> events_;
};

} // namespace downqueue
