#include "downqueue/event_bus.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace downqueue {

const char* toString(EventKind kind) noexcept {
    switch (kind) {
    case EventKind::Queued:
        return "queued";
    case EventKind::Metadata:
        return "metadata";
    case EventKind::Progress:
        return "progress";
    case EventKind::Status:
        return "status";
    case EventKind::Completed:
        return "completed";
    case EventKind::Error:
        return "error";
    case EventKind::Removed:
        return "removed";
    }
    return "status";
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    handlers_.end());
}

void EventBus::publish(const JobEvent& event) {
    std::vector<std::pair<SubscriptionId, Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }

    for (const auto& [id, handler] : handlers) {
        if (!handler) {
            continue;
        }
        try {
            handler(event);
        } catch (const std::exception& ex) {
            spdlog::error("Event handler #{} failed on '{}' event for job {}: {}",
                          id, toString(event.kind), event.job_id, ex.what());
        }
    }
}

void EventQueue::push(const JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<JobEvent> EventQueue::popAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobEvent> out;
    out.swap(events_);
    return out;
}

} // namespace downqueue
