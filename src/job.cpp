#include "downqueue/job.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <random>
#include <utility>

#include <fmt/format.h>

namespace downqueue {

namespace {

constexpr const char* kQueuedText = "Queued";
constexpr const char* kStartingText = "Starting...";
constexpr const char* kPausedText = "Paused";
constexpr const char* kResumingText = "Resuming...";
constexpr const char* kCancellingText = "Cancelling...";

} // namespace

const char* toString(JobKind kind) noexcept {
    switch (kind) {
    case JobKind::Video:
        return "video";
    case JobKind::Audio:
        return "audio";
    case JobKind::Install:
        return "install";
    }
    return "video";
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
    case JobStatus::Queued:
        return "queued";
    case JobStatus::Running:
        return "running";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Cancelled:
        return "cancelled";
    }
    return "queued";
}

std::optional<JobKind> parseJobKind(const std::string& text) {
    if (text == "video") {
        return JobKind::Video;
    }
    if (text == "audio") {
        return JobKind::Audio;
    }
    if (text == "install") {
        return JobKind::Install;
    }
    return std::nullopt;
}

bool operator==(const JobSpec& lhs, const JobSpec& rhs) {
    return lhs.url == rhs.url && lhs.kind == rhs.kind && lhs.dest_dir == rhs.dest_dir &&
           lhs.quality_height == rhs.quality_height && lhs.audio_quality == rhs.audio_quality &&
           lhs.subs_langs == rhs.subs_langs && lhs.embed_subs == rhs.embed_subs &&
           lhs.container == rhs.container;
}

std::string generateJobId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    const std::uint64_t hi = engine();
    const std::uint64_t lo = engine();

    // UUID v4: version nibble 4, variant bits 10
    return fmt::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
                       static_cast<std::uint32_t>(hi >> 32),
                       static_cast<std::uint32_t>((hi >> 16) & 0xffff),
                       static_cast<std::uint32_t>(hi & 0x0fff),
                       static_cast<std::uint32_t>(((lo >> 48) & 0x3fff) | 0x8000),
                       lo & 0xffffffffffffULL);
}

std::string shortId(const std::string& id) {
    return id.substr(0, 8);
}

Job::Job(JobSpec spec)
    : id_(generateJobId()),
      spec_(std::move(spec)) {
    state_.status_text = kQueuedText;
    state_.title = spec_.title;
}

bool Job::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (downqueue::isTerminal(state_.status)) {
        return false;
    }
    if (!state_.paused) {
        state_.paused = true;
        state_.status_text = kPausedText;
    }
    return true;
}

bool Job::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (downqueue::isTerminal(state_.status)) {
            return false;
        }
        state_.paused = false;
        if (!state_.cancel_requested) {
            state_.status_text = kResumingText;
        }
    }
    gate_.notify_all();
    return true;
}

bool Job::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (downqueue::isTerminal(state_.status)) {
            return false;
        }
        state_.cancel_requested = true;
        state_.status_text = kCancellingText;
    }
    // 唤醒暂停中的执行线程
    gate_.notify_all();
    return true;
}

bool Job::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.paused;
}

bool Job::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.cancel_requested;
}

bool Job::isTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return downqueue::isTerminal(state_.status);
}

void Job::checkpoint() {
    std::unique_lock<std::mutex> lock(mutex_);
    gate_.wait(lock, [this] { return !state_.paused || state_.cancel_requested; });
    if (state_.cancel_requested) {
        throw JobCancelled();
    }
}

bool Job::markRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != JobStatus::Queued) {
        return false;
    }
    state_.status = JobStatus::Running;
    if (!state_.paused && !state_.cancel_requested) {
        state_.status_text = kStartingText;
    }
    return true;
}

void Job::updateProgress(double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status == JobStatus::Running) {
        state_.progress = std::max(state_.progress, std::clamp(progress, 0.0, 100.0));
    }
}

void Job::updateProgress(double progress, std::string speed, std::string eta, std::string status_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != JobStatus::Running) {
        return;
    }
    state_.progress = std::max(state_.progress, std::clamp(progress, 0.0, 100.0));
    state_.speed = std::move(speed);
    state_.eta = std::move(eta);
    if (!state_.paused && !state_.cancel_requested && !status_text.empty()) {
        state_.status_text = std::move(status_text);
    }
}

void Job::setStatusText(std::string status_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (downqueue::isTerminal(state_.status) || state_.paused || state_.cancel_requested) {
        return;
    }
    state_.status_text = std::move(status_text);
}

void Job::setTitle(std::string title) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.title = std::move(title);
}

void Job::addWarning(std::string warning) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.warnings.push_back(std::move(warning));
}

bool Job::markCompleted(std::string output_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finishLocked(JobStatus::Completed)) {
        return false;
    }
    state_.progress = 100.0;
    state_.status_text = "Completed";
    state_.output_path = std::move(output_path);
    return true;
}

bool Job::markFailed(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finishLocked(JobStatus::Failed)) {
        return false;
    }
    state_.status_text = "Error";
    state_.error_message = std::move(message);
    return true;
}

bool Job::markCancelled() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finishLocked(JobStatus::Cancelled)) {
        return false;
    }
    state_.cancel_requested = true;
    state_.status_text = "Cancelled";
    return true;
}

bool Job::finishLocked(JobStatus status) {
    if (downqueue::isTerminal(state_.status)) {
        return false;
    }
    state_.status = status;
    state_.paused = false;
    state_.speed.clear();
    state_.eta.clear();
    gate_.notify_all();
    return true;
}

JobState Job::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double Job::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.progress;
}

JobStatus Job::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status;
}

} // namespace downqueue
