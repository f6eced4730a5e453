#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace downqueue {

enum class JobKind { Video, Audio, Install };

enum class JobStatus { Queued, Running, Completed, Failed, Cancelled };

const char* toString(JobKind kind) noexcept;
const char* toString(JobStatus status) noexcept;
std::optional<JobKind> parseJobKind(const std::string& text);

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

// Immutable parameters of a job.
struct JobSpec {
    std::string url;
    JobKind kind{JobKind::Video};
    std::string dest_dir;
    std::optional<int> quality_height;  // 空 = 最佳
    std::string audio_quality{"320"};
    std::vector<std::string> subs_langs;
    bool embed_subs{false};
    std::string container{"mp4"};
    std::string title;  // restored display title, may be empty
};

bool operator==(const JobSpec& lhs, const JobSpec& rhs);
inline bool operator!=(const JobSpec& lhs, const JobSpec& rhs) { return !(lhs == rhs); }

struct JobState {
    JobStatus status{JobStatus::Queued};
    bool paused{false};
    bool cancel_requested{false};
    double progress{0.0};
    std::string status_text;
    std::string speed;
    std::string eta;
    std::string title;
    std::string output_path;
    std::string error_message;
    std::vector<std::string> warnings;
};

class Job {
public:
    explicit Job(JobSpec spec);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const JobSpec& spec() const noexcept { return spec_; }

    // Control side. Each returns false when the job is already terminal.
    bool pause();
    bool resume();
    bool cancel();

    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] bool isCancelled() const;
    [[nodiscard]] bool isTerminal() const;

    // Blocks while the pause gate is closed, then throws JobCancelled if
    // the cancel flag is set.
    void checkpoint();

    // Execution side.
    bool markRunning();
    void updateProgress(double progress);
    void updateProgress(double progress, std::string speed, std::string eta, std::string status_text);
    void setStatusText(std::string status_text);
    void setTitle(std::string title);
    void addWarning(std::string warning);
    bool markCompleted(std::string output_path);
    bool markFailed(std::string message);
    bool markCancelled();

    [[nodiscard]] JobState state() const;
    [[nodiscard]] double progress() const;
    [[nodiscard]] JobStatus status() const;

private:
    bool finishLocked(JobStatus status);

    const std::string id_;
    const JobSpec spec_;

    mutable std::mutex mutex_;
    std::condition_variable gate_;
    JobState state_;
};

using JobPtr = std::shared_ptr<Job>;

std::string generateJobId();

// 前8位, 用于日志
std::string shortId(const std::string& id);

} // namespace downqueue
