#pragma once

#include "capabilities.hpp"
#include "event_bus.hpp"
#include "job.hpp"
#include "progress.hpp"

#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>

namespace downqueue {

struct JobOutcome {
    JobStatus status{JobStatus::Failed};
    std::string output_path;
    std::string message;
};

// Maps the stage-local progress of one running job onto the job and the bus.
class StageTracker {
public:
    using Clock = ThroughputMeter::Clock;

    StageTracker(Job& job, EventBus& events, StageWeights weights);

    void beginStage(const std::string& stage, std::string status_text);
    // Checks pause/cancel first, so call it for every chunk.
    void reportTransfer(const TransferProgress& progress);
    void reportStage(double stage_percent);
    void completeStage();
    void checkpoint();

    [[nodiscard]] double overall() const noexcept { return progress_.overall(); }
    [[nodiscard]] const std::string& currentStage() const noexcept { return stage_; }

private:
    void publish(const std::string& speed, const std::string& eta);

    Job& job_;
    EventBus& events_;
    WeightedProgress progress_;
    ThroughputMeter meter_;
    std::string stage_;
    std::string status_text_;
    Clock::time_point stage_started_{};
    double last_published_{-1.0};
};

class StageExecutor {
public:
    explicit StageExecutor(StageWeights weights);
    virtual ~StageExecutor() = default;

    StageExecutor(const StageExecutor&) = delete;
    StageExecutor& operator=(const StageExecutor&) = delete;

    [[nodiscard]] virtual JobKind kind() const = 0;

    // Runs every stage of the job. Never throws: each outcome becomes one
    // terminal status on the job and one terminal event on the bus.
    JobOutcome run(Job& job, EventBus& events);

protected:
    virtual OutputDescriptor execute(Job& job, StageTracker& tracker, EventBus& events) = 0;

    [[nodiscard]] const StageWeights& weights() const noexcept { return weights_; }
    static void requireStages(const StageWeights& weights, std::initializer_list<const char*> names);

private:
    StageWeights weights_;
};

class MediaExecutor : public StageExecutor {
public:
    MediaExecutor(FetchCapability& fetcher, StageWeights weights);

protected:
    OutputDescriptor execute(Job& job, StageTracker& tracker, EventBus& events) override;

    [[nodiscard]] virtual FetchOptions buildOptions(const JobSpec& spec) const = 0;
    [[nodiscard]] virtual const char* postprocessText() const = 0;

private:
    FetchCapability& fetcher_;
};

// Fetch, then remux into the chosen container.
class VideoExecutor final : public MediaExecutor {
public:
    using MediaExecutor::MediaExecutor;

    [[nodiscard]] JobKind kind() const override { return JobKind::Video; }

    static std::string formatSelector(const std::optional<int>& height, const std::string& container);

protected:
    [[nodiscard]] FetchOptions buildOptions(const JobSpec& spec) const override;
    [[nodiscard]] const char* postprocessText() const override { return "Remuxing..."; }
};

// Fetch best audio, then transcode to mp3.
class AudioExecutor final : public MediaExecutor {
public:
    using MediaExecutor::MediaExecutor;

    [[nodiscard]] JobKind kind() const override { return JobKind::Audio; }

protected:
    [[nodiscard]] FetchOptions buildOptions(const JobSpec& spec) const override;
    [[nodiscard]] const char* postprocessText() const override { return "Converting..."; }
};

// Download archive, extract into the destination, locate the installed program.
class InstallExecutor final : public StageExecutor {
public:
    InstallExecutor(InstallCapability& installer, StageWeights weights,
                    std::filesystem::path temp_root = std::filesystem::temp_directory_path());

    [[nodiscard]] JobKind kind() const override { return JobKind::Install; }

    static std::filesystem::path findExecutable(const std::filesystem::path& root);

protected:
    OutputDescriptor execute(Job& job, StageTracker& tracker, EventBus& events) override;

private:
    InstallCapability& installer_;
    std::filesystem::path temp_root_;
};

using ExecutorMap = std::map<JobKind, std::unique_ptr<StageExecutor>>;

ExecutorMap makeExecutors(FetchCapability& fetcher, InstallCapability& installer, const WeightTable& weights);

} // namespace downqueue
