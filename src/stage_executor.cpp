#include "downqueue/stage_executor.hpp"
#include "downqueue/errors.hpp"
#include "downqueue/format.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace downqueue {

StageTracker::StageTracker(Job& job, EventBus& events, StageWeights weights)
    : job_(job), events_(events), progress_(std::move(weights)) {}

void StageTracker::beginStage(const std::string& stage, std::string status_text) {
    checkpoint();
    stage_ = stage;
    status_text_ = std::move(status_text);
    stage_started_ = Clock::now();
    meter_ = ThroughputMeter{};

    progress_.update(stage_, 0.0);
    job_.updateProgress(progress_.overall(), {}, {}, status_text_);
    publish({}, {});
    spdlog::debug("[{}] stage '{}' started at {:.1f}%", shortId(job_.id()), stage_, progress_.overall());
}

void StageTracker::reportTransfer(const TransferProgress& progress) {
    checkpoint();

    const auto now = Clock::now();
    double percent = 0.0;
    if (progress.total_bytes > 0) {
        percent = static_cast<double>(progress.downloaded_bytes) / static_cast<double>(progress.total_bytes) * 100.0;
    } else {
        percent = indeterminateEstimate(now - stage_started_);
    }
    progress_.update(stage_, progress.finished ? 100.0 : percent);

    const auto tick = meter_.sample(progress.downloaded_bytes, now);
    if (!tick) {
        job_.updateProgress(progress_.overall());
        return;
    }

    const std::string speed = formatSpeed(*tick);
    const std::string eta = formatEta(progress.downloaded_bytes, progress.total_bytes, *tick);
    job_.updateProgress(progress_.overall(), speed, eta, status_text_);
    publish(speed, eta);
}

void StageTracker::reportStage(double stage_percent) {
    checkpoint();
    progress_.update(stage_, stage_percent);
    job_.updateProgress(progress_.overall(), {}, {}, status_text_);
    publish({}, {});
}

void StageTracker::completeStage() {
    progress_.completeStage(stage_);
    job_.updateProgress(progress_.overall(), {}, {}, status_text_);
    publish({}, {});
}

void StageTracker::checkpoint() {
    job_.checkpoint();
}

void StageTracker::publish(const std::string& speed, const std::string& eta) {
    const double overall = progress_.overall();
    // 同一任务的进度事件保持单调
    last_published_ = std::max(last_published_, overall);

    JobEvent event;
    event.job_id = job_.id();
    event.kind = EventKind::Progress;
    event.progress = last_published_;
    event.speed = speed;
    event.eta = eta;
    event.status_text = status_text_;
    events_.publish(event);
}

StageExecutor::StageExecutor(StageWeights weights) : weights_(std::move(weights)) {}

void StageExecutor::requireStages(const StageWeights& weights, std::initializer_list<const char*> names) {
    const auto actual = weights.names();
    const bool same = actual.size() == names.size() &&
                      std::equal(actual.begin(), actual.end(), names.begin(),
                                 [](const std::string& lhs, const char* rhs) { return lhs == rhs; });
    if (!same) {
        std::string expected;
        for (const char* name : names) {
            expected += expected.empty() ? name : fmt::format(", {}", name);
        }
        throw ConfigError("Stage weights must name exactly: " + expected);
    }
}

JobOutcome StageExecutor::run(Job& job, EventBus& events) {
    const std::string tag = shortId(job.id());

    if (!job.markRunning()) {
        const auto state = job.state();
        return {state.status, state.output_path, state.error_message};
    }

    {
        JobEvent started;
        started.job_id = job.id();
        started.kind = EventKind::Status;
        started.status_text = job.state().status_text;
        events.publish(started);
    }
    spdlog::info("[{}] {} job started: {}", tag, toString(kind()), job.spec().url);

    StageTracker tracker(job, events, weights_);
    try {
        tracker.checkpoint();
        const OutputDescriptor output = execute(job, tracker, events);

        std::string output_path = output.path;
        std::error_code ec;
        if (output_path.empty() || !std::filesystem::exists(output_path, ec)) {
            const std::string warning = output_path.empty()
                ? std::string("Output file could not be located.")
                : fmt::format("Output file not found: {}", output_path);
            spdlog::warn("[{}] {}", tag, warning);
            job.addWarning(warning);
            output_path.clear();
        }

        job.markCompleted(output_path);
        const auto state = job.state();

        JobEvent done;
        done.job_id = job.id();
        done.kind = EventKind::Completed;
        done.progress = 100.0;
        done.status_text = state.status_text;
        done.title = state.title;
        done.output_path = output_path;
        events.publish(done);
        spdlog::info("[{}] completed: {}", tag, output_path.empty() ? state.title : output_path);
        return {JobStatus::Completed, output_path, {}};
    } catch (const JobCancelled& ex) {
        job.markCancelled();

        JobEvent cancelled;
        cancelled.job_id = job.id();
        cancelled.kind = EventKind::Status;
        cancelled.progress = job.progress();
        cancelled.status_text = job.state().status_text;
        cancelled.message = ex.what();
        events.publish(cancelled);
        spdlog::info("[{}] cancelled during stage '{}'", tag, tracker.currentStage());
        return {JobStatus::Cancelled, {}, ex.what()};
    } catch (const std::exception& ex) {
        const std::string message = ex.what();
        job.markFailed(message);

        JobEvent failed;
        failed.job_id = job.id();
        failed.kind = EventKind::Error;
        failed.progress = job.progress();
        failed.status_text = job.state().status_text;
        failed.message = message;
        events.publish(failed);
        spdlog::error("[{}] failed during stage '{}': {}", tag, tracker.currentStage(), message);
        return {JobStatus::Failed, {}, message};
    }
}

ExecutorMap makeExecutors(FetchCapability& fetcher, InstallCapability& installer, const WeightTable& weights) {
    ExecutorMap executors;
    executors.emplace(JobKind::Video, std::make_unique<VideoExecutor>(fetcher, weights.get(JobKind::Video)));
    executors.emplace(JobKind::Audio, std::make_unique<AudioExecutor>(fetcher, weights.get(JobKind::Audio)));
    executors.emplace(JobKind::Install, std::make_unique<InstallExecutor>(installer, weights.get(JobKind::Install)));
    return executors;
}

} // namespace downqueue
