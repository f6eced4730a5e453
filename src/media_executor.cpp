#include "downqueue/stage_executor.hpp"

#include <utility>

#include <fmt/format.h>

namespace downqueue {

MediaExecutor::MediaExecutor(FetchCapability& fetcher, StageWeights weights)
    : StageExecutor(std::move(weights)), fetcher_(fetcher) {
    requireStages(this->weights(), {"metadata", "transfer", "postprocess"});
}

OutputDescriptor MediaExecutor::execute(Job& job, StageTracker& tracker, EventBus& events) {
    const JobSpec& spec = job.spec();

    tracker.beginStage("metadata", "Fetching info...");
    const MediaMetadata meta = fetcher_.resolveMetadata(spec.url);
    const std::string title = meta.title.empty() ? spec.url : meta.title;
    job.setTitle(title);
    {
        JobEvent event;
        event.job_id = job.id();
        event.kind = EventKind::Metadata;
        event.title = title;
        events.publish(event);
    }
    tracker.completeStage();

    tracker.beginStage("transfer", "Downloading...");
    bool postprocessing = false;
    const auto on_progress = [&](const TransferProgress& progress) {
        if (postprocessing) {
            tracker.checkpoint();
            return;
        }
        if (progress.finished) {
            tracker.completeStage();
            tracker.beginStage("postprocess", postprocessText());
            postprocessing = true;
            return;
        }
        tracker.reportTransfer(progress);
    };

    const OutputDescriptor output = fetcher_.fetch(spec.url, buildOptions(spec), on_progress);

    if (!postprocessing) {
        tracker.completeStage();
        tracker.beginStage("postprocess", postprocessText());
    }
    tracker.completeStage();
    return output;
}

std::string VideoExecutor::formatSelector(const std::optional<int>& height, const std::string& container) {
    if (!height) {
        return "bestvideo*+bestaudio/best";
    }
    if (container == "mp4") {
        return fmt::format("bestvideo[height<={0}][ext=mp4]+bestaudio[ext=m4a]/best[height<={0}][ext=mp4]/best", *height);
    }
    return fmt::format("bestvideo[height<={0}]+bestaudio/best[height<={0}]/best", *height);
}

FetchOptions VideoExecutor::buildOptions(const JobSpec& spec) const {
    FetchOptions options;
    options.output_dir = spec.dest_dir;
    options.container = spec.container.empty() ? "mp4" : spec.container;
    options.quality_height = spec.quality_height;
    options.format_selector = formatSelector(spec.quality_height, options.container);
    if (!spec.subs_langs.empty()) {
        options.subs_langs = spec.subs_langs;
        options.embed_subs = spec.embed_subs;
    }
    return options;
}

FetchOptions AudioExecutor::buildOptions(const JobSpec& spec) const {
    FetchOptions options;
    options.output_dir = spec.dest_dir;
    options.format_selector = "bestaudio/best";
    options.extract_audio = true;
    options.audio_format = "mp3";
    options.audio_bitrate = spec.audio_quality.empty() ? "320" : spec.audio_quality;
    return options;
}

} // namespace downqueue
