#include "downqueue/errors.hpp"
#include "downqueue/stage_executor.hpp"

#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

namespace fs = std::filesystem;
using test::EventLog;
using test::FakeFetcher;
using test::FakeInstaller;
using test::Permits;
using test::TempDirectory;
using test::waitUntil;

JobSpec mediaSpec(JobKind kind, const fs::path& dest) {
    JobSpec spec;
    spec.url = "https://media.example/watch/clip";
    spec.kind = kind;
    spec.dest_dir = dest.string();
    return spec;
}

std::vector<double> progressValues(const std::vector<JobEvent>& events) {
    std::vector<double> values;
    for (const auto& event : events) {
        if (event.kind == EventKind::Progress) {
            values.push_back(event.progress);
        }
    }
    return values;
}

TEST(VideoExecutor, CompletesWithOutputAndTitle) {
    TempDirectory dir;
    EventBus bus;
    EventLog log(bus);
    FakeFetcher fetcher;
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Completed);
    EXPECT_EQ(outcome.output_path, (dir.path() / "clip.out").string());
    EXPECT_EQ(job.status(), JobStatus::Completed);
    EXPECT_DOUBLE_EQ(job.progress(), 100.0);
    EXPECT_EQ(job.state().title, "Title of https://media.example/watch/clip");
    EXPECT_TRUE(job.state().warnings.empty());

    const auto events = log.eventsFor(job.id());
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(log.contains(job.id(), EventKind::Metadata));
    EXPECT_EQ(events.back().kind, EventKind::Completed);
    EXPECT_EQ(events.back().output_path, outcome.output_path);

    const auto values = progressValues(events);
    ASSERT_FALSE(values.empty());
    EXPECT_TRUE(std::is_sorted(values.begin(), values.end()));
    EXPECT_LE(values.back(), 100.0);
}

TEST(VideoExecutor, BuildsFormatSelectorFromQualityAndContainer) {
    EXPECT_EQ(VideoExecutor::formatSelector(std::nullopt, "mp4"), "bestvideo*+bestaudio/best");
    EXPECT_EQ(VideoExecutor::formatSelector(720, "mp4"),
              "bestvideo[height<=720][ext=mp4]+bestaudio[ext=m4a]/best[height<=720][ext=mp4]/best");
    EXPECT_EQ(VideoExecutor::formatSelector(1080, "mkv"),
              "bestvideo[height<=1080]+bestaudio/best[height<=1080]/best");
}

TEST(VideoExecutor, PassesSubtitleAndContainerOptions) {
    TempDirectory dir;
    EventBus bus;
    FakeFetcher fetcher;
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    JobSpec spec = mediaSpec(JobKind::Video, dir.path());
    spec.quality_height = 480;
    spec.container = "mkv";
    spec.subs_langs = {"en", "de"};
    spec.embed_subs = true;
    Job job(spec);
    executor.run(job, bus);

    const FetchOptions options = fetcher.lastOptions();
    EXPECT_EQ(options.output_dir, dir.path().string());
    EXPECT_EQ(options.container, "mkv");
    EXPECT_EQ(options.quality_height, 480);
    EXPECT_FALSE(options.extract_audio);
    EXPECT_EQ(options.subs_langs, (std::vector<std::string>{"en", "de"}));
    EXPECT_TRUE(options.embed_subs);
}

TEST(AudioExecutor, RequestsMp3AtChosenBitrate) {
    TempDirectory dir;
    EventBus bus;
    FakeFetcher fetcher;
    AudioExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Audio));

    JobSpec spec = mediaSpec(JobKind::Audio, dir.path());
    spec.audio_quality = "192";
    Job job(spec);
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Completed);
    const FetchOptions options = fetcher.lastOptions();
    EXPECT_TRUE(options.extract_audio);
    EXPECT_EQ(options.audio_format, "mp3");
    EXPECT_EQ(options.audio_bitrate, "192");
    EXPECT_EQ(options.format_selector, "bestaudio/best");
    EXPECT_TRUE(options.container.empty());
}

TEST(MediaExecutor, MissingOutputCompletesWithWarning) {
    TempDirectory dir;
    EventBus bus;
    FakeFetcher fetcher;
    fetcher.on_fetch = [](const std::string&, const FetchOptions&, const TransferCallback& on_progress) {
        on_progress({100, 100, true});
        return OutputDescriptor{};
    };
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Completed);
    EXPECT_TRUE(outcome.output_path.empty());
    ASSERT_EQ(job.state().warnings.size(), 1u);
    EXPECT_EQ(job.state().warnings[0], "Output file could not be located.");
}

TEST(MediaExecutor, FetchFailureBecomesErrorEvent) {
    TempDirectory dir;
    EventBus bus;
    EventLog log(bus);
    FakeFetcher fetcher;
    fetcher.on_fetch = [](const std::string&, const FetchOptions&, const TransferCallback& on_progress) -> OutputDescriptor {
        on_progress({10, 100, false});
        throw StageError("ERROR: Video unavailable");
    };
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Failed);
    EXPECT_EQ(outcome.message, "ERROR: Video unavailable");
    EXPECT_EQ(job.state().error_message, "ERROR: Video unavailable");

    const auto events = log.eventsFor(job.id());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, EventKind::Error);
    EXPECT_EQ(events.back().message, "ERROR: Video unavailable");
}

TEST(MediaExecutor, CancelDuringTransferStopsTheJob) {
    TempDirectory dir;
    EventBus bus;
    EventLog log(bus);
    Permits permits;
    FakeFetcher fetcher;
    fetcher.on_fetch = test::blockingFetch(permits);
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    JobOutcome outcome;
    std::thread runner([&] { outcome = executor.run(job, bus); });

    ASSERT_TRUE(waitUntil([&] { return fetcher.fetch_calls.load() == 1; }));
    job.cancel();
    runner.join();

    EXPECT_EQ(outcome.status, JobStatus::Cancelled);
    EXPECT_EQ(job.status(), JobStatus::Cancelled);
    EXPECT_FALSE(fs::exists(dir.path() / "clip.out"));

    const auto events = log.eventsFor(job.id());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, EventKind::Status);
    EXPECT_EQ(events.back().message, "Cancelled by user.");
}

TEST(MediaExecutor, CancelWhilePausedUnblocksTheJob) {
    TempDirectory dir;
    EventBus bus;
    Permits permits;
    FakeFetcher fetcher;
    fetcher.on_fetch = test::blockingFetch(permits);
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    JobOutcome outcome;
    std::thread runner([&] { outcome = executor.run(job, bus); });

    ASSERT_TRUE(waitUntil([&] { return fetcher.fetch_calls.load() == 1; }));
    ASSERT_TRUE(job.pause());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(job.status(), JobStatus::Running);
    EXPECT_TRUE(job.isPaused());

    job.cancel();
    runner.join();
    EXPECT_EQ(outcome.status, JobStatus::Cancelled);
}

TEST(MediaExecutor, PauseThenResumeFinishes) {
    TempDirectory dir;
    EventBus bus;
    Permits permits;
    FakeFetcher fetcher;
    fetcher.on_fetch = test::blockingFetch(permits);
    VideoExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Video));

    Job job(mediaSpec(JobKind::Video, dir.path()));
    JobOutcome outcome;
    std::thread runner([&] { outcome = executor.run(job, bus); });

    ASSERT_TRUE(waitUntil([&] { return fetcher.fetch_calls.load() == 1; }));
    ASSERT_TRUE(job.pause());
    const double paused_at = job.progress();
    permits.release();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(job.status(), JobStatus::Running);
    EXPECT_DOUBLE_EQ(job.progress(), paused_at);

    ASSERT_TRUE(job.resume());
    runner.join();
    EXPECT_EQ(outcome.status, JobStatus::Completed);
}

TEST(MediaExecutor, CancelledBeforeRunNeverFetches) {
    TempDirectory dir;
    EventBus bus;
    FakeFetcher fetcher;
    AudioExecutor executor(fetcher, WeightTable::defaults().get(JobKind::Audio));

    Job job(mediaSpec(JobKind::Audio, dir.path()));
    job.cancel();
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Cancelled);
    EXPECT_EQ(fetcher.fetch_calls.load(), 0);
}

TEST(MediaExecutor, RejectsWeightsWithWrongStages) {
    FakeFetcher fetcher;
    const StageWeights wrong(std::vector<Stage>{{"download", 50}, {"extract", 50}});
    EXPECT_THROW(VideoExecutor executor(fetcher, wrong), ConfigError);
}

TEST(InstallExecutor, ExtractsAndLocatesExecutable) {
    TempDirectory dir;
    TempDirectory temp_root;
    EventBus bus;
    EventLog log(bus);
    FakeInstaller installer;
    InstallExecutor executor(installer, WeightTable::defaults().get(JobKind::Install), temp_root.path());

    JobSpec spec;
    spec.url = "https://example.com/releases/tool-1.0.zip?token=abc";
    spec.kind = JobKind::Install;
    spec.dest_dir = (dir.path() / "apps").string();
    Job job(spec);
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Completed);
    EXPECT_EQ(outcome.output_path, (dir.path() / "apps" / "bin" / "tool").string());
    EXPECT_EQ(job.state().title, "tool-1.0.zip");
    EXPECT_TRUE(fs::exists(dir.path() / "apps" / "README.txt"));

    // 临时工作目录已删除
    EXPECT_FALSE(installer.last_work_dir.empty());
    EXPECT_FALSE(fs::exists(installer.last_work_dir));

    const auto values = progressValues(log.eventsFor(job.id()));
    EXPECT_TRUE(std::is_sorted(values.begin(), values.end()));
}

TEST(InstallExecutor, PathEscapeFailsTheJob) {
    TempDirectory dir;
    TempDirectory temp_root;
    EventBus bus;
    FakeInstaller installer;
    installer.fail_extract = true;
    InstallExecutor executor(installer, WeightTable::defaults().get(JobKind::Install), temp_root.path());

    JobSpec spec;
    spec.url = "https://example.com/evil.zip";
    spec.kind = JobKind::Install;
    spec.dest_dir = dir.path().string();
    Job job(spec);
    const JobOutcome outcome = executor.run(job, bus);

    EXPECT_EQ(outcome.status, JobStatus::Failed);
    EXPECT_NE(outcome.message.find("path traversal"), std::string::npos);
    EXPECT_FALSE(fs::exists(installer.last_work_dir));
}

TEST(InstallExecutor, FindExecutableIgnoresPlainFiles) {
    TempDirectory dir;
    test::writeText(dir.path() / "docs" / "notes.txt", "text");
    fs::permissions(dir.path() / "docs" / "notes.txt", fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_TRUE(InstallExecutor::findExecutable(dir.path()).empty());
    EXPECT_TRUE(InstallExecutor::findExecutable(dir.path() / "missing").empty());

    test::writeText(dir.path() / "run.sh", "#!/bin/sh\n");
    fs::permissions(dir.path() / "run.sh", fs::perms::owner_all);
    EXPECT_EQ(InstallExecutor::findExecutable(dir.path()), dir.path() / "run.sh");
}

TEST(ExecutorMap, HasOneExecutorPerKind) {
    FakeFetcher fetcher;
    FakeInstaller installer;
    const ExecutorMap executors = makeExecutors(fetcher, installer, WeightTable::defaults());
    ASSERT_EQ(executors.size(), 3u);
    EXPECT_EQ(executors.at(JobKind::Video)->kind(), JobKind::Video);
    EXPECT_EQ(executors.at(JobKind::Audio)->kind(), JobKind::Audio);
    EXPECT_EQ(executors.at(JobKind::Install)->kind(), JobKind::Install);
}

} // namespace
} // namespace downqueue
