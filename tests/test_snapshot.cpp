#include "downqueue/snapshot.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace downqueue {
namespace {

using nlohmann::json;

TEST(Snapshot, WritesCamelCaseFields) {
    QueueSnapshot snapshot;
    JobSpec spec;
    spec.url = "https://m/clip";
    spec.kind = JobKind::Audio;
    spec.dest_dir = "/music";
    spec.audio_quality = "192";
    spec.title = "Clip";
    snapshot.queue.push_back(spec);
    snapshot.completed = {"/music/a.mp3"};
    snapshot.defaults.video_dir = "/videos";
    snapshot.defaults.audio_dir = "/music";

    const json doc = json::parse(toJson(snapshot));
    EXPECT_EQ(doc.at("version"), kSnapshotVersion);
    ASSERT_EQ(doc.at("queue").size(), 1u);

    const json& item = doc.at("queue").at(0);
    EXPECT_EQ(item.at("url"), "https://m/clip");
    EXPECT_EQ(item.at("kind"), "audio");
    EXPECT_EQ(item.at("destDir"), "/music");
    EXPECT_TRUE(item.at("qualityHeight").is_null());
    EXPECT_EQ(item.at("audioQuality"), "192");
    EXPECT_EQ(item.at("title"), "Clip");
    EXPECT_EQ(doc.at("completed").at(0), "/music/a.mp3");
    EXPECT_EQ(doc.at("defaults").at("videoDir"), "/videos");
    EXPECT_EQ(doc.at("defaults").at("audioDir"), "/music");
}

TEST(Snapshot, ReadsFullRecord) {
    const std::string text = R"({
        "version": 1,
        "queue": [{
            "url": "https://m/clip", "kind": "video", "destDir": "/v",
            "qualityHeight": 720, "subsLangs": ["en", "fr"], "embedSubs": true,
            "container": "mkv", "title": "Clip"
        }],
        "completed": ["/v/old.mp4"],
        "defaults": {"videoDir": "/v", "audioDir": "/a"}
    })";

    const QueueSnapshot snapshot = snapshotFromJson(text);
    ASSERT_EQ(snapshot.queue.size(), 1u);
    const JobSpec& spec = snapshot.queue[0];
    EXPECT_EQ(spec.url, "https://m/clip");
    EXPECT_EQ(spec.kind, JobKind::Video);
    EXPECT_EQ(spec.dest_dir, "/v");
    EXPECT_EQ(spec.quality_height, 720);
    EXPECT_EQ(spec.subs_langs, (std::vector<std::string>{"en", "fr"}));
    EXPECT_TRUE(spec.embed_subs);
    EXPECT_EQ(spec.container, "mkv");
    EXPECT_EQ(spec.title, "Clip");
    EXPECT_EQ(snapshot.completed, std::vector<std::string>{"/v/old.mp4"});
    EXPECT_EQ(snapshot.defaults.audio_dir, "/a");
}

TEST(Snapshot, MissingFieldsTakeDefaults) {
    const QueueSnapshot snapshot = snapshotFromJson(R"({"queue": [{"url": "https://m/x"}]})");
    ASSERT_EQ(snapshot.queue.size(), 1u);
    const JobSpec& spec = snapshot.queue[0];
    EXPECT_EQ(spec.kind, JobKind::Video);
    EXPECT_FALSE(spec.quality_height.has_value());
    EXPECT_EQ(spec.audio_quality, "320");
    EXPECT_EQ(spec.container, "mp4");
    EXPECT_FALSE(spec.embed_subs);
    EXPECT_TRUE(spec.subs_langs.empty());
    EXPECT_TRUE(snapshot.completed.empty());
    EXPECT_EQ(snapshot.version, kSnapshotVersion);
}

TEST(Snapshot, AcceptsSnakeCaseKeys) {
    const QueueSnapshot snapshot = snapshotFromJson(R"({
        "queue": [{"url": "https://m/x", "kind": "audio", "dest_dir": "/a", "audio_quality": 128,
                   "quality_height": "480", "subs_langs": ["de"], "embed_subs": true}],
        "defaults": {"video_dir": "/v", "audio_dir": "/a"}
    })");
    ASSERT_EQ(snapshot.queue.size(), 1u);
    const JobSpec& spec = snapshot.queue[0];
    EXPECT_EQ(spec.kind, JobKind::Audio);
    EXPECT_EQ(spec.dest_dir, "/a");
    EXPECT_EQ(spec.audio_quality, "128");
    EXPECT_EQ(spec.quality_height, 480);
    EXPECT_EQ(spec.subs_langs, std::vector<std::string>{"de"});
    EXPECT_TRUE(spec.embed_subs);
    EXPECT_EQ(snapshot.defaults.video_dir, "/v");
}

TEST(Snapshot, SkipsRecordsWithoutUrl) {
    const QueueSnapshot snapshot = snapshotFromJson(R"({
        "queue": [{"kind": "video"}, {"url": ""}, 42, {"url": "https://m/ok"}, {"url": null}]
    })");
    ASSERT_EQ(snapshot.queue.size(), 1u);
    EXPECT_EQ(snapshot.queue[0].url, "https://m/ok");
}

TEST(Snapshot, IgnoresInvalidFieldValues) {
    const QueueSnapshot snapshot = snapshotFromJson(R"({
        "queue": [{"url": "https://m/x", "kind": "podcast", "qualityHeight": "high",
                   "subsLangs": "en", "embedSubs": "yes", "container": ""}],
        "completed": [1, "/ok", null]
    })");
    ASSERT_EQ(snapshot.queue.size(), 1u);
    const JobSpec& spec = snapshot.queue[0];
    EXPECT_EQ(spec.kind, JobKind::Video);
    EXPECT_FALSE(spec.quality_height.has_value());
    EXPECT_TRUE(spec.subs_langs.empty());
    EXPECT_FALSE(spec.embed_subs);
    EXPECT_EQ(spec.container, "mp4");
    EXPECT_EQ(snapshot.completed, std::vector<std::string>{"/ok"});
}

TEST(Snapshot, InvalidUtf8IsReplacedOnWrite) {
    QueueSnapshot snapshot;
    JobSpec spec;
    spec.url = "https://example.com/caf\xe9";
    snapshot.queue.push_back(spec);
    snapshot.completed = {"/v/\xff\xfe.mp4"};

    std::string text;
    ASSERT_NO_THROW(text = toJson(snapshot));
    const QueueSnapshot loaded = snapshotFromJson(text);
    ASSERT_EQ(loaded.queue.size(), 1u);
    EXPECT_EQ(loaded.queue[0].url, "https://example.com/caf\xEF\xBF\xBD");
    ASSERT_EQ(loaded.completed.size(), 1u);
    EXPECT_EQ(loaded.completed[0], "/v/\xEF\xBF\xBD\xEF\xBF\xBD.mp4");
}

TEST(Snapshot, MalformedTextGivesEmptySnapshot) {
    for (const std::string text : {"", "not json", "[1, 2]", "{\"queue\": [", "null"}) {
        const QueueSnapshot snapshot = snapshotFromJson(text);
        EXPECT_TRUE(snapshot.queue.empty()) << text;
        EXPECT_TRUE(snapshot.completed.empty()) << text;
        EXPECT_TRUE(snapshot.defaults.video_dir.empty()) << text;
    }
}

} // namespace
} // namespace downqueue
