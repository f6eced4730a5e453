#include "downqueue/state_store.hpp"

#include "test_helpers.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

namespace fs = std::filesystem;
using test::TempDirectory;

TEST(JsonFileStateStore, MissingFileLoadsEmpty) {
    TempDirectory dir;
    JsonFileStateStore store(dir.path() / "state.json");
    const QueueSnapshot snapshot = store.load();
    EXPECT_TRUE(snapshot.queue.empty());
    EXPECT_TRUE(snapshot.completed.empty());
}

TEST(JsonFileStateStore, CorruptFileLoadsEmpty) {
    TempDirectory dir;
    test::writeText(dir.path() / "state.json", "{\"queue\": [ broken");
    JsonFileStateStore store(dir.path() / "state.json");
    EXPECT_TRUE(store.load().queue.empty());
}

TEST(JsonFileStateStore, SaveThenLoad) {
    TempDirectory dir;
    const fs::path path = dir.path() / "nested" / "state.json";
    JsonFileStateStore store(path);

    QueueSnapshot snapshot;
    JobSpec spec;
    spec.url = "https://m/clip";
    spec.quality_height = 1080;
    snapshot.queue.push_back(spec);
    snapshot.completed = {"/v/done.mp4"};
    snapshot.defaults.video_dir = "/v";

    ASSERT_TRUE(store.save(snapshot));
    EXPECT_TRUE(fs::exists(path));

    fs::path tmp = path;
    tmp += ".tmp";
    EXPECT_FALSE(fs::exists(tmp));

    JsonFileStateStore reopened(path);
    const QueueSnapshot loaded = reopened.load();
    ASSERT_EQ(loaded.queue.size(), 1u);
    EXPECT_EQ(loaded.queue[0], spec);
    EXPECT_EQ(loaded.completed, snapshot.completed);
    EXPECT_EQ(loaded.defaults.video_dir, "/v");
}

TEST(JsonFileStateStore, SavesStringsThatAreNotUtf8) {
    TempDirectory dir;
    const fs::path path = dir.path() / "state.json";
    JsonFileStateStore store(path);

    QueueSnapshot snapshot;
    JobSpec spec;
    spec.url = "https://example.com/caf\xe9";
    snapshot.queue.push_back(spec);

    bool saved = false;
    ASSERT_NO_THROW(saved = store.save(snapshot));
    EXPECT_TRUE(saved);
    EXPECT_EQ(store.load().queue.size(), 1u);
}

TEST(JsonFileStateStore, SaveReplacesPreviousState) {
    TempDirectory dir;
    JsonFileStateStore store(dir.path() / "state.json");

    QueueSnapshot first;
    first.completed = {"a", "b"};
    ASSERT_TRUE(store.save(first));

    QueueSnapshot second;
    second.completed = {"c"};
    ASSERT_TRUE(store.save(second));

    EXPECT_EQ(store.load().completed, std::vector<std::string>{"c"});
}

TEST(JsonFileStateStore, UnwritableLocationReturnsFalse) {
    TempDirectory dir;
    test::writeText(dir.path() / "blocker", "file");
    // 父路径是普通文件
    JsonFileStateStore store(dir.path() / "blocker" / "state.json");
    EXPECT_FALSE(store.save(QueueSnapshot{}));
}

} // namespace
} // namespace downqueue
