#include "downqueue/paths.hpp"

#include "test_helpers.hpp"

#include <filesystem>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

namespace fs = std::filesystem;
using test::TempDirectory;

TEST(XdgDocumentsDir, ExpandsHome) {
    TempDirectory dir;
    const fs::path file = dir.path() / "user-dirs.dirs";
    test::writeText(file,
        "# This file is written by xdg-user-dirs-update\n"
        "XDG_DESKTOP_DIR=\"$HOME/Desktop\"\n"
        "XDG_DOCUMENTS_DIR=\"$HOME/Dokumente/\"\n");

    EXPECT_EQ(parseXdgDocumentsDir(file, "/home/kim"), fs::path("/home/kim/Dokumente/"));
}

TEST(XdgDocumentsDir, AbsoluteValue) {
    TempDirectory dir;
    const fs::path file = dir.path() / "user-dirs.dirs";
    test::writeText(file, "XDG_DOCUMENTS_DIR=/data/docs\n");
    EXPECT_EQ(parseXdgDocumentsDir(file, "/home/kim"), fs::path("/data/docs"));
}

TEST(XdgDocumentsDir, CommentedOrMissing) {
    TempDirectory dir;
    const fs::path file = dir.path() / "user-dirs.dirs";
    test::writeText(file, "# XDG_DOCUMENTS_DIR=\"$HOME/Docs\"\nXDG_MUSIC_DIR=\"$HOME/Music\"\n");
    EXPECT_TRUE(parseXdgDocumentsDir(file, "/home/kim").empty());
    EXPECT_TRUE(parseXdgDocumentsDir(dir.path() / "absent", "/home/kim").empty());
}

TEST(DefaultDownloadDirs, SplitsVideoAndAudio) {
    const SnapshotDefaults defaults = defaultDownloadDirs("AppFolder");
    EXPECT_EQ(fs::path(defaults.video_dir).filename(), "video");
    EXPECT_EQ(fs::path(defaults.audio_dir).filename(), "audio");
    EXPECT_EQ(fs::path(defaults.video_dir).parent_path().filename(), "AppFolder");
    EXPECT_EQ(fs::path(defaults.video_dir).parent_path(), fs::path(defaults.audio_dir).parent_path());
}

TEST(EnsureDirectories, CreatesBoth) {
    TempDirectory dir;
    SnapshotDefaults defaults;
    defaults.video_dir = (dir.path() / "a" / "video").string();
    defaults.audio_dir = (dir.path() / "a" / "audio").string();
    ensureDirectories(defaults);
    EXPECT_TRUE(fs::is_directory(defaults.video_dir));
    EXPECT_TRUE(fs::is_directory(defaults.audio_dir));
}

} // namespace
} // namespace downqueue
