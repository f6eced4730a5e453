#include "downqueue/detail/subprocess.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

using detail::Subprocess;
using namespace std::chrono_literals;

TEST(Subprocess, ReadsMergedOutputAndExitCode) {
    Subprocess child({"/bin/sh", "-c", "echo out; echo err 1>&2; printf 'a\\rb'; exit 3"});

    std::vector<std::string> lines;
    std::string line;
    while (child.readLine(line, 5s) == Subprocess::ReadResult::Line) {
        lines.push_back(line);
    }
    EXPECT_EQ(lines, (std::vector<std::string>{"out", "err", "a", "b"}));
    EXPECT_EQ(child.wait(), 3);
}

TEST(Subprocess, MissingProgramExitsWith127) {
    Subprocess child({"downqueue-no-such-program"});
    std::string line;
    while (child.readLine(line, 5s) == Subprocess::ReadResult::Line) {
    }
    EXPECT_EQ(child.wait(), 127);
}

TEST(Subprocess, EmptyArgumentsThrow) {
    EXPECT_THROW(Subprocess child(std::vector<std::string>{}), StageError);
}

TEST(Subprocess, TerminateStopsLongRunningChild) {
    Subprocess child({"sleep", "30"});
    const auto started = std::chrono::steady_clock::now();
    child.terminate();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(child.wait(), 128 + 15);
}

// 另一个线程同时启动长时间运行的子进程, 短进程仍应及时读到 EOF
TEST(Subprocess, ConcurrentSpawnDoesNotDelayEof) {
    std::atomic<bool> stop{false};
    std::thread spawner([&stop]() {
        std::vector<std::unique_ptr<Subprocess>> sleepers;
        while (!stop.load()) {
            sleepers.push_back(std::make_unique<Subprocess>(std::vector<std::string>{"sleep", "3"}));
            if (sleepers.size() > 16) {
                sleepers.erase(sleepers.begin());
            }
        }
    });

    auto worst = std::chrono::steady_clock::duration::zero();
    for (int i = 0; i < 40; ++i) {
        const auto started = std::chrono::steady_clock::now();
        Subprocess child({"echo", "hi"});
        std::string line;
        Subprocess::ReadResult result = Subprocess::ReadResult::Line;
        while (result == Subprocess::ReadResult::Line) {
            result = child.readLine(line, 10s);
        }
        EXPECT_EQ(result, Subprocess::ReadResult::Eof);
        EXPECT_EQ(child.wait(), 0);
        worst = std::max(worst, std::chrono::steady_clock::now() - started);
    }

    stop = true;
    spawner.join();
    EXPECT_LT(worst, 1500ms);
}

} // namespace
} // namespace downqueue
