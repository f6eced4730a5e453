#include "downqueue/format.hpp"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

TEST(FormatEta, HalfOfOneMebibyteAtOneMebibytePerSecond) {
    EXPECT_EQ(formatEta(524288, 1048576, 1048576.0), "0:01");
}

TEST(FormatEta, UnknownWhenSpeedOrTotalIsMissing) {
    EXPECT_EQ(formatEta(524288, 1048576, 0.0), kUnknownEta);
    EXPECT_EQ(formatEta(524288, 0, 1048576.0), kUnknownEta);
    EXPECT_EQ(formatEta(-1.0), kUnknownEta);
    EXPECT_EQ(formatEta(std::numeric_limits<double>::infinity()), kUnknownEta);
    EXPECT_EQ(formatEta(std::nan("")), kUnknownEta);
    EXPECT_EQ(formatEta(1e30), kUnknownEta);
    EXPECT_EQ(formatEta(std::numeric_limits<double>::max()), kUnknownEta);
    EXPECT_EQ(formatEta(1, std::numeric_limits<std::uint64_t>::max(), 1e-9), kUnknownEta);
    EXPECT_EQ(formatEta(3599999.0), "999:59:59");
}

TEST(FormatEta, RoundsUpAndSwitchesToHours) {
    EXPECT_EQ(formatEta(0.0), "0:00");
    EXPECT_EQ(formatEta(0.2), "0:01");
    EXPECT_EQ(formatEta(59.2), "1:00");
    EXPECT_EQ(formatEta(754.0), "12:34");
    EXPECT_EQ(formatEta(3600.0), "1:00:00");
    EXPECT_EQ(formatEta(3725.0), "1:02:05");
}

TEST(FormatEta, FinishedTransferIsZero) {
    EXPECT_EQ(formatEta(2048, 1024, 10.0), "0:00");
}

TEST(FormatSize, BinaryUnitLadder) {
    EXPECT_EQ(formatSize(std::uint64_t{0}), "0 B");
    EXPECT_EQ(formatSize(std::uint64_t{512}), "512 B");
    EXPECT_EQ(formatSize(std::uint64_t{1536}), "1.5 KB");
    EXPECT_EQ(formatSize(std::uint64_t{1048576}), "1.0 MB");
    EXPECT_EQ(formatSize(std::uint64_t{5} * 1024 * 1024 * 1024), "5.0 GB");
}

TEST(FormatSpeed, EmptyUnlessPositive) {
    EXPECT_EQ(formatSpeed(0.0), "");
    EXPECT_EQ(formatSpeed(-5.0), "");
    EXPECT_EQ(formatSpeed(2048.0), "2.0 KB/s");
}

} // namespace
} // namespace downqueue
