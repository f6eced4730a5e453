#include "downqueue/format.hpp"

#include <array>
#include <cmath>

#include <fmt/format.h>

namespace downqueue {

namespace {

// 999:59:59, 再大的估计没有意义
constexpr double kMaxEtaSeconds = 1000.0 * 3600.0 - 1.0;

} // namespace

std::string formatSize(std::uint64_t bytes) {
    return formatSize(static_cast<double>(bytes));
}

std::string formatSize(double bytes) {
    static constexpr std::array<const char*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};
    constexpr double step = 1024.0;

    double value = bytes < 0.0 ? 0.0 : bytes;
    if (value < step) {
        return fmt::format("{} B", static_cast<std::uint64_t>(value));
    }

    std::size_t unit = 0;
    while (value >= step && unit + 1 < units.size()) {
        value /= step;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string formatSpeed(double bytes_per_second) {
    if (!(bytes_per_second > 0.0) || !std::isfinite(bytes_per_second)) {
        return {};
    }
    return formatSize(bytes_per_second) + "/s";
}

std::string formatEta(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > kMaxEtaSeconds) {
        return kUnknownEta;
    }

    const auto total = static_cast<std::uint64_t>(std::ceil(seconds));
    const std::uint64_t hours = total / 3600;
    const std::uint64_t minutes = (total % 3600) / 60;
    const std::uint64_t secs = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return fmt::format("{}:{:02}", minutes, secs);
}

std::string formatEta(std::uint64_t downloaded_bytes, std::uint64_t total_bytes, double bytes_per_second) {
    if (total_bytes == 0 || !(bytes_per_second > 0.0)) {
        return kUnknownEta;
    }
    const std::uint64_t remaining = downloaded_bytes >= total_bytes ? 0 : total_bytes - downloaded_bytes;
    return formatEta(static_cast<double>(remaining) / bytes_per_second);
}

} // namespace downqueue
