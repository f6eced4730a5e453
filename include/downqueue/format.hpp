#pragma once

#include <cstdint>
#include <string>

namespace downqueue {

inline constexpr const char* kUnknownEta = "--:--";

// 1024 进制: "512 B", "1.5 MB"
std::string formatSize(std::uint64_t bytes);
std::string formatSize(double bytes);

// Empty when the speed is not positive.
std::string formatSpeed(double bytes_per_second);

// "M:SS" below one hour, "H:MM:SS" above. Fractions round up.
std::string formatEta(double seconds);

// total_bytes == 0 means the size is unknown.
std::string formatEta(std::uint64_t downloaded_bytes, std::uint64_t total_bytes, double bytes_per_second);

} // namespace downqueue
