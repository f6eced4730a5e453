#pragma once

#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace downqueue::detail {

// 临时目录, 无论成功与否都会被删除
class TempDir {
public:
    explicit TempDir(std::filesystem::path path) : path_(std::move(path)) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove temporary directory {}: {}", path_.string(), ec.message());
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace downqueue::detail
