#pragma once

#include <stdexcept>
#include <string>

namespace downqueue {

// 用户主动取消, 不是错误
class JobCancelled : public std::runtime_error {
public:
    JobCancelled() : std::runtime_error("Cancelled by user.") {}
};

class StageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Archive entry resolving outside the destination root.
class PathEscapeError : public StageError {
public:
    explicit PathEscapeError(const std::string& entry)
        : StageError("Suspicious archive entry (path traversal): " + entry), entry_(entry) {}

    [[nodiscard]] const std::string& entry() const noexcept { return entry_; }

private:
    std::string entry_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace downqueue
