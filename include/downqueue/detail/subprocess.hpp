#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace downqueue::detail {

// Child process with stdout and stderr merged into one pipe.
class Subprocess {
public:
    enum class ReadResult { Line, Timeout, Eof };

    // args[0] is looked up on PATH. Exit code 127 means it could not be run.
    explicit Subprocess(std::vector<std::string> args);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Next line without its terminator; '\r' also ends a line.
    ReadResult readLine(std::string& line, std::chrono::milliseconds timeout);

    // Exit code, or 128 + signal when killed.
    int wait();
    void terminate() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    bool takeLine(std::string& line);
    void closePipe() noexcept;

    pid_t pid_{-1};
    int fd_{-1};
    std::string buffer_;
    bool eof_{false};
    bool reaped_{false};
    int exit_code_{-1};
};

} // namespace downqueue::detail
