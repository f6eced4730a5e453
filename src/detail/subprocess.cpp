#include "downqueue/detail/subprocess.hpp"
#include "downqueue/errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace downqueue::detail {

namespace {

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Subprocess::Subprocess(std::vector<std::string> args) {
    if (args.empty()) {
        throw StageError("No program to run");
    }

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (std::string& s : args) {
        cargs.push_back(s.data());
    }
    cargs.push_back(nullptr);

    // 两端都带 O_CLOEXEC, 否则并发 fork 的其他子进程会继承写端, 读端收不到 EOF
    int pipefd[2] = {-1, -1};
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        throw StageError(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    pid_ = fork();
    if (pid_ < 0) {
        const int err = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw StageError(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid_ == 0) {
        // dup2 的目标不继承 FD_CLOEXEC
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(cargs[0], cargs.data());
        _exit(127);
    }

    close(pipefd[1]);
    fd_ = pipefd[0];
}

Subprocess::~Subprocess() {
    terminate();
    closePipe();
}

bool Subprocess::takeLine(std::string& line) {
    while (true) {
        const size_t nl = buffer_.find_first_of("\n\r");
        if (nl == std::string::npos) {
            return false;
        }
        line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        if (!line.empty()) {
            return true;
        }
    }
}

Subprocess::ReadResult Subprocess::readLine(std::string& line, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[4096];

    while (true) {
        if (takeLine(line)) {
            return ReadResult::Line;
        }
        if (eof_) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return ReadResult::Line;
            }
            return ReadResult::Eof;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadResult::Timeout;
        }

        pollfd pfd{fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw StageError(std::string("poll() failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return ReadResult::Timeout;
        }

        const ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

int Subprocess::wait() {
    if (reaped_) {
        return exit_code_;
    }
    int status = 0;
    pid_t w = -1;
    do {
        w = waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);

    reaped_ = true;
    exit_code_ = w == pid_ ? decodeStatus(status) : -1;
    closePipe();
    return exit_code_;
}

void Subprocess::terminate() noexcept {
    if (reaped_ || pid_ <= 0) {
        return;
    }
    kill(pid_, SIGTERM);
    // 暂停中的进程收不到 SIGTERM
    kill(pid_, SIGCONT);

    int status = 0;
    for (int i = 0; i < 50; ++i) {
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            exit_code_ = decodeStatus(status);
            return;
        }
        usleep(20 * 1000);
    }
    kill(pid_, SIGKILL);
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_code_ = decodeStatus(status);
    }
    reaped_ = true;
}

void Subprocess::closePipe() noexcept {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

} // namespace downqueue::detail
