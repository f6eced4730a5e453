#pragma once

#include <thread>
#include <utility>
#include <vector>

namespace downqueue::detail {

// 析构时 join 所有线程; 线程引用的数据必须在本对象之前声明
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void reserve(std::size_t n) { threads_.reserve(n); }

    // Throws std::system_error when the thread cannot be created.
    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll() noexcept {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace downqueue::detail
