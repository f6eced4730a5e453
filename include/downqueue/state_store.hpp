#pragma once

#include "snapshot.hpp"

#include <filesystem>
#include <mutex>

namespace downqueue {

class StateStore {
public:
    virtual ~StateStore() = default;

    // Missing or corrupt state is an empty snapshot, never an error.
    virtual QueueSnapshot load() = 0;
    // Returns false when the state could not be written.
    virtual bool save(const QueueSnapshot& snapshot) = 0;
};

class JsonFileStateStore final : public StateStore {
public:
    explicit JsonFileStateStore(std::filesystem::path path);

    QueueSnapshot load() override;
    bool save(const QueueSnapshot& snapshot) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace downqueue
