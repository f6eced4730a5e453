#include "downqueue/state_store.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;

JsonFileStateStore::JsonFileStateStore(fs::path path) : path_(std::move(path)) {}

QueueSnapshot JsonFileStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::debug("No saved state at {}", path_.string());
        return {};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        spdlog::warn("Cannot open state file {}", path_.string());
        return {};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return snapshotFromJson(buffer.str());
}

bool JsonFileStateStore::save(const QueueSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create state directory {}: {}", path_.parent_path().string(), ec.message());
            return false;
        }
    }

    // 先写临时文件再改名, 避免写一半
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write state file {}", tmp.string());
            return false;
        }
        try {
            out << toJson(snapshot);
        } catch (const std::exception& ex) {
            spdlog::error("Cannot serialize queue state: {}", ex.what());
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
        out.flush();
        if (!out) {
            spdlog::error("Failed while writing state file {}", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        spdlog::error("Cannot replace state file {}: {}", path_.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace downqueue
