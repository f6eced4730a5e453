#include "downqueue/paths.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;

namespace {

fs::path homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    std::error_code ec;
    return fs::current_path(ec);
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

fs::path parseXdgDocumentsDir(const fs::path& user_dirs_file, const fs::path& home) {
    std::ifstream in(user_dirs_file);
    if (!in) {
        return {};
    }

    const std::string key = "XDG_DOCUMENTS_DIR";
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#' || line.compare(0, key.size(), key) != 0) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        // 格式: XDG_DOCUMENTS_DIR="$HOME/Documents"
        const std::string home_var = "$HOME";
        const auto pos = value.find(home_var);
        if (pos != std::string::npos) {
            value.replace(pos, home_var.size(), home.string());
        }
        if (value.empty()) {
            return {};
        }
        return fs::path(value).lexically_normal();
    }
    return {};
}

fs::path userDocumentsDir() {
    const fs::path home = homeDir();
    const fs::path xdg = parseXdgDocumentsDir(home / ".config" / "user-dirs.dirs", home);
    if (!xdg.empty()) {
        return xdg;
    }

    std::error_code ec;
    const fs::path documents = home / "Documents";
    if (fs::is_directory(documents, ec) || !fs::is_directory(home, ec)) {
        return documents;
    }
    return home;
}

SnapshotDefaults defaultDownloadDirs(const std::string& app_folder) {
    const fs::path base = userDocumentsDir() / app_folder;
    return {(base / "video").string(), (base / "audio").string()};
}

void ensureDirectories(const SnapshotDefaults& defaults) {
    for (const auto& dir : {defaults.video_dir, defaults.audio_dir}) {
        if (dir.empty()) {
            continue;
        }
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::warn("Cannot create directory {}: {}", dir, ec.message());
        }
    }
}

} // namespace downqueue
