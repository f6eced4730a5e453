#pragma once

#include "snapshot.hpp"

#include <filesystem>
#include <string>

namespace downqueue {

// Parses XDG_DOCUMENTS_DIR out of a user-dirs.dirs file; empty when absent.
std::filesystem::path parseXdgDocumentsDir(const std::filesystem::path& user_dirs_file,
                                           const std::filesystem::path& home);

// XDG documents dir, else ~/Documents when it exists, else $HOME.
std::filesystem::path userDocumentsDir();

// <Documents>/<app_folder>/{video,audio}
SnapshotDefaults defaultDownloadDirs(const std::string& app_folder = "DownVid");

// Creates both directories; failures are logged, not thrown.
void ensureDirectories(const SnapshotDefaults& defaults);

} // namespace downqueue
