#include "downqueue/package_installer.hpp"
#include "downqueue/archive_extractor.hpp"
#include "downqueue/curl_transfer.hpp"
#include "downqueue/errors.hpp"
#include "downqueue/detail/curl_utils.hpp"

#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;

std::string PackageInstaller::archiveName(const std::string& url) {
    std::string name = url;
    const auto query = name.find_first_of("?#");
    if (query != std::string::npos) {
        name.erase(query);
    }
    const auto scheme = name.find("://");
    const auto path_start = name.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_start == std::string::npos) {
        return "package.zip";
    }
    name = name.substr(name.find_last_of('/') + 1);
    if (name.empty() || name == "." || name == "..") {
        return "package.zip";
    }
    return name;
}

fs::path PackageInstaller::downloadArchive(const std::string& url, const fs::path& work_dir,
                                           const TransferCallback& on_progress) {
    if (!detail::isProtocolSupported(url)) {
        throw StageError("Unsupported url scheme: " + url);
    }
    fs::create_directories(work_dir);
    const fs::path target = work_dir / archiveName(url);
    spdlog::debug("downloading {} -> {}", url, target.string());

    CurlTransfer transfer(url, target, segments_);
    transfer.start(on_progress);
    return target;
}

void PackageInstaller::extractArchive(const fs::path& archive, const fs::path& dest_dir,
                                      const TransferCallback& on_progress) {
    ArchiveExtractor extractor(archive, dest_dir);
    extractor.extract(on_progress);
    spdlog::debug("extracted {} bytes from {}", extractor.totalBytes(), archive.filename().string());
}

} // namespace downqueue
