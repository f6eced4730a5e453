#pragma once

#include "capabilities.hpp"

namespace downqueue {

// InstallCapability backed by CurlTransfer and ArchiveExtractor.
class PackageInstaller final : public InstallCapability {
public:
    explicit PackageInstaller(int segments = 4) : segments_(segments) {}

    std::filesystem::path downloadArchive(const std::string& url,
                                          const std::filesystem::path& work_dir,
                                          const TransferCallback& on_progress) override;
    void extractArchive(const std::filesystem::path& archive,
                        const std::filesystem::path& dest_dir,
                        const TransferCallback& on_progress) override;

    // Local file name for an archive url; falls back to "package.zip".
    [[nodiscard]] static std::string archiveName(const std::string& url);

private:
    int segments_;
};

} // namespace downqueue
