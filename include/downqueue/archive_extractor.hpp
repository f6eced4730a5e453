#pragma once

#include "progress.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace downqueue {

// True when target (already normalized) lies inside base.
[[nodiscard]] bool isWithinDirectory(const std::filesystem::path& base, const std::filesystem::path& target);

// Extracts zip/tar(.gz/.xz/.bz2) archives. Every entry and link target is
// validated before anything is written; a failure part way through removes
// what was created.
class ArchiveExtractor final {
public:
    ArchiveExtractor(std::filesystem::path archive, std::filesystem::path dest_dir);

    // Throws PathEscapeError, StageError, or whatever on_progress throws.
    void extract(const TransferCallback& on_progress);

    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_bytes_; }

private:
    void validate();
    void unpack(const TransferCallback& on_progress);
    void rollback() noexcept;
    [[nodiscard]] std::filesystem::path resolveEntry(const std::string& name) const;
    void recordCreated(const std::filesystem::path& target);

    std::filesystem::path archive_;
    std::filesystem::path dest_dir_;
    std::uint64_t total_bytes_{0};
    std::vector<std::filesystem::path> created_;
};

} // namespace downqueue
