#pragma once

#include "capabilities.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace downqueue {

// Combines the progress of the files one fetch downloads. Subtitle files
// are skipped so they cannot fill the transfer stage before the media starts.
class FileProgressTracker {
public:
    // nullopt when the file is a subtitle.
    std::optional<TransferProgress> update(const std::string& filename, const TransferProgress& progress);

    [[nodiscard]] static bool isSubtitleFile(const std::string& filename);

private:
    std::vector<std::pair<std::string, TransferProgress>> files_;
};

// FetchCapability that drives the yt-dlp executable.
class YtDlpFetcher final : public FetchCapability {
public:
    explicit YtDlpFetcher(std::string executable = "yt-dlp");

    MediaMetadata resolveMetadata(const std::string& ref) override;
    std::vector<std::string> expand(const std::string& ref) override;
    OutputDescriptor fetch(const std::string& ref, const FetchOptions& options,
                           const TransferCallback& on_progress) override;

    // Arguments after the executable name.
    [[nodiscard]] static std::vector<std::string> buildFetchArgs(const std::string& ref,
                                                                 const FetchOptions& options,
                                                                 const std::string& temp_dir);
    // "[downqueue] <downloaded> <total> <estimate> <filename>"; fields may be "NA".
    [[nodiscard]] static std::optional<TransferProgress> parseProgressLine(const std::string& line,
                                                                           std::string* filename = nullptr);
    [[nodiscard]] static bool isPostprocessLine(const std::string& line);
    [[nodiscard]] static std::vector<std::string> parsePlaylist(const std::string& json, const std::string& ref);
    [[nodiscard]] static MediaMetadata parseMetadata(const std::string& json);

private:
    // Runs yt-dlp to completion and returns the JSON document it printed.
    std::string runForJson(std::vector<std::string> args);

    std::string executable_;
};

} // namespace downqueue
