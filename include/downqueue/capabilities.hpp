#pragma once

#include "progress.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace downqueue {

struct MediaMetadata {
    std::string title;
    std::string id;
};

struct FetchOptions {
    std::string output_dir;
    std::string format_selector;
    std::optional<int> quality_height;
    std::string container;            // merge/remux target, empty for audio
    std::vector<std::string> subs_langs;
    bool embed_subs{false};
    bool extract_audio{false};
    std::string audio_format{"mp3"};
    std::string audio_bitrate{"320"};
};

struct OutputDescriptor {
    std::string path;  // 可能为空: 无法定位输出文件
};

// Media fetch/transcode engine.
class FetchCapability {
public:
    virtual ~FetchCapability() = default;

    virtual MediaMetadata resolveMetadata(const std::string& ref) = 0;
    // Playlist expansion; a plain reference expands to itself.
    virtual std::vector<std::string> expand(const std::string& ref) = 0;
    // The callback may block (pause) or throw JobCancelled; implementations
    // must stop the transfer and let the exception through.
    virtual OutputDescriptor fetch(const std::string& ref, const FetchOptions& options,
                                   const TransferCallback& on_progress) = 0;
};

// Archive download and extraction.
class InstallCapability {
public:
    virtual ~InstallCapability() = default;

    virtual std::filesystem::path downloadArchive(const std::string& url,
                                                  const std::filesystem::path& work_dir,
                                                  const TransferCallback& on_progress) = 0;
    // Every entry must resolve inside dest_dir, otherwise nothing is extracted.
    virtual void extractArchive(const std::filesystem::path& archive,
                                const std::filesystem::path& dest_dir,
                                const TransferCallback& on_progress) = 0;
};

} // namespace downqueue
