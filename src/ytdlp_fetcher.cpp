#include "downqueue/ytdlp_fetcher.hpp"
#include "downqueue/detail/subprocess.hpp"
#include "downqueue/detail/temp_dir.hpp"
#include "downqueue/errors.hpp"
#include "downqueue/job.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(250);

const std::string kProgressPrefix = "[downqueue] ";
const std::string kPostprocessPrefix = "[downqueue-pp]";
const std::string kFilePrefix = "[downqueue-file] ";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// "NA"/"None" 表示未知
std::optional<double> parseField(const std::string& token) {
    if (token.empty() || token == "NA" || token == "None") {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::string joinLangs(const std::vector<std::string>& langs) {
    std::string out;
    for (const auto& lang : langs) {
        if (!out.empty()) {
            out += ',';
        }
        out += lang;
    }
    return out;
}

std::string exitMessage(int code, const std::string& last_error, const std::string& executable) {
    if (code == 127) {
        return fmt::format("Cannot run {} (is it installed and on PATH?)", executable);
    }
    if (!last_error.empty()) {
        return last_error;
    }
    return fmt::format("{} exited with code {}", executable, code);
}

json parseJson(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw StageError("Unexpected output from yt-dlp");
    }
    return doc;
}

} // namespace

YtDlpFetcher::YtDlpFetcher(std::string executable) : executable_(std::move(executable)) {}

std::vector<std::string> YtDlpFetcher::buildFetchArgs(const std::string& ref, const FetchOptions& options,
                                                      const std::string& temp_dir) {
    std::vector<std::string> args = {
        "--newline",
        "--progress",
        "--no-simulate",
        "--no-playlist",
        "--progress-template",
        "download:" + kProgressPrefix +
            "%(progress.downloaded_bytes)s %(progress.total_bytes)s %(progress.total_bytes_estimate)s "
            "%(progress.filename)s",
        "--progress-template",
        "postprocess:" + kPostprocessPrefix + " %(progress.postprocessor)s",
        "--print",
        "after_move:" + kFilePrefix + "%(filepath)s",
        "--retries", "10",
        "--fragment-retries", "10",
        "--no-overwrites",
        "--continue",
        "-o", "%(title)s [%(id)s].%(ext)s",
    };

    if (!options.output_dir.empty()) {
        args.insert(args.end(), {"-P", options.output_dir});
    }
    if (!temp_dir.empty()) {
        args.insert(args.end(), {"-P", "temp:" + temp_dir});
    }
    if (!options.format_selector.empty()) {
        args.insert(args.end(), {"-f", options.format_selector});
    }

    if (options.extract_audio) {
        args.insert(args.end(), {"-x", "--audio-format", options.audio_format,
                                 "--audio-quality", options.audio_bitrate + "K"});
    } else if (!options.container.empty()) {
        args.insert(args.end(), {"--merge-output-format", options.container,
                                 "--remux-video", options.container});
    }

    if (!options.subs_langs.empty()) {
        args.insert(args.end(), {"--write-subs", "--sub-langs", joinLangs(options.subs_langs),
                                 "--sub-format", "srt/best"});
        if (options.embed_subs) {
            args.emplace_back("--embed-subs");
        }
    }

    args.emplace_back("--");
    args.push_back(ref);
    return args;
}

std::optional<TransferProgress> FileProgressTracker::update(const std::string& filename,
                                                            const TransferProgress& progress) {
    if (isSubtitleFile(filename)) {
        return std::nullopt;
    }

    auto it = std::find_if(files_.begin(), files_.end(),
                           [&filename](const auto& entry) { return entry.first == filename; });
    if (it == files_.end()) {
        files_.emplace_back(filename, progress);
    } else {
        it->second = progress;
    }

    // 合并格式时视频和音频分别下载, 按字节累加
    TransferProgress combined;
    bool total_known = true;
    for (const auto& entry : files_) {
        combined.downloaded_bytes += entry.second.downloaded_bytes;
        combined.total_bytes += entry.second.total_bytes;
        total_known = total_known && entry.second.total_bytes > 0;
    }
    if (!total_known) {
        combined.total_bytes = 0;
    }
    return combined;
}

bool FileProgressTracker::isSubtitleFile(const std::string& filename) {
    static const char* const kSubtitleExts[] = {
        ".vtt", ".srt", ".ass", ".ssa", ".ttml", ".srv1", ".srv2", ".srv3", ".json3", ".lrc", ".sbv", ".dfxp",
    };
    std::string name = filename;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // ".part" 等临时后缀不影响判断
    if (const auto part = name.rfind(".part"); part != std::string::npos && part + 5 == name.size()) {
        name.erase(part);
    }
    for (const char* ext : kSubtitleExts) {
        const std::string suffix(ext);
        if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

std::optional<TransferProgress> YtDlpFetcher::parseProgressLine(const std::string& line, std::string* filename) {
    if (!startsWith(line, kProgressPrefix)) {
        return std::nullopt;
    }

    std::istringstream stream(line.substr(kProgressPrefix.size()));
    std::string downloaded;
    std::string total;
    std::string estimate;
    if (!(stream >> downloaded)) {
        return std::nullopt;
    }
    stream >> total >> estimate;
    if (filename) {
        std::string rest;
        std::getline(stream >> std::ws, rest);
        *filename = rest == "NA" ? std::string() : rest;
    }

    TransferProgress progress;
    progress.downloaded_bytes = static_cast<std::uint64_t>(parseField(downloaded).value_or(0.0));
    if (const auto exact = parseField(total)) {
        progress.total_bytes = static_cast<std::uint64_t>(*exact);
    } else if (const auto approx = parseField(estimate)) {
        progress.total_bytes = static_cast<std::uint64_t>(*approx);
    }
    return progress;
}

bool YtDlpFetcher::isPostprocessLine(const std::string& line) {
    static const char* const kPostprocessors[] = {
        "[Merger]", "[ExtractAudio]", "[VideoRemuxer]", "[VideoConvertor]", "[EmbedSubtitle]", "[FixupM3u8]",
    };
    if (startsWith(line, kPostprocessPrefix)) {
        return true;
    }
    for (const char* tag : kPostprocessors) {
        if (startsWith(line, tag)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> YtDlpFetcher::parsePlaylist(const std::string& text, const std::string& ref) {
    const json doc = parseJson(text);
    const auto entries = doc.find("entries");
    if (entries == doc.end() || !entries->is_array()) {
        return {ref};
    }

    std::vector<std::string> out;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            continue;
        }
        const auto url = entry.find("url");
        if (url != entry.end() && url->is_string() && startsWith(url->get<std::string>(), "http")) {
            out.push_back(url->get<std::string>());
            continue;
        }
        const auto id = entry.find("id");
        if (id != entry.end() && id->is_string() && !id->get<std::string>().empty()) {
            out.push_back("https://www.youtube.com/watch?v=" + id->get<std::string>());
        }
    }
    if (out.empty()) {
        out.push_back(ref);
    }
    return out;
}

MediaMetadata YtDlpFetcher::parseMetadata(const std::string& text) {
    const json doc = parseJson(text);
    MediaMetadata meta;
    const auto title = doc.find("title");
    if (title != doc.end() && title->is_string()) {
        meta.title = title->get<std::string>();
    }
    const auto id = doc.find("id");
    if (id != doc.end() && id->is_string()) {
        meta.id = id->get<std::string>();
    }
    return meta;
}

std::string YtDlpFetcher::runForJson(std::vector<std::string> args) {
    args.insert(args.begin(), executable_);
    spdlog::debug("running {}", fmt::join(args, " "));

    detail::Subprocess child(std::move(args));
    std::string document;
    std::string last_error;
    std::string line;
    while (true) {
        const auto result = child.readLine(line, std::chrono::seconds(1));
        if (result == detail::Subprocess::ReadResult::Eof) {
            break;
        }
        if (result == detail::Subprocess::ReadResult::Timeout) {
            continue;
        }
        if (!line.empty() && line.front() == '{') {
            document = std::move(line);
        } else if (startsWith(line, "ERROR:")) {
            last_error = line;
        } else {
            spdlog::debug("yt-dlp: {}", line);
        }
    }

    const int code = child.wait();
    if (code != 0) {
        throw StageError(exitMessage(code, last_error, executable_));
    }
    if (document.empty()) {
        throw StageError("yt-dlp printed no metadata");
    }
    return document;
}

MediaMetadata YtDlpFetcher::resolveMetadata(const std::string& ref) {
    return parseMetadata(runForJson({"--dump-single-json", "--skip-download", "--no-playlist", "--no-warnings",
                                     "--", ref}));
}

std::vector<std::string> YtDlpFetcher::expand(const std::string& ref) {
    return parsePlaylist(runForJson({"--flat-playlist", "--dump-single-json", "--no-warnings", "--", ref}), ref);
}

OutputDescriptor YtDlpFetcher::fetch(const std::string& ref, const FetchOptions& options,
                                     const TransferCallback& on_progress) {
    // 未完成的分片写在临时目录, 取消或失败时一并删除
    detail::TempDir temp(fs::temp_directory_path() / ("downqueue-ytdlp-" + generateJobId()));

    std::vector<std::string> args = buildFetchArgs(ref, options, temp.path().string());
    args.insert(args.begin(), executable_);
    spdlog::debug("running {}", fmt::join(args, " "));

    detail::Subprocess child(std::move(args));

    TransferProgress last;
    FileProgressTracker files;
    std::string filename;
    bool postprocessing = false;
    std::string output_path;
    std::string last_error;
    std::string line;
    while (true) {
        const auto result = child.readLine(line, kPollInterval);
        if (result == detail::Subprocess::ReadResult::Eof) {
            break;
        }
        if (result == detail::Subprocess::ReadResult::Timeout) {
            // 让暂停/取消及时生效
            if (on_progress) {
                on_progress(last);
            }
            continue;
        }

        if (startsWith(line, kFilePrefix)) {
            output_path = line.substr(kFilePrefix.size());
        } else if (auto progress = parseProgressLine(line, &filename)) {
            if (!postprocessing) {
                if (auto combined = files.update(filename, *progress)) {
                    last = *combined;
                }
                if (on_progress) {
                    on_progress(last);
                }
            }
        } else if (isPostprocessLine(line)) {
            if (!postprocessing) {
                postprocessing = true;
                last.finished = true;
                if (on_progress) {
                    on_progress(last);
                }
            }
        } else if (startsWith(line, "ERROR:")) {
            last_error = line;
            spdlog::debug("yt-dlp: {}", line);
        } else if (startsWith(line, "WARNING:")) {
            spdlog::info("yt-dlp: {}", line);
        } else {
            spdlog::trace("yt-dlp: {}", line);
        }
    }

    const int code = child.wait();
    if (code != 0) {
        throw StageError(exitMessage(code, last_error, executable_));
    }

    std::error_code ec;
    if (!output_path.empty() && !fs::exists(output_path, ec)) {
        spdlog::warn("yt-dlp reported {} but the file is missing", output_path);
        output_path.clear();
    }
    return {output_path};
}

} // namespace downqueue
