#include "downqueue/config.hpp"
#include "downqueue/errors.hpp"

#include <cstdlib>
#include <exception>

#include <fmt/format.h>

namespace downqueue {

namespace {

int parsePositive(const std::string& option, const std::string& value, int max_value) {
    int parsed = 0;
    try {
        std::size_t used = 0;
        parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw ConfigError("");
        }
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (parsed <= 0 || parsed > max_value) {
        throw ConfigError(fmt::format("{} must be between 1 and {}", option, max_value));
    }
    return parsed;
}

} // namespace

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [options] <url>...\n"
        << "Options:\n"
        << "  -a, --audio               Add urls as audio (mp3) jobs\n"
        << "  -q, --quality <height>    Video height ceiling, e.g. 720 (default: best)\n"
        << "  -b, --bitrate <kbps>      Audio bitrate (default: 320)\n"
        << "      --subs <langs>        Comma separated subtitle languages\n"
        << "      --embed-subs          Embed subtitles into the video\n"
        << "      --container <c>       mp4 | mkv (default: mp4)\n"
        << "  -o, --output <dir>        Destination directory for the added urls\n"
        << "      --install <url>       Add an archive install job (destination: -o)\n"
        << "  -j, --jobs <n>            Concurrent jobs (default: 3)\n"
        << "      --video-dir <dir>     Default video directory\n"
        << "      --audio-dir <dir>     Default audio directory\n"
        << "      --state <file>        State file (default: ./downqueue_state.json)\n"
        << "      --no-restore          Do not re-add the saved queue\n"
        << "      --import <file>       Add every queue record of a snapshot file\n"
        << "      --export <file>       Write the snapshot once the urls are added\n"
        << "      --weights <spec>      Stage weights, kind:stage=w,... (repeatable)\n"
        << "      --yt-dlp <path>       yt-dlp executable (default: yt-dlp)\n"
        << "      --log-level <level>   trace|debug|info|warn|error|off (default: warn)\n"
        << "      --log-file <file>     Write the log to a file instead of stderr\n"
        << "  -h, --help                Show this message" << std::endl;
}

std::vector<std::string> splitList(const std::string& text, char separator) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find(separator, start);
        std::string item = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        const auto first = item.find_first_not_of(" \t");
        if (first != std::string::npos) {
            const auto last = item.find_last_not_of(" \t");
            out.push_back(item.substr(first, last - first + 1));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return out;
}

AppConfig parseArgs(int argc, const char* const* argv) {
    AppConfig config;
    int arg_index = 1;

    while (arg_index < argc) {
        std::string option = argv[arg_index];
        if (option.empty() || option[0] != '-' || option == "-") {
            config.urls.push_back(option);
            ++arg_index;
            continue;
        }
        if (option == "--") {
            for (++arg_index; arg_index < argc; ++arg_index) {
                config.urls.emplace_back(argv[arg_index]);
            }
            break;
        }

        // --name=value
        std::optional<std::string> inline_value;
        const auto eq = option.find('=');
        if (option.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            inline_value = option.substr(eq + 1);
            option.erase(eq);
        }

        const auto value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (arg_index + 1 >= argc) {
                throw ConfigError("Missing value for " + option);
            }
            return argv[++arg_index];
        };

        if (option == "-h" || option == "--help") {
            config.show_help = true;
        } else if (option == "-a" || option == "--audio") {
            config.kind = JobKind::Audio;
        } else if (option == "-q" || option == "--quality") {
            config.quality_height = parsePositive(option, value(), 10000);
        } else if (option == "-b" || option == "--bitrate") {
            config.audio_bitrate = std::to_string(parsePositive(option, value(), 1000));
        } else if (option == "--subs") {
            config.subs_langs = splitList(value());
        } else if (option == "--embed-subs") {
            config.embed_subs = true;
        } else if (option == "--container") {
            config.container = value();
            if (config.container != "mp4" && config.container != "mkv") {
                throw ConfigError("Unsupported container: " + config.container);
            }
        } else if (option == "-o" || option == "--output") {
            config.output_dir = value();
        } else if (option == "--install") {
            config.installs.push_back(value());
        } else if (option == "-j" || option == "--jobs") {
            config.jobs = parsePositive(option, value(), 64);
        } else if (option == "--video-dir") {
            config.video_dir = value();
        } else if (option == "--audio-dir") {
            config.audio_dir = value();
        } else if (option == "--state") {
            config.state_file = value();
        } else if (option == "--no-restore") {
            config.restore = false;
        } else if (option == "--import") {
            config.import_file = value();
        } else if (option == "--export") {
            config.export_file = value();
        } else if (option == "--weights") {
            config.weight_specs.push_back(value());
        } else if (option == "--yt-dlp") {
            config.ytdlp = value();
        } else if (option == "--log-level") {
            config.log.level = value();
        } else if (option == "--log-file") {
            config.log.file = value();
        } else {
            throw ConfigError("Unknown option: " + option);
        }
        ++arg_index;
    }

    if (config.embed_subs && config.subs_langs.empty()) {
        throw ConfigError("--embed-subs requires --subs");
    }
    return config;
}

WeightTable buildWeightTable(const AppConfig& config) {
    WeightTable table = WeightTable::defaults();
    for (const auto& spec : config.weight_specs) {
        table.apply(spec);
    }
    return table;
}

std::vector<JobSpec> buildRequests(const AppConfig& config) {
    std::vector<JobSpec> requests;
    for (const auto& url : config.urls) {
        JobSpec spec;
        spec.url = url;
        spec.kind = config.kind;
        spec.dest_dir = config.output_dir;
        if (config.kind == JobKind::Video) {
            spec.quality_height = config.quality_height;
            spec.container = config.container;
            spec.subs_langs = config.subs_langs;
            spec.embed_subs = config.embed_subs;
        } else {
            spec.audio_quality = config.audio_bitrate;
        }
        requests.push_back(std::move(spec));
    }
    for (const auto& url : config.installs) {
        JobSpec spec;
        spec.url = url;
        spec.kind = JobKind::Install;
        spec.dest_dir = config.output_dir;
        requests.push_back(std::move(spec));
    }
    return requests;
}

} // namespace downqueue
