#pragma once

#include "job.hpp"
#include "log.hpp"
#include "progress.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace downqueue {

struct AppConfig {
    std::vector<std::string> urls;
    std::vector<std::string> installs;
    JobKind kind{JobKind::Video};
    std::optional<int> quality_height;
    std::string audio_bitrate{"320"};
    std::vector<std::string> subs_langs;
    bool embed_subs{false};
    std::string container{"mp4"};
    std::string output_dir;           // empty: default directory per kind

    int jobs{3};
    std::string video_dir;
    std::string audio_dir;
    std::string state_file{"downqueue_state.json"};
    bool restore{true};
    std::string import_file;
    std::string export_file;
    std::vector<std::string> weight_specs;
    std::string ytdlp{"yt-dlp"};
    LogOptions log;

    bool show_help{false};
};

// Throws ConfigError on unknown options, missing values or bad numbers.
AppConfig parseArgs(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

std::vector<std::string> splitList(const std::string& text, char separator = ',');

// Defaults with every --weights spec applied in order.
WeightTable buildWeightTable(const AppConfig& config);

// One add request per url and per --install url.
std::vector<JobSpec> buildRequests(const AppConfig& config);

} // namespace downqueue
