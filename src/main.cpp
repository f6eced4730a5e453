#include "downqueue/config.hpp"
#include "downqueue/errors.hpp"
#include "downqueue/event_bus.hpp"
#include "downqueue/log.hpp"
#include "downqueue/package_installer.hpp"
#include "downqueue/paths.hpp"
#include "downqueue/progress_panel.hpp"
#include "downqueue/queue_controller.hpp"
#include "downqueue/state_store.hpp"
#include "downqueue/ytdlp_fetcher.hpp"
#include "downqueue/detail/curl_utils.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::atomic<int> g_interrupts{0};

extern "C" void onInterrupt(int) {
    if (g_interrupts.fetch_add(1) >= 1) {
        // 第二次 Ctrl+C 直接退出
        std::_Exit(130);
    }
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw downqueue::ConfigError("Cannot read " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out || !(out << content)) {
        throw std::runtime_error("Cannot write " + path);
    }
}

downqueue::SnapshotDefaults resolveDefaults(const downqueue::AppConfig& config,
                                            const downqueue::QueueSnapshot& saved) {
    downqueue::SnapshotDefaults defaults = downqueue::defaultDownloadDirs();
    if (!saved.defaults.video_dir.empty()) {
        defaults.video_dir = saved.defaults.video_dir;
    }
    if (!saved.defaults.audio_dir.empty()) {
        defaults.audio_dir = saved.defaults.audio_dir;
    }
    if (!config.video_dir.empty()) {
        defaults.video_dir = config.video_dir;
    }
    if (!config.audio_dir.empty()) {
        defaults.audio_dir = config.audio_dir;
    }
    return defaults;
}

} // namespace

int main(int argc, char** argv) {
    using namespace downqueue;

    AppConfig config;
    WeightTable weights;
    try {
        config = parseArgs(argc, argv);
        if (config.show_help) {
            printUsage(std::cout, argv[0]);
            return 0;
        }
        initLogging(config.log);
        weights = buildWeightTable(config);
    } catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    try {
        detail::ensureCurlInitialized();

        JsonFileStateStore store(config.state_file);
        const QueueSnapshot saved = store.load();

        ControllerOptions options;
        options.concurrency = config.jobs;
        options.defaults = resolveDefaults(config, saved);
        options.weights = weights;
        ensureDirectories(options.defaults);

        EventBus events;
        YtDlpFetcher fetcher(config.ytdlp);
        PackageInstaller installer;
        QueueController controller(events, fetcher, installer, options, &store);

        const std::size_t restored = controller.restore(saved, config.restore);
        if (restored > 0) {
            spdlog::info("Restored {} job(s) from {}", restored, config.state_file);
        }
        if (!config.import_file.empty()) {
            controller.importSnapshot(readFile(config.import_file));
        }
        for (const auto& request : buildRequests(config)) {
            if (controller.add(request).empty()) {
                spdlog::warn("Ignoring empty url");
            }
        }

        if (controller.jobs().empty()) {
            std::cerr << "Nothing to download.\n\n";
            printUsage(std::cerr, argv[0]);
            return 0;
        }
        if (!config.export_file.empty()) {
            writeFile(config.export_file, controller.exportSnapshot());
        }

        std::signal(SIGINT, onInterrupt);
        bool interrupted = false;

        //绘制进度面板直到队列清空
        ProgressPanel panel(std::cout);
        panel.renderLoop(controller, [&]() {
            if (!interrupted && g_interrupts.load() > 0) {
                interrupted = true;
                std::cerr << "\nInterrupted, cancelling jobs (press Ctrl+C again to quit)..." << std::endl;
                controller.shutdown();
            }
        });
        controller.waitIdle();

        int failed = 0;
        for (const auto& job : controller.jobs()) {
            const JobState state = job->state();
            if (state.status == JobStatus::Failed) {
                ++failed;
                std::cerr << "Failed: " << (state.title.empty() ? job->spec().url : state.title)
                          << " - " << state.error_message << std::endl;
            }
            for (const auto& warning : state.warnings) {
                std::cerr << "Warning: " << warning << std::endl;
            }
        }
        return failed > 0 ? 2 : 0;

    } catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
