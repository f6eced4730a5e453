#include "downqueue/stage_executor.hpp"
#include "downqueue/detail/temp_dir.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;

namespace {

std::string titleFromUrl(const std::string& url) {
    std::string name = url;
    const auto query = name.find_first_of("?#");
    if (query != std::string::npos) {
        name.erase(query);
    }
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos && slash + 1 < name.size()) {
        name = name.substr(slash + 1);
    }
    return name.empty() ? url : name;
}

} // namespace

InstallExecutor::InstallExecutor(InstallCapability& installer, StageWeights weights, fs::path temp_root)
    : StageExecutor(std::move(weights)), installer_(installer), temp_root_(std::move(temp_root)) {
    requireStages(this->weights(), {"download", "extract", "finalize"});
}

fs::path InstallExecutor::findExecutable(const fs::path& root) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return {};
    }

    constexpr auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        if (!entry.is_regular_file(ec) || entry.is_symlink(ec)) {
            continue;
        }
        if ((entry.status(ec).permissions() & exec_bits) != fs::perms::none) {
            return entry.path();
        }
    }
    return {};
}

OutputDescriptor InstallExecutor::execute(Job& job, StageTracker& tracker, EventBus& events) {
    const JobSpec& spec = job.spec();
    const fs::path dest_dir = spec.dest_dir;

    const std::string title = spec.title.empty() ? titleFromUrl(spec.url) : spec.title;
    job.setTitle(title);
    {
        JobEvent event;
        event.job_id = job.id();
        event.kind = EventKind::Metadata;
        event.title = title;
        events.publish(event);
    }

    detail::TempDir temp(temp_root_ / ("downqueue-" + job.id()));
    const auto on_progress = [&tracker](const TransferProgress& progress) { tracker.reportTransfer(progress); };

    tracker.beginStage("download", "Downloading package...");
    const fs::path archive = installer_.downloadArchive(spec.url, temp.path(), on_progress);
    tracker.completeStage();

    tracker.beginStage("extract", "Extracting files...");
    fs::create_directories(dest_dir);
    spdlog::info("[{}] extracting {} into {}", shortId(job.id()), archive.filename().string(), dest_dir.string());
    installer_.extractArchive(archive, dest_dir, on_progress);
    tracker.completeStage();

    tracker.beginStage("finalize", "Finalizing...");
    fs::path program = findExecutable(dest_dir);
    if (program.empty()) {
        spdlog::info("[{}] no executable found under {}", shortId(job.id()), dest_dir.string());
        program = dest_dir;
    }
    tracker.completeStage();

    return {program.string()};
}

} // namespace downqueue
