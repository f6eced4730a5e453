#include "downqueue/progress_panel.hpp"
#include "downqueue/format.hpp"
#include "downqueue/queue_controller.hpp"

#include <algorithm>
#include <ostream>
#include <thread>

#include <fmt/format.h>

namespace downqueue {

namespace {

constexpr std::size_t kNameWidth = 28;
constexpr int kBarWidth = 30;

// 按 UTF-8 字符截断
std::string truncateName(const std::string& text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

const char* kindTag(JobKind kind) {
    switch (kind) {
    case JobKind::Video:
        return "V";
    case JobKind::Audio:
        return "A";
    case JobKind::Install:
        return "I";
    }
    return "?";
}

} // namespace

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::renderLoop(const QueueController& controller, const std::function<void()>& on_tick,
                               std::chrono::milliseconds interval) {
    while (true) {
        if (on_tick) {
            on_tick();
        }
        const auto jobs = controller.jobs();
        render(jobs);

        if (!hasActiveJobs(jobs)) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }
    out_ << std::flush;
}

void ProgressPanel::render(const std::vector<JobPtr>& jobs) {
    redrawPanel(buildPanel(jobs));
}

std::string ProgressPanel::buildPanel(const std::vector<JobPtr>& jobs) {
    std::string panel;
    panel.reserve(jobs.size() * 160 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("downqueue ({} jobs)\n", jobs.size());
    panel.append("--------------------------------------------------\n");

    double progress_sum = 0.0;
    std::size_t running = 0;
    std::size_t queued = 0;
    std::size_t failed = 0;
    for (const auto& job : jobs) {
        if (!job) {
            continue;
        }
        const JobState state = job->state();
        panel += formatJobLine(job->spec(), state);
        panel.push_back('\n');

        progress_sum += state.progress;
        if (state.status == JobStatus::Running) {
            ++running;
        } else if (state.status == JobStatus::Queued) {
            ++queued;
        } else if (state.status == JobStatus::Failed) {
            ++failed;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (!jobs.empty()) {
        panel += fmt::format("Overall: {:>3}%  running {}, queued {}, failed {}",
                             static_cast<int>(progress_sum / static_cast<double>(jobs.size())),
                             running, queued, failed);
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatJobLine(const JobSpec& spec, const JobState& state) {
    std::string display_name = state.title.empty() ? spec.url : state.title;
    display_name = truncateName(display_name, kNameWidth);
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    const double ratio = std::clamp(state.progress / 100.0, 0.0, 1.0);
    const int bar_pos = static_cast<int>(ratio * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("[{}] {:<28} [{}] {:>3}%", kindTag(spec.kind), display_name, bar,
                                   static_cast<int>(state.progress));

    switch (state.status) {
    case JobStatus::Completed:
        line.append("  ✅ Done");
        break;
    case JobStatus::Failed:
        line += fmt::format("  ❌ {}", state.error_message);
        break;
    case JobStatus::Cancelled:
        line.append("  ⛔ Cancelled");
        break;
    case JobStatus::Queued:
        line.append("  Queued");
        break;
    case JobStatus::Running:
        if (!state.speed.empty()) {
            line += fmt::format("  {:>11} ETA {}", state.speed, state.eta.empty() ? kUnknownEta : state.eta);
        }
        if (!state.status_text.empty()) {
            line += "  " + state.status_text;
        }
        break;
    }
    return line;
}

bool ProgressPanel::hasActiveJobs(const std::vector<JobPtr>& jobs) {
    return std::any_of(jobs.begin(), jobs.end(),
                       [](const JobPtr& job) { return job && !job->isTerminal(); });
}

void ProgressPanel::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace downqueue
