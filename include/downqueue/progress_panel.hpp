#pragma once

#include "job.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace downqueue {

class QueueController;

// Terminal observer: redraws one line per job in place.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);

    // Redraws every `interval` until no job is live. on_tick runs before each frame.
    void renderLoop(const QueueController& controller, const std::function<void()>& on_tick,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    void render(const std::vector<JobPtr>& jobs);

    static std::string buildPanel(const std::vector<JobPtr>& jobs);
    static std::string formatJobLine(const JobSpec& spec, const JobState& state);
    static bool hasActiveJobs(const std::vector<JobPtr>& jobs);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace downqueue
