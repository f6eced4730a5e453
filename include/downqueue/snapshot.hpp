#pragma once

#include "job.hpp"

#include <string>
#include <vector>

namespace downqueue {

inline constexpr int kSnapshotVersion = 1;

struct SnapshotDefaults {
    std::string video_dir;
    std::string audio_dir;
};

// Restart-time projection of the queue; never drives scheduling.
struct QueueSnapshot {
    int version{kSnapshotVersion};
    std::vector<JobSpec> queue;
    std::vector<std::string> completed;
    SnapshotDefaults defaults;
};

std::string toJson(const QueueSnapshot& snapshot, int indent = 2);

// Tolerant reader: malformed fields fall back to defaults, records without
// a url are skipped, unparseable text gives an empty snapshot.
QueueSnapshot snapshotFromJson(const std::string& text);

} // namespace downqueue
