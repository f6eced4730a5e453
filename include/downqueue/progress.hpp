#pragma once

#include "job.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace downqueue {

// One sample of a byte transfer (download, extraction).
struct TransferProgress {
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};  // 0 = unknown
    bool finished{false};          // transfer done, post-processing may follow
};

using TransferCallback = std::function<void(const TransferProgress&)>;

struct Stage {
    std::string name;
    int weight{0};
};

// Ordered stage list whose weights sum to 100.
class StageWeights {
public:
    StageWeights() = default;
    explicit StageWeights(std::vector<Stage> stages);

    [[nodiscard]] const std::vector<Stage>& stages() const noexcept { return stages_; }
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] int weightOf(const std::string& name) const;
    // Sum of the weights of every stage before `name`.
    [[nodiscard]] int offsetOf(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::vector<Stage> stages_;
};

class WeightTable {
public:
    static WeightTable defaults();

    void set(JobKind kind, StageWeights weights);
    [[nodiscard]] const StageWeights& get(JobKind kind) const;

    // "install:download=60,extract=30,finalize=10"
    void apply(const std::string& spec);

private:
    std::map<JobKind, StageWeights> weights_;
};

// Maps stage-local percentages onto overall job progress.
class WeightedProgress {
public:
    explicit WeightedProgress(StageWeights weights);

    double update(const std::string& stage, double stage_percent);
    double completeStage(const std::string& stage);
    [[nodiscard]] double overall() const noexcept { return overall_; }

private:
    StageWeights weights_;
    double overall_{0.0};
};

// Throughput over a sliding window rather than a cumulative average.
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputMeter(Clock::duration window = std::chrono::milliseconds(250));

    void reset(std::uint64_t downloaded_bytes, Clock::time_point now);
    // Returns the new speed once a full window has elapsed.
    std::optional<double> sample(std::uint64_t downloaded_bytes, Clock::time_point now);
    [[nodiscard]] double speed() const noexcept { return speed_; }

private:
    Clock::duration window_;
    Clock::time_point window_start_{};
    std::uint64_t window_bytes_start_{0};
    double speed_{0.0};
    bool started_{false};
};

// Stage percentage for a transfer of unknown size, below 100 for any elapsed time.
double indeterminateEstimate(std::chrono::duration<double> elapsed);

} // namespace downqueue
