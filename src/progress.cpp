#include "downqueue/progress.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace downqueue {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

StageWeights::StageWeights(std::vector<Stage> stages) : stages_(std::move(stages)) {
    if (stages_.empty()) {
        throw ConfigError("Stage weight table is empty");
    }

    int sum = 0;
    for (const auto& stage : stages_) {
        if (stage.name.empty()) {
            throw ConfigError("Stage name is empty");
        }
        if (stage.weight < 0) {
            throw ConfigError(fmt::format("Negative weight for stage '{}'", stage.name));
        }
        if (std::count_if(stages_.begin(), stages_.end(),
                          [&](const Stage& other) { return other.name == stage.name; }) > 1) {
            throw ConfigError(fmt::format("Duplicate stage '{}'", stage.name));
        }
        sum += stage.weight;
    }
    if (sum != 100) {
        throw ConfigError(fmt::format("Stage weights must sum to 100 (got {})", sum));
    }
}

bool StageWeights::contains(const std::string& name) const {
    return std::any_of(stages_.begin(), stages_.end(), [&](const Stage& s) { return s.name == name; });
}

int StageWeights::weightOf(const std::string& name) const {
    for (const auto& stage : stages_) {
        if (stage.name == name) {
            return stage.weight;
        }
    }
    throw std::out_of_range("Unknown stage: " + name);
}

int StageWeights::offsetOf(const std::string& name) const {
    int offset = 0;
    for (const auto& stage : stages_) {
        if (stage.name == name) {
            return offset;
        }
        offset += stage.weight;
    }
    throw std::out_of_range("Unknown stage: " + name);
}

std::vector<std::string> StageWeights::names() const {
    std::vector<std::string> out;
    out.reserve(stages_.size());
    for (const auto& stage : stages_) {
        out.push_back(stage.name);
    }
    return out;
}

WeightTable WeightTable::defaults() {
    WeightTable table;
    table.set(JobKind::Video, StageWeights({{"metadata", 5}, {"transfer", 85}, {"postprocess", 10}}));
    table.set(JobKind::Audio, StageWeights({{"metadata", 5}, {"transfer", 75}, {"postprocess", 20}}));
    table.set(JobKind::Install, StageWeights({{"download", 60}, {"extract", 30}, {"finalize", 10}}));
    return table;
}

void WeightTable::set(JobKind kind, StageWeights weights) {
    weights_[kind] = std::move(weights);
}

const StageWeights& WeightTable::get(JobKind kind) const {
    const auto it = weights_.find(kind);
    if (it == weights_.end()) {
        throw ConfigError(fmt::format("No stage weights for job kind '{}'", toString(kind)));
    }
    return it->second;
}

void WeightTable::apply(const std::string& spec) {
    const auto colon = spec.find(':');
    if (colon == std::string::npos) {
        throw ConfigError("Invalid weight spec (expected kind:stage=weight,...): " + spec);
    }

    const auto kind = parseJobKind(trim(spec.substr(0, colon)));
    if (!kind) {
        throw ConfigError("Unknown job kind in weight spec: " + spec);
    }

    std::map<std::string, int> given;
    std::stringstream list(spec.substr(colon + 1));
    std::string item;
    while (std::getline(list, item, ',')) {
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Invalid stage weight: " + item);
        }
        const std::string name = trim(item.substr(0, eq));
        int weight = 0;
        try {
            weight = std::stoi(trim(item.substr(eq + 1)));
        } catch (const std::exception&) {
            throw ConfigError("Invalid weight for stage '" + name + "': " + item);
        }
        given[name] = weight;
    }

    // 阶段顺序由执行器决定, 这里只替换权重
    std::vector<Stage> stages;
    for (const auto& name : get(*kind).names()) {
        const auto it = given.find(name);
        if (it == given.end()) {
            throw ConfigError(fmt::format("Missing weight for stage '{}' of kind '{}'", name, toString(*kind)));
        }
        stages.push_back({name, it->second});
        given.erase(it);
    }
    if (!given.empty()) {
        throw ConfigError(fmt::format("Unknown stage '{}' for kind '{}'", given.begin()->first, toString(*kind)));
    }

    set(*kind, StageWeights(std::move(stages)));
}

WeightedProgress::WeightedProgress(StageWeights weights) : weights_(std::move(weights)) {}

double WeightedProgress::update(const std::string& stage, double stage_percent) {
    const double fraction = std::clamp(stage_percent, 0.0, 100.0) / 100.0;
    const double value = weights_.offsetOf(stage) + fraction * weights_.weightOf(stage);
    overall_ = std::max(overall_, std::min(100.0, value));
    return overall_;
}

double WeightedProgress::completeStage(const std::string& stage) {
    return update(stage, 100.0);
}

ThroughputMeter::ThroughputMeter(Clock::duration window) : window_(window) {}

void ThroughputMeter::reset(std::uint64_t downloaded_bytes, Clock::time_point now) {
    window_start_ = now;
    window_bytes_start_ = downloaded_bytes;
    speed_ = 0.0;
    started_ = true;
}

std::optional<double> ThroughputMeter::sample(std::uint64_t downloaded_bytes, Clock::time_point now) {
    if (!started_) {
        reset(downloaded_bytes, now);
        return std::nullopt;
    }

    const auto elapsed = now - window_start_;
    if (elapsed < window_) {
        return std::nullopt;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    const std::uint64_t bytes = downloaded_bytes >= window_bytes_start_ ? downloaded_bytes - window_bytes_start_ : 0;
    speed_ = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;

    window_start_ = now;
    window_bytes_start_ = downloaded_bytes;
    return speed_;
}

double indeterminateEstimate(std::chrono::duration<double> elapsed) {
    constexpr double cap = 90.0;
    constexpr double time_constant = 30.0;
    const double seconds = std::max(0.0, elapsed.count());
    return cap * (1.0 - std::exp(-seconds / time_constant));
}

} // namespace downqueue
