#include "downqueue/snapshot.hpp"

#include <initializer_list>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace downqueue {

using nlohmann::json;

namespace {

// camelCase 为主, 兼容旧版 snake_case 字段
const json* field(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const auto it = object.find(name);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string stringField(const json& object, std::initializer_list<const char*> names, const std::string& fallback) {
    const json* value = field(object, names);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    if (value && value->is_number_integer()) {
        return std::to_string(value->get<long long>());
    }
    return fallback;
}

JobSpec specFromJson(const json& item) {
    JobSpec spec;
    spec.url = stringField(item, {"url"}, {});

    const auto kind = parseJobKind(stringField(item, {"kind"}, "video"));
    spec.kind = kind.value_or(JobKind::Video);

    spec.dest_dir = stringField(item, {"destDir", "dest_dir"}, {});

    if (const json* height = field(item, {"qualityHeight", "quality_height"})) {
        if (height->is_number_integer() && height->get<long long>() > 0) {
            spec.quality_height = static_cast<int>(height->get<long long>());
        } else if (height->is_string()) {
            try {
                const int parsed = std::stoi(height->get<std::string>());
                if (parsed > 0) {
                    spec.quality_height = parsed;
                }
            } catch (const std::exception&) {
                spdlog::debug("Ignoring invalid qualityHeight in snapshot for {}", spec.url);
            }
        }
    }

    spec.audio_quality = stringField(item, {"audioQuality", "audio_quality"}, "320");
    if (spec.audio_quality.empty()) {
        spec.audio_quality = "320";
    }

    if (const json* langs = field(item, {"subsLangs", "subs_langs"}); langs && langs->is_array()) {
        for (const auto& lang : *langs) {
            if (lang.is_string() && !lang.get<std::string>().empty()) {
                spec.subs_langs.push_back(lang.get<std::string>());
            }
        }
    }

    if (const json* embed = field(item, {"embedSubs", "embed_subs"}); embed && embed->is_boolean()) {
        spec.embed_subs = embed->get<bool>();
    }

    spec.container = stringField(item, {"container"}, "mp4");
    if (spec.container.empty()) {
        spec.container = "mp4";
    }

    spec.title = stringField(item, {"title"}, {});
    return spec;
}

json specToJson(const JobSpec& spec) {
    json item = json::object();
    item["url"] = spec.url;
    item["kind"] = toString(spec.kind);
    item["destDir"] = spec.dest_dir;
    item["qualityHeight"] = spec.quality_height ? json(*spec.quality_height) : json(nullptr);
    item["audioQuality"] = spec.audio_quality;
    item["subsLangs"] = spec.subs_langs;
    item["embedSubs"] = spec.embed_subs;
    item["container"] = spec.container;
    item["title"] = spec.title;
    return item;
}

} // namespace

std::string toJson(const QueueSnapshot& snapshot, int indent) {
    json root = json::object();
    root["version"] = snapshot.version;

    json queue = json::array();
    for (const auto& spec : snapshot.queue) {
        queue.push_back(specToJson(spec));
    }
    root["queue"] = std::move(queue);
    root["completed"] = snapshot.completed;
    root["defaults"] = {
        {"videoDir", snapshot.defaults.video_dir},
        {"audioDir", snapshot.defaults.audio_dir},
    };
    // 非 UTF-8 字节(如 Latin-1 路径)替换为 U+FFFD, 不抛异常
    return root.dump(indent, ' ', false, json::error_handler_t::replace);
}

QueueSnapshot snapshotFromJson(const std::string& text) {
    QueueSnapshot snapshot;

    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        spdlog::warn("Ignoring unreadable snapshot: {}", ex.what());
        return snapshot;
    }
    if (!root.is_object()) {
        spdlog::warn("Ignoring snapshot: top level is not an object");
        return snapshot;
    }

    if (const auto it = root.find("version"); it != root.end() && it->is_number_integer()) {
        snapshot.version = it->get<int>();
    }

    if (const auto it = root.find("queue"); it != root.end() && it->is_array()) {
        for (const auto& item : *it) {
            if (!item.is_object()) {
                continue;
            }
            JobSpec spec = specFromJson(item);
            if (spec.url.empty()) {
                continue;
            }
            snapshot.queue.push_back(std::move(spec));
        }
    }

    if (const auto it = root.find("completed"); it != root.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                snapshot.completed.push_back(entry.get<std::string>());
            }
        }
    }

    if (const auto it = root.find("defaults"); it != root.end() && it->is_object()) {
        snapshot.defaults.video_dir = stringField(*it, {"videoDir", "video_dir"}, {});
        snapshot.defaults.audio_dir = stringField(*it, {"audioDir", "audio_dir"}, {});
    }

    return snapshot;
}

} // namespace downqueue
