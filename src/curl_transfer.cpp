#include "downqueue/curl_transfer.hpp"
#include "downqueue/detail/curl_utils.hpp"
#include "downqueue/detail/thread_group.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace downqueue {

namespace {

constexpr const char* kUserAgent = "downqueue/1.0";
// 小文件不分段
constexpr curl_off_t kMinSegmentBytes = 256 * 1024;
constexpr int kSegmentAttempts = 3;

bool isTransient(CURLcode code) {
    switch (code) {
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_GOT_NOTHING:
        return true;
    default:
        return false;
    }
}

} // namespace

class CurlTransfer::Impl {
public:
    Impl(std::string url, std::filesystem::path destination, int max_segments)
        : url_(std::move(url)),
          destination_(std::move(destination)),
          max_segments_(std::max(1, max_segments)) {}

    void start(const TransferCallback& on_progress) {
        detail::ensureCurlInitialized();
        on_progress_ = on_progress;

        file_.reset(std::fopen(destination_.c_str(), "wb+"));
        if (!file_) {
            throw StageError("Cannot create destination file: " + destination_.string());
        }

        const Probe probe = probeServer();
        total_ = probe.length;
        auto segments = planSegments(probe);
        spdlog::debug("{}: {} bytes in {} segment(s)", url_, total_, segments.size());

        if (segments.size() > 1 && ftruncate(fileno(file_.get()), total_) == -1) {
            file_.reset();
            throw StageError("Cannot resize destination file");
        }

        if (segments.size() == 1) {
            runSegment(segments.front());
        } else {
            // 声明在 segments 之后, 异常退出时先 join 再销毁 segments
            detail::ThreadGroup workers;
            workers.reserve(segments.size());
            try {
                for (auto& segment : segments) {
                    workers.spawn([this, &segment]() { runSegment(segment); });
                }
            } catch (const std::system_error& ex) {
                registerError(std::string("Cannot start segment thread: ") + ex.what());
                throw StageError(std::string("Cannot start segment thread: ") + ex.what());
            }
            workers.joinAll();
        }

        std::fflush(file_.get());
        file_.reset();

        // 回调抛出的异常(取消)优先于 curl 错误
        if (failure_) {
            std::rethrow_exception(failure_);
        }
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!error_message_.empty()) {
                throw StageError(error_message_);
            }
        }
        if (total_ > 0 && downloaded_ != total_) {
            throw StageError(fmt::format("Download incomplete ({} of {} bytes)",
                                         static_cast<curl_off_t>(downloaded_), total_));
        }
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct Probe {
        bool ranges{false};
        curl_off_t length{0};
    };

    // One byte range written at its own offset; unranged covers the whole body.
    struct Segment {
        Impl* owner{nullptr};
        curl_off_t offset{0};
        curl_off_t length{0};
        curl_off_t written{0};
        bool ranged{false};
    };

    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    CurlHandle newHandle() const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return curl;
        }
        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
        // 30 秒内低于 1 B/s 视为卡住
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 30L);
        return curl;
    }

    [[nodiscard]] Probe probeServer() const {
        Probe probe;
        CurlHandle curl = newHandle();
        if (!curl) {
            return probe;
        }
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
            +[](char* buffer, size_t size, size_t nitems, Probe* out) -> size_t {
                std::string line(buffer, size * nitems);
                std::transform(line.begin(), line.end(), line.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                // 重定向后以最后一个响应为准
                if (line.compare(0, 5, "http/") == 0) {
                    out->ranges = false;
                } else if (line.find("accept-ranges:") == 0 && line.find("bytes") != std::string::npos) {
                    out->ranges = true;
                }
                return size * nitems;
            });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &probe);

        const CURLcode res = curl_easy_perform(curl.get());
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res != CURLE_OK || code != 200) {
            spdlog::debug("HEAD {} gave {} ({})", url_, code, curl_easy_strerror(res));
            return {};
        }

        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        //没有返回length字段时为-1
        probe.length = std::max<curl_off_t>(0, length);
        if (probe.length == 0) {
            probe.ranges = false;
        }
        return probe;
    }

    [[nodiscard]] std::vector<Segment> planSegments(const Probe& probe) {
        if (!probe.ranges || probe.length < 2 * kMinSegmentBytes || max_segments_ == 1) {
            return {Segment{this, 0, probe.length, 0, false}};
        }

        const curl_off_t wanted = std::min<curl_off_t>(max_segments_, probe.length / kMinSegmentBytes);
        const curl_off_t part = (probe.length + wanted - 1) / wanted;
        std::vector<Segment> segments;
        for (curl_off_t offset = 0; offset < probe.length; offset += part) {
            segments.push_back({this, offset, std::min(part, probe.length - offset), 0, true});
        }
        return segments;
    }

    void runSegment(Segment& segment) {
        for (int attempt = 1; attempt <= kSegmentAttempts; ++attempt) {
            CurlHandle curl = newHandle();
            if (!curl) {
                registerError("Failed to allocate curl handle");
                return;
            }

            std::string range;
            if (segment.ranged) {
                // 重试时从已写入的位置继续
                range = fmt::format("{}-{}", segment.offset + segment.written, segment.offset + segment.length - 1);
                curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
            }
            curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &segment);
            curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);

            const CURLcode res = curl_easy_perform(curl.get());
            if (aborted_) {
                return;
            }
            if (res == CURLE_OK) {
                if (segment.ranged && segment.written != segment.length) {
                    registerError(fmt::format("Range {}+{} incomplete", segment.offset, segment.length));
                }
                return;
            }
            // 只有分段下载可以续传
            if (!segment.ranged || !isTransient(res) || attempt == kSegmentAttempts) {
                registerError(std::string{"curl error: "} + curl_easy_strerror(res));
                return;
            }
            spdlog::debug("{}: retrying range at {} after {}", url_, segment.offset + segment.written,
                          curl_easy_strerror(res));
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* segment = static_cast<Segment*>(userdata);
        const size_t total = size * nmemb;
        if (!segment || !segment->owner || total == 0) {
            return 0;
        }
        Impl& self = *segment->owner;
        if (self.aborted_) {
            return 0;
        }

        {
            std::lock_guard<std::mutex> file_lock(self.file_mutex_);
            FILE* file = self.file_.get();
            if (!file || fseeko(file, segment->offset + segment->written, SEEK_SET) != 0) {
                self.registerError("Failed to seek output file");
                return 0;
            }
            if (std::fwrite(ptr, 1, total, file) != total) {
                self.registerError("Failed to write output file");
                return 0;
            }
        }

        segment->written += static_cast<curl_off_t>(total);
        self.downloaded_ += static_cast<curl_off_t>(total);

        // 每个数据块都检查暂停/取消
        return self.report() ? total : 0;
    }

    static int xferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<Impl*>(userdata);
        return self && self->report() ? 0 : 1;
    }

    // Runs the progress callback; false aborts every segment.
    bool report() {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (aborted_) {
            return false;
        }
        if (!on_progress_) {
            return true;
        }

        const curl_off_t done = downloaded_;
        try {
            on_progress_({static_cast<std::uint64_t>(done), static_cast<std::uint64_t>(total_), false});
        } catch (...) {
            // curl 回调中不能抛出异常, 保存后在 start() 中重新抛出
            failure_ = std::current_exception();
            aborted_ = true;
            return false;
        }
        return true;
    }

    void registerError(std::string message) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (error_message_.empty()) {
                error_message_ = std::move(message);
            }
        }
        aborted_ = true;
    }

    std::string url_;
    std::filesystem::path destination_;
    int max_segments_;
    TransferCallback on_progress_;

    std::unique_ptr<FILE, FileDeleter> file_{};

    std::mutex file_mutex_;
    std::mutex callback_mutex_;
    std::mutex error_mutex_;

    curl_off_t total_{0};
    std::atomic<curl_off_t> downloaded_{0};
    std::atomic<bool> aborted_{false};
    std::exception_ptr failure_;
    std::string error_message_;
};

CurlTransfer::CurlTransfer(std::string url, std::filesystem::path destination, int max_segments)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(destination), max_segments)) {}

CurlTransfer::~CurlTransfer() = default;

void CurlTransfer::start(const TransferCallback& on_progress) { impl_->start(on_progress); }

} // namespace downqueue
