#pragma once

#include "progress.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace downqueue {

// Download into a file. Large bodies from servers that accept ranges are
// split into up to max_segments parallel requests, each retried from where it
// stopped. Progress callbacks are serialized; an exception thrown by one
// stops every segment and is rethrown from start().
class CurlTransfer final {
public:
    CurlTransfer(std::string url, std::filesystem::path destination, int max_segments = 4);
    ~CurlTransfer();

    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    // Throws StageError on transfer failure.
    void start(const TransferCallback& on_progress);

private:
    //使用impl类减少头文件的依赖
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace downqueue
