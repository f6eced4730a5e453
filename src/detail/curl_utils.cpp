#include "downqueue/detail/curl_utils.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace downqueue::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw StageError(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info) {
            spdlog::debug("libcurl {} ({})", info->version, info->ssl_version ? info->ssl_version : "no TLS");
        }
    });
}

bool isProtocolSupported(const std::string& url) {
    const auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return true;
    }
    std::string scheme = url.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info || !info->protocols) {
        return false;
    }
    for (const char* const* protocol = info->protocols; *protocol; ++protocol) {
        if (scheme == *protocol) {
            return true;
        }
    }
    return false;
}

} // namespace downqueue::detail
