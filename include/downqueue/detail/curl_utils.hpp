#pragma once

#include <string>

namespace downqueue::detail {

// curl_global_init exactly once per process. Throws StageError on failure.
void ensureCurlInitialized();

// Whether the linked libcurl handles the scheme of `url`. Urls without a
// scheme count as supported (curl guesses http).
[[nodiscard]] bool isProtocolSupported(const std::string& url);

} // namespace downqueue::detail
