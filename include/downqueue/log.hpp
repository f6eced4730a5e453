#pragma once

#include <string>

namespace downqueue {

struct LogOptions {
    std::string level{"warn"};  // trace|debug|info|warn|error|off
    std::string file;           // empty: stderr
};

// Installs the "downqueue" default logger. Throws ConfigError on an unknown level.
void initLogging(const LogOptions& options);

} // namespace downqueue
