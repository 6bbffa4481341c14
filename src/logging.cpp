//
//  logging.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

namespace oggfetch {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

std::optional<LogVerbosity> parse_log_verbosity(std::string_view name) {
    if (name == "debug") {
        return LogVerbosity::Debug;
    }
    // Subsystem tags are not levels.
    const auto severity = of_severity_for_tag(name);
    if (severity == LogVerbosity::Debug) {
        return std::nullopt;
    }
    return severity;
}

}  // namespace oggfetch
