//
//  logging.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace oggfetch {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// "error", "warn"/"warning", "info" or "debug"; nullopt for anything else.
std::optional<LogVerbosity> parse_log_verbosity(std::string_view name);

/// Log tags and the verbosity they need. Subsystem tags only show up at Debug.
struct LogTag {
    std::string_view name;
    LogVerbosity severity;
};

inline constexpr LogTag kLogTags[] = {
    {"error", LogVerbosity::Error},   {"warn", LogVerbosity::Warn},
    {"warning", LogVerbosity::Warn},  {"info", LogVerbosity::Info},
    {"input", LogVerbosity::Debug},   {"resolve", LogVerbosity::Debug},
    {"catalog", LogVerbosity::Debug}, {"pipeline", LogVerbosity::Debug},
    {"crypto", LogVerbosity::Debug},  {"ogg", LogVerbosity::Debug},
    {"run", LogVerbosity::Debug},
};

// Short hex dump of key material, file ids and page headers for debug lines.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const uint8_t *data, size_t size,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, size);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    if (size > limit) {
        oss << " ..";
    }
    return oss.str();
}

inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    return hex_prefix(data.data(), data.size(), max_len);
}

}  // namespace oggfetch

inline constexpr oggfetch::LogVerbosity of_severity_for_tag(std::string_view tag) {
    for (const auto &entry : oggfetch::kLogTags) {
        if (entry.name == tag) {
            return entry.severity;
        }
    }
    // Unlisted tags are debug output.
    return oggfetch::LogVerbosity::Debug;
}

inline bool of_should_log(const char *tag) {
    const auto current = oggfetch::get_log_verbosity();
    const auto sev = of_severity_for_tag(tag ? tag : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void of_log_impl(const char *tag, const std::string &msg, const char *file, int line,
                        const char *func) {
    const std::string_view name(tag ? tag : "");
    if (of_severity_for_tag(name) == oggfetch::LogVerbosity::Error) {
        std::cerr << "[OggFetch][" << name << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[OggFetch][" << name << "] " << msg << std::endl;
    }
}

#define OF_LOG(tag, message)                                                \
    do {                                                                    \
        if (of_should_log(tag)) {                                           \
            std::ostringstream _of_log_ss;                                  \
            _of_log_ss << message;                                          \
            of_log_impl(tag, _of_log_ss.str(), __FILE__, __LINE__,          \
                        __func__);                                          \
        }                                                                   \
    } while (0)
