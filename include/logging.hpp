//
//  logging.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace webpforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI level name onto a verbosity; unknown names fall back to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (e.g. VP8L).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace webpforge

inline constexpr webpforge::LogVerbosity wf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return webpforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return webpforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return webpforge::LogVerbosity::Info;
    }
    // Everything else (io/inspect/writer/etc.) treated as debug-level.
    return webpforge::LogVerbosity::Debug;
}

inline bool wf_should_log(const char *level) {
    const auto current = webpforge::get_log_verbosity();
    const auto sev = wf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void wf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[WebPForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[WebPForge][" << level << "] " << msg << std::endl;
    }
}

#define WF_LOG(level, message)                                              \
    do {                                                                    \
        if (wf_should_log(level)) {                                         \
            std::ostringstream _wf_log_ss;                                  \
            _wf_log_ss << message;                                          \
            wf_log_impl(level, _wf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
