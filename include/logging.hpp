//
//  logging.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
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

namespace qovcheck {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; anything unrecognized maps to Error.
LogVerbosity parse_log_verbosity(const std::string &name);

// Hex-preview helper used in debug logs and reports to dump a short run of raw bytes
// (end marker, header prefix).
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

}  // namespace qovcheck

inline constexpr qovcheck::LogVerbosity qc_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return qovcheck::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return qovcheck::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return qovcheck::LogVerbosity::Info;
    }
    // Everything else (io/walker/compare/etc.) treated as debug-level.
    return qovcheck::LogVerbosity::Debug;
}

inline bool qc_should_log(const char *level) {
    const auto current = qovcheck::get_log_verbosity();
    const auto sev = qc_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void qc_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[QovCheck][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[QovCheck][" << level << "] " << msg << std::endl;
    }
}

#define QC_LOG(level, message)                                              \
    do {                                                                    \
        if (qc_should_log(level)) {                                         \
            std::ostringstream _qc_log_ss;                                  \
            _qc_log_ss << message;                                          \
            qc_log_impl(level, _qc_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
