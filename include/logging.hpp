//
//  logging.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "byte_io.hpp"

namespace pgsforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide verbosity shared by the decoder, the encoder and the CLI.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// "error", "warn"/"warning", "info" or "debug"; nullopt for anything else.
std::optional<LogVerbosity> parse_log_verbosity(std::string_view name);

// First bytes of a segment payload as "50 47 ..." for debug logs.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(ByteView bytes, size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, bytes.size);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace pgsforge

inline constexpr pgsforge::LogVerbosity pf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return pgsforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return pgsforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return pgsforge::LogVerbosity::Info;
    }
    // Component tags ("pgs", "rle", "encoder", "io") are per-segment chatter.
    return pgsforge::LogVerbosity::Debug;
}

inline bool pf_should_log(const char *level) {
    const auto current = pgsforge::get_log_verbosity();
    const auto sev = pf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void pf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[PgsForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[PgsForge][" << level << "] " << msg << std::endl;
    }
}

#define PF_LOG(level, message)                                              \
    do {                                                                    \
        if (pf_should_log(level)) {                                         \
            std::ostringstream _pf_log_ss;                                  \
            _pf_log_ss << message;                                          \
            pf_log_impl(level, _pf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
