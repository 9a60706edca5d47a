//
//  logging.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace cuescribe {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Maps a CLI level name onto a verbosity; unknown names fall back to Error.
LogVerbosity parse_log_level(std::string_view name);

// Quote-and-truncate helper used in debug logs to show where a document stopped matching.
inline constexpr size_t kTextPreviewChars = 16;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    std::string out = "\"";
    const size_t limit = std::min(max_len, text.size());
    for (size_t i = 0; i < limit; ++i) {
        const char c = text[i];
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else {
            out += c;
        }
    }
    out += '"';
    if (text.size() > limit) {
        out += "...";
    }
    return out;
}

}  // namespace cuescribe

inline constexpr cuescribe::LogVerbosity cs_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return cuescribe::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return cuescribe::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return cuescribe::LogVerbosity::Info;
    }
    // Everything else (io/parser/render/etc.) treated as debug-level.
    return cuescribe::LogVerbosity::Debug;
}

inline bool cs_should_log(const char* level) {
    const auto current = cuescribe::get_log_verbosity();
    const auto sev = cs_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cs_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CueScribe][" << lvl << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CueScribe][" << lvl << "] " << msg << std::endl;
    }
}

#define CS_LOG(level, message)                                              \
    do {                                                                    \
        if (cs_should_log(level)) {                                         \
            std::ostringstream _cs_log_ss;                                  \
            _cs_log_ss << message;                                          \
            cs_log_impl(level, _cs_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
