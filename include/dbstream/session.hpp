/**
 * dbstream/session.hpp - Default writer session metadata
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Every writing stream tags its rows with where and when the session began:
 *   session_ts  UTC timestamp fixed when the stream is constructed
 *   hostname    host the process runs on
 *   pid         process id
 */

#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include <unistd.h>

namespace dbstream::session {

inline constexpr const char* kSessionTs = "session_ts";
inline constexpr const char* kHostname = "hostname";
inline constexpr const char* kPid = "pid";

inline std::string hostname() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return buf;
}

inline std::string pid() {
    return std::to_string(static_cast<long long>(getpid()));
}

// ISO-8601 with milliseconds, e.g. 2026-10-18T09:12:03.250Z
inline std::string timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03dZ", static_cast<int>(ms));
    return std::string(buf, n) + frac;
}

inline SessionMetadata current() {
    return {
        {kSessionTs, timestamp(std::chrono::system_clock::now())},
        {kHostname, hostname()},
        {kPid, pid()},
    };
}

/**
 * Process info overlaid with caller keys. Caller keys win on conflict.
 */
inline SessionMetadata merge(SessionMetadata base, const SessionMetadata& overrides) {
    for (const auto& [key, value] : overrides) {
        base[key] = value;
    }
    return base;
}

} // namespace dbstream::session
