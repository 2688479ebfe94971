#pragma once

/**
 * Time utilities for the gateway
 *
 * Provides consistent timestamp generation across all components.
 * Uses steady_clock for monotonic uptime and system_clock for the
 * wall-clock timestamps reported to clients.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace mcpgw {
namespace util {

/**
 * Returns current time in milliseconds since steady_clock epoch.
 * Used for uptime and elapsed-time measurement.
 */
inline uint64_t now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Current UTC time as ISO-8601 with milliseconds, e.g.
 * "2024-11-05T12:34:56.789Z".
 */
inline std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
    return buf;
}

}  // namespace util
}  // namespace mcpgw
