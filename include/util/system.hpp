#pragma once

/**
 * System utilities for the gateway
 *
 * Provides OS-level utilities for signal handling. Linux-specific
 * implementations.
 */

#include <atomic>
#include <csignal>

namespace mcpgw {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline volatile sig_atomic_t g_last_signal = 0;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Only sets the running flag; the main loop does the logging and the
 * ordered teardown outside signal context.
 */
inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal = sig;
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 */
inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

/// Signal that triggered the shutdown, 0 if none
inline int shutdown_signal() {
    return detail::g_last_signal;
}

/**
 * Writes to a closed pipe or socket must fail with EPIPE instead of
 * terminating the process.
 */
inline void ignore_sigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace util
} // namespace mcpgw
