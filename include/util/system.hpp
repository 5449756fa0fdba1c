#pragma once

/**
 * Process signal handling for the long-running engine
 */

#include <atomic>
#include <csignal>

namespace fxsig {
namespace util {

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline void (*g_pre_shutdown_callback)() = nullptr;
} // namespace detail

/**
 * Sets the running flag to false after the optional pre-shutdown callback.
 * Only async-signal-safe work happens here; the loop logs the shutdown.
 */
inline void graceful_shutdown_handler(int) {
    if (detail::g_pre_shutdown_callback) {
        detail::g_pre_shutdown_callback();
    }
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 * @param pre_shutdown Optional callback to invoke before setting flag
 */
inline void install_shutdown_handler(std::atomic<bool>& running, void (*pre_shutdown)() = nullptr) {
    detail::g_running_flag = &running;
    detail::g_pre_shutdown_callback = pre_shutdown;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

} // namespace util
} // namespace fxsig
