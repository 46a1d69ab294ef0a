#pragma once

#include <chrono>
#include <mutex>
#include <thread>
#include <libssh2.h>
#include <core/constants.hpp>

// The session runs non-blocking: every libssh2 call may return
// LIBSSH2_ERROR_EAGAIN and has to be retried. Each attempt takes the session's
// I/O lock only for the call itself, so other users of the same session can
// interleave between attempts.
//
// Returns the last return code; LIBSSH2_ERROR_EAGAIN means the deadline passed.
template <typename Fn>
int retry_eagain(std::mutex& io_mutex,
                 std::chrono::steady_clock::time_point deadline,
                 Fn&& fn) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = static_cast<int>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (std::chrono::steady_clock::now() >= deadline) return rc;
        std::this_thread::sleep_for(std::chrono::milliseconds(EAGAIN_SLEEP_MS));
    }
}

// Same, for libssh2 calls that return a pointer and signal EAGAIN through
// libssh2_session_last_errno(). Returns nullptr on failure or timeout.
template <typename T, typename Fn>
T* retry_eagain_ptr(std::mutex& io_mutex, LIBSSH2_SESSION* session,
                    std::chrono::steady_clock::time_point deadline,
                    Fn&& fn) {
    while (true) {
        T* p;
        int err;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            p = fn();
            err = p ? 0 : libssh2_session_last_errno(session);
        }
        if (p) return p;
        if (err != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (std::chrono::steady_clock::now() >= deadline) return nullptr;
        std::this_thread::sleep_for(std::chrono::milliseconds(EAGAIN_SLEEP_MS));
    }
}

inline std::chrono::steady_clock::time_point deadline_after_secs(int secs) {
    return std::chrono::steady_clock::now() + std::chrono::seconds(secs);
}

inline std::chrono::steady_clock::time_point deadline_after_ms(int ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}
