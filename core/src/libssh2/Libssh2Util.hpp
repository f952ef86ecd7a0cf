// Retry helpers for libssh2 calls made on a non-blocking session.
#pragma once
#include "sshdeck/Libssh2Transport.hpp"
#include <libssh2.h>
#include <mutex>

namespace sshdeck {
namespace ssh2 {

// Calls fn() under the transport mutex until it stops returning EAGAIN.
// Returns false (err set by waitSocket) when the wait was cut short;
// otherwise rc holds the final return code.
template <typename Fn>
bool callRetry(Libssh2Transport& t, Libssh2Transport::Deadline deadline, long& rc,
               Error& err, Fn&& fn) {
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(t.mutex());
            rc = (long)fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return true;
        if (!t.waitSocket(deadline, err)) return false;
    }
}

// Same for calls that return a handle and report EAGAIN through the session errno.
// Returns nullptr with err clear when the call itself failed.
template <typename T, typename Fn>
T* callRetryPtr(Libssh2Transport& t, Libssh2Transport::Deadline deadline, Error& err,
                Fn&& fn) {
    for (;;) {
        T* p = nullptr;
        int e = 0;
        {
            std::lock_guard<std::mutex> lk(t.mutex());
            p = fn();
            if (!p) e = libssh2_session_last_errno(t.session());
        }
        if (p) return p;
        if (e != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (!t.waitSocket(deadline, err)) return nullptr;
    }
}

} // namespace ssh2
} // namespace sshdeck
