/******************************************************************************\
 * CancelToken.hpp - Cooperative cancellation shared by one session and the
 *                   components working on its behalf.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "Errors.hpp"

namespace ara {

class CancelToken {
private: // variables
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;

public: // interface
    // Request cancellation and wake every waiter
    void cancel()
    {
        { std::lock_guard<std::mutex> lock{m_mutex};
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool cancelled() const { return m_cancelled.load(); }

    // Sleep for the given duration unless cancelled first. Returns true if
    // the token was cancelled.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> const& duration) const
    {
        std::unique_lock<std::mutex> lock{m_mutex};
        return m_cv.wait_for(lock, duration, [this]() { return m_cancelled.load(); });
    }

    // Suspension point: raise UserCancelled if cancellation was requested
    void throwIfCancelled(std::string const& where) const
    {
        if (cancelled()) {
            throw UserCancelled{"cancelled during " + where};
        }
    }

public: // Constructor/destructors
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;
    CancelToken(CancelToken&&) = delete;
    CancelToken& operator=(CancelToken&&) = delete;
};

} /* namespace ara */
