/******************************************************************************\
 * ProgressTracker.hpp - Polls running helpers on a timer thread.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "Config.hpp"
#include "Connection.hpp"
#include "CancelToken.hpp"
#include "Model.hpp"

#include "useful/ara_log.h"

namespace ara {

class ProgressTracker {
public: // types
    // index into the tracked deployments and its latest state
    using UpdateCallback = std::function<void(size_t index, ProgressUpdate const& update)>;
    // too many consecutive polls failed, the tracker has stopped
    using StallCallback = std::function<void(Outcome const& outcome)>;

private: // members
    Config const& m_config;
    Logger& m_log;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;

private: // functions
    void trackerLoop(Connection& connection, std::vector<Deployment> const& deployments,
        UpdateCallback onUpdate, StallCallback onStalled, CancelToken const& cancel);

public: // interface
    // Query one deployment. Throws if the connection fails.
    ProgressUpdate poll(Connection& connection, Deployment const& deployment);

    /*
     * start - Begin polling on a background thread
     *
     * Detail
     *      Every pollInterval each unfinished deployment is polled and the
     *      result passed to onUpdate. A deployment is finished once it
     *      reports Completed or Exited. A failed tick is logged and retried
     *      on the next one; stallThreshold failures in a row call onStalled
     *      and end the thread. Connection and deployments must not be used
     *      elsewhere until stop() returns.
     */
    void start(Connection& connection, std::vector<Deployment> const& deployments,
        UpdateCallback onUpdate, StallCallback onStalled, CancelToken const& cancel);

    // Stop polling and join the thread. Safe to repeat.
    void stop();

    bool running() const { return m_running.load(); }

public: // Constructor/destructors
    ProgressTracker(Config const& config, Logger& log)
        : m_config{config}
        , m_log{log}
    {}
    ~ProgressTracker();
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;
    ProgressTracker(ProgressTracker&&) = delete;
    ProgressTracker& operator=(ProgressTracker&&) = delete;
};

} /* namespace ara */
