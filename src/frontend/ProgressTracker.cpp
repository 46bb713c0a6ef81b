/******************************************************************************\
 * ProgressTracker.cpp - Polls running helpers on a timer thread.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <algorithm>
#include <stdexcept>

#include "ProgressTracker.hpp"

namespace ara {

ProgressTracker::~ProgressTracker()
{
    stop();
}

ProgressUpdate
ProgressTracker::poll(Connection& connection, Deployment const& deployment)
{
    auto const status = connection.status(deployment.process);

    auto update = ProgressUpdate{};
    if (!deployment.outputPath.empty()) {
        update.bytesTransferred = connection.fileSize(deployment.outputPath);
    }

    auto const determinate = !deployment.isService() && (deployment.expectedBytes > 0);
    auto const percentDone = [&]() {
        auto const percent = (update.bytesTransferred * 100) / deployment.expectedBytes;
        // 100 is reserved for a clean exit
        return (int)std::min<uint64_t>(percent, 99);
    };

    if (status.running) {
        update.status = ProgressStatus::Running;
        update.percent = determinate ? percentDone() : -1;
    } else if (!deployment.isService() && (status.exitCode == 0)) {
        update.status = ProgressStatus::Completed;
        update.percent = 100;
        update.exitCode = 0;
    } else {
        // services never exit on their own, tasks failed
        update.status = ProgressStatus::Exited;
        update.percent = determinate ? percentDone() : -1;
        update.exitCode = status.exitCode;
    }

    return update;
}

void
ProgressTracker::trackerLoop(Connection& connection, std::vector<Deployment> const& deployments,
    UpdateCallback onUpdate, StallCallback onStalled, CancelToken const& cancel)
{
    auto finished = std::vector<bool>(deployments.size(), false);
    auto failures = 0;

    while (!cancel.cancelled()) {
        auto tickFailed = false;
        for (size_t i = 0; i < deployments.size(); i++) {
            if (finished[i]) {
                continue;
            }
            try {
                auto const update = poll(connection, deployments[i]);
                if (update.status != ProgressStatus::Running) {
                    finished[i] = true;
                }
                onUpdate(i, update);
            } catch (std::exception const& ex) {
                m_log.write("%s: progress poll of %s failed: %s\n", connection.host().c_str(),
                    deployments[i].describe().c_str(), ex.what());
                tickFailed = true;
                break;
            }
        }

        if (tickFailed) {
            failures++;
            if (failures >= m_config.stallThreshold) {
                onStalled(Outcome{ARA_ERR_ACQUISITION_STALLED, "no progress from " + connection.host()
                    + " after " + std::to_string(failures) + " consecutive failed polls"});
                break;
            }
        } else {
            failures = 0;
        }

        if (std::all_of(finished.begin(), finished.end(), [](bool done) { return done; })) {
            break;
        }

        std::unique_lock<std::mutex> lock{m_mutex};
        if (m_cv.wait_for(lock, m_config.pollInterval, [this]() { return m_stopRequested; })) {
            break;
        }
    }

    m_running = false;
}

void
ProgressTracker::start(Connection& connection, std::vector<Deployment> const& deployments,
    UpdateCallback onUpdate, StallCallback onStalled, CancelToken const& cancel)
{
    if (m_thread.joinable()) {
        throw std::logic_error("progress tracker is already running");
    }

    { std::lock_guard<std::mutex> lock{m_mutex};
        m_stopRequested = false;
    }
    m_running = true;
    m_thread = std::thread{&ProgressTracker::trackerLoop, this, std::ref(connection), std::cref(deployments),
        std::move(onUpdate), std::move(onStalled), std::cref(cancel)};
}

void
ProgressTracker::stop()
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_stopRequested = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

} /* namespace ara */
