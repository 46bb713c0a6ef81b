/******************************************************************************\
 * AcquisitionSession.hpp - State machine driving one acquisition against one
 *                          target.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Config.hpp"
#include "Connection.hpp"
#include "ConnectionManager.hpp"
#include "ServiceDeployer.hpp"
#include "ProgressTracker.hpp"
#include "CleanupCoordinator.hpp"
#include "CancelToken.hpp"
#include "Interfaces.hpp"
#include "Model.hpp"

#include "useful/ara_log.h"

namespace ara {

// What a caller asks for
struct SessionRequest {
    Target target;
    std::vector<HelperRequest> helpers;
    std::chrono::milliseconds connectTimeout{0}; // 0 uses the configured timeout
};

// External services a session reports to
struct SessionContext {
    Config const& config;
    Transport& transport;
    ArtifactStore& artifactStore;
    SessionObserver& observer;
    Logger& log;
};

/*
** An AcquisitionSession connects to its target, deploys the requested
** helpers one after the other, tracks them while they run and tears all of
** it down again. The whole sequence runs on one worker task started by
** start(). Every other member function may be called from any thread.
**
** State changes are published to the observer on the thread that made them.
** The session only rests in CLEANED, FAILED or FAILED_CLEANUP, and never
** enters one of them before cleanup was attempted for everything it created.
*/
class AcquisitionSession {
private: // members
    SessionId const m_id;
    Target const m_target;
    std::vector<HelperRequest> const m_helpers;
    std::chrono::milliseconds const m_connectTimeout;
    SessionContext m_context;

    ConnectionManager m_connectionManager;
    ServiceDeployer m_deployer;
    CleanupCoordinator m_cleanup;
    ProgressTracker m_tracker;
    CancelToken m_cancel;

    // only touched by the worker, released once CONNECTING is over
    std::unique_ptr<CredentialSource> m_credentialSource;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;

    // guarded by m_mutex
    ara_session_state_t m_state = ARA_STATE_INIT;
    std::optional<Outcome> m_error;
    std::optional<Outcome> m_cause;       // why the session stopped or failed
    int m_progress = -1;
    bool m_stopRequested = false;
    bool m_cancelRequested = false;
    bool m_failurePath = false;
    bool m_started = false;
    bool m_finished = false;
    bool m_cleanupBusy = false;
    std::optional<Outcome> m_runFailure;  // stall or unexpected exit while RUNNING
    bool m_tasksDone = false;
    std::vector<ProgressUpdate> m_updates;
    SessionResources m_resources;
    std::vector<ArtifactDescriptor> m_artifacts;
    CleanupResult m_lastCleanup;
    Clock::time_point const m_createdAt;
    std::optional<Clock::time_point> m_endedAt;

    std::future<void> m_worker;

private: // functions
    void run();
    void runStages();

    // move to newState and publish the change
    void transition(ara_session_state_t newState, std::optional<Outcome> error = std::nullopt);

    // each returns once a resting state is reached
    void stopAndClean(std::optional<Outcome> cause);
    void failAndClean(Outcome const& cause);

    CleanupResult runCleanup();
    bool stopWanted() const;
    // cause recorded for a stop, only set if the user cancelled
    std::optional<Outcome> stopCause(std::optional<Outcome> const& aborted) const;

    // tracker callbacks, tracker thread
    void handleUpdate(size_t index, ProgressUpdate const& update);
    void handleStall(Outcome const& outcome);

    void fetchArtifacts(Connection& connection);

public: // interface
    SessionId id() const { return m_id; }
    Target const& target() const { return m_target; }

    // Start the worker. Only valid once.
    void start();

    // Ask the session to wind down. In-flight steps are aborted at their next
    // suspension point. Returns false if the session is already resting.
    bool stop();

    // As stop(), but the session records UserCancelled.
    bool cancel();

    // Block until the worker has finished. Throws std::logic_error when
    // called from the session's own worker, such as from a state observer.
    void wait() const;

    // true once the worker has returned from its final transition
    bool finished() const;

    // The session whose worker is running on the calling thread, or null
    static AcquisitionSession const* current();

    /*
     * retryCleanup - Run cleanup again for a session left in FAILED_CLEANUP
     *
     * Detail
     *      Runs on the calling thread. On full success the session moves to
     *      CLEANED, or to FAILED if it originally failed. Otherwise it stays
     *      in FAILED_CLEANUP with the remaining items.
     *
     * Throws
     *      std::logic_error if the session is not resting in FAILED_CLEANUP
     */
    CleanupResult retryCleanup();

    ara_session_state_t state() const;
    int progress() const;
    std::optional<Outcome> error() const;
    std::vector<Deployment> deployments() const;
    std::vector<ArtifactDescriptor> artifacts() const;
    CleanupResult lastCleanup() const;
    Clock::time_point createdAt() const { return m_createdAt; }
    std::optional<Clock::time_point> endedAt() const;

    // true while deployments remain on the target
    bool residualState() const;

    // One line describing where the session is
    std::string summary() const;

public: // Constructor/destructors
    AcquisitionSession(SessionId id, SessionRequest request, std::unique_ptr<CredentialSource> credentialSource,
        SessionContext context);
    ~AcquisitionSession();
    AcquisitionSession(const AcquisitionSession&) = delete;
    AcquisitionSession& operator=(const AcquisitionSession&) = delete;
    AcquisitionSession(AcquisitionSession&&) = delete;
    AcquisitionSession& operator=(AcquisitionSession&&) = delete;
};

} /* namespace ara */
