/******************************************************************************\
 * Frontend.hpp - Entry point that owns the active sessions of a process.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "AcquisitionSession.hpp"
#include "Config.hpp"
#include "Connection.hpp"
#include "ConnectionManager.hpp"
#include "Interfaces.hpp"
#include "Model.hpp"

#include "useful/ara_log.h"

namespace ara {

// At most one active session per target identity. The lock only guards
// insert and remove.
class ActiveSessionRegistry {
private: // members
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, SessionId> m_active;

public: // interface
    // Throws DuplicateSessionError if identity already has a session
    void insert(std::string const& identity, SessionId sessionId);
    // Drop the entry held by sessionId, if any
    void remove(SessionId sessionId);
    bool contains(std::string const& identity) const;
    size_t size() const;
};

/*
** The Frontend creates sessions, keeps them reachable by id until they are
** released, and fans their events out to every registered observer. A target
** stays claimed by its session until the session is CLEANED, FAILED without
** anything left behind, or released.
*/
class Frontend : public SessionObserver {
private: // members
    Config const& m_config;
    Transport& m_transport;
    ArtifactStore& m_artifactStore;
    Logger& m_log;

    ConnectionManager m_connectionManager;
    ActiveSessionRegistry m_registry;
    std::atomic<SessionId> m_lastId{0};

    std::mutex m_mutex;
    std::unordered_map<SessionId, std::shared_ptr<AcquisitionSession>> m_sessions;
    // released from their own state callback, kept until their worker returns
    std::vector<std::shared_ptr<AcquisitionSession>> m_retired;

    std::mutex m_observerMutex;
    std::vector<SessionObserver*> m_observers;

private: // functions
    std::shared_ptr<AcquisitionSession> findSession(SessionId sessionId);
    void reapRetired();

public: // SessionObserver
    void onStateChange(SessionEvent const& event) override;
    void onProgress(SessionId sessionId, int percent) override;

public: // interface
    // Observers must outlive the Frontend or be removed first
    void addObserver(SessionObserver& observer);
    void removeObserver(SessionObserver& observer);

    /*
     * requestSession - Create and start a session
     *
     * Detail
     *      The target is claimed before anything else happens. The credential
     *      source is handed to the session, which drops it once connected.
     *
     * Throws
     *      DuplicateSessionError if the target already has an active session,
     *      std::runtime_error for a malformed request
     */
    std::shared_ptr<AcquisitionSession>
    requestSession(SessionRequest request, std::unique_ptr<CredentialSource> credentialSource);

    // Throws std::runtime_error for an unknown or released id
    std::shared_ptr<AcquisitionSession> getSession(SessionId sessionId);

    bool stopSession(SessionId sessionId);
    bool cancelSession(SessionId sessionId);
    CleanupResult retryCleanup(SessionId sessionId);

    // Forget a resting session. A session still holding remote state gives
    // up its claim on the target with a warning. May be called from the
    // session's own state callback.
    void releaseSession(SessionId sessionId);

    // Copy of target with its reachability filled in
    Target probe(Target const& target, std::chrono::milliseconds timeout);

    bool isActive(std::string const& address) const { return m_registry.contains(targetIdentity(address)); }

    // Cancel every session and wait for all of them to come to rest. Returns
    // false if any of them left state behind. Throws std::logic_error when
    // called from a session's state callback.
    bool finalize();

public: // Constructor/destructors
    Frontend(Config const& config, Transport& transport, ArtifactStore& artifactStore, Logger& log);
    ~Frontend();
    Frontend(const Frontend&) = delete;
    Frontend& operator=(const Frontend&) = delete;
    Frontend(Frontend&&) = delete;
    Frontend& operator=(Frontend&&) = delete;
};

} /* namespace ara */
