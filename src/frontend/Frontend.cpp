/******************************************************************************\
 * Frontend.cpp - Entry point that owns the active sessions of a process.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <stdio.h>

#include <algorithm>
#include <stdexcept>

#include "Frontend.hpp"

namespace ara {

/* ActiveSessionRegistry */

void
ActiveSessionRegistry::insert(std::string const& identity, SessionId sessionId)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    auto const [entry, inserted] = m_active.emplace(identity, sessionId);
    if (!inserted) {
        throw DuplicateSessionError("target " + identity + " already has active session "
            + std::to_string(entry->second));
    }
}

void
ActiveSessionRegistry::remove(SessionId sessionId)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    for (auto entry = m_active.begin(); entry != m_active.end(); ++entry) {
        if (entry->second == sessionId) {
            m_active.erase(entry);
            return;
        }
    }
}

bool
ActiveSessionRegistry::contains(std::string const& identity) const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_active.find(identity) != m_active.end();
}

size_t
ActiveSessionRegistry::size() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_active.size();
}

/* Frontend */

static void
verifyRequest(SessionRequest const& request)
{
    if (request.target.identity().empty()) {
        throw std::runtime_error("session request has no target address");
    }
    if (request.helpers.empty()) {
        throw std::runtime_error("session request for " + request.target.address + " names no helpers");
    }
    for (auto&& helper : request.helpers) {
        if ((helper.kind < ARA_HELPER_FILE_BROWSER) || (helper.kind > ARA_HELPER_PROCESS_DUMPER)) {
            throw std::runtime_error("invalid ara_helper_kind_t " + std::to_string((int)helper.kind));
        }
        if (helper.binaryPath.empty()) {
            throw std::runtime_error(std::string{helperKindName(helper.kind)} + " helper has no binary");
        }
        if (helper.isService()) {
            if ((helper.port <= 0) || (helper.port > 65535)) {
                throw std::runtime_error(std::string{helperKindName(helper.kind)} + " helper has invalid port "
                    + std::to_string(helper.port));
            }
        } else {
            if (helper.port != 0) {
                throw std::runtime_error(std::string{helperKindName(helper.kind)} + " helper does not listen, "
                    "port " + std::to_string(helper.port) + " given");
            }
            if (helper.outputName.empty()) {
                throw std::runtime_error(std::string{helperKindName(helper.kind)} + " helper has no output name");
            }
        }
    }
}

Frontend::Frontend(Config const& config, Transport& transport, ArtifactStore& artifactStore, Logger& log)
    : m_config{config}
    , m_transport{transport}
    , m_artifactStore{artifactStore}
    , m_log{log}
    , m_connectionManager{config, transport, log}
    , m_registry{}
    , m_sessions{}
    , m_observers{}
{}

Frontend::~Frontend()
{
    try {
        finalize();
    } catch (std::exception const& ex) {
        fprintf(stderr, "warning: %s\n", ex.what());
    }
}

void
Frontend::addObserver(SessionObserver& observer)
{
    std::lock_guard<std::mutex> lock{m_observerMutex};
    m_observers.push_back(&observer);
}

void
Frontend::removeObserver(SessionObserver& observer)
{
    std::lock_guard<std::mutex> lock{m_observerMutex};
    m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), &observer), m_observers.end());
}

std::shared_ptr<AcquisitionSession>
Frontend::findSession(SessionId sessionId)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    auto const session = m_sessions.find(sessionId);
    return (session != m_sessions.end()) ? session->second : nullptr;
}

void
Frontend::reapRetired()
{
    auto finished = std::vector<std::shared_ptr<AcquisitionSession>>{};
    { std::lock_guard<std::mutex> lock{m_mutex};
        auto const current = AcquisitionSession::current();
        auto keep = std::vector<std::shared_ptr<AcquisitionSession>>{};
        for (auto&& session : m_retired) {
            if ((session.get() != current) && session->finished()) {
                finished.push_back(std::move(session));
            } else {
                keep.push_back(std::move(session));
            }
        }
        m_retired.swap(keep);
    }
    // destroyed here, outside the lock, joining each worker
}

void
Frontend::onStateChange(SessionEvent const& event)
{
    // Give up the target once nothing is left on it
    if (event.newState == ARA_STATE_CLEANED) {
        m_registry.remove(event.sessionId);
    } else if (event.newState == ARA_STATE_FAILED) {
        auto const session = findSession(event.sessionId);
        if (!session || !session->residualState()) {
            m_registry.remove(event.sessionId);
        }
    }

    auto observers = std::vector<SessionObserver*>{};
    { std::lock_guard<std::mutex> lock{m_observerMutex};
        observers = m_observers;
    }
    for (auto&& observer : observers) {
        observer->onStateChange(event);
    }
}

void
Frontend::onProgress(SessionId sessionId, int percent)
{
    auto observers = std::vector<SessionObserver*>{};
    { std::lock_guard<std::mutex> lock{m_observerMutex};
        observers = m_observers;
    }
    for (auto&& observer : observers) {
        observer->onProgress(sessionId, percent);
    }
}

std::shared_ptr<AcquisitionSession>
Frontend::requestSession(SessionRequest request, std::unique_ptr<CredentialSource> credentialSource)
{
    reapRetired();

    verifyRequest(request);

    auto const sessionId = ++m_lastId;
    auto const identity = request.target.identity();

    try {
        m_registry.insert(identity, sessionId);
    } catch (DuplicateSessionError const& ex) {
        m_log.write("rejected session request: %s\n", ex.what());
        throw;
    }

    try {
        auto session = std::make_shared<AcquisitionSession>(sessionId, std::move(request),
            std::move(credentialSource), SessionContext{m_config, m_transport, m_artifactStore, *this, m_log});
        { std::lock_guard<std::mutex> lock{m_mutex};
            m_sessions.emplace(sessionId, session);
        }
        m_log.write("session %lld: created for %s\n", (long long)sessionId, identity.c_str());

        session->start();
        return session;

    } catch (std::exception const&) {
        { std::lock_guard<std::mutex> lock{m_mutex};
            m_sessions.erase(sessionId);
        }
        m_registry.remove(sessionId);
        throw;
    }
}

std::shared_ptr<AcquisitionSession>
Frontend::getSession(SessionId sessionId)
{
    if (auto session = findSession(sessionId)) {
        return session;
    }
    throw std::runtime_error("session " + std::to_string(sessionId) + " is invalid");
}

bool
Frontend::stopSession(SessionId sessionId)
{
    return getSession(sessionId)->stop();
}

bool
Frontend::cancelSession(SessionId sessionId)
{
    return getSession(sessionId)->cancel();
}

CleanupResult
Frontend::retryCleanup(SessionId sessionId)
{
    return getSession(sessionId)->retryCleanup();
}

void
Frontend::releaseSession(SessionId sessionId)
{
    auto session = std::shared_ptr<AcquisitionSession>{};
    { std::lock_guard<std::mutex> lock{m_mutex};
        auto const entry = m_sessions.find(sessionId);
        if (entry == m_sessions.end()) {
            throw std::runtime_error("session " + std::to_string(sessionId) + " is invalid");
        }
        if (!isResting(entry->second->state())) {
            throw std::runtime_error("session " + std::to_string(sessionId) + " is still "
                + stateName(entry->second->state()) + ", stop it first");
        }
        session = entry->second;
        m_sessions.erase(entry);
    }

    if (AcquisitionSession::current() == session.get()) {
        // released from its own state callback, the worker is still unwinding
        std::lock_guard<std::mutex> lock{m_mutex};
        m_retired.push_back(session);
    } else {
        // the worker may still be publishing its last event
        session->wait();
        reapRetired();
    }

    if (session->residualState()) {
        fprintf(stderr, "warning: %s\n", session->summary().c_str());
        m_log.write("warning: released with residual state: %s\n", session->summary().c_str());
    }
    m_registry.remove(sessionId);
}

Target
Frontend::probe(Target const& target, std::chrono::milliseconds timeout)
{
    return m_connectionManager.probe(target, timeout);
}

bool
Frontend::finalize()
{
    if (AcquisitionSession::current() != nullptr) {
        throw std::logic_error("sessions cannot be finalized from a session state callback");
    }

    auto sessions = std::vector<std::shared_ptr<AcquisitionSession>>{};
    auto retired = std::vector<std::shared_ptr<AcquisitionSession>>{};
    { std::lock_guard<std::mutex> lock{m_mutex};
        for (auto&& entry : m_sessions) {
            sessions.push_back(entry.second);
        }
        retired.swap(m_retired);
    }
    for (auto&& session : retired) {
        session->wait();
    }

    for (auto&& session : sessions) {
        session->cancel();
    }
    auto clean = true;
    for (auto&& session : sessions) {
        session->wait();
        if (session->residualState()) {
            fprintf(stderr, "warning: %s\n", session->summary().c_str());
            clean = false;
        }
    }
    return clean;
}

} /* namespace ara */
