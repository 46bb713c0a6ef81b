/******************************************************************************\
 * AcquisitionSession.cpp - State machine driving one acquisition against one
 *                          target.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <stdio.h>

#include <stdexcept>

#include "AcquisitionSession.hpp"

namespace ara {

// set for the lifetime of a session's worker thread
static thread_local AcquisitionSession const* t_currentSession = nullptr;

static Outcome
cleanupOutcome(CleanupResult const& result)
{
    return Outcome{ARA_ERR_CLEANUP_FAILURE, "cleanup incomplete: " + result.describe()};
}

AcquisitionSession::AcquisitionSession(SessionId id, SessionRequest request,
    std::unique_ptr<CredentialSource> credentialSource, SessionContext context)
    : m_id{id}
    , m_target{std::move(request.target)}
    , m_helpers{std::move(request.helpers)}
    , m_connectTimeout{(request.connectTimeout.count() > 0) ? request.connectTimeout : context.config.connectTimeout}
    , m_context{context}
    , m_connectionManager{m_context.config, m_context.transport, m_context.log}
    , m_deployer{m_context.config, m_context.log}
    , m_cleanup{m_context.config, m_deployer, m_connectionManager, m_context.log}
    , m_tracker{m_context.config, m_context.log}
    , m_cancel{}
    , m_credentialSource{std::move(credentialSource)}
    , m_createdAt{Clock::now()}
{
    if (!m_credentialSource) {
        throw std::logic_error("session " + std::to_string(m_id) + " has no credential source");
    }
}

AcquisitionSession::~AcquisitionSession()
{
    if (m_worker.valid()) {
        cancel();
        m_worker.wait();
    }
}

void
AcquisitionSession::start()
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        if (m_started) {
            throw std::logic_error("session " + std::to_string(m_id) + " was already started");
        }
        m_started = true;
    }

    m_worker = std::async(std::launch::async, &AcquisitionSession::run, this);
}

bool
AcquisitionSession::stop()
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        if (m_finished || isResting(m_state)) {
            return false;
        }
        m_stopRequested = true;
    }
    m_cancel.cancel();
    m_cv.notify_all();

    m_context.log.write("session %lld: stop requested\n", (long long)m_id);
    return true;
}

bool
AcquisitionSession::cancel()
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        if (m_finished || isResting(m_state)) {
            return false;
        }
        m_stopRequested = true;
        m_cancelRequested = true;
    }
    m_cancel.cancel();
    m_cv.notify_all();

    m_context.log.write("session %lld: cancel requested\n", (long long)m_id);
    return true;
}

void
AcquisitionSession::wait() const
{
    if (t_currentSession == this) {
        throw std::logic_error("session " + std::to_string(m_id) + " cannot be waited on from its own state callback");
    }
    std::unique_lock<std::mutex> lock{m_mutex};
    m_cv.wait(lock, [this]() { return !m_started || m_finished; });
}

bool
AcquisitionSession::finished() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_finished;
}

AcquisitionSession const*
AcquisitionSession::current()
{
    return t_currentSession;
}

void
AcquisitionSession::transition(ara_session_state_t newState, std::optional<Outcome> error)
{
    auto event = SessionEvent{};
    { std::lock_guard<std::mutex> lock{m_mutex};
        event.oldState = m_state;
        m_state = newState;
        if (error) {
            m_error = std::move(error);
        }
        if (isResting(newState)) {
            m_endedAt = Clock::now();
        }

        event.sessionId = m_id;
        event.newState = newState;
        event.progress = m_progress;
        event.error = m_error;
    }
    m_cv.notify_all();

    m_context.log.write("session %lld: %s -> %s%s%s\n", (long long)m_id, stateName(event.oldState),
        stateName(event.newState), event.error ? ": " : "", event.error ? event.error->message.c_str() : "");

    try {
        m_context.observer.onStateChange(event);
    } catch (std::exception const& ex) {
        fprintf(stderr, "warning: state change observer failed: %s\n", ex.what());
        m_context.log.write("warning: state change observer failed: %s\n", ex.what());
    }
}

bool
AcquisitionSession::stopWanted() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_stopRequested;
}

std::optional<Outcome>
AcquisitionSession::stopCause(std::optional<Outcome> const& aborted) const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    if (!m_cancelRequested) {
        return std::nullopt;
    }
    if (aborted && (aborted->kind == ARA_ERR_USER_CANCELLED)) {
        return aborted;
    }
    return Outcome{ARA_ERR_USER_CANCELLED, "session cancelled by user"};
}

CleanupResult
AcquisitionSession::runCleanup()
{
    // nothing else may use the connection while it is torn down
    m_tracker.stop();

    auto resources = SessionResources{};
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_cleanupBusy = true;
        resources.connection = std::move(m_resources.connection);
        resources.deployments = m_resources.deployments;
    }

    auto const result = m_cleanup.cleanup(resources);

    { std::lock_guard<std::mutex> lock{m_mutex};
        m_resources.connection = std::move(resources.connection);
        m_resources.deployments = std::move(resources.deployments);
        m_lastCleanup = result;
        m_cleanupBusy = false;
    }

    return result;
}

void
AcquisitionSession::stopAndClean(std::optional<Outcome> cause)
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_cause = cause;
    }
    transition(ARA_STATE_STOPPING, cause);

    auto const result = runCleanup();
    if (result.fullySucceeded) {
        transition(ARA_STATE_CLEANED);
    } else {
        transition(ARA_STATE_FAILED_CLEANUP, cleanupOutcome(result));
    }
}

void
AcquisitionSession::failAndClean(Outcome const& cause)
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_cause = cause;
        m_failurePath = true;
    }

    // FAILED is only entered once everything was torn down or tried
    auto const result = runCleanup();
    transition(ARA_STATE_FAILED, cause);
    if (!result.fullySucceeded) {
        transition(ARA_STATE_FAILED_CLEANUP, cleanupOutcome(result));
    }
}

void
AcquisitionSession::handleUpdate(size_t index, ProgressUpdate const& update)
{
    // deployments do not change while the tracker runs
    auto const& deployments = m_resources.deployments;

    auto progress = -1;
    auto changed = false;
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_updates[index] = update;

        if ((update.status == ProgressStatus::Exited) && !m_runFailure) {
            m_runFailure = Outcome{ARA_ERR_DEPLOYMENT_FAILURE, deployments[index].describe()
                + " exited unexpectedly with code " + std::to_string(update.exitCode)};
        }

        // overall progress is the mean of the task helpers with a known size
        auto sum = 0;
        auto count = 0;
        auto anyService = false;
        auto allTasksDone = true;
        for (size_t i = 0; i < deployments.size(); i++) {
            if (deployments[i].isService()) {
                anyService = true;
                continue;
            }
            if (m_updates[i].status != ProgressStatus::Completed) {
                allTasksDone = false;
            }
            if (m_updates[i].percent >= 0) {
                sum += m_updates[i].percent;
                count++;
            }
        }
        progress = (count > 0) ? (sum / count) : -1;
        changed = (progress != m_progress);
        m_progress = progress;

        if (!anyService && allTasksDone) {
            m_tasksDone = true;
        }
    }
    m_cv.notify_all();

    if (changed) {
        try {
            m_context.observer.onProgress(m_id, progress);
        } catch (std::exception const& ex) {
            m_context.log.write("warning: progress observer failed: %s\n", ex.what());
        }
    }
}

void
AcquisitionSession::handleStall(Outcome const& outcome)
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        if (!m_runFailure) {
            m_runFailure = outcome;
        }
    }
    m_cv.notify_all();
}

void
AcquisitionSession::fetchArtifacts(Connection& connection)
{
    for (auto&& deployment : m_resources.deployments) {
        if (deployment.isService() || !deployment.completed || deployment.outputPath.empty()) {
            continue;
        }

        auto const artifact = m_deployer.fetchArtifact(connection, deployment, m_context.config.evidenceDir, m_id);
        m_context.artifactStore.recordArtifact(m_id, artifact);

        std::lock_guard<std::mutex> lock{m_mutex};
        m_artifacts.push_back(artifact);
    }
}

void
AcquisitionSession::runStages()
{
    transition(ARA_STATE_CONNECTING);

    auto connection = std::unique_ptr<Connection>{};
    auto const connected = runStep(ARA_ERR_NETWORK_UNREACHABLE, [&]() {
        // the source, and the credential it hands out, end with this step
        auto credentialSource = std::move(m_credentialSource);
        m_cancel.throwIfCancelled("connect to " + m_target.address);
        connection = m_connectionManager.connect(m_target, credentialSource->acquire(m_target),
            m_connectTimeout, m_cancel);
    });
    if (connection) {
        std::lock_guard<std::mutex> lock{m_mutex};
        m_resources.connection = std::move(connection);
    }
    if (!connected) {
        if (connected.kind == ARA_ERR_USER_CANCELLED) {
            stopAndClean(stopCause(connected));
        } else {
            failAndClean(connected);
        }
        return;
    }

    transition(ARA_STATE_CONNECTED);
    if (stopWanted()) {
        stopAndClean(stopCause(std::nullopt));
        return;
    }

    // Only this thread replaces the connection
    auto& remote = *m_resources.connection;

    transition(ARA_STATE_DEPLOYING);
    for (size_t i = 0; i < m_helpers.size(); i++) {
        auto deployment = Deployment{};
        deployment.id = std::to_string(m_id) + "." + std::to_string(i + 1);
        deployment.kind = m_helpers[i].kind;

        auto const deployed = runStep(ARA_ERR_DEPLOYMENT_FAILURE, [&]() {
            m_deployer.deploy(remote, m_helpers[i], deployment, m_cancel);
        });

        // recorded even if it failed, whatever it created must be torn down
        { std::lock_guard<std::mutex> lock{m_mutex};
            m_resources.deployments.push_back(deployment);
        }

        if (!deployed) {
            if (deployed.kind == ARA_ERR_USER_CANCELLED) {
                stopAndClean(stopCause(deployed));
            } else {
                failAndClean(deployed);
            }
            return;
        }
    }
    if (stopWanted()) {
        stopAndClean(stopCause(std::nullopt));
        return;
    }

    { std::lock_guard<std::mutex> lock{m_mutex};
        m_updates.assign(m_resources.deployments.size(), ProgressUpdate{});
        m_runFailure.reset();
        m_tasksDone = false;
    }
    transition(ARA_STATE_RUNNING);

    m_tracker.start(remote, m_resources.deployments,
        [this](size_t index, ProgressUpdate const& update) { handleUpdate(index, update); },
        [this](Outcome const& outcome) { handleStall(outcome); },
        m_cancel);

    auto runFailure = std::optional<Outcome>{};
    { std::unique_lock<std::mutex> lock{m_mutex};
        m_cv.wait(lock, [this]() { return m_stopRequested || m_runFailure || m_tasksDone; });
        runFailure = m_runFailure;
    }
    m_tracker.stop();

    { std::lock_guard<std::mutex> lock{m_mutex};
        for (size_t i = 0; i < m_updates.size(); i++) {
            auto& deployment = m_resources.deployments[i];
            if (m_updates[i].status == ProgressStatus::Completed) {
                deployment.completed = true;
                deployment.exitCode = 0;
            } else if (m_updates[i].status == ProgressStatus::Exited) {
                deployment.exitCode = m_updates[i].exitCode;
            }
        }
    }

    if (runFailure) {
        failAndClean(*runFailure);
        return;
    }

    // Completed task output is secured before teardown removes its directory,
    // whether every task finished or the session was stopped with a service
    // still running. A cancelled session is torn down without it.
    auto const cause = stopCause(std::nullopt);
    if (!cause) {
        auto const fetched = runStep(ARA_ERR_DEPLOYMENT_FAILURE, [&]() {
            fetchArtifacts(remote);
        });
        if (!fetched) {
            failAndClean(fetched);
            return;
        }
    }

    stopAndClean(cause);
}

void
AcquisitionSession::run()
{
    t_currentSession = this;

    try {
        runStages();
    } catch (std::exception const& ex) {
        fprintf(stderr, "warning: session %lld: %s\n", (long long)m_id, ex.what());
        m_context.log.write("session %lld: unexpected error: %s\n", (long long)m_id, ex.what());

        // a resting state must still be reached
        if (!isResting(state())) {
            failAndClean(Outcome{ARA_ERR_DEPLOYMENT_FAILURE, ex.what()});
        }
    }

    { std::lock_guard<std::mutex> lock{m_mutex};
        m_finished = true;
    }
    m_cv.notify_all();

    t_currentSession = nullptr;
}

CleanupResult
AcquisitionSession::retryCleanup()
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        if (!m_finished || m_cleanupBusy || (m_state != ARA_STATE_FAILED_CLEANUP)) {
            throw std::logic_error("session " + std::to_string(m_id) + " is not awaiting a cleanup retry ("
                + stateName(m_state) + ")");
        }
        m_cleanupBusy = true;
    }

    m_context.log.write("session %lld: retrying cleanup\n", (long long)m_id);
    auto const result = runCleanup();

    if (result.fullySucceeded) {
        auto failurePath = false;
        { std::lock_guard<std::mutex> lock{m_mutex};
            failurePath = m_failurePath;
            m_error = m_cause;
        }
        transition(failurePath ? ARA_STATE_FAILED : ARA_STATE_CLEANED);
    } else {
        std::lock_guard<std::mutex> lock{m_mutex};
        m_error = cleanupOutcome(result);
    }

    return result;
}

ara_session_state_t
AcquisitionSession::state() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_state;
}

int
AcquisitionSession::progress() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_progress;
}

std::optional<Outcome>
AcquisitionSession::error() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_error;
}

std::vector<Deployment>
AcquisitionSession::deployments() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_resources.deployments;
}

std::vector<ArtifactDescriptor>
AcquisitionSession::artifacts() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_artifacts;
}

CleanupResult
AcquisitionSession::lastCleanup() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_lastCleanup;
}

std::optional<Clock::time_point>
AcquisitionSession::endedAt() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_endedAt;
}

bool
AcquisitionSession::residualState() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_resources.cleanupPending();
}

std::string
AcquisitionSession::summary() const
{
    std::lock_guard<std::mutex> lock{m_mutex};

    auto const session = "session " + std::to_string(m_id) + " on " + m_target.address;
    auto const cause = m_cause
        ? std::string{errorKindName(m_cause->kind)} + ": " + m_cause->message
        : std::string{};

    switch (m_state) {
        case ARA_STATE_CLEANED:
            if (m_cause) {
                return session + " stopped (" + cause + "), no remote state left";
            }
            return session + " finished with " + std::to_string(m_artifacts.size())
                + " artifact(s), no remote state left";

        case ARA_STATE_FAILED:
            return session + " failed (" + cause + "), no remote state left";

        case ARA_STATE_FAILED_CLEANUP:
        {
            auto result = "WARNING: residual remote state on " + m_target.address + " from session "
                + std::to_string(m_id) + ": " + m_lastCleanup.describe();
            if (m_cause) {
                result += " (" + cause + ")";
            }
            return result;
        }

        default:
            return session + " is " + stateName(m_state);
    }
}

} /* namespace ara */
