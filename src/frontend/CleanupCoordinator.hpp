/******************************************************************************\
 * CleanupCoordinator.hpp - Tears down everything a session created.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Config.hpp"
#include "Connection.hpp"
#include "ConnectionManager.hpp"
#include "ServiceDeployer.hpp"
#include "Model.hpp"

#include "useful/ara_log.h"

namespace ara {

// Remote state a session is responsible for
struct SessionResources {
    std::unique_ptr<Connection> connection;
    std::vector<Deployment> deployments;

    // true while anything on the target is left to remove
    bool cleanupPending() const;
};

struct CleanupResult {
    bool fullySucceeded = true;
    std::vector<std::string> failedItems;

    // failedItems joined into one line
    std::string describe() const;
};

class CleanupCoordinator {
private: // members
    Config const& m_config;
    ServiceDeployer& m_deployer;
    ConnectionManager& m_connectionManager;
    Logger& m_log;

private: // functions
    // one deployment with bounded retries, returns the last failure if all fail
    std::string teardownWithRetry(Connection& connection, Deployment& deployment);

public: // interface
    /*
     * cleanup - Tear down every deployment that still needs it
     *
     * Detail
     *      Each deployment is handled independently, so one failure does not
     *      stop the others. Deployments already torn down are skipped, which
     *      makes repeated calls converge. The connection is closed and
     *      released only once nothing remains to clean; otherwise it is kept
     *      for a later retry and listed among the failed items. Failures are
     *      printed as warnings and logged, never thrown.
     */
    CleanupResult cleanup(SessionResources& resources);

public: // Constructor/destructors
    CleanupCoordinator(Config const& config, ServiceDeployer& deployer, ConnectionManager& connectionManager,
        Logger& log)
        : m_config{config}
        , m_deployer{deployer}
        , m_connectionManager{connectionManager}
        , m_log{log}
    {}
};

} /* namespace ara */
