/******************************************************************************\
 * ServiceDeployer.hpp - Stages, starts, health checks and tears down helper
 *                       binaries on a target.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

#include "Config.hpp"
#include "Connection.hpp"
#include "CancelToken.hpp"
#include "Model.hpp"

#include "useful/ara_log.h"

namespace ara {

class ServiceDeployer {
private: // members
    Config const& m_config;
    Logger& m_log;

private: // functions
    // create the remote working directory and ship the helper package into it
    void stage(Connection& connection, HelperRequest const& request, Deployment& out,
        CancelToken const& cancel);
    // launch the staged helper
    void start(Connection& connection, HelperRequest const& request, Deployment& out,
        CancelToken const& cancel);
    // poll until the helper is confirmed healthy
    void waitHealthy(Connection& connection, Deployment& out, CancelToken const& cancel);

public: // interface
    /*
     * deploy - Bring up one helper on the target
     *
     * Detail
     *      out is filled in as remote state is created. cleanupRequired is
     *      set as soon as the remote working directory exists, so a caller
     *      can always tear down whatever a failed deploy left behind.
     *
     * Throws
     *      DeploymentFailure, TimeoutExceeded, UserCancelled
     */
    void deploy(Connection& connection, HelperRequest const& request, Deployment& out,
        CancelToken const& cancel);

    // Terminate the helper and remove its working directory. Returns at once
    // if nothing needs cleaning. Throws CleanupFailure, leaving
    // cleanupRequired set, if either step fails.
    void teardown(Connection& connection, Deployment& deployment);

    // Copy a finished task helper's output into localDir
    ArtifactDescriptor fetchArtifact(Connection& connection, Deployment const& deployment,
        std::string const& localDir, SessionId sessionId);

    // Argument list with {port} and {output} replaced
    static std::vector<std::string> substituteArgs(std::vector<std::string> const& args,
        int port, std::string const& outputPath);

public: // Constructor/destructors
    ServiceDeployer(Config const& config, Logger& log)
        : m_config{config}
        , m_log{log}
    {}
};

} /* namespace ara */
