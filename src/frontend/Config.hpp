/******************************************************************************\
 * Config.hpp - Runtime configuration of the acquisition core.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <string>

namespace ara {

// Every tunable of the core. Built once, then passed by reference to each
// component.
struct Config {
    using Millis = std::chrono::milliseconds;

    // connection
    Millis connectTimeout;
    int connectAttempts;
    Millis backoffBase;
    int sshPort;
    std::string knownHostsPath;
    Millis commandTimeout;

    // deployment
    int healthCheckAttempts;
    Millis healthCheckInterval;
    Millis healthCheckTimeout;
    std::string remoteBase;
    std::string stageDir;

    // tracking
    Millis pollInterval;
    int stallThreshold;

    // cleanup
    int cleanupAttempts;
    Millis cleanupRetryDelay;

    // evidence and logging
    std::string evidenceDir;
    std::string logDir;
    bool debug;

    // Compile time defaults, no environment
    Config();

    // Defaults overridden by the ARA_* environment variables
    static Config fromEnvironment();

    // Parse helpers shared with the attribute interface. Throw on malformed
    // or out of range values.
    static Millis parseMillis(std::string const& name, std::string const& value);
    static int parseCount(std::string const& name, std::string const& value);
    static bool parseFlag(std::string const& name, std::string const& value);
};

} /* namespace ara */
