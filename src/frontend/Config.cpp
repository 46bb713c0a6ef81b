/******************************************************************************\
 * Config.cpp - Runtime configuration of the acquisition core.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

// This pulls in the compile time defaults
#include "ara_defs.h"

#include <limits>
#include <stdexcept>

#include "Config.hpp"

#include "useful/ara_wrappers.hpp"

namespace ara {

Config::Config()
    : connectTimeout{ARA_DEFAULT_CONNECT_TIMEOUT}
    , connectAttempts{ARA_DEFAULT_CONNECT_ATTEMPTS}
    , backoffBase{ARA_DEFAULT_BACKOFF_BASE}
    , sshPort{ARA_SSH_PORT}
    , knownHostsPath{}
    , commandTimeout{ARA_DEFAULT_COMMAND_TIMEOUT}
    , healthCheckAttempts{ARA_DEFAULT_HEALTH_CHECK_ATTEMPTS}
    , healthCheckInterval{ARA_DEFAULT_HEALTH_CHECK_INTERVAL}
    , healthCheckTimeout{ARA_DEFAULT_HEALTH_CHECK_TIMEOUT}
    , remoteBase{ARA_REMOTE_BASE}
    , stageDir{getenvOrDefault("TMPDIR", "/tmp")}
    , pollInterval{ARA_DEFAULT_POLL_INTERVAL}
    , stallThreshold{ARA_DEFAULT_STALL_THRESHOLD}
    , cleanupAttempts{ARA_DEFAULT_CLEANUP_ATTEMPTS}
    , cleanupRetryDelay{ARA_DEFAULT_CLEANUP_RETRY_DELAY}
    , evidenceDir{"."}
    , logDir{ARA_DEFAULT_LOG_DIR}
    , debug{false}
{
    if (auto const home = ::getenv("HOME")) {
        knownHostsPath = std::string{home} + "/.ssh/known_hosts";
    }
}

static long long parseInteger(std::string const& name, std::string const& value,
    long long const minimum)
{
    size_t end = 0;
    auto result = (long long)0;
    try {
        result = std::stoll(value, &end, 10);
    } catch (std::exception const&) {
        throw std::runtime_error(name + ": '" + value + "' is not a number");
    }
    if (end != value.length()) {
        throw std::runtime_error(name + ": '" + value + "' is not a number");
    }
    if (result < minimum) {
        throw std::runtime_error(name + ": " + value + " is below the minimum of "
            + std::to_string(minimum));
    }
    return result;
}

Config::Millis
Config::parseMillis(std::string const& name, std::string const& value)
{
    return Millis{parseInteger(name, value, 0)};
}

int
Config::parseCount(std::string const& name, std::string const& value)
{
    auto const count = parseInteger(name, value, 1);
    if (count > std::numeric_limits<int>::max()) {
        throw std::runtime_error(name + ": " + value + " is too large");
    }
    return (int)count;
}

bool
Config::parseFlag(std::string const& name, std::string const& value)
{
    if ((value == "1") || (value == "true") || (value == "yes")) {
        return true;
    } else if ((value == "0") || (value == "false") || (value == "no")) {
        return false;
    }
    throw std::runtime_error(name + ": '" + value + "' is not a boolean");
}

Config
Config::fromEnvironment()
{
    auto config = Config{};

    auto readMillis = [](char const* var, Millis& target) {
        if (auto const value = ::getenv(var)) {
            target = parseMillis(var, value);
        }
    };
    auto readCount = [](char const* var, int& target) {
        if (auto const value = ::getenv(var)) {
            target = parseCount(var, value);
        }
    };
    auto readString = [](char const* var, std::string& target) {
        if (auto const value = ::getenv(var)) {
            if (value[0] != '\0') {
                target = value;
            }
        }
    };

    readMillis(ARA_CONNECT_TIMEOUT_ENV_VAR,       config.connectTimeout);
    readCount (ARA_CONNECT_ATTEMPTS_ENV_VAR,      config.connectAttempts);
    readMillis(ARA_BACKOFF_BASE_ENV_VAR,          config.backoffBase);
    readCount (ARA_HEALTH_CHECK_ATTEMPTS_ENV_VAR, config.healthCheckAttempts);
    readMillis(ARA_HEALTH_CHECK_INTERVAL_ENV_VAR, config.healthCheckInterval);
    readMillis(ARA_HEALTH_CHECK_TIMEOUT_ENV_VAR,  config.healthCheckTimeout);
    readMillis(ARA_POLL_INTERVAL_ENV_VAR,         config.pollInterval);
    readCount (ARA_STALL_THRESHOLD_ENV_VAR,       config.stallThreshold);
    readCount (ARA_CLEANUP_ATTEMPTS_ENV_VAR,      config.cleanupAttempts);
    readMillis(ARA_CLEANUP_RETRY_DELAY_ENV_VAR,   config.cleanupRetryDelay);

    readString(ARA_REMOTE_BASE_ENV_VAR,          config.remoteBase);
    readString(ARA_STAGE_DIR_ENV_VAR,            config.stageDir);
    readString(ARA_EVIDENCE_DIR_ENV_VAR,         config.evidenceDir);
    readString(ARA_LOG_DIR_ENV_VAR,              config.logDir);
    readString(ARA_SSH_KNOWNHOSTS_PATH_ENV_VAR,  config.knownHostsPath);

    if (auto const ssh_port = ::getenv(ARA_SSH_PORT_ENV_VAR)) {
        auto const port = parseCount(ARA_SSH_PORT_ENV_VAR, ssh_port);
        if (port > 65535) {
            throw std::runtime_error(ARA_SSH_PORT_ENV_VAR ": " + std::string{ssh_port}
                + " is not a valid port");
        }
        config.sshPort = port;
    }

    // any value turns on debug logging, as for the other tool interfaces
    config.debug = (::getenv(ARA_DBG_ENV_VAR) != nullptr);

    return config;
}

} /* namespace ara */
