/******************************************************************************\
 * ConnectionManager.hpp - Opens authenticated connections to targets, with
 *                         bounded retries for transient network failures.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <memory>

#include "Config.hpp"
#include "Connection.hpp"
#include "Credential.hpp"
#include "CancelToken.hpp"

#include "useful/ara_log.h"

namespace ara {

class ConnectionManager {
private: // members
    Config const& m_config;
    Transport& m_transport;
    Logger& m_log;

public: // interface
    /*
     * connect - Open an authenticated connection to target
     *
     * Detail
     *      Takes ownership of the credential and wipes it before returning or
     *      throwing. NetworkUnreachable and per-attempt timeouts are retried
     *      up to connectAttempts times with doubling backoff, as long as the
     *      overall timeout has not passed. Authentication failures are never
     *      retried.
     *
     * Throws
     *      AuthenticationError, NetworkUnreachable, TimeoutExceeded, UserCancelled
     */
    std::unique_ptr<Connection>
    connect(Target const& target, Credential&& credential, std::chrono::milliseconds timeout,
        CancelToken const& cancel);

    // Close a connection. Safe to repeat, null is ignored.
    void disconnect(Connection* connection);

    // Copy of target with its reachability filled in
    Target probe(Target const& target, std::chrono::milliseconds timeout);

public: // Constructor/destructors
    ConnectionManager(Config const& config, Transport& transport, Logger& log)
        : m_config{config}
        , m_transport{transport}
        , m_log{log}
    {}
};

} /* namespace ara */
