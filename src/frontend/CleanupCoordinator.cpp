/******************************************************************************\
 * CleanupCoordinator.cpp - Tears down everything a session created.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <stdio.h>

#include <algorithm>
#include <thread>

#include "CleanupCoordinator.hpp"

namespace ara {

bool
SessionResources::cleanupPending() const
{
    return std::any_of(deployments.begin(), deployments.end(),
        [](Deployment const& deployment) { return deployment.cleanupRequired; });
}

std::string
CleanupResult::describe() const
{
    auto result = std::string{};
    for (auto&& item : failedItems) {
        if (!result.empty()) {
            result += "; ";
        }
        result += item;
    }
    return result;
}

std::string
CleanupCoordinator::teardownWithRetry(Connection& connection, Deployment& deployment)
{
    auto lastError = std::string{};

    for (int attempt = 1; attempt <= m_config.cleanupAttempts; attempt++) {
        try {
            m_deployer.teardown(connection, deployment);
            return std::string{};
        } catch (std::exception const& ex) {
            lastError = ex.what();
            m_log.write("%s: teardown attempt %d/%d of %s failed: %s\n", connection.host().c_str(),
                attempt, m_config.cleanupAttempts, deployment.describe().c_str(), ex.what());
        }

        if (attempt < m_config.cleanupAttempts) {
            std::this_thread::sleep_for(m_config.cleanupRetryDelay);
        }
    }

    return lastError;
}

CleanupResult
CleanupCoordinator::cleanup(SessionResources& resources)
{
    auto result = CleanupResult{};

    auto fail = [&](std::string const& item) {
        result.fullySucceeded = false;
        result.failedItems.push_back(item);
        fprintf(stderr, "warning: %s\n", item.c_str());
        m_log.write("warning: %s\n", item.c_str());
    };

    for (auto&& deployment : resources.deployments) {
        if (!deployment.cleanupRequired) {
            continue;
        }

        if (!resources.connection) {
            fail("cannot tear down " + deployment.describe() + ": no connection to the target");
            continue;
        }

        auto const error = teardownWithRetry(*resources.connection, deployment);
        if (!error.empty()) {
            fail(error);
        }
    }

    if (resources.connection) {
        if (resources.cleanupPending()) {
            // needed again for retryCleanup
            fail("connection to " + resources.connection->host() + " retained for retry");
        } else {
            auto const host = resources.connection->host();
            try {
                m_connectionManager.disconnect(resources.connection.get());
            } catch (std::exception const& ex) {
                m_log.write("%s: closing connection failed: %s\n", host.c_str(), ex.what());
            }
            resources.connection.reset();
        }
    }

    return result;
}

} /* namespace ara */
