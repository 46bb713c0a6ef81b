/******************************************************************************\
 * ConnectionManager.cpp - Opens authenticated connections to targets, with
 *                         bounded retries for transient network failures.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <algorithm>
#include <string>

#include "ConnectionManager.hpp"

namespace ara {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

static milliseconds remainingUntil(steady_clock::time_point const deadline)
{
    auto const remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
    return std::max(remaining, milliseconds{0});
}

std::unique_ptr<Connection>
ConnectionManager::connect(Target const& target, Credential&& credential, milliseconds timeout,
    CancelToken const& cancel)
{
    // Owned here so it is wiped on every path out of this function
    auto heldCredential = Credential{std::move(credential)};

    auto const deadline = steady_clock::now() + timeout;
    auto backoff = m_config.backoffBase;
    auto lastKind = ARA_ERR_NETWORK_UNREACHABLE;
    auto lastError = std::string{"no connection attempt was made"};

    for (int attempt = 1; attempt <= m_config.connectAttempts; attempt++) {
        cancel.throwIfCancelled("connect to " + target.address);

        auto const remaining = remainingUntil(deadline);
        if (remaining.count() == 0) {
            break;
        }

        m_log.write("connect to %s attempt %d/%d\n", target.address.c_str(), attempt, m_config.connectAttempts);
        try {
            auto connection = m_transport.open(target, heldCredential, remaining);
            if (connection == nullptr) {
                throw NetworkUnreachable("transport returned no connection to " + target.address);
            }
            heldCredential.discard();
            m_log.write("connected to %s\n", target.address.c_str());
            return connection;

        } catch (AuthenticationError const& ex) {
            heldCredential.discard();
            m_log.write("authentication with %s failed: %s\n", target.address.c_str(), ex.what());
            throw;

        } catch (NetworkUnreachable const& ex) {
            lastKind = ex.kind();
            lastError = ex.what();

        } catch (TimeoutExceeded const& ex) {
            lastKind = ex.kind();
            lastError = ex.what();
        }

        m_log.write("connect to %s attempt %d failed: %s\n", target.address.c_str(), attempt, lastError.c_str());

        if (attempt == m_config.connectAttempts) {
            break;
        }

        // Back off, but never past the deadline
        auto const delay = std::min(backoff, remainingUntil(deadline));
        if (cancel.waitFor(delay)) {
            throw UserCancelled("cancelled while waiting to reconnect to " + target.address);
        }
        backoff *= 2;
    }

    heldCredential.discard();

    if (remainingUntil(deadline).count() == 0) {
        throw TimeoutExceeded("could not connect to " + target.address + " within "
            + std::to_string(timeout.count()) + " ms: " + lastError);
    }
    if (lastKind == ARA_ERR_TIMEOUT_EXCEEDED) {
        throw TimeoutExceeded(lastError);
    }
    throw NetworkUnreachable(lastError);
}

void
ConnectionManager::disconnect(Connection* connection)
{
    if (connection != nullptr) {
        connection->close();
    }
}

Target
ConnectionManager::probe(Target const& target, milliseconds timeout)
{
    auto result = target;
    result.reachability = m_transport.reachable(target, timeout)
        ? Reachability::Reachable
        : Reachability::Unreachable;
    return result;
}

} /* namespace ara */
