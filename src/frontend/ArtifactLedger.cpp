/******************************************************************************\
 * ArtifactLedger.cpp - In process record of acquired evidence.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ArtifactLedger.hpp"

namespace ara {

void
ArtifactLedger::recordArtifact(SessionId sessionId, ArtifactDescriptor const& artifact)
{
    { std::lock_guard<std::mutex> lock{m_mutex};
        m_artifacts.push_back(artifact);
        m_artifacts.back().sessionId = sessionId;
    }

    m_log.write("session %lld: recorded %s artifact %s (%llu bytes) from %s\n", (long long)sessionId,
        helperKindName(artifact.kind), artifact.localPath.c_str(), (unsigned long long)artifact.bytes,
        artifact.remotePath.c_str());
}

std::vector<ArtifactDescriptor>
ArtifactLedger::artifacts(SessionId sessionId) const
{
    auto result = std::vector<ArtifactDescriptor>{};

    std::lock_guard<std::mutex> lock{m_mutex};
    for (auto&& artifact : m_artifacts) {
        if (artifact.sessionId == sessionId) {
            result.push_back(artifact);
        }
    }
    return result;
}

size_t
ArtifactLedger::size() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_artifacts.size();
}

} /* namespace ara */
