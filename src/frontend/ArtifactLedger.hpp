/******************************************************************************\
 * ArtifactLedger.hpp - In process record of acquired evidence.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <mutex>
#include <vector>

#include "Interfaces.hpp"

#include "useful/ara_log.h"

namespace ara {

// Default case store. Keeps every descriptor for the lifetime of the process
// and writes each one to the log.
class ArtifactLedger : public ArtifactStore {
private: // members
    mutable std::mutex m_mutex;
    std::vector<ArtifactDescriptor> m_artifacts;
    Logger& m_log;

public: // interface
    void recordArtifact(SessionId sessionId, ArtifactDescriptor const& artifact) override;

    // everything recorded for sessionId, in order of acquisition
    std::vector<ArtifactDescriptor> artifacts(SessionId sessionId) const;

    size_t size() const;

public: // Constructor/destructors
    explicit ArtifactLedger(Logger& log)
        : m_log{log}
    {}
};

} /* namespace ara */
