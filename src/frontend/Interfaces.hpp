/******************************************************************************\
 * Interfaces.hpp - Seams to the collaborators outside the acquisition core:
 *                  the credential source, the case store and the
 *                  presentation layer.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "Model.hpp"
#include "Credential.hpp"

namespace ara {

// Supplies the credential for a target right before it is used
class CredentialSource {
public:
    virtual Credential acquire(Target const& target) = 0;
    virtual ~CredentialSource() = default;
};

// Receives finished acquisitions
class ArtifactStore {
public:
    virtual void recordArtifact(SessionId sessionId, ArtifactDescriptor const& artifact) = 0;
    virtual ~ArtifactStore() = default;
};

// Presentation layer hook. Called on the session's worker thread.
class SessionObserver {
public:
    virtual void onStateChange(SessionEvent const& event) = 0;
    virtual void onProgress(SessionId, int) {}
    virtual ~SessionObserver() = default;
};

// Credential source holding one credential, handed out exactly once.
// Whatever was never handed out is wiped with the source.
class OneShotCredentialSource : public CredentialSource {
private:
    std::mutex m_mutex;
    std::optional<Credential> m_credential;

public:
    explicit OneShotCredentialSource(Credential&& credential)
        : m_credential{std::move(credential)}
    {}

    Credential acquire(Target const& target) override;
};

} /* namespace ara */
