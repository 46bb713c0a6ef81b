/******************************************************************************\
 * Credential.cpp - Scoped holder for the administrative login secret.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <string.h>

#include <stdexcept>
#include <utility>

#include "Credential.hpp"
#include "Interfaces.hpp"

namespace ara {

Credential::Credential(std::string username, char const* secret, size_t secretLength)
    : m_username{std::move(username)}
    , m_secret{}
{
    if (m_username.empty()) {
        throw std::runtime_error("credential requires a username");
    }
    if (secret == nullptr) {
        throw std::runtime_error("credential for " + m_username + " has no secret");
    }

    m_secret.reserve(secretLength + 1);
    m_secret.assign(secret, secret + secretLength);
    m_secret.push_back('\0');
}

Credential::Credential(std::string username, char const* secret)
    : Credential{std::move(username), secret, (secret != nullptr) ? ::strlen(secret) : 0}
{}

Credential::~Credential()
{
    discard();
}

Credential::Credential(Credential&& expiring)
    : m_username{std::move(expiring.m_username)}
    , m_secret{}
{
    // swap so the only buffer holding the secret moves with it
    m_secret.swap(expiring.m_secret);
    expiring.discard();
}

Credential& Credential::operator=(Credential&& expiring)
{
    if (this != &expiring) {
        discard();
        m_username = std::move(expiring.m_username);
        m_secret.swap(expiring.m_secret);
        expiring.discard();
    }
    return *this;
}

void Credential::wipe()
{
    if (!m_secret.empty()) {
        ::explicit_bzero(m_secret.data(), m_secret.size());
    }
}

void Credential::discard()
{
    wipe();
    m_secret.clear();
    m_secret.shrink_to_fit();
}

char const* Credential::secret() const
{
    return m_secret.empty() ? "" : m_secret.data();
}

size_t Credential::secretLength() const
{
    return m_secret.empty() ? 0 : (m_secret.size() - 1);
}

std::string Credential::loginName(std::string const& domain) const
{
    if (domain.empty()) {
        return m_username;
    }
    return domain + "\\" + m_username;
}

Credential OneShotCredentialSource::acquire(Target const& target)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    if (!m_credential) {
        throw AuthenticationError("credential for " + target.address + " was already used");
    }
    auto credential = std::move(*m_credential);
    m_credential.reset();
    return credential;
}

} /* namespace ara */
