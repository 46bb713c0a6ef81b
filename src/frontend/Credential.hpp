/******************************************************************************\
 * Credential.hpp - Scoped holder for the administrative login secret.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

namespace ara {

/*
** A Credential owns the only copy of a secret the core ever holds. The secret
** buffer is wiped when the credential is discarded, destroyed or moved from.
** There is intentionally no way to format a Credential; only the username is
** ever printed.
*/
class Credential {
private: // variables
    std::string m_username;
    std::vector<char> m_secret; // nul-terminated while held

private: // functions
    void wipe();

public: // interface
    std::string const& username() const { return m_username; }

    // Nul-terminated secret, empty once discarded
    char const* secret() const;
    size_t secretLength() const;

    bool discarded() const { return m_secret.empty(); }

    // Wipe and release the secret. Safe to repeat.
    void discard();

    // Login name presented to the target: domain\username if a domain is set
    std::string loginName(std::string const& domain) const;

public: // Constructor/destructors
    Credential(std::string username, char const* secret, size_t secretLength);
    Credential(std::string username, char const* secret);
    ~Credential();

    Credential(Credential&& expiring);
    Credential& operator=(Credential&& expiring);

    Credential(const Credential&) = delete;
    Credential& operator=(const Credential&) = delete;
};

} /* namespace ara */
