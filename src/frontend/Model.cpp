/******************************************************************************\
 * Model.cpp - Names and identities for the acquisition records.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <algorithm>
#include <cctype>

#include "Model.hpp"

#include "useful/ara_split.hpp"

namespace ara {

std::string
targetIdentity(std::string const& address)
{
    auto identity = split::removeLeadingWhitespace(address);
    std::transform(identity.begin(), identity.end(), identity.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return identity;
}

std::string
Target::identity() const
{
    return targetIdentity(address);
}

std::string
Deployment::describe() const
{
    auto result = std::string{helperKindName(kind)};
    if (!id.empty()) {
        result += " " + id;
    }
    if (!remoteDir.empty()) {
        result += " (" + remoteDir + ")";
    }
    return result;
}

char const*
stateName(ara_session_state_t state)
{
    switch (state) {
        case ARA_STATE_INIT:           return "INIT";
        case ARA_STATE_CONNECTING:     return "CONNECTING";
        case ARA_STATE_CONNECTED:      return "CONNECTED";
        case ARA_STATE_DEPLOYING:      return "DEPLOYING";
        case ARA_STATE_RUNNING:        return "RUNNING";
        case ARA_STATE_STOPPING:       return "STOPPING";
        case ARA_STATE_CLEANED:        return "CLEANED";
        case ARA_STATE_FAILED:         return "FAILED";
        case ARA_STATE_FAILED_CLEANUP: return "FAILED_CLEANUP";
    }
    return "Invalid state.";
}

char const*
helperKindName(ara_helper_kind_t kind)
{
    switch (kind) {
        case ARA_HELPER_FILE_BROWSER:   return "file_browser";
        case ARA_HELPER_MEMORY_IMAGER:  return "memory_imager";
        case ARA_HELPER_PROCESS_DUMPER: return "process_dumper";
    }
    return "invalid_helper";
}

char const*
errorKindName(ara_error_kind_t kind)
{
    switch (kind) {
        case ARA_ERR_NONE:                return "None";
        case ARA_ERR_AUTHENTICATION:      return "AuthenticationError";
        case ARA_ERR_NETWORK_UNREACHABLE: return "NetworkUnreachable";
        case ARA_ERR_TIMEOUT_EXCEEDED:    return "TimeoutExceeded";
        case ARA_ERR_DEPLOYMENT_FAILURE:  return "DeploymentFailure";
        case ARA_ERR_ACQUISITION_STALLED: return "AcquisitionStalled";
        case ARA_ERR_DUPLICATE_SESSION:   return "DuplicateSession";
        case ARA_ERR_USER_CANCELLED:      return "UserCancelled";
        case ARA_ERR_CLEANUP_FAILURE:     return "CleanupFailure";
    }
    return "Invalid error kind.";
}

bool
isServiceKind(ara_helper_kind_t kind)
{
    return kind == ARA_HELPER_FILE_BROWSER;
}

bool
isResting(ara_session_state_t state)
{
    return (state == ARA_STATE_CLEANED)
        || (state == ARA_STATE_FAILED)
        || (state == ARA_STATE_FAILED_CLEANUP);
}

} /* namespace ara */
