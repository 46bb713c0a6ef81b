/******************************************************************************\
 * Errors.hpp - Exception types and step outcomes for the acquisition core.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "anubis_remote_shared.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace ara {

// Base of every error raised by the core. Carries the taxonomy kind so the
// session can turn it into an outcome without inspecting the message.
class Error : public std::runtime_error {
private:
    ara_error_kind_t m_kind;

public:
    Error(ara_error_kind_t kind, std::string const& what)
        : std::runtime_error{what}
        , m_kind{kind}
    {}

    ara_error_kind_t kind() const { return m_kind; }
};

struct AuthenticationError : public Error {
    explicit AuthenticationError(std::string const& what) : Error{ARA_ERR_AUTHENTICATION, what} {}
};

struct NetworkUnreachable : public Error {
    explicit NetworkUnreachable(std::string const& what) : Error{ARA_ERR_NETWORK_UNREACHABLE, what} {}
};

struct TimeoutExceeded : public Error {
    explicit TimeoutExceeded(std::string const& what) : Error{ARA_ERR_TIMEOUT_EXCEEDED, what} {}
};

struct DeploymentFailure : public Error {
    explicit DeploymentFailure(std::string const& what) : Error{ARA_ERR_DEPLOYMENT_FAILURE, what} {}
};

struct AcquisitionStalled : public Error {
    explicit AcquisitionStalled(std::string const& what) : Error{ARA_ERR_ACQUISITION_STALLED, what} {}
};

struct DuplicateSessionError : public Error {
    explicit DuplicateSessionError(std::string const& what) : Error{ARA_ERR_DUPLICATE_SESSION, what} {}
};

struct UserCancelled : public Error {
    explicit UserCancelled(std::string const& what) : Error{ARA_ERR_USER_CANCELLED, what} {}
};

struct CleanupFailure : public Error {
    explicit CleanupFailure(std::string const& what) : Error{ARA_ERR_CLEANUP_FAILURE, what} {}
};

// Result of one state machine step. A default constructed outcome is a success.
struct Outcome {
    ara_error_kind_t kind = ARA_ERR_NONE;
    std::string message;

    bool ok() const { return kind == ARA_ERR_NONE; }
    explicit operator bool() const { return ok(); }
};

// Run a step that can throw and report how it went. Errors that carry no kind
// of their own are reported as defaultKind.
template <typename FuncType>
static inline Outcome
runStep(ara_error_kind_t const defaultKind, FuncType&& func)
{
    try {
        std::forward<FuncType>(func)();
        return Outcome{};
    } catch (Error const& ex) {
        return Outcome{ex.kind(), ex.what()};
    } catch (std::exception const& ex) {
        return Outcome{defaultKind, ex.what() ? ex.what() : "(null error string)"};
    }
}

} /* namespace ara */
