/******************************************************************************\
 * ara_fe_iface.cpp - C interface layer for the remote acquisition core.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

// This pulls in the compile time defaults
#include "ara_defs.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <optional>

#include "ara_fe_iface.hpp"

#include "ArtifactLedger.hpp"
#include "Config.hpp"
#include "Credential.hpp"
#include "Frontend.hpp"
#include "frontend_impl/SSH/Connection.hpp"

#include "useful/ara_log.h"
#include "useful/ara_wrappers.hpp"

using namespace ara;

/*********************
** Internal data
*********************/
char *      FE_iface::_ara_err_str = nullptr;
std::string FE_iface::m_err_str = DEFAULT_ERR_STR;
std::mutex  FE_iface::m_err_mutex;
char *      FE_iface::_ara_attr_str = nullptr;

constexpr auto SUCCESS = FE_iface::SUCCESS;
constexpr auto FAILURE = FE_iface::FAILURE;

constexpr auto SESSION_ERROR = FE_iface::SESSION_ERROR;

namespace {

// Everything ara_init brings up, torn down in reverse by ara_fini
struct Runtime {
    Config config;
    Logger log;
    SSHTransport transport;
    ArtifactLedger ledger;
    Frontend frontend;

    Runtime(Config const& config_, CallbackObserver& callbacks)
        : config{config_}
        , log{config.debug, config.logDir, ARA_LOG_NAME, getpid()}
        , transport{config, log}
        , ledger{log}
        , frontend{config, transport, ledger, log}
    {
        frontend.addObserver(callbacks);
    }
};

// Destroyed after the runtime, whose sessions still publish while winding down
CallbackObserver s_callbacks;

std::mutex s_mutex;
// Settings made by ara_setAttribute, applied at ara_init
std::optional<Config> s_pending;
std::unique_ptr<Runtime> s_runtime;

Config& pendingConfig()
{
    if (!s_pending) {
        s_pending = Config::fromEnvironment();
    }
    return *s_pending;
}

Runtime& runtime()
{
    std::lock_guard<std::mutex> lock{s_mutex};
    if (!s_runtime) {
        throw std::runtime_error("ara_init has not been called.");
    }
    return *s_runtime;
}

std::vector<std::string> stringArray(char const* const* array)
{
    auto result = std::vector<std::string>{};
    if (array != nullptr) {
        for (auto entry = array; *entry != nullptr; ++entry) {
            result.emplace_back(*entry);
        }
    }
    return result;
}

} /* anonymous namespace */

/*********************
** internal functions
*********************/

void
CallbackObserver::setCallback(ara_state_callback_t callback, void* userData)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    m_callback = callback;
    m_userData = userData;
}

void
CallbackObserver::onStateChange(SessionEvent const& event)
{
    auto callback = ara_state_callback_t{nullptr};
    auto userData = (void*)nullptr;
    { std::lock_guard<std::mutex> lock{m_mutex};
        callback = m_callback;
        userData = m_userData;
    }

    if (callback != nullptr) {
        callback(event.sessionId, event.oldState, event.newState, event.progress,
            event.error ? event.error->kind : ARA_ERR_NONE,
            event.error ? event.error->message.c_str() : nullptr,
            userData);
    }
}

void
FE_iface::set_error_str(std::string str)
{
    std::lock_guard<std::mutex> lock{m_err_mutex};
    m_err_str = std::move(str);
}

// Note that we want to leak by design! Do not free the buffer!
// Since we pass this out via the c interface, we cannot safely
// reclaim the space.
const char *
FE_iface::get_error_str()
{
    std::lock_guard<std::mutex> lock{m_err_mutex};
    if (_ara_err_str == nullptr) {
        // Allocate space for the external string
        _ara_err_str = (char *)std::malloc(ARA_ERR_STR_SIZE);
        memset(_ara_err_str, '\0', ARA_ERR_STR_SIZE);
    }
    // Copy the internal error string to the external buffer
    strncpy(_ara_err_str, m_err_str.c_str(), ARA_ERR_STR_SIZE);
    // Enforce null termination
    _ara_err_str[ARA_ERR_STR_SIZE - 1] = '\0';
    // Return the pointer to the external buffer
    return const_cast<const char *>(_ara_err_str);
}

void
FE_iface::copy_error_str(char *buf, size_t buf_len)
{
    std::lock_guard<std::mutex> lock{m_err_mutex};
    strncpy(buf, m_err_str.c_str(), buf_len - 1);
    buf[buf_len - 1] = '\0';
}

// Note that we want to leak by design! Do not free the buffer!
const char *
FE_iface::get_attr_str(const char *value)
{
    if (_ara_attr_str == nullptr) {
        // Allocate space for the external string
        _ara_attr_str = (char *)std::malloc(ARA_BUF_SIZE);
        memset(_ara_attr_str, '\0', ARA_BUF_SIZE);
    }
    // Copy the value string to the buffer
    strncpy(_ara_attr_str, value, ARA_BUF_SIZE - 1);
    // Enforce null termination
    _ara_attr_str[ARA_BUF_SIZE - 1] = '\0';
    // Return the pointer to the external buffer
    return const_cast<const char *>(_ara_attr_str);
}

/*******************************
* C API defined functions below
*******************************/

const char *
ara_version(void) {
    return ARA_FE_VERSION;
}

const char *
ara_error_str(void) {
    return FE_iface::get_error_str();
}

int
ara_error_str_r(char *buf, size_t buf_len) {
    if ((buf == nullptr) || (buf_len < 1)) {
        return ERANGE;
    }

    FE_iface::copy_error_str(buf, buf_len);
    return 0;
}

const char *
ara_state_toString(ara_session_state_t state) {
    return stateName(state);
}

const char *
ara_helper_kind_toString(ara_helper_kind_t kind) {
    return helperKindName(kind);
}

const char *
ara_error_kind_toString(ara_error_kind_t kind) {
    return errorKindName(kind);
}

int
ara_setAttribute(ara_attr_type_t attrib, const char *value)
{
    return FE_iface::runSafely(__func__, [&](){
        if (value == nullptr) {
            throw std::runtime_error("NULL pointer pass as value argument.");
        }
        std::lock_guard<std::mutex> lock{s_mutex};
        if (s_runtime) {
            throw std::runtime_error("attributes must be set before ara_init.");
        }
        auto&& config = pendingConfig();
        auto const str = std::string{value};
        switch (attrib) {
            case ARA_ATTR_CONNECT_TIMEOUT:
                config.connectTimeout = Config::parseMillis("ARA_ATTR_CONNECT_TIMEOUT", str);
                break;
            case ARA_ATTR_CONNECT_ATTEMPTS:
                config.connectAttempts = Config::parseCount("ARA_ATTR_CONNECT_ATTEMPTS", str);
                break;
            case ARA_ATTR_BACKOFF_BASE:
                config.backoffBase = Config::parseMillis("ARA_ATTR_BACKOFF_BASE", str);
                break;
            case ARA_ATTR_HEALTH_CHECK_ATTEMPTS:
                config.healthCheckAttempts = Config::parseCount("ARA_ATTR_HEALTH_CHECK_ATTEMPTS", str);
                break;
            case ARA_ATTR_HEALTH_CHECK_INTERVAL:
                config.healthCheckInterval = Config::parseMillis("ARA_ATTR_HEALTH_CHECK_INTERVAL", str);
                break;
            case ARA_ATTR_HEALTH_CHECK_TIMEOUT:
                config.healthCheckTimeout = Config::parseMillis("ARA_ATTR_HEALTH_CHECK_TIMEOUT", str);
                break;
            case ARA_ATTR_POLL_INTERVAL:
                config.pollInterval = Config::parseMillis("ARA_ATTR_POLL_INTERVAL", str);
                break;
            case ARA_ATTR_STALL_THRESHOLD:
                config.stallThreshold = Config::parseCount("ARA_ATTR_STALL_THRESHOLD", str);
                break;
            case ARA_ATTR_CLEANUP_ATTEMPTS:
                config.cleanupAttempts = Config::parseCount("ARA_ATTR_CLEANUP_ATTEMPTS", str);
                break;
            case ARA_ATTR_CLEANUP_RETRY_DELAY:
                config.cleanupRetryDelay = Config::parseMillis("ARA_ATTR_CLEANUP_RETRY_DELAY", str);
                break;
            case ARA_ATTR_REMOTE_BASE:
                if (str.empty() || (str[0] != '/')) {
                    throw std::runtime_error("ARA_ATTR_REMOTE_BASE: " + str + " is not an absolute path");
                }
                config.remoteBase = str;
                break;
            case ARA_ATTR_EVIDENCE_DIR:
                if (!dirHasPerms(value, W_OK | X_OK)) {
                    throw std::runtime_error("ARA_ATTR_EVIDENCE_DIR: Bad directory specified by value " + str);
                }
                config.evidenceDir = str;
                break;
            case ARA_ATTR_LOG_DIR:
                if (!dirHasPerms(value, R_OK | W_OK | X_OK)) {
                    throw std::runtime_error("ARA_ATTR_LOG_DIR: Bad directory specified by value " + str);
                }
                config.logDir = str;
                break;
            case ARA_ATTR_DEBUG:
                config.debug = Config::parseFlag("ARA_ATTR_DEBUG", str);
                break;
            default:
                throw std::runtime_error("Invalid ara_attr_type_t " + std::to_string((int)attrib));
        }
        return SUCCESS;
    }, FAILURE);
}

const char *
ara_getAttribute(ara_attr_type_t attrib)
{
    return FE_iface::runSafely(__func__, [&](){
        std::lock_guard<std::mutex> lock{s_mutex};
        auto const& config = s_runtime ? s_runtime->config : pendingConfig();
        auto const millis = [](Config::Millis value) {
            return FE_iface::get_attr_str(std::to_string(value.count()).c_str());
        };
        auto const count = [](int value) {
            return FE_iface::get_attr_str(std::to_string(value).c_str());
        };
        switch (attrib) {
            case ARA_ATTR_CONNECT_TIMEOUT:       return millis(config.connectTimeout);
            case ARA_ATTR_CONNECT_ATTEMPTS:      return count(config.connectAttempts);
            case ARA_ATTR_BACKOFF_BASE:          return millis(config.backoffBase);
            case ARA_ATTR_HEALTH_CHECK_ATTEMPTS: return count(config.healthCheckAttempts);
            case ARA_ATTR_HEALTH_CHECK_INTERVAL: return millis(config.healthCheckInterval);
            case ARA_ATTR_HEALTH_CHECK_TIMEOUT:  return millis(config.healthCheckTimeout);
            case ARA_ATTR_POLL_INTERVAL:         return millis(config.pollInterval);
            case ARA_ATTR_STALL_THRESHOLD:       return count(config.stallThreshold);
            case ARA_ATTR_CLEANUP_ATTEMPTS:      return count(config.cleanupAttempts);
            case ARA_ATTR_CLEANUP_RETRY_DELAY:   return millis(config.cleanupRetryDelay);
            case ARA_ATTR_REMOTE_BASE:           return FE_iface::get_attr_str(config.remoteBase.c_str());
            case ARA_ATTR_EVIDENCE_DIR:          return FE_iface::get_attr_str(config.evidenceDir.c_str());
            case ARA_ATTR_LOG_DIR:               return FE_iface::get_attr_str(config.logDir.c_str());
            case ARA_ATTR_DEBUG:                 return FE_iface::get_attr_str(config.debug ? "1" : "0");
            default:
                throw std::runtime_error("Invalid ara_attr_type_t " + std::to_string((int)attrib));
        }
        // Shouldn't get here
        return (const char *)nullptr;
    }, (const char*)nullptr);
}

int
ara_init(void)
{
    return FE_iface::runSafely(__func__, [&](){
        std::lock_guard<std::mutex> lock{s_mutex};
        if (s_runtime) {
            throw std::runtime_error("ara_init was already called.");
        }
        s_runtime = std::make_unique<Runtime>(pendingConfig(), s_callbacks);
        s_runtime->log.write("ara %s initialized\n", ARA_FE_VERSION);
        return SUCCESS;
    }, FAILURE);
}

int
ara_fini(void)
{
    return FE_iface::runSafely(__func__, [&](){
        if (AcquisitionSession::current() != nullptr) {
            throw std::logic_error("ara_fini must not be called from a state callback.");
        }
        auto finished = std::unique_ptr<Runtime>{};
        { std::lock_guard<std::mutex> lock{s_mutex};
            finished = std::move(s_runtime);
        }
        if (!finished) {
            throw std::runtime_error("ara_init has not been called.");
        }
        if (!finished->frontend.finalize()) {
            throw std::runtime_error("remote state was left behind on at least one target.");
        }
        return SUCCESS;
    }, FAILURE);
}

int
ara_registerStateCallback(ara_state_callback_t callback, void *user_data)
{
    return FE_iface::runSafely(__func__, [&](){
        s_callbacks.setCallback(callback, user_data);
        return SUCCESS;
    }, FAILURE);
}

ara_session_id_t
ara_requestSession(const char *address, const char *domain, const char *username, const char *secret,
    const ara_helper_t *helpers, size_t num_helpers)
{
    return FE_iface::runSafely(__func__, [&](){
        if ((address == nullptr) || (username == nullptr) || (secret == nullptr)) {
            throw std::runtime_error("NULL pointer passed as argument.");
        }
        if ((helpers == nullptr) || (num_helpers == 0)) {
            throw std::runtime_error("no helpers provided.");
        }

        // Copied into its scoped buffer first, so it is wiped on every path
        auto credentialSource = std::make_unique<OneShotCredentialSource>(Credential{username, secret});

        auto request = SessionRequest{};
        request.target.address = address;
        request.target.domain = (domain != nullptr) ? domain : "";
        for (size_t i = 0; i < num_helpers; i++) {
            auto const& helper = helpers[i];
            if (helper.binary_path == nullptr) {
                throw std::runtime_error("helper " + std::to_string(i) + " has no binary path.");
            }
            auto helperRequest = HelperRequest{};
            helperRequest.kind = helper.kind;
            helperRequest.binaryPath = helper.binary_path;
            helperRequest.args = stringArray(helper.args);
            helperRequest.supportFiles = stringArray(helper.support_files);
            helperRequest.port = helper.port;
            helperRequest.outputName = (helper.output_name != nullptr) ? helper.output_name : "";
            helperRequest.expectedBytes = helper.expected_bytes;
            request.helpers.push_back(std::move(helperRequest));
        }

        auto&& rt = runtime();
        return rt.frontend.requestSession(std::move(request), std::move(credentialSource))->id();
    }, SESSION_ERROR);
}

int
ara_sessionIsValid(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        runtime().frontend.getSession(sid);
        return true;
    }, false);
}

ara_session_state_t
ara_sessionState(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        return runtime().frontend.getSession(sid)->state();
    }, ARA_STATE_INIT);
}

int
ara_sessionProgress(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        return runtime().frontend.getSession(sid)->progress();
    }, -2);
}

ara_error_kind_t
ara_sessionError(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        auto const error = runtime().frontend.getSession(sid)->error();
        return error ? error->kind : ARA_ERR_NONE;
    }, ARA_ERR_NONE);
}

char *
ara_sessionSummary(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        auto const summary = runtime().frontend.getSession(sid)->summary();
        auto result = strdup(summary.c_str());
        if (result == nullptr) {
            throw std::runtime_error("strdup failed.");
        }
        return result;
    }, (char*)nullptr);
}

int
ara_stopSession(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        runtime().frontend.stopSession(sid);
        return SUCCESS;
    }, FAILURE);
}

int
ara_cancelSession(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        runtime().frontend.cancelSession(sid);
        return SUCCESS;
    }, FAILURE);
}

int
ara_waitSession(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        auto const session = runtime().frontend.getSession(sid);
        session->wait();
        return (session->state() == ARA_STATE_CLEANED) ? SUCCESS : FAILURE;
    }, FAILURE);
}

int
ara_retryCleanup(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        auto const result = runtime().frontend.retryCleanup(sid);
        if (!result.fullySucceeded) {
            throw CleanupFailure("cleanup incomplete: " + result.describe());
        }
        return SUCCESS;
    }, FAILURE);
}

int
ara_releaseSession(ara_session_id_t sid)
{
    return FE_iface::runSafely(__func__, [&](){
        runtime().frontend.releaseSession(sid);
        return SUCCESS;
    }, FAILURE);
}
