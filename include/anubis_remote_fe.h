/*****************************************************************************\
 * anubis_remote_fe.h - External C interface to the remote acquisition core.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 *****************************************************************************/

#ifndef _ANUBIS_REMOTE_FE_H
#define _ANUBIS_REMOTE_FE_H

#include <stddef.h>

#include "anubis_remote_shared.h"

#ifdef __cplusplus
extern "C" {
#endif

/************************************************************
 * Types defined by the remote acquisition interface
 ***********************************************************/

typedef int64_t ara_session_id_t;

/*
 *  This enum enumerates the various attributes that
 *  can be set by ara_setAttribute.
 */
typedef enum
{
    ARA_ATTR_CONNECT_TIMEOUT,
    ARA_ATTR_CONNECT_ATTEMPTS,
    ARA_ATTR_BACKOFF_BASE,
    ARA_ATTR_HEALTH_CHECK_ATTEMPTS,
    ARA_ATTR_HEALTH_CHECK_INTERVAL,
    ARA_ATTR_HEALTH_CHECK_TIMEOUT,
    ARA_ATTR_POLL_INTERVAL,
    ARA_ATTR_STALL_THRESHOLD,
    ARA_ATTR_CLEANUP_ATTEMPTS,
    ARA_ATTR_CLEANUP_RETRY_DELAY,
    ARA_ATTR_REMOTE_BASE,
    ARA_ATTR_EVIDENCE_DIR,
    ARA_ATTR_LOG_DIR,
    ARA_ATTR_DEBUG
} ara_attr_type_t;

/*
 * Description of one helper to deploy on a target.
 *
 *      kind           - which helper this is
 *      binary_path    - local path of the helper executable
 *      args           - null-terminated argument list, or NULL. The
 *                       placeholders {port} and {output} are replaced by
 *                       the negotiated port and the remote output path.
 *      support_files  - null-terminated list of extra local files shipped
 *                       next to the binary, or NULL
 *      port           - listening port for services, 0 for tasks
 *      output_name    - file name the task writes its artifact to, or NULL
 *      expected_bytes - expected artifact size, 0 if unknown
 */
typedef struct
{
    ara_helper_kind_t       kind;
    const char *            binary_path;
    const char * const *    args;
    const char * const *    support_files;
    int                     port;
    const char *            output_name;
    uint64_t                expected_bytes;
} ara_helper_t;

/*
 * Called on every session state change. error_msg is NULL when error is
 * ARA_ERR_NONE. progress is 0-100, or -1 if indeterminate. The callback runs
 * on the session's worker thread and must not block. ara_releaseSession may be
 * called from it. ara_waitSession on the same session and ara_fini fail there.
 */
typedef void (*ara_state_callback_t)(ara_session_id_t sid,
    ara_session_state_t old_state, ara_session_state_t new_state,
    int progress, ara_error_kind_t error, const char *error_msg,
    void *user_data);

/************************************************************
 * The following functions are used to interact with the
 * interface itself. They can be called at any time.
 ***********************************************************/

/*
 * ara_version - Returns the version string of the interface.
 *
 * Returns
 *      A string containing the current interface version in the form
 *      major.minor.revision.
 */
const char * ara_version(void);

/*
 * ara_error_str - Get an error string associated with a command that returned
 *                 a failure.
 *
 * Detail
 *      This function returns an error string associated with a command that
 *      returned a failure. The string is never freed by the caller and is
 *      overwritten by the next failing call. No error string ever contains
 *      a credential secret.
 *
 * Returns
 *      A string containing the error message.
 */
const char * ara_error_str(void);

/*
 * ara_error_str_r - Thread-safe copy of the current error string into a
 *                   caller buffer. Returns 0 on success, ERANGE if
 *                   buf_len is 0.
 */
int ara_error_str_r(char *buf, size_t buf_len);

const char * ara_state_toString(ara_session_state_t state);
const char * ara_helper_kind_toString(ara_helper_kind_t kind);
const char * ara_error_kind_toString(ara_error_kind_t kind);

/*
 * ara_setAttribute - Set an attribute to a specified value. Used for
 *                    modifying runtime configuration.
 *
 * Detail
 *      Attributes must be set before ara_init. They override the matching
 *      environment variables.
 *
 *          ARA_ATTR_CONNECT_TIMEOUT        - milliseconds. Default: "30000"
 *          ARA_ATTR_CONNECT_ATTEMPTS       - attempts for transient network
 *                                            failures. Default: "3"
 *          ARA_ATTR_BACKOFF_BASE           - first backoff delay in
 *                                            milliseconds, doubled after each
 *                                            attempt. Default: "2000"
 *          ARA_ATTR_HEALTH_CHECK_ATTEMPTS  - Default: "10"
 *          ARA_ATTR_HEALTH_CHECK_INTERVAL  - milliseconds. Default: "500"
 *          ARA_ATTR_HEALTH_CHECK_TIMEOUT   - milliseconds. Default: "15000"
 *          ARA_ATTR_POLL_INTERVAL          - milliseconds. Default: "1000"
 *          ARA_ATTR_STALL_THRESHOLD        - consecutive failed polls before
 *                                            a session is stalled. Default: "5"
 *          ARA_ATTR_CLEANUP_ATTEMPTS       - Default: "3"
 *          ARA_ATTR_CLEANUP_RETRY_DELAY    - milliseconds between cleanup
 *                                            attempts. Default: "1000"
 *          ARA_ATTR_REMOTE_BASE            - Default: "/tmp"
 *          ARA_ATTR_EVIDENCE_DIR           - Default: current directory
 *          ARA_ATTR_LOG_DIR                - Default: "/tmp"
 *          ARA_ATTR_DEBUG                  - "0" or "1". Default: "0"
 *
 * Returns
 *      0 on success, or else 1 on failure
 */
int ara_setAttribute(ara_attr_type_t attrib, const char *value);

/*
 * ara_getAttribute - Get 'value' of 'attrib'. Returns a string owned by the
 *                    interface, or NULL on error.
 */
const char * ara_getAttribute(ara_attr_type_t attrib);

/*
 * ara_init - Initialize the interface.
 *
 * Detail
 *      Reads the environment, applies attributes set by ara_setAttribute
 *      and initializes the SSH transport. Must be called once before any
 *      session function.
 *
 * Returns
 *      0 on success, or else 1 on failure
 */
int ara_init(void);

/*
 * ara_fini - Cancel every active session, wait for their cleanup and release
 *            the interface. Returns 0 on success, or 1 if any session ended
 *            in ARA_STATE_FAILED_CLEANUP.
 */
int ara_fini(void);

/*
 * ara_registerStateCallback - Register a callback for session state changes.
 *                             Returns 0 on success, or else 1 on failure.
 */
int ara_registerStateCallback(ara_state_callback_t callback, void *user_data);

/************************************************************
 * Session functions. All require ara_init.
 ***********************************************************/

/*
 * ara_requestSession - Start an acquisition session against a target.
 *
 * Detail
 *      Creates a session for the target at 'address' and starts it in the
 *      background. The session connects with the given credentials, deploys
 *      every helper in 'helpers' in order, and runs until it is stopped,
 *      cancelled, completes or fails. The secret is copied into a scoped
 *      buffer that is wiped as soon as the connection attempt finishes; the
 *      caller may clear its own copy immediately after this call returns.
 *
 *      Only one session may be active per target. A second request against
 *      an active target fails without affecting the first.
 *
 * Arguments
 *      address     - host name or IP address of the target
 *      domain      - authentication domain, or NULL
 *      username    - account to authenticate as
 *      secret      - password for the account
 *      helpers     - array of helpers to deploy
 *      num_helpers - length of the helpers array
 *
 * Returns
 *      A non-zero ara_session_id_t on success, or else 0 on failure.
 */
ara_session_id_t ara_requestSession(const char *address, const char *domain,
    const char *username, const char *secret,
    const ara_helper_t *helpers, size_t num_helpers);

int ara_sessionIsValid(ara_session_id_t sid);

ara_session_state_t ara_sessionState(ara_session_id_t sid);

/* Returns 0-100, -1 if indeterminate, or -2 on error */
int ara_sessionProgress(ara_session_id_t sid);

ara_error_kind_t ara_sessionError(ara_session_id_t sid);

/*
 * ara_sessionSummary - Human readable summary of the session's state.
 *                      The returned string must be freed by the caller.
 *                      Returns NULL on error.
 */
char * ara_sessionSummary(ara_session_id_t sid);

/*
 * ara_stopSession - Request an orderly stop. The session tears down every
 *                   helper and closes its connection. Returns immediately;
 *                   use ara_waitSession to wait for the resting state.
 */
int ara_stopSession(ara_session_id_t sid);

/*
 * ara_cancelSession - Abort whatever the session is doing. Cleanup still
 *                     runs exactly as for ara_stopSession.
 */
int ara_cancelSession(ara_session_id_t sid);

/*
 * ara_waitSession - Block until the session reaches a resting state.
 *
 * Returns
 *      0 if the session ended ARA_STATE_CLEANED, or else 1.
 */
int ara_waitSession(ara_session_id_t sid);

/*
 * ara_retryCleanup - Re-run teardown for a session in
 *                    ARA_STATE_FAILED_CLEANUP. Returns 0 if the session is
 *                    now fully cleaned, or else 1.
 */
int ara_retryCleanup(ara_session_id_t sid);

/*
 * ara_releaseSession - Forget a session that is in a resting state. A
 *                      session in ARA_STATE_FAILED_CLEANUP is released with a
 *                      warning naming the remote state that was left behind.
 */
int ara_releaseSession(ara_session_id_t sid);

#ifdef __cplusplus
}
#endif

#endif /* _ANUBIS_REMOTE_FE_H */
