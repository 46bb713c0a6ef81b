/******************************************************************************\
 * anubis_remote_shared.h - Type definitions shared between the remote
 *                          acquisition core and its C interface.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _ANUBIS_REMOTE_SHARED_H
#define _ANUBIS_REMOTE_SHARED_H

#include <stdint.h>
#include <sys/types.h>

/*
 * The remote acquisition core reads environment variables about its
 * configuration at initialization time. The environment variables that are
 * read are defined here. Use the defines to guarantee portability.
 *
 * ARA_DBG_ENV_VAR (optional)
 *
 *      Turns on debug logging. Log files are written to the directory named
 *      by ARA_LOG_DIR_ENV_VAR, or to /tmp if unset.
 *
 * ARA_LOG_DIR_ENV_VAR (optional)
 *
 *      Directory to write log files to.
 *
 * ARA_STAGE_DIR_ENV_VAR (optional)
 *
 *      Local directory used to stage helper packages before they are copied
 *      to a target. Defaults to $TMPDIR, then /tmp.
 *
 * ARA_EVIDENCE_DIR_ENV_VAR (optional)
 *
 *      Local directory that completed acquisitions are copied into.
 *      Defaults to the current working directory.
 *
 * ARA_REMOTE_BASE_ENV_VAR (optional)
 *
 *      Directory on the target under which helper working directories are
 *      created. Defaults to /tmp.
 *
 * ARA_SSH_PORT_ENV_VAR (optional)
 *
 *      Port of the administrative (SSH) service on targets. Defaults to 22.
 *
 * ARA_SSH_KNOWNHOSTS_PATH_ENV_VAR (optional)
 *
 *      known_hosts file used to verify target host keys. Defaults to
 *      ~/.ssh/known_hosts.
 *
 * Timing and retry attributes (ARA_CONNECT_TIMEOUT_ENV_VAR and friends) are
 * listed with their defaults in ara_defs.h.
 */
#define ARA_DBG_ENV_VAR                  "ARA_DEBUG"
#define ARA_LOG_DIR_ENV_VAR              "ARA_LOG_DIR"
#define ARA_STAGE_DIR_ENV_VAR            "ARA_STAGE_DIR"
#define ARA_EVIDENCE_DIR_ENV_VAR         "ARA_EVIDENCE_DIR"
#define ARA_REMOTE_BASE_ENV_VAR          "ARA_REMOTE_BASE"
#define ARA_SSH_PORT_ENV_VAR             "ARA_SSH_PORT"
#define ARA_SSH_KNOWNHOSTS_PATH_ENV_VAR  "ARA_SSH_KNOWNHOSTS_PATH"

/*
 * Session states. ARA_STATE_CLEANED, ARA_STATE_FAILED and
 * ARA_STATE_FAILED_CLEANUP are resting states: a session never leaves them
 * on its own. ARA_STATE_FAILED_CLEANUP means state was left on the target.
 */
typedef enum
{
    ARA_STATE_INIT,
    ARA_STATE_CONNECTING,
    ARA_STATE_CONNECTED,
    ARA_STATE_DEPLOYING,
    ARA_STATE_RUNNING,
    ARA_STATE_STOPPING,
    ARA_STATE_CLEANED,
    ARA_STATE_FAILED,
    ARA_STATE_FAILED_CLEANUP
} ara_session_state_t;

/* Helpers that can be deployed to a target */
typedef enum
{
    ARA_HELPER_FILE_BROWSER,    // long running service, listens on a port
    ARA_HELPER_MEMORY_IMAGER,   // task, writes a memory image and exits
    ARA_HELPER_PROCESS_DUMPER   // task, writes a process dump and exits
} ara_helper_kind_t;

/* Error kinds reported by the core */
typedef enum
{
    ARA_ERR_NONE,
    ARA_ERR_AUTHENTICATION,
    ARA_ERR_NETWORK_UNREACHABLE,
    ARA_ERR_TIMEOUT_EXCEEDED,
    ARA_ERR_DEPLOYMENT_FAILURE,
    ARA_ERR_ACQUISITION_STALLED,
    ARA_ERR_DUPLICATE_SESSION,
    ARA_ERR_USER_CANCELLED,
    ARA_ERR_CLEANUP_FAILURE
} ara_error_kind_t;

#endif /* _ANUBIS_REMOTE_SHARED_H */
