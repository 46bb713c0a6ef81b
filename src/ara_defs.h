/******************************************************************************\
 * ara_defs.h - A header file for common compile time defines.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _ARA_DEFS_H
#define _ARA_DEFS_H

#include "anubis_remote_shared.h"

#include <limits.h>
#include <stdint.h>
#include <sys/types.h>

/*******************************************************************************
** Generic defines
*******************************************************************************/
#ifndef ARA_FE_VERSION
#define ARA_FE_VERSION          "1.0.0"
#endif
#define ARA_BUF_SIZE            4096
#define ARA_ERR_STR_SIZE        1024
#define DEFAULT_ERR_STR         "Unknown remote acquisition error"
#define ARA_LOG_NAME            "ara_session"                       // log file base name, suffixed with pid

/*******************************************************************************
** Local staging
*******************************************************************************/
// The following need the 'X' for random char replacement.
#define ARA_STAGE_DIR           "araXXXXXX"                         // local directory for staging helper packages
#define ARA_PACKAGE_NAME        "helper.tar"                        // name of the staged helper archive
#define ARA_DEFAULT_LOG_DIR     "/tmp"

/*******************************************************************************
** Remote layout
*******************************************************************************/
#define ARA_REMOTE_BASE         "/tmp"                              // default parent of remote working directories
#define ARA_REMOTE_DIR_FMT      "ara_%s.XXXXXX"                     // remote working directory, %s is the helper kind
#define ARA_REMOTE_LOG_FILE     "helper.log"                        // helper stdout / stderr, inside the working directory
#define ARA_REMOTE_EXIT_FILE    ".exit"                             // helper exit status, written by the launch wrapper
#define ARA_SSH_PORT            22

/*******************************************************************************
** Timing defaults. All durations in milliseconds.
*******************************************************************************/
#define ARA_CONNECT_TIMEOUT_ENV_VAR         "ARA_CONNECT_TIMEOUT"
#define ARA_CONNECT_ATTEMPTS_ENV_VAR        "ARA_CONNECT_ATTEMPTS"
#define ARA_BACKOFF_BASE_ENV_VAR            "ARA_BACKOFF_BASE"
#define ARA_HEALTH_CHECK_ATTEMPTS_ENV_VAR   "ARA_HEALTH_CHECK_ATTEMPTS"
#define ARA_HEALTH_CHECK_INTERVAL_ENV_VAR   "ARA_HEALTH_CHECK_INTERVAL"
#define ARA_HEALTH_CHECK_TIMEOUT_ENV_VAR    "ARA_HEALTH_CHECK_TIMEOUT"
#define ARA_POLL_INTERVAL_ENV_VAR           "ARA_POLL_INTERVAL"
#define ARA_STALL_THRESHOLD_ENV_VAR         "ARA_STALL_THRESHOLD"
#define ARA_CLEANUP_ATTEMPTS_ENV_VAR        "ARA_CLEANUP_ATTEMPTS"
#define ARA_CLEANUP_RETRY_DELAY_ENV_VAR     "ARA_CLEANUP_RETRY_DELAY"

#define ARA_DEFAULT_CONNECT_TIMEOUT         30000
#define ARA_DEFAULT_CONNECT_ATTEMPTS        3
#define ARA_DEFAULT_BACKOFF_BASE            2000
#define ARA_DEFAULT_HEALTH_CHECK_ATTEMPTS   10
#define ARA_DEFAULT_HEALTH_CHECK_INTERVAL   500
#define ARA_DEFAULT_HEALTH_CHECK_TIMEOUT    15000
#define ARA_DEFAULT_POLL_INTERVAL           1000
#define ARA_DEFAULT_STALL_THRESHOLD         5
#define ARA_DEFAULT_CLEANUP_ATTEMPTS        3
#define ARA_DEFAULT_CLEANUP_RETRY_DELAY     1000
#define ARA_DEFAULT_COMMAND_TIMEOUT         60000                   // per remote command / transfer

/*******************************************************************************
** CLI
*******************************************************************************/
#define ARA_SECRET_ENV_VAR      "ARA_SECRET"                        // ara_acquire: secret for non-interactive use (read)

#endif /* _ARA_DEFS_H */
