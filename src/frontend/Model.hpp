/******************************************************************************\
 * Model.hpp - Records describing targets, deployments and their progress.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "anubis_remote_shared.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>
#include <sys/types.h>

#include "Errors.hpp"

namespace ara {

using SessionId = int64_t;
using Clock = std::chrono::system_clock;

enum class Reachability { Unknown, Reachable, Unreachable };

struct Target {
    std::string address;
    std::string domain;
    Reachability reachability = Reachability::Unknown;

    // identity used to enforce one active session per target
    std::string identity() const;
};

// Trimmed, lower-cased address
std::string targetIdentity(std::string const& address);

// Helper process started on a target
struct ProcessHandle {
    pid_t pid = 0;          // launch wrapper pid
    pid_t groupId = 0;      // process group of the helper and its wrapper
    std::string exitFile;   // written with the exit code once the helper ends
};

struct ProcessStatus {
    bool running = false;
    int exitCode = -1;      // -1 while running or if the helper was killed
};

// File browsers serve a port until stopped, the other kinds are tasks that
// write one output file and exit
bool isServiceKind(ara_helper_kind_t kind);

// What the caller asked to deploy
struct HelperRequest {
    ara_helper_kind_t kind = ARA_HELPER_FILE_BROWSER;
    std::string binaryPath;
    std::vector<std::string> args;
    int port = 0;
    std::vector<std::string> supportFiles;
    std::string outputName;
    uint64_t expectedBytes = 0;

    bool isService() const { return isServiceKind(kind); }
};

// What was created on the target for one helper. Filled in progressively so
// that a partial deployment can always be rolled back.
struct Deployment {
    std::string id;
    ara_helper_kind_t kind = ARA_HELPER_FILE_BROWSER;
    std::string remoteDir;
    std::string remoteBinary;
    int port = 0;
    ProcessHandle process;
    Clock::time_point deployedAt;
    bool cleanupRequired = false;
    bool healthy = false;
    std::string outputPath;
    uint64_t expectedBytes = 0;
    bool completed = false;
    int exitCode = -1;

    bool isService() const { return isServiceKind(kind); }
    std::string describe() const;
};

struct ArtifactDescriptor {
    SessionId sessionId = 0;
    ara_helper_kind_t kind = ARA_HELPER_MEMORY_IMAGER;
    std::string remotePath;
    std::string localPath;
    uint64_t bytes = 0;
    Clock::time_point acquiredAt;
};

enum class ProgressStatus { Running, Completed, Exited };

struct ProgressUpdate {
    int percent = -1;           // 0-100, or -1 if indeterminate
    uint64_t bytesTransferred = 0;
    ProgressStatus status = ProgressStatus::Running;
    int exitCode = -1;
};

// Published to observers on every state transition
struct SessionEvent {
    SessionId sessionId = 0;
    ara_session_state_t oldState = ARA_STATE_INIT;
    ara_session_state_t newState = ARA_STATE_INIT;
    int progress = -1;
    std::optional<Outcome> error;
};

char const* stateName(ara_session_state_t state);
char const* helperKindName(ara_helper_kind_t kind);
char const* errorKindName(ara_error_kind_t kind);

// CLEANED, FAILED and FAILED_CLEANUP are never left without outside help
bool isResting(ara_session_state_t state);

} /* namespace ara */
