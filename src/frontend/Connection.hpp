/******************************************************************************\
 * Connection.hpp - Abstract administrative channel to a target host, and the
 *                  transport that opens it.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <stdint.h>

#include "Model.hpp"
#include "Credential.hpp"

namespace ara {

/*
** A Connection is an authenticated channel to one target. It executes
** commands, moves files and starts helper processes there. It never holds the
** credential it was opened with. Implementations throw ara::Error subtypes
** for timeouts and std::runtime_error for anything else that fails.
*/
class Connection {
public: // types
    struct CommandResult {
        int exitCode;
        std::string output; // stdout and stderr, interleaved
    };

public: // interface
    // host this connection is open to
    virtual std::string const& host() const = 0;

    // start argv in workDir, detached in its own process group, with stdout
    // and stderr captured to logPath
    virtual ProcessHandle
    launch(std::vector<std::string> const& argv, std::string const& workDir,
        std::string const& logPath) = 0;

    virtual ProcessStatus
    status(ProcessHandle const& handle) = 0;

    // terminate the helper's process group
    virtual void
    terminate(ProcessHandle const& handle) = 0;

    // run a command to completion
    virtual CommandResult
    execute(std::vector<std::string> const& argv) = 0;

    virtual void
    sendFile(std::string const& localPath, std::string const& remotePath, int mode) = 0;

    // copy a remote file to localPath, returns the number of bytes copied
    virtual uint64_t
    fetchFile(std::string const& remotePath, std::string const& localPath) = 0;

    // test whether the target accepts TCP connections on its own port
    virtual bool
    probePort(int port) = 0;

    // current size of a remote file, 0 if it does not exist yet
    virtual uint64_t
    fileSize(std::string const& remotePath) = 0;

    virtual bool
    isAlive() = 0;

    // close the channel, safe to repeat
    virtual void
    close() = 0;

    virtual ~Connection() = default;
};

/*
** A Transport opens connections. The credential is only borrowed for the
** duration of the call.
*/
class Transport {
public: // interface
    virtual std::unique_ptr<Connection>
    open(Target const& target, Credential const& credential, std::chrono::milliseconds timeout) = 0;

    // plain reachability check of the administrative port
    virtual bool
    reachable(Target const& target, std::chrono::milliseconds timeout) = 0;

    virtual ~Transport() = default;
};

} /* namespace ara */
