/******************************************************************************\
 * Connection.hpp - A header file for the SSH based connection to a target
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "frontend/Config.hpp"
#include "frontend/Connection.hpp"

#include "SSHSession/SSHSession.hpp"

#include "useful/ara_log.h"

namespace ara {

/*
** Connection over one authenticated libssh2 session. Helpers are started
** through a POSIX shell on the target: the launch wrapper detaches them into
** their own session, records their exit code next to them, and reports the
** wrapper pid and process group.
*/
class SSHConnection : public Connection
{
private: // members
    std::string m_host;
    SSHSession m_session;
    Logger& m_log;

private: // functions
    SSHSession& session();
    // run a shell script on the target and return its output
    SSHSession::CommandResult runScript(std::string const& script);

public: // inherited interface
    std::string const& host() const override { return m_host; }

    ProcessHandle launch(std::vector<std::string> const& argv, std::string const& workDir,
        std::string const& logPath) override;

    ProcessStatus status(ProcessHandle const& handle) override;

    void terminate(ProcessHandle const& handle) override;

    CommandResult execute(std::vector<std::string> const& argv) override;

    void sendFile(std::string const& localPath, std::string const& remotePath, int mode) override;

    uint64_t fetchFile(std::string const& remotePath, std::string const& localPath) override;

    bool probePort(int port) override;

    uint64_t fileSize(std::string const& remotePath) override;

    bool isAlive() override;

    void close() override;

public: // constructor / destructor interface
    SSHConnection(std::string host, SSHSession&& session, Logger& log);
    ~SSHConnection();
    SSHConnection(const SSHConnection&) = delete;
    SSHConnection& operator=(const SSHConnection&) = delete;
    SSHConnection(SSHConnection&&) = delete;
    SSHConnection& operator=(SSHConnection&&) = delete;
};

// Opens SSHConnections. Owns the process-wide libssh2 initialization.
class SSHTransport : public Transport
{
private: // members
    Config const& m_config;
    Logger& m_log;

public: // inherited interface
    std::unique_ptr<Connection>
    open(Target const& target, Credential const& credential, std::chrono::milliseconds timeout) override;

    bool
    reachable(Target const& target, std::chrono::milliseconds timeout) override;

public: // constructor / destructor interface
    SSHTransport(Config const& config, Logger& log);
    ~SSHTransport();
    SSHTransport(const SSHTransport&) = delete;
    SSHTransport& operator=(const SSHTransport&) = delete;
    SSHTransport(SSHTransport&&) = delete;
    SSHTransport& operator=(SSHTransport&&) = delete;
};

} /* namespace ara */
