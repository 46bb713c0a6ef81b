/******************************************************************************\
 * SSHSession.hpp - A header file for the SSH helper functions
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <stdint.h>

#include <libssh2.h>

#include "useful/ara_wrappers.hpp"
#include "useful/ara_log.h"

namespace ara {

// Custom deleters
static void delete_ssh2_session(LIBSSH2_SESSION *pSession)
{
    libssh2_session_disconnect(pSession, "Session closed");
    libssh2_session_free(pSession);
}

static void delete_ssh2_channel(LIBSSH2_CHANNEL *pChannel)
{
    // SSH standard does not mandate sending EOF before closing connection,
    // but some SSH servers will not respond properly to shutdown requests
    // unless an EOF message is received
    libssh2_channel_send_eof(pChannel);
    libssh2_channel_wait_eof(pChannel);

    libssh2_channel_close(pChannel);
    libssh2_channel_wait_closed(pChannel);
    libssh2_channel_free(pChannel);
}

// Forwarded TCP channels are closed without waiting for the peer's EOF, a
// listening service would keep them open
static void delete_ssh2_tunnel(LIBSSH2_CHANNEL *pChannel)
{
    libssh2_channel_close(pChannel);
    libssh2_channel_free(pChannel);
}

namespace remote {

// Connect a TCP socket to host:port within timeout. Throws NetworkUnreachable
// if the host cannot be resolved or refuses, TimeoutExceeded if it does not
// answer in time.
fd_handle connectSocket(std::string const& hostname, int port, std::chrono::milliseconds timeout);

} /* namespace ara::remote */

class SSHSession
{
public: // types
    using UniqueSession = std::unique_ptr<LIBSSH2_SESSION, decltype(&delete_ssh2_session)>;
    using UniqueChannel = std::unique_ptr<LIBSSH2_CHANNEL, decltype(&delete_ssh2_channel)>;

    struct CommandResult {
        int exitCode;
        std::string output;
    };

private: // members
    fd_handle m_session_sock;
    UniqueSession m_session_ptr;
    std::string m_hostname;
    Logger* m_log;

private: // functions
    LIBSSH2_SESSION* session() const;
    UniqueChannel openChannel();
    void verifyHostKey(std::string const& knownHostsPath, int port);

public: // interface
    /*
     * SSHSession constructor - start an ssh session with a remote host
     *
     * detail
     *      connects to hostname within timeout, trades banners and keys, and
     *      verifies the identity of the remote host against knownHostsPath.
     *      Hosts missing from the file are accepted for this session only;
     *      a mismatching key is an AuthenticationError. The session is not
     *      authenticated yet.
     *
     * arguments
     *      hostname - hostname of remote host to which to connect
     *      port - port of the remote ssh service
     *      knownHostsPath - known_hosts file, may be empty or missing
     *      timeout - limit for the TCP connect and for every blocking libssh2 call
     *      log - session log
     */
    SSHSession(std::string const& hostname, int port, std::string const& knownHostsPath,
        std::chrono::milliseconds timeout, Logger& log);

    ~SSHSession() = default;

    SSHSession(SSHSession&& expiring);
    SSHSession& operator=(SSHSession&& expiring);

    // Delete copy constructors
    SSHSession(const SSHSession&) = delete;
    SSHSession& operator=(const SSHSession&) = delete;

    /*
     * authenticate - Authenticate the session as loginName
     *
     * Detail
     *      Uses the password method if the server offers it, then
     *      keyboard-interactive with the secret answering every prompt, then
     *      the ssh-agent. The secret is only passed through to libssh2 and is
     *      never logged or copied into an error message.
     *
     * Arguments
     *      loginName - account name, domain\user for domain accounts
     *      secret - password buffer
     *      secretLength - length of secret
     */
    void authenticate(std::string const& loginName, char const* secret, size_t secretLength);

    // limit for every later blocking libssh2 call
    void setTimeout(std::chrono::milliseconds timeout);

    /*
     * executeRemoteCommand - Execute a command on a remote host through an ssh session
     *
     * Detail
     *      Runs command through the remote login shell, waits for it to finish
     *      and returns its exit status together with everything it wrote to
     *      stdout.
     *
     * Arguments
     *      command - shell command line, already quoted
     */
    CommandResult executeRemoteCommand(std::string const& command);

    /*
     * sendRemoteFile - Send a file to a remote host on an open ssh session
     *
     * Detail
     *      Sends the file specified by source_path to the remote host connected on session
     *      at the location destination_path on the remote host with permissions specified by
     *      mode.
     *
     * Arguments
     *      source_path - A C-string specifying the path to the file to ship
     *      destination_path- A C-string specifying the path of the destination on the remote host
     *      mode- POSIX mode for specifying permissions of new file on remote host
     */
    void sendRemoteFile(const char* source_path, const char* destination_path, int mode);

    // Copy source_path on the remote host to destination_path. Returns bytes copied.
    uint64_t receiveRemoteFile(const char* source_path, const char* destination_path);

    // Test whether the remote host accepts a tunnelled connection to its own port
    bool probeRemotePort(int port);

    // Send a keepalive and report whether the transport still works
    bool isAlive();

    // Disconnect and release the session, safe to repeat
    void disconnect();

    bool connected() const { return m_session_ptr != nullptr; }
};

} /* namespace ara */
