/******************************************************************************\
 * SSHSession.cpp - libssh2 session used as the administrative channel to a
 *                  target host.
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <algorithm>
#include <vector>

#include "SSHSession.hpp"

#include "frontend/Errors.hpp"

#include <libssh2.h>

namespace ara {

namespace remote {

fd_handle connectSocket(std::string const& hostname, int port, std::chrono::milliseconds timeout)
{
    struct addrinfo hints = {};
    // Setup the hints structure
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo *host;
    auto const service = std::to_string(port);
    if (auto const rc = getaddrinfo(hostname.c_str(), service.c_str(), &hints, &host)) {
        throw NetworkUnreachable("failed to resolve " + hostname + ": " + gai_strerror(rc));
    }
    // Take ownership of the host addrinfo into the unique_ptr.
    // This will enforce cleanup.
    auto host_ptr = take_pointer_ownership(std::move(host), freeaddrinfo);

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lastError = std::string{"no usable address"};
    auto timedOut = false;

    for (auto addr = host_ptr.get(); addr != nullptr; addr = addr->ai_next) {

        auto const raw_sock = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if (raw_sock < 0) {
            lastError = strerror(errno);
            continue;
        }
        auto sock = fd_handle{raw_sock};

        // Connect without blocking so the attempt can be bounded
        auto const flags = ::fcntl(sock.fd(), F_GETFL);
        if ((flags < 0) || (::fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK) < 0)) {
            throw std::runtime_error("fcntl failed on socket: " + std::string{strerror(errno)});
        }

        if (::connect(sock.fd(), addr->ai_addr, addr->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                lastError = strerror(errno);
                continue;
            }

            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                timedOut = true;
                break;
            }

            auto pfd = pollfd{sock.fd(), POLLOUT, 0};
            int rc;
            do {
                rc = ::poll(&pfd, 1, (int)remaining);
            } while ((rc < 0) && (errno == EINTR));

            if (rc == 0) {
                timedOut = true;
                continue;
            } else if (rc < 0) {
                lastError = strerror(errno);
                continue;
            }

            // Check the result of the connect
            int so_error = 0;
            auto so_len = socklen_t{sizeof(so_error)};
            if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
                lastError = strerror(errno);
                continue;
            }
            if (so_error != 0) {
                lastError = strerror(so_error);
                continue;
            }
        }

        // Back to blocking mode, libssh2 applies its own timeout
        if (::fcntl(sock.fd(), F_SETFL, flags) < 0) {
            throw std::runtime_error("fcntl failed on socket: " + std::string{strerror(errno)});
        }

        return sock;
    }

    if (timedOut) {
        throw TimeoutExceeded("connection to " + hostname + ":" + service + " timed out after "
            + std::to_string(timeout.count()) + " ms");
    }
    throw NetworkUnreachable("failed to connect to " + hostname + ":" + service + ": " + lastError);
}

} /* namespace ara::remote */

class SSHAgent {
private:
    LIBSSH2_AGENT * m_agent;
    std::string     m_username;

public:
    SSHAgent(LIBSSH2_SESSION *session, std::string username)
        : m_agent{nullptr}, m_username{username}
    {
        if (session == nullptr) {
            throw std::logic_error("SSHAgent: session was null");
        }

        // Connect to the ssh-agent
        m_agent = libssh2_agent_init(session);
        if (m_agent == nullptr) {
            throw std::runtime_error("Could not init ssh-agent support.");
        }
    }

    ~SSHAgent()
    {
        // cleanup
        if (m_agent != nullptr) {
            libssh2_agent_disconnect(m_agent);
            libssh2_agent_free(m_agent);
        }
    }

    // Delete copy/move constructors
    SSHAgent(const SSHAgent&) = delete;
    SSHAgent& operator=(const SSHAgent&) = delete;
    SSHAgent(SSHAgent&&) = delete;
    SSHAgent& operator=(SSHAgent&&) = delete;

    void auth()
    {
        if (libssh2_agent_connect(m_agent)) {
            throw std::runtime_error("Could not connect to ssh-agent.");
        }
        if (libssh2_agent_list_identities(m_agent)) {
            throw std::runtime_error("Could not request identities from ssh-agent.");
        }
        // Try to obtain a valid identity from the agent and authenticate
        struct libssh2_agent_publickey *identity, *prev_identity = nullptr;
        while (1) {
            auto rc = libssh2_agent_get_identity(m_agent, &identity, prev_identity);

            if (rc < 0) {
                throw std::runtime_error("Could not obtain identity from ssh-agent.");

            } else if (rc == 1) {
                throw std::runtime_error("ssh-agent reached the end of the public keys without authenticating.");
            }

            // Only valid return codes are 1, 0, or negative value.
            if (libssh2_agent_userauth(m_agent, m_username.c_str(), identity) == 0) {
                return;
            }

            prev_identity = identity;
        }
    }
};

// SSHSession implementations

// Get libssh2 error information
static auto get_libssh2_error(LIBSSH2_SESSION* session)
{
    char *libssh2_error_ptr = nullptr;
    libssh2_session_last_error(session, &libssh2_error_ptr, nullptr, false);
    return std::string{ (libssh2_error_ptr)
        ? libssh2_error_ptr
        : "no error information available"
    };
}

// Raise the error matching a failed libssh2 call
[[noreturn]] static void
throw_libssh2_error(LIBSSH2_SESSION* session, std::string const& what, int rc)
{
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        throw TimeoutExceeded(what + ": timed out");
    }
    throw std::runtime_error(what + ": " + get_libssh2_error(session));
}

// Retry if hit a spurious timeout
template <typename Func>
static auto libssh2_retry(Func&& func)
{
    auto rc = LIBSSH2_ERROR_TIMEOUT;
    for (auto i = 0; i < 3; i++) {
        rc = func();

        if (rc != LIBSSH2_ERROR_TIMEOUT)  {
            break;
        }

        ::sleep(1);
    }

    return rc;
}

// Map the host key type reported by libssh2 to the known_hosts key type
static int knownhost_keymask(int const hostkey_type)
{
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:
            return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

// Secret handed to the keyboard-interactive callback through the session abstract
struct KbdintSecret {
    char const* secret;
    size_t length;
};

// Answer every keyboard-interactive prompt with the secret
static LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(kbdint_response)
{
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;

    auto const kbdint = (abstract != nullptr) ? static_cast<KbdintSecret*>(*abstract) : nullptr;
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if ((kbdint == nullptr) || (kbdint->length == 0)) {
            continue;
        }
        // libssh2 takes ownership of the response and frees it
        if (auto const text = (char*)::malloc(kbdint->length)) {
            ::memcpy(text, kbdint->secret, kbdint->length);
            responses[i].text = text;
            responses[i].length = (unsigned int)kbdint->length;
        }
    }
}

SSHSession::SSHSession(std::string const& hostname, int port, std::string const& knownHostsPath,
    std::chrono::milliseconds timeout, Logger& log)
    : m_session_sock{remote::connectSocket(hostname, port, timeout)}
    , m_session_ptr{nullptr, delete_ssh2_session}
    , m_hostname{hostname}
    , m_log{&log}
{
    // Init a new libssh2 session.
    m_session_ptr = take_pointer_ownership(libssh2_session_init(), delete_ssh2_session);
    if (m_session_ptr == nullptr) {
        throw std::runtime_error("libssh2_session_init() failed");
    }

    // Set to blocking mode, bounded by the timeout
    libssh2_session_set_blocking(m_session_ptr.get(), 1);
    libssh2_session_set_timeout(m_session_ptr.get(), (long)timeout.count());
    if (::getenv(ARA_DBG_ENV_VAR) != nullptr) {
        libssh2_trace(m_session_ptr.get(), LIBSSH2_TRACE_KEX | LIBSSH2_TRACE_AUTH | LIBSSH2_TRACE_ERROR);
    }

    // Start up the new session.
    // This will trade welcome banners, exchange keys, and setup crypto,
    // compression, and MAC layers.
    auto const handshake_rc = libssh2_session_handshake(m_session_ptr.get(), m_session_sock.fd());
    if (handshake_rc < 0) {
        if (handshake_rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutExceeded("SSH handshake with " + hostname + " timed out");
        }
        throw NetworkUnreachable("Failure establishing SSH session with " + hostname + ": "
            + get_libssh2_error(m_session_ptr.get()));
    }

    // At this point we havn't authenticated. The first thing to do is check
    // the hostkey's fingerprint against our known hosts.
    verifyHostKey(knownHostsPath, port);

    // Keepalives are sent on demand by isAlive
    libssh2_keepalive_config(m_session_ptr.get(), 1, 60);

    m_log->write("ssh session to %s:%d established\n", hostname.c_str(), port);
}

void SSHSession::verifyHostKey(std::string const& knownHostsPath, int port)
{
    auto known_host_ptr = take_pointer_ownership(libssh2_knownhost_init(session()),
                                                 libssh2_knownhost_free);
    if (known_host_ptr == nullptr) {
        throw std::runtime_error("Failure initializing knownhost file");
    }

    // Read known_hosts
    if (!knownHostsPath.empty() && fileHasPerms(knownHostsPath.c_str(), R_OK)) {
        auto const rc = libssh2_knownhost_readfile(known_host_ptr.get(), knownHostsPath.c_str(),
            LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (rc < 0) {
            throw std::runtime_error("The SSH known hosts file at " + knownHostsPath +
                " failed to parse correctly. Ensure the file exists and is formatted correctly. If your "
                "system is configured to use a non-default SSH known_hosts file, it can be overridden "
                "by setting the environment variable " ARA_SSH_KNOWNHOSTS_PATH_ENV_VAR " to the known hosts file "
                "path.");
        }
    } else {
        m_log->write("known hosts file '%s' is not readable, host keys are checked against an empty list\n",
            knownHostsPath.c_str());
    }

    // obtain the session hostkey fingerprint
    size_t len;
    int type;
    const char *fingerprint = libssh2_session_hostkey(session(), &len, &type);
    if (fingerprint == nullptr) {
        throw std::runtime_error("Failed to obtain the remote hostkey of " + m_hostname);
    }

    // Check the remote hostkey against the knownhosts
    auto const keymask = knownhost_keymask(type);
    struct libssh2_knownhost *kh = nullptr;
    auto const check = libssh2_knownhost_checkp(known_host_ptr.get(),
                                                m_hostname.c_str(), port,
                                                fingerprint, len,
                                                LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                                LIBSSH2_KNOWNHOST_KEYENC_RAW |
                                                keymask,
                                                &kh);
    switch (check) {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            // Do nothing
            break;
        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
            // Accepted for this session only, known_hosts is never written
            m_log->write("host key of %s is not in the known hosts file, accepting it for this session\n",
                m_hostname.c_str());
            break;
        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            throw AuthenticationError("Remote hostkey mismatch with knownhosts file! Remove the host from knownhosts to resolve: " + m_hostname);
        case LIBSSH2_KNOWNHOST_CHECK_FAILURE:
        default:
            throw std::runtime_error("Failure with libssh2 knownhost check for " + m_hostname);
    }
}

SSHSession::SSHSession(SSHSession&& expiring)
    : m_session_sock{std::move(expiring.m_session_sock)}
    , m_session_ptr{std::move(expiring.m_session_ptr)}
    , m_hostname{std::move(expiring.m_hostname)}
    , m_log{expiring.m_log}
{
    expiring.m_hostname = {};
}

SSHSession& SSHSession::operator=(SSHSession&& expiring)
{
    // release the session before its socket
    m_session_ptr = std::move(expiring.m_session_ptr);
    m_session_sock = std::move(expiring.m_session_sock);
    m_hostname = std::move(expiring.m_hostname);
    m_log = expiring.m_log;

    expiring.m_hostname = {};

    return *this;
}

LIBSSH2_SESSION* SSHSession::session() const
{
    if (m_session_ptr == nullptr) {
        throw std::runtime_error("SSH session to " + m_hostname + " is closed");
    }
    return m_session_ptr.get();
}

void SSHSession::authenticate(std::string const& loginName, char const* secret, size_t secretLength)
{
    // check what authentication methods are available
    auto const userauthlist = libssh2_userauth_list(session(), loginName.c_str(), loginName.length());
    if (userauthlist == nullptr) {
        // The server accepted the "none" method
        if (libssh2_userauth_authenticated(session())) {
            return;
        }
        auto const rc = libssh2_session_last_errno(session());
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutExceeded("authentication with " + m_hostname + " timed out");
        }
        throw AuthenticationError("failed to query authentication methods of " + m_hostname + " for "
            + loginName + ": " + get_libssh2_error(session()));
    }
    auto const methods = std::string{userauthlist};
    auto offered = [&methods](char const* method) {
        return methods.find(method) != std::string::npos;
    };

    // Password authentication
    if (offered("password") && (secretLength > 0)) {
        auto const rc = libssh2_userauth_password_ex(session(), loginName.c_str(), loginName.length(),
            secret, secretLength, nullptr);
        if (rc == 0) {
            m_log->write("authenticated as %s on %s using password\n", loginName.c_str(), m_hostname.c_str());
            return;
        } else if (rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutExceeded("password authentication with " + m_hostname + " timed out");
        }
        m_log->write("password authentication as %s on %s was rejected (%d)\n",
            loginName.c_str(), m_hostname.c_str(), rc);
    }

    // Keyboard-interactive, the secret answers every prompt
    if (offered("keyboard-interactive") && (secretLength > 0)) {
        auto kbdint = KbdintSecret{secret, secretLength};
        auto const abstract = libssh2_session_abstract(session());
        *abstract = &kbdint;
        auto const rc = libssh2_userauth_keyboard_interactive_ex(session(), loginName.c_str(),
            loginName.length(), kbdint_response);
        *abstract = nullptr;
        if (rc == 0) {
            m_log->write("authenticated as %s on %s using keyboard-interactive\n", loginName.c_str(), m_hostname.c_str());
            return;
        } else if (rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutExceeded("keyboard-interactive authentication with " + m_hostname + " timed out");
        }
        m_log->write("keyboard-interactive authentication as %s on %s was rejected (%d)\n",
            loginName.c_str(), m_hostname.c_str(), rc);
    }

    // Fall back on the ssh-agent mechanism
    if (offered("publickey")) {
        try {
            SSHAgent agent(session(), loginName);
            agent.auth();
            m_log->write("authenticated as %s on %s using ssh-agent\n", loginName.c_str(), m_hostname.c_str());
            return;

        } catch (std::exception const& ex) {
            m_log->write("ssh-agent authentication as %s on %s failed: %s\n",
                loginName.c_str(), m_hostname.c_str(), ex.what());
        }
    }

    throw AuthenticationError("authentication as " + loginName + " on " + m_hostname
        + " was rejected (offered methods: " + methods + ")");
}

void SSHSession::setTimeout(std::chrono::milliseconds timeout)
{
    libssh2_session_set_timeout(session(), (long)timeout.count());
}

SSHSession::UniqueChannel SSHSession::openChannel()
{
    // Create a new ssh channel
    auto channel_ptr = UniqueChannel{nullptr, delete_ssh2_channel};
    auto const open_session_rc = libssh2_retry([&]() {
        channel_ptr.reset(libssh2_channel_open_session(session()));
        return (channel_ptr == nullptr) ? libssh2_session_last_errno(session()) : 0;
    });
    if ((open_session_rc < 0) || (channel_ptr == nullptr)) {
        throw_libssh2_error(session(), "Failure opening SSH channel on session to " + m_hostname,
            open_session_rc);
    }

    return channel_ptr;
}

SSHSession::CommandResult SSHSession::executeRemoteCommand(std::string const& command)
{
    auto channel_ptr = openChannel();

    // Request execution of the command on the remote host
    auto const exec_rc = libssh2_retry([&]() {
        return libssh2_channel_exec(channel_ptr.get(), command.c_str());
    });
    if (exec_rc < 0) {
        throw_libssh2_error(session(), "Executing remote command on " + m_hostname + " failed", exec_rc);
    }

    // Collect output until the remote side closes its end
    auto result = CommandResult{-1, {}};
    char buf[ARA_BUF_SIZE];
    while (true) {
        auto const bytes_read = libssh2_channel_read(channel_ptr.get(), buf, sizeof(buf));
        if (bytes_read == LIBSSH2_ERROR_EAGAIN) {
            continue;
        } else if (bytes_read < 0) {
            throw_libssh2_error(session(), "Reading remote command output from " + m_hostname + " failed",
                (int)bytes_read);
        } else if (bytes_read == 0) {
            if (libssh2_channel_eof(channel_ptr.get())) {
                break;
            }
            continue;
        }
        result.output.append(buf, (size_t)bytes_read);
    }

    // The exit status is only available once the channel is closed
    libssh2_channel_close(channel_ptr.get());
    libssh2_channel_wait_closed(channel_ptr.get());
    result.exitCode = libssh2_channel_get_exit_status(channel_ptr.get());

    return result;
}

void SSHSession::sendRemoteFile(const char* source_path, const char* destination_path, int mode)
{
    if ((source_path == nullptr) || (destination_path == nullptr)) {
        throw std::logic_error("sendRemoteFile: null path");
    }
    //Get the length of the source file
    struct stat stbuf;
    {   fd_handle source{ open(source_path, O_RDONLY) };
        if ((fstat(source.fd(), &stbuf) != 0) || (!S_ISREG(stbuf.st_mode))) {
            throw std::runtime_error("Could not fstat file to send: " + std::string{source_path});
        }
    }
    // Start a new scp transfer
    auto channel_ptr = take_pointer_ownership( libssh2_scp_send(   session(),
                                                                   destination_path,
                                                                   mode & 0777,
                                                                   stbuf.st_size ),
                                               delete_ssh2_channel);
    if (channel_ptr == nullptr) {
        throw_libssh2_error(session(), "Failure to scp send " + std::string{destination_path}
            + " to " + m_hostname, libssh2_session_last_errno(session()));
    }
    // Write the contents of the source file to the destination file in blocks
    size_t const BLOCK_SIZE = 65536;
    auto buf = std::vector<char>(BLOCK_SIZE);
    if (auto source_file = file::open(source_path, "rb")) {
        // read in a block
        while (auto bytes_read = file::read(buf.data(), sizeof(char), BLOCK_SIZE, source_file.get())) {
            char *ptr = buf.data();
            // perform the write
            do {
                auto rc = libssh2_channel_write(channel_ptr.get(), ptr, bytes_read);
                if (rc < 0) {
                    throw_libssh2_error(session(), "Error writing to remote file " + std::string{destination_path},
                        (int)rc);
                }
                // rc indicates how many bytes were written this time
                ptr += rc;
                bytes_read -= rc;
            } while(bytes_read);
        }
    }
}

uint64_t SSHSession::receiveRemoteFile(const char* source_path, const char* destination_path)
{
    if ((source_path == nullptr) || (destination_path == nullptr)) {
        throw std::logic_error("receiveRemoteFile: null path");
    }

    // Start a new scp transfer
    libssh2_struct_stat fileinfo;
    ::memset(&fileinfo, 0, sizeof(fileinfo));
    auto channel_ptr = take_pointer_ownership( libssh2_scp_recv2(session(), source_path, &fileinfo),
                                               delete_ssh2_channel);
    if (channel_ptr == nullptr) {
        throw_libssh2_error(session(), "Failure to scp receive " + std::string{source_path}
            + " from " + m_hostname, libssh2_session_last_errno(session()));
    }

    auto const total = (uint64_t)fileinfo.st_size;
    auto received = uint64_t{0};

    size_t const BLOCK_SIZE = 65536;
    auto buf = std::vector<char>(BLOCK_SIZE);
    auto destination_file = file::open(destination_path, "wb");
    while (received < total) {
        auto const wanted = (size_t)std::min<uint64_t>(BLOCK_SIZE, total - received);
        auto const bytes_read = libssh2_channel_read(channel_ptr.get(), buf.data(), wanted);
        if (bytes_read == LIBSSH2_ERROR_EAGAIN) {
            continue;
        } else if (bytes_read < 0) {
            throw_libssh2_error(session(), "Error reading remote file " + std::string{source_path},
                (int)bytes_read);
        } else if (bytes_read == 0) {
            throw std::runtime_error("remote file " + std::string{source_path} + " ended after "
                + std::to_string(received) + " of " + std::to_string(total) + " bytes");
        }
        file::write(buf.data(), sizeof(char), (size_t)bytes_read, destination_file.get());
        received += (uint64_t)bytes_read;
    }

    return received;
}

bool SSHSession::probeRemotePort(int port)
{
    auto tunnel_ptr = take_pointer_ownership(
        libssh2_channel_direct_tcpip(session(), "127.0.0.1", port),
        delete_ssh2_tunnel);
    if (tunnel_ptr != nullptr) {
        return true;
    }

    // The remote side could not connect to the port
    auto const rc = libssh2_session_last_errno(session());
    if (rc == LIBSSH2_ERROR_CHANNEL_FAILURE) {
        return false;
    }
    throw_libssh2_error(session(), "Probing port " + std::to_string(port) + " on " + m_hostname, rc);
}

bool SSHSession::isAlive()
{
    if (m_session_ptr == nullptr) {
        return false;
    }
    int seconds_to_next = 0;
    return libssh2_keepalive_send(m_session_ptr.get(), &seconds_to_next) == 0;
}

void SSHSession::disconnect()
{
    if (m_session_ptr != nullptr) {
        m_log->write("closing ssh session to %s\n", m_hostname.c_str());
    }
    m_session_ptr.reset();
    m_session_sock = fd_handle{};
}

} /* namespace ara */
