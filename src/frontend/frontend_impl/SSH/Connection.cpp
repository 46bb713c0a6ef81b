/******************************************************************************\
 * Connection.cpp - SSH based connection to a target
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <stdexcept>

#include "Connection.hpp"

#include "frontend/Errors.hpp"

#include "useful/ara_argv.hpp"
#include "useful/ara_split.hpp"

namespace ara {

static ManagedArgv
toManagedArgv(std::vector<std::string> const& argv)
{
    if (argv.empty()) {
        throw std::logic_error("attempted to run an empty remote command");
    }
    auto result = ManagedArgv{};
    for (auto&& arg : argv) {
        result.add(arg);
    }
    return result;
}

// Last non-empty line of command output
static std::string
lastLine(std::string const& output)
{
    auto const lines = split::lines(output);
    return lines.empty() ? std::string{} : lines.back();
}

SSHConnection::SSHConnection(std::string host, SSHSession&& session, Logger& log)
    : m_host{std::move(host)}
    , m_session{std::move(session)}
    , m_log{log}
{}

SSHConnection::~SSHConnection()
{
    close();
}

SSHSession& SSHConnection::session()
{
    if (!m_session.connected()) {
        throw std::runtime_error("connection to " + m_host + " is closed");
    }
    return m_session;
}

SSHSession::CommandResult SSHConnection::runScript(std::string const& script)
{
    auto const command = ManagedArgv{"sh", "-c", script};
    return session().executeRemoteCommand(command.shellString());
}

ProcessHandle SSHConnection::launch(std::vector<std::string> const& argv, std::string const& workDir,
    std::string const& logPath)
{
    auto const helperArgv = toManagedArgv(argv);
    auto const exitFile = workDir + "/" ARA_REMOTE_EXIT_FILE;

    // The subshell waits for the helper and records its exit code. Its own
    // output is detached from the channel so the channel closes right away.
    auto const script = "cd " + shellQuote(workDir) + " || exit 1; "
        "( " + helperArgv.shellString() + " < /dev/null > " + shellQuote(logPath) + " 2>&1; "
        "echo $? > " + shellQuote(exitFile) + " ) < /dev/null > /dev/null 2>&1 & "
        "echo $$ $!";

    auto const launcher = ManagedArgv{"setsid", "sh", "-c", script};
    auto const result = session().executeRemoteCommand(launcher.shellString());

    auto const [group, pid] = split::string<2>(lastLine(result.output));
    auto handle = ProcessHandle{};
    try {
        handle.groupId = std::stoi(group);
        handle.pid = std::stoi(pid);
    } catch (std::exception const&) {
        throw std::runtime_error("failed to launch " + std::string{argv.front()} + " on " + m_host
            + ": " + split::removeLeadingWhitespace(result.output));
    }
    if ((handle.groupId <= 1) || (handle.pid <= 1)) {
        throw std::runtime_error("failed to launch " + argv.front() + " on " + m_host
            + ": unexpected process ids '" + group + " " + pid + "'");
    }
    handle.exitFile = exitFile;

    m_log.write("%s: launched %s as pid %d in group %d\n", m_host.c_str(), argv.front().c_str(),
        (int)handle.pid, (int)handle.groupId);

    return handle;
}

ProcessStatus SSHConnection::status(ProcessHandle const& handle)
{
    auto const script = "if kill -0 " + std::to_string(handle.pid) + " 2>/dev/null; then echo running; "
        "else cat " + shellQuote(handle.exitFile) + " 2>/dev/null; fi";
    auto const result = runScript(script);
    auto const line = lastLine(result.output);

    if (line == "running") {
        return ProcessStatus{true, -1};
    } else if (line.empty()) {
        // gone without recording an exit code: killed
        return ProcessStatus{false, -1};
    }

    try {
        return ProcessStatus{false, std::stoi(line)};
    } catch (std::exception const&) {
        throw std::runtime_error("unexpected status of pid " + std::to_string(handle.pid) + " on "
            + m_host + ": " + line);
    }
}

void SSHConnection::terminate(ProcessHandle const& handle)
{
    auto const group = std::to_string(handle.groupId);

    // TERM the group, give it five seconds, then KILL it
    auto const script = "kill -TERM -- -" + group + " 2>/dev/null || exit 0; "
        "i=0; while [ $i -lt 5 ]; do "
            "kill -0 -- -" + group + " 2>/dev/null || exit 0; sleep 1; i=$((i+1)); "
        "done; "
        "kill -KILL -- -" + group + " 2>/dev/null; exit 0";
    auto const result = runScript(script);
    if (result.exitCode != 0) {
        throw std::runtime_error("failed to terminate process group " + group + " on " + m_host
            + ": " + split::removeLeadingWhitespace(result.output));
    }

    m_log.write("%s: terminated process group %s\n", m_host.c_str(), group.c_str());
}

Connection::CommandResult SSHConnection::execute(std::vector<std::string> const& argv)
{
    auto const command = toManagedArgv(argv);
    auto const result = session().executeRemoteCommand(command.shellString() + " 2>&1");

    m_log.write("%s: '%s' exited with %d\n", m_host.c_str(), argv.front().c_str(), result.exitCode);

    return CommandResult{result.exitCode, result.output};
}

void SSHConnection::sendFile(std::string const& localPath, std::string const& remotePath, int mode)
{
    session().sendRemoteFile(localPath.c_str(), remotePath.c_str(), mode);
    m_log.write("%s: sent %s to %s\n", m_host.c_str(), localPath.c_str(), remotePath.c_str());
}

uint64_t SSHConnection::fetchFile(std::string const& remotePath, std::string const& localPath)
{
    auto const bytes = session().receiveRemoteFile(remotePath.c_str(), localPath.c_str());
    m_log.write("%s: fetched %s to %s (%llu bytes)\n", m_host.c_str(), remotePath.c_str(),
        localPath.c_str(), (unsigned long long)bytes);
    return bytes;
}

bool SSHConnection::probePort(int port)
{
    return session().probeRemotePort(port);
}

uint64_t SSHConnection::fileSize(std::string const& remotePath)
{
    auto const result = runScript("stat -c %s " + shellQuote(remotePath) + " 2>/dev/null || echo 0");
    auto const line = lastLine(result.output);
    try {
        return std::stoull(line);
    } catch (std::exception const&) {
        throw std::runtime_error("unexpected size of " + remotePath + " on " + m_host + ": " + line);
    }
}

bool SSHConnection::isAlive()
{
    return m_session.isAlive();
}

void SSHConnection::close()
{
    m_session.disconnect();
}

/* SSHTransport */

SSHTransport::SSHTransport(Config const& config, Logger& log)
    : m_config{config}
    , m_log{log}
{
    if (auto const rc = libssh2_init(0)) {
        throw std::runtime_error("libssh2_init failed: " + std::to_string(rc));
    }
}

SSHTransport::~SSHTransport()
{
    libssh2_exit();
}

std::unique_ptr<Connection>
SSHTransport::open(Target const& target, Credential const& credential, std::chrono::milliseconds timeout)
{
    auto session = SSHSession{target.address, m_config.sshPort, m_config.knownHostsPath, timeout, m_log};
    session.authenticate(credential.loginName(target.domain), credential.secret(), credential.secretLength());

    // later commands and transfers get their own limit
    session.setTimeout(m_config.commandTimeout);

    return std::make_unique<SSHConnection>(target.address, std::move(session), m_log);
}

bool
SSHTransport::reachable(Target const& target, std::chrono::milliseconds timeout)
{
    try {
        remote::connectSocket(target.address, m_config.sshPort, timeout);
        return true;
    } catch (NetworkUnreachable const& ex) {
        m_log.write("%s is unreachable: %s\n", target.address.c_str(), ex.what());
    } catch (TimeoutExceeded const& ex) {
        m_log.write("%s is unreachable: %s\n", target.address.c_str(), ex.what());
    }
    return false;
}

} /* namespace ara */
