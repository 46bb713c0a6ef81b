/******************************************************************************\
 * ara_acquire.cpp - Run one acquisition session from the command line
 *
 * Copyright 2021-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "anubis_remote_fe.h"

#include "ara_argv_defs.hpp"

static volatile sig_atomic_t stopSignal = 0;

static void
usage(char *name)
{
    fprintf(stdout, "Usage: %s [OPTIONS]...\n", name);
    fprintf(stdout, "Deploy a forensic helper on a remote host, track it and remove it again\n\n");

    fprintf(stdout, "\t-%c, --%s            target host name or address      (required)\n",
        AcquireArgv::Host.val, AcquireArgv::Host.name);
    fprintf(stdout, "\t-%c, --%s          authentication domain\n",
        AcquireArgv::Domain.val, AcquireArgv::Domain.name);
    fprintf(stdout, "\t-%c, --%s            account to authenticate as       (required)\n",
        AcquireArgv::User.val, AcquireArgv::User.name);
    fprintf(stdout, "\t-%c, --%s            file_browser, memory_imager or process_dumper (required)\n",
        AcquireArgv::Kind.val, AcquireArgv::Kind.name);
    fprintf(stdout, "\t-%c, --%s          local path of the helper binary  (required)\n",
        AcquireArgv::Binary.val, AcquireArgv::Binary.name);
    fprintf(stdout, "\t-%c, --%s            port the helper service listens on\n",
        AcquireArgv::Port.val, AcquireArgv::Port.name);
    fprintf(stdout, "\t-%c, --%s             helper argument, may be repeated. {port} and {output}\n"
                    "\t                        are replaced on the target\n",
        AcquireArgv::Arg.val, AcquireArgv::Arg.name);
    fprintf(stdout, "\t-%c, --%s            support file to ship with the helper, may be repeated\n",
        AcquireArgv::File.val, AcquireArgv::File.name);
    fprintf(stdout, "\t-%c, --%s          name of the file the helper writes its output to\n",
        AcquireArgv::Output.val, AcquireArgv::Output.name);
    fprintf(stdout, "\t-%c, --%s  expected output size, for progress reporting\n",
        AcquireArgv::ExpectedBytes.val, AcquireArgv::ExpectedBytes.name);
    fprintf(stdout, "\t    --%s    local directory for acquired output\n",
        AcquireArgv::EvidenceDir.name);
    fprintf(stdout, "\t-%c, --%s            run until the helpers finish instead of until Enter\n",
        AcquireArgv::Wait.val, AcquireArgv::Wait.name);
    fprintf(stdout, "\t    --%s           write a debug log to $%s\n",
        AcquireArgv::Debug.name, ARA_LOG_DIR_ENV_VAR);
    fprintf(stdout, "\t-%c, --%s            Display this text and exit\n\n",
        AcquireArgv::Help.val, AcquireArgv::Help.name);

    fprintf(stdout, "The password is read from $%s, or prompted for.\n", ARA_SECRET_ENV_VAR);
}

static void
stop_handler(int)
{
    stopSignal = 1;
}

static void
print_state_change(ara_session_id_t sid, ara_session_state_t old_state, ara_session_state_t new_state,
    int progress, ara_error_kind_t error, const char *error_msg, void *)
{
    if (progress >= 0) {
        fprintf(stdout, "session %lld: %s -> %s (%d%%)", (long long)sid,
            ara_state_toString(old_state), ara_state_toString(new_state), progress);
    } else {
        fprintf(stdout, "session %lld: %s -> %s", (long long)sid,
            ara_state_toString(old_state), ara_state_toString(new_state));
    }
    if (error != ARA_ERR_NONE) {
        fprintf(stdout, " [%s: %s]", ara_error_kind_toString(error), (error_msg != nullptr) ? error_msg : "");
    }
    fprintf(stdout, "\n");
    fflush(stdout);
}

static bool
parse_kind(std::string const& name, ara_helper_kind_t& kind)
{
    for (auto candidate : { ARA_HELPER_FILE_BROWSER, ARA_HELPER_MEMORY_IMAGER, ARA_HELPER_PROCESS_DUMPER }) {
        if (name == ara_helper_kind_toString(candidate)) {
            kind = candidate;
            return true;
        }
    }
    return false;
}

static bool
is_resting(ara_session_state_t state)
{
    return (state == ARA_STATE_CLEANED) || (state == ARA_STATE_FAILED) || (state == ARA_STATE_FAILED_CLEANUP);
}

// Secret buffer that is wiped when it goes out of scope
struct SecretBuffer {
    std::vector<char> data;

    ~SecretBuffer() { wipe(); }

    void wipe()
    {
        if (!data.empty()) {
            explicit_bzero(data.data(), data.size());
        }
        data.clear();
    }

    void assign(char const* secret)
    {
        auto const len = strlen(secret);
        data.assign(secret, secret + len);
        data.push_back('\0');
    }
};

int
main(int argc, char *argv[])
{
    auto host = std::string{};
    auto domain = std::string{};
    auto user = std::string{};
    auto kind = ARA_HELPER_FILE_BROWSER;
    auto haveKind = false;
    auto binary = std::string{};
    auto port = 0;
    auto args = std::vector<std::string>{};
    auto files = std::vector<std::string>{};
    auto output = std::string{};
    auto expectedBytes = uint64_t{0};
    auto evidenceDir = std::string{};
    auto waitForHelpers = false;
    auto debug = false;

    { auto incomingArgv = ara::IncomingArgv<AcquireArgv>{argc, argv};
        int c; std::string optarg;
        while (true) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }

            try {
                switch (c) {

                case AcquireArgv::Host.val:
                    host = optarg;
                    break;

                case AcquireArgv::Domain.val:
                    domain = optarg;
                    break;

                case AcquireArgv::User.val:
                    user = optarg;
                    break;

                case AcquireArgv::Kind.val:
                    if (!parse_kind(optarg, kind)) {
                        fprintf(stderr, "unknown helper kind '%s'\n", optarg.c_str());
                        usage(argv[0]);
                        return 1;
                    }
                    haveKind = true;
                    break;

                case AcquireArgv::Binary.val:
                    binary = optarg;
                    break;

                case AcquireArgv::Port.val:
                    port = std::stoi(optarg);
                    break;

                case AcquireArgv::Arg.val:
                    args.push_back(optarg);
                    break;

                case AcquireArgv::File.val:
                    files.push_back(optarg);
                    break;

                case AcquireArgv::Output.val:
                    output = optarg;
                    break;

                case AcquireArgv::ExpectedBytes.val:
                    expectedBytes = std::stoull(optarg);
                    break;

                case AcquireArgv::EvidenceDir.val:
                    evidenceDir = optarg;
                    break;

                case AcquireArgv::Wait.val:
                    waitForHelpers = true;
                    break;

                case AcquireArgv::Debug.val:
                    debug = true;
                    break;

                case AcquireArgv::Help.val:
                    usage(argv[0]);
                    return 0;

                case '?':
                default:
                    usage(argv[0]);
                    return 1;

                }
            } catch (std::exception const& ex) {
                fprintf(stderr, "invalid value '%s': %s\n", optarg.c_str(), ex.what());
                return 1;
            }
        }
    }

    // post-process required args to make sure we have everything we need
    if (host.empty() || user.empty() || binary.empty() || !haveKind) {
        usage(argv[0]);
        return 1;
    }

    if (debug && (ara_setAttribute(ARA_ATTR_DEBUG, "1") != 0)) {
        fprintf(stderr, "error: %s\n", ara_error_str());
        return 1;
    }
    if (!evidenceDir.empty() && (ara_setAttribute(ARA_ATTR_EVIDENCE_DIR, evidenceDir.c_str()) != 0)) {
        fprintf(stderr, "error: %s\n", ara_error_str());
        return 1;
    }

    // Read the secret before anything touches the network
    auto secret = SecretBuffer{};
    if (auto const envSecret = ::getenv(ARA_SECRET_ENV_VAR)) {
        secret.assign(envSecret);
        ::unsetenv(ARA_SECRET_ENV_VAR);
    } else {
        auto const prompt = "Password for " + (domain.empty() ? user : (domain + "\\" + user)) + "@" + host + ": ";
        auto const entered = ::getpass(prompt.c_str());
        if (entered == nullptr) {
            fprintf(stderr, "error: failed to read password: %s\n", strerror(errno));
            return 1;
        }
        secret.assign(entered);
        explicit_bzero(entered, strlen(entered));
    }

    // stop the session on SIGINT / SIGTERM
    { struct sigaction sig_action;
        memset(&sig_action, 0, sizeof(sig_action));
        sig_action.sa_handler = stop_handler;
        for (auto&& signum : { SIGINT, SIGTERM }) {
            if (sigaction(signum, &sig_action, nullptr)) {
                fprintf(stderr, "sigaction %d: %s\n", signum, strerror(errno));
                return 1;
            }
        }
    }

    if (ara_init() != 0) {
        fprintf(stderr, "error: %s\n", ara_error_str());
        return 1;
    }
    if (ara_registerStateCallback(print_state_change, nullptr) != 0) {
        fprintf(stderr, "warning: %s\n", ara_error_str());
    }

    // Build the C helper description
    auto argPtrs = std::vector<char const*>{};
    for (auto&& arg : args) {
        argPtrs.push_back(arg.c_str());
    }
    argPtrs.push_back(nullptr);
    auto filePtrs = std::vector<char const*>{};
    for (auto&& file : files) {
        filePtrs.push_back(file.c_str());
    }
    filePtrs.push_back(nullptr);

    auto helper = ara_helper_t{};
    helper.kind = kind;
    helper.binary_path = binary.c_str();
    helper.args = argPtrs.data();
    helper.support_files = filePtrs.data();
    helper.port = port;
    helper.output_name = output.empty() ? nullptr : output.c_str();
    helper.expected_bytes = expectedBytes;

    auto const sid = ara_requestSession(host.c_str(), domain.empty() ? nullptr : domain.c_str(),
        user.c_str(), secret.data.data(), &helper, 1);
    // The session holds its own copy until connected
    secret.wipe();
    if (sid == 0) {
        fprintf(stderr, "error: %s\n", ara_error_str());
        ara_fini();
        return 1;
    }

    if (!waitForHelpers) {
        fprintf(stdout, "press Enter to stop the session\n");
        fflush(stdout);
    }

    // Run until the session rests on its own, Enter is pressed or a signal arrives
    auto stopRequested = false;
    while (!is_resting(ara_sessionState(sid))) {
        auto stdinReady = false;
        if (!waitForHelpers) {
            struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
            stdinReady = (::poll(&pfd, 1, 200) > 0) && (pfd.revents & (POLLIN | POLLHUP));
        } else {
            ::usleep(200 * 1000);
        }

        if (!stopRequested && (stopSignal || stdinReady)) {
            stopRequested = true;
            if (ara_stopSession(sid) != 0) {
                fprintf(stderr, "warning: %s\n", ara_error_str());
            }
        }
    }
    auto rc = ara_waitSession(sid);
    if (auto const summary = std::unique_ptr<char, decltype(&::free)>{ara_sessionSummary(sid), ::free}) {
        fprintf((rc == 0) ? stdout : stderr, "%s\n", summary.get());
    }

    if (ara_releaseSession(sid) != 0) {
        fprintf(stderr, "warning: %s\n", ara_error_str());
    }
    if (ara_fini() != 0) {
        fprintf(stderr, "warning: %s\n", ara_error_str());
        rc = 1;
    }

    return rc;
}
