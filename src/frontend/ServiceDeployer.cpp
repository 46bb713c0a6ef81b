/******************************************************************************\
 * ServiceDeployer.cpp - Stages, starts, health checks and tears down helper
 *                       binaries on a target.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <stdio.h>

#include <algorithm>
#include <chrono>

#include "ServiceDeployer.hpp"

#include "transfer/Archive.hpp"

#include "useful/ara_split.hpp"
#include "useful/ara_wrappers.hpp"

namespace ara {

using std::chrono::steady_clock;

namespace {

// Local staging directory, removed with everything in it on scope exit
class StageDir {
private:
    std::string m_path;
    Logger& m_log;

public:
    StageDir(std::string const& parent, Logger& log)
        : m_path{cstr::mkdtemp(parent + "/" ARA_STAGE_DIR)}
        , m_log{log}
    {}

    ~StageDir()
    {
        try {
            removeDirectory(m_path);
        } catch (std::exception const& ex) {
            fprintf(stderr, "warning: %s\n", ex.what());
            m_log.write("warning: %s\n", ex.what());
        }
    }

    std::string const& path() const { return m_path; }

    StageDir(const StageDir&) = delete;
    StageDir& operator=(const StageDir&) = delete;
};

std::string
firstLine(std::string const& output)
{
    auto const lines = split::lines(output);
    return lines.empty() ? std::string{} : lines.front();
}

} /* anonymous namespace */

std::vector<std::string>
ServiceDeployer::substituteArgs(std::vector<std::string> const& args, int port, std::string const& outputPath)
{
    auto replaceAll = [](std::string arg, std::string const& placeholder, std::string const& value) {
        for (auto pos = arg.find(placeholder); pos != std::string::npos;
            pos = arg.find(placeholder, pos + value.length())) {
            arg.replace(pos, placeholder.length(), value);
        }
        return arg;
    };

    auto result = std::vector<std::string>{};
    result.reserve(args.size());
    for (auto&& arg : args) {
        result.push_back(replaceAll(replaceAll(arg, "{port}", std::to_string(port)), "{output}", outputPath));
    }
    return result;
}

void
ServiceDeployer::stage(Connection& connection, HelperRequest const& request, Deployment& out,
    CancelToken const& cancel)
{
    if (!fileHasPerms(request.binaryPath.c_str(), R_OK)) {
        throw DeploymentFailure("helper binary " + request.binaryPath + " is not a readable file");
    }
    for (auto&& supportFile : request.supportFiles) {
        if (!pathExists(supportFile.c_str())) {
            throw DeploymentFailure("support file " + supportFile + " does not exist");
        }
    }

    cancel.throwIfCancelled("staging of " + out.describe());

    // Remote working directory
    char dirName[ARA_BUF_SIZE];
    snprintf(dirName, sizeof(dirName), ARA_REMOTE_DIR_FMT, helperKindName(request.kind));
    auto const mktemp = connection.execute({"mktemp", "-d", m_config.remoteBase + "/" + dirName});
    auto const remoteDir = firstLine(mktemp.output);
    if ((mktemp.exitCode != 0) || remoteDir.empty()) {
        throw DeploymentFailure("failed to create a working directory under " + m_config.remoteBase
            + " on " + connection.host() + ": " + split::removeLeadingWhitespace(mktemp.output));
    }

    // From here on something exists on the target
    out.remoteDir = remoteDir;
    out.cleanupRequired = true;
    m_log.write("%s: created working directory %s\n", connection.host().c_str(), remoteDir.c_str());

    cancel.throwIfCancelled("staging of " + out.describe());

    // Package binary and support files
    auto const binaryName = cstr::basename(request.binaryPath);
    auto const remotePackage = remoteDir + "/" ARA_PACKAGE_NAME;
    { auto const stageDir = StageDir{m_config.stageDir, m_log};
        auto archive = Archive{stageDir.path() + "/" ARA_PACKAGE_NAME};
        archive.addPath(binaryName, request.binaryPath);
        for (auto&& supportFile : request.supportFiles) {
            archive.addPath(cstr::basename(supportFile), supportFile);
        }
        auto const& packagePath = archive.finalize();

        cancel.throwIfCancelled("copy of " + out.describe());
        connection.sendFile(packagePath, remotePackage, 0600);
    }

    cancel.throwIfCancelled("unpacking of " + out.describe());

    auto const untar = connection.execute({"tar", "-xf", remotePackage, "-C", remoteDir});
    if (untar.exitCode != 0) {
        throw DeploymentFailure("failed to unpack helper package in " + remoteDir + " on "
            + connection.host() + ": " + split::removeLeadingWhitespace(untar.output));
    }

    // the package itself goes with the directory at teardown if this fails
    auto const rm = connection.execute({"rm", "-f", remotePackage});
    if (rm.exitCode != 0) {
        m_log.write("%s: failed to remove %s: %s\n", connection.host().c_str(), remotePackage.c_str(),
            rm.output.c_str());
    }

    out.remoteBinary = remoteDir + "/" + binaryName;
    if (!request.outputName.empty()) {
        out.outputPath = remoteDir + "/" + request.outputName;
    }
}

void
ServiceDeployer::start(Connection& connection, HelperRequest const& request, Deployment& out,
    CancelToken const& cancel)
{
    cancel.throwIfCancelled("start of " + out.describe());

    auto argv = std::vector<std::string>{out.remoteBinary};
    for (auto&& arg : substituteArgs(request.args, request.port, out.outputPath)) {
        argv.push_back(arg);
    }

    out.process = connection.launch(argv, out.remoteDir, out.remoteDir + "/" ARA_REMOTE_LOG_FILE);
    out.deployedAt = Clock::now();
}

void
ServiceDeployer::waitHealthy(Connection& connection, Deployment& out, CancelToken const& cancel)
{
    auto const deadline = steady_clock::now() + m_config.healthCheckTimeout;

    for (int attempt = 1; attempt <= m_config.healthCheckAttempts; attempt++) {
        cancel.throwIfCancelled("health check of " + out.describe());
        if (steady_clock::now() >= deadline) {
            throw TimeoutExceeded(out.describe() + " did not become healthy within "
                + std::to_string(m_config.healthCheckTimeout.count()) + " ms");
        }

        auto const status = connection.status(out.process);
        if (out.isService()) {
            if (!status.running) {
                throw DeploymentFailure(out.describe() + " exited with code "
                    + std::to_string(status.exitCode) + " before listening on port "
                    + std::to_string(out.port));
            }
            if (connection.probePort(out.port)) {
                return;
            }
        } else {
            if (status.running) {
                return;
            }
            if (status.exitCode == 0) {
                // finished before the first check
                out.completed = true;
                out.exitCode = 0;
                return;
            }
            throw DeploymentFailure(out.describe() + " exited with code " + std::to_string(status.exitCode));
        }

        m_log.write("%s: health check %d/%d of %s: not ready\n", connection.host().c_str(), attempt,
            m_config.healthCheckAttempts, out.describe().c_str());

        if (attempt < m_config.healthCheckAttempts) {
            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());
            if (cancel.waitFor(std::min(m_config.healthCheckInterval, std::max(remaining, std::chrono::milliseconds{0})))) {
                throw UserCancelled("cancelled during health check of " + out.describe());
            }
        }
    }

    throw DeploymentFailure(out.describe() + " did not become healthy after "
        + std::to_string(m_config.healthCheckAttempts) + " health checks");
}

void
ServiceDeployer::deploy(Connection& connection, HelperRequest const& request, Deployment& out,
    CancelToken const& cancel)
{
    out.kind = request.kind;
    out.port = request.port;
    out.expectedBytes = request.expectedBytes;

    stage(connection, request, out, cancel);
    start(connection, request, out, cancel);
    waitHealthy(connection, out, cancel);

    out.healthy = true;
    m_log.write("%s: %s is healthy\n", connection.host().c_str(), out.describe().c_str());
}

void
ServiceDeployer::teardown(Connection& connection, Deployment& deployment)
{
    if (!deployment.cleanupRequired) {
        return;
    }

    try {
        // Stop the helper first, it may still write into its directory
        if (deployment.process.groupId > 0) {
            auto const status = connection.status(deployment.process);
            if (status.running) {
                connection.terminate(deployment.process);
            }
        }

        // Only ever remove directories this core created
        auto const dirName = cstr::basename(deployment.remoteDir);
        if (deployment.remoteDir.empty() || (dirName.rfind("ara_", 0) != 0)) {
            throw CleanupFailure("refusing to remove unexpected directory '" + deployment.remoteDir + "'");
        }
        auto const rm = connection.execute({"rm", "-rf", "--", deployment.remoteDir});
        if (rm.exitCode != 0) {
            throw CleanupFailure("failed to remove " + deployment.remoteDir + " on " + connection.host()
                + ": " + split::removeLeadingWhitespace(rm.output));
        }
    } catch (CleanupFailure const&) {
        throw;
    } catch (std::exception const& ex) {
        throw CleanupFailure("teardown of " + deployment.describe() + " failed: " + ex.what());
    }

    deployment.cleanupRequired = false;
    m_log.write("%s: tore down %s\n", connection.host().c_str(), deployment.describe().c_str());
}

ArtifactDescriptor
ServiceDeployer::fetchArtifact(Connection& connection, Deployment const& deployment,
    std::string const& localDir, SessionId sessionId)
{
    if (deployment.outputPath.empty()) {
        throw DeploymentFailure(deployment.describe() + " has no output to fetch");
    }
    if (!dirHasPerms(localDir.c_str(), W_OK | X_OK)) {
        throw DeploymentFailure("evidence directory " + localDir + " is not writable");
    }

    auto artifact = ArtifactDescriptor{};
    artifact.sessionId = sessionId;
    artifact.kind = deployment.kind;
    artifact.remotePath = deployment.outputPath;
    artifact.localPath = localDir + "/" + std::to_string(sessionId) + "_"
        + cstr::basename(deployment.outputPath);
    artifact.bytes = connection.fetchFile(artifact.remotePath, artifact.localPath);
    artifact.acquiredAt = Clock::now();

    m_log.write("%s: acquired %s (%llu bytes)\n", connection.host().c_str(), artifact.localPath.c_str(),
        (unsigned long long)artifact.bytes);

    return artifact;
}

} /* namespace ara */
