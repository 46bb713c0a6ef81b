/******************************************************************************\
 * ara_deployer_unit_test.cpp - Helper deployment unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <future>
#include <thread>

#include "ara_deployer_unit_test.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StartsWith;

using namespace ara;
using std::chrono::milliseconds;

ARADeployerUnitTest::ARADeployerUnitTest()
    : scratch{}
    , config{testConfig(scratch)}
    , log{}
    , mockConnection{}
    , deployer{config, log}
    , cancel{}
    , browser_path{scratch.writeFile("fbrowser", "#!/bin/sh\nexec sleep 1000\n")}
    , imager_path{scratch.writeFile("memimage", "#!/bin/sh\nexit 0\n")}
{}

ARADeployerUnitTest::~ARADeployerUnitTest()
{}

HelperRequest ARADeployerUnitTest::browserRequest() const
{
    auto request = HelperRequest{};
    request.kind = ARA_HELPER_FILE_BROWSER;
    request.binaryPath = browser_path;
    request.args = {"--listen", "0.0.0.0:{port}"};
    request.port = 8080;
    return request;
}

HelperRequest ARADeployerUnitTest::imagerRequest() const
{
    auto request = HelperRequest{};
    request.kind = ARA_HELPER_MEMORY_IMAGER;
    request.binaryPath = imager_path;
    request.args = {"--output", "{output}"};
    request.outputName = "mem.raw";
    request.expectedBytes = 4096;
    return request;
}

// stage, start and health check of a service in order
TEST_F(ARADeployerUnitTest, DeploysService)
{
    { InSequence seq;
        EXPECT_CALL(mockConnection, execute(ElementsAre("mktemp", "-d", "/tmp/ara_file_browser.XXXXXX")));
        EXPECT_CALL(mockConnection, sendFile(StartsWith(scratch.path()), EndsWith("/helper.tar"), 0600));
        EXPECT_CALL(mockConnection, execute(ElementsAre("tar", "-xf", EndsWith("/helper.tar"), "-C", _)));
        EXPECT_CALL(mockConnection, execute(ElementsAre("rm", "-f", EndsWith("/helper.tar"))));
        EXPECT_CALL(mockConnection, launch(ElementsAre(EndsWith("/fbrowser"), "--listen", "0.0.0.0:8080"),
            StartsWith("/tmp/ara_file_browser."), EndsWith("/helper.log")));
        EXPECT_CALL(mockConnection, status(_));
        EXPECT_CALL(mockConnection, probePort(8080));
    }

    auto deployment = Deployment{};
    ASSERT_NO_THROW(deployer.deploy(mockConnection, browserRequest(), deployment, cancel));

    EXPECT_TRUE(deployment.healthy);
    EXPECT_TRUE(deployment.cleanupRequired);
    EXPECT_TRUE(deployment.isService());
    EXPECT_THAT(deployment.remoteDir, StartsWith("/tmp/ara_file_browser."));
    EXPECT_EQ(deployment.remoteBinary, deployment.remoteDir + "/fbrowser");
    EXPECT_GT(deployment.process.groupId, 1);
    EXPECT_TRUE(deployment.outputPath.empty());
}

// nothing is created on the target for a bad request
TEST_F(ARADeployerUnitTest, MissingBinary)
{
    EXPECT_CALL(mockConnection, execute(_)).Times(0);

    auto request = browserRequest();
    request.binaryPath = scratch.path() + "/no_such_helper";

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, request, deployment, cancel), DeploymentFailure);
    EXPECT_FALSE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, MissingSupportFile)
{
    EXPECT_CALL(mockConnection, execute(_)).Times(0);

    auto request = browserRequest();
    request.supportFiles = {scratch.path() + "/no_such_file"};

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, request, deployment, cancel), DeploymentFailure);
    EXPECT_FALSE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, WorkingDirectoryFails)
{
    EXPECT_CALL(mockConnection, execute(ElementsAre("mktemp", _, _)))
        .WillOnce(Return(Connection::CommandResult{1, "mktemp: Permission denied\n"}));
    EXPECT_CALL(mockConnection, sendFile(_, _, _)).Times(0);

    auto deployment = Deployment{};
    try {
        deployer.deploy(mockConnection, browserRequest(), deployment, cancel);
        FAIL() << "deploy succeeded";
    } catch (DeploymentFailure const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("Permission denied"));
    }
    EXPECT_FALSE(deployment.cleanupRequired);
}

// once the directory exists a failure leaves it marked for teardown
TEST_F(ARADeployerUnitTest, UnpackFails)
{
    EXPECT_CALL(mockConnection, execute(_)).Times(AnyNumber());
    EXPECT_CALL(mockConnection, execute(ElementsAre("tar", _, _, _, _)))
        .WillOnce(Return(Connection::CommandResult{2, "tar: Cannot open: No space left on device\n"}));
    EXPECT_CALL(mockConnection, launch(_, _, _)).Times(0);

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, browserRequest(), deployment, cancel), DeploymentFailure);
    EXPECT_TRUE(deployment.cleanupRequired);
    EXPECT_THAT(deployment.remoteDir, StartsWith("/tmp/ara_file_browser."));
}

TEST_F(ARADeployerUnitTest, HealthCheckExhausted)
{
    EXPECT_CALL(mockConnection, probePort(8080))
        .Times(config.healthCheckAttempts)
        .WillRepeatedly(Return(false));

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, browserRequest(), deployment, cancel), DeploymentFailure);
    EXPECT_FALSE(deployment.healthy);
    EXPECT_TRUE(deployment.cleanupRequired);
    EXPECT_GT(deployment.process.groupId, 1);
}

TEST_F(ARADeployerUnitTest, ServiceExitsBeforeListening)
{
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 98}));
    EXPECT_CALL(mockConnection, probePort(_)).Times(0);

    auto deployment = Deployment{};
    try {
        deployer.deploy(mockConnection, browserRequest(), deployment, cancel);
        FAIL() << "deploy succeeded";
    } catch (DeploymentFailure const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("exited with code 98"));
    }
}

TEST_F(ARADeployerUnitTest, HealthCheckTimeout)
{
    config.healthCheckAttempts = 1000;
    config.healthCheckTimeout = milliseconds{60};

    EXPECT_CALL(mockConnection, probePort(_))
        .WillRepeatedly(Return(false));

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, browserRequest(), deployment, cancel), TimeoutExceeded);
}

// cancellation interrupts the wait between health checks
TEST_F(ARADeployerUnitTest, CancelledDuringHealthCheck)
{
    config.healthCheckInterval = milliseconds{5000};

    auto probed = std::promise<void>{};
    EXPECT_CALL(mockConnection, probePort(_))
        .WillOnce(Invoke([&](int) {
            probed.set_value();
            return false;
        }));

    auto deployment = Deployment{};
    auto deploying = std::async(std::launch::async, [&]() {
        deployer.deploy(mockConnection, browserRequest(), deployment, cancel);
    });

    probed.get_future().wait();
    cancel.cancel();

    EXPECT_THROW(deploying.get(), UserCancelled);
    EXPECT_TRUE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, CancelledBeforeStaging)
{
    EXPECT_CALL(mockConnection, execute(_)).Times(0);

    cancel.cancel();
    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, browserRequest(), deployment, cancel), UserCancelled);
    EXPECT_FALSE(deployment.cleanupRequired);
}

// a task that is running counts as healthy, its output path is set
TEST_F(ARADeployerUnitTest, DeploysTask)
{
    EXPECT_CALL(mockConnection, probePort(_)).Times(0);
    EXPECT_CALL(mockConnection, launch(ElementsAre(EndsWith("/memimage"), "--output", EndsWith("/mem.raw")), _, _));

    auto deployment = Deployment{};
    ASSERT_NO_THROW(deployer.deploy(mockConnection, imagerRequest(), deployment, cancel));

    EXPECT_TRUE(deployment.healthy);
    EXPECT_FALSE(deployment.completed);
    EXPECT_EQ(deployment.outputPath, deployment.remoteDir + "/mem.raw");
    EXPECT_EQ(deployment.expectedBytes, 4096);
}

TEST_F(ARADeployerUnitTest, TaskFinishedBeforeCheck)
{
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 0}));

    auto deployment = Deployment{};
    ASSERT_NO_THROW(deployer.deploy(mockConnection, imagerRequest(), deployment, cancel));
    EXPECT_TRUE(deployment.completed);
    EXPECT_EQ(deployment.exitCode, 0);
}

TEST_F(ARADeployerUnitTest, TaskFailedBeforeCheck)
{
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 1}));

    auto deployment = Deployment{};
    EXPECT_THROW(deployer.deploy(mockConnection, imagerRequest(), deployment, cancel), DeploymentFailure);
    EXPECT_TRUE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, Teardown)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, browserRequest(), deployment, cancel);
    auto const dir = deployment.remoteDir;

    { InSequence seq;
        EXPECT_CALL(mockConnection, status(_));
        EXPECT_CALL(mockConnection, terminate(_));
        EXPECT_CALL(mockConnection, execute(ElementsAre("rm", "-rf", "--", dir)));
    }

    ASSERT_NO_THROW(deployer.teardown(mockConnection, deployment));
    EXPECT_FALSE(deployment.cleanupRequired);

    // a second teardown has nothing to do
    EXPECT_CALL(mockConnection, execute(_)).Times(0);
    EXPECT_NO_THROW(deployer.teardown(mockConnection, deployment));
}

TEST_F(ARADeployerUnitTest, TeardownExitedHelper)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, browserRequest(), deployment, cancel);

    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 0}));
    EXPECT_CALL(mockConnection, terminate(_)).Times(0);

    ASSERT_NO_THROW(deployer.teardown(mockConnection, deployment));
    EXPECT_FALSE(deployment.cleanupRequired);
}

// only directories this core created are ever removed
TEST_F(ARADeployerUnitTest, TeardownRefusesForeignDirectory)
{
    auto deployment = Deployment{};
    deployment.kind = ARA_HELPER_FILE_BROWSER;
    deployment.remoteDir = "/home/admin";
    deployment.cleanupRequired = true;

    EXPECT_CALL(mockConnection, execute(_)).Times(0);

    EXPECT_THROW(deployer.teardown(mockConnection, deployment), CleanupFailure);
    EXPECT_TRUE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, TeardownRemoveFails)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, browserRequest(), deployment, cancel);

    EXPECT_CALL(mockConnection, execute(ElementsAre("rm", "-rf", "--", _)))
        .WillOnce(Return(Connection::CommandResult{1, "rm: Device or resource busy\n"}));

    EXPECT_THROW(deployer.teardown(mockConnection, deployment), CleanupFailure);
    EXPECT_TRUE(deployment.cleanupRequired);
}

// connection errors during teardown become CleanupFailure
TEST_F(ARADeployerUnitTest, TeardownConnectionLost)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, browserRequest(), deployment, cancel);

    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Invoke([](ProcessHandle const&) -> ProcessStatus {
            throw std::runtime_error("connection to 10.0.0.5 is closed");
        }));

    EXPECT_THROW(deployer.teardown(mockConnection, deployment), CleanupFailure);
    EXPECT_TRUE(deployment.cleanupRequired);
}

TEST_F(ARADeployerUnitTest, SubstituteArgs)
{
    auto const args = ServiceDeployer::substituteArgs({"-p", "{port}", "--out={output}", "{port}{port}", "plain"},
        8080, "/tmp/ara_memory_imager.1/mem.raw");

    EXPECT_EQ(args, (std::vector<std::string>{"-p", "8080", "--out=/tmp/ara_memory_imager.1/mem.raw",
        "80808080", "plain"}));
}

TEST_F(ARADeployerUnitTest, FetchArtifact)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, imagerRequest(), deployment, cancel);

    EXPECT_CALL(mockConnection, fetchFile(deployment.outputPath, scratch.path() + "/7_mem.raw"))
        .WillOnce(Return(4096));

    auto const artifact = deployer.fetchArtifact(mockConnection, deployment, scratch.path(), 7);
    EXPECT_EQ(artifact.sessionId, 7);
    EXPECT_EQ(artifact.kind, ARA_HELPER_MEMORY_IMAGER);
    EXPECT_EQ(artifact.remotePath, deployment.outputPath);
    EXPECT_EQ(artifact.localPath, scratch.path() + "/7_mem.raw");
    EXPECT_EQ(artifact.bytes, 4096);
}

TEST_F(ARADeployerUnitTest, FetchArtifactWithoutOutput)
{
    auto deployment = Deployment{};
    deployer.deploy(mockConnection, browserRequest(), deployment, cancel);

    EXPECT_CALL(mockConnection, fetchFile(_, _)).Times(0);
    EXPECT_THROW(deployer.fetchArtifact(mockConnection, deployment, scratch.path(), 7), DeploymentFailure);
}
