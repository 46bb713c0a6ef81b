/******************************************************************************\
 * ara_tracker_unit_test.cpp - Progress tracking unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <algorithm>
#include <atomic>
#include <thread>

#include "ara_tracker_unit_test.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

using namespace ara;
using std::chrono::milliseconds;

ARATrackerUnitTest::ARATrackerUnitTest()
    : scratch{}
    , config{testConfig(scratch)}
    , log{}
    , mockConnection{}
    , cancel{}
    , deployments{}
    , tracker{config, log}
{}

ARATrackerUnitTest::~ARATrackerUnitTest()
{
    tracker.stop();
}

Deployment ARATrackerUnitTest::taskDeployment(uint64_t expectedBytes) const
{
    auto deployment = Deployment{};
    deployment.id = "1.1";
    deployment.kind = ARA_HELPER_MEMORY_IMAGER;
    deployment.remoteDir = "/tmp/ara_memory_imager.100001";
    deployment.outputPath = deployment.remoteDir + "/mem.raw";
    deployment.expectedBytes = expectedBytes;
    deployment.process.pid = 4001;
    deployment.process.groupId = 4001;
    deployment.cleanupRequired = true;
    deployment.healthy = true;
    return deployment;
}

Deployment ARATrackerUnitTest::serviceDeployment() const
{
    auto deployment = Deployment{};
    deployment.id = "1.2";
    deployment.kind = ARA_HELPER_FILE_BROWSER;
    deployment.remoteDir = "/tmp/ara_file_browser.100002";
    deployment.port = 8080;
    deployment.process.pid = 4002;
    deployment.process.groupId = 4002;
    deployment.cleanupRequired = true;
    deployment.healthy = true;
    return deployment;
}

void ARATrackerUnitTest::startTracker()
{
    tracker.start(mockConnection, deployments,
        [this](size_t index, ProgressUpdate const& update) {
            { std::lock_guard<std::mutex> lock{mutex};
                updates.emplace_back(index, update);
            }
            cv.notify_all();
        },
        [this](Outcome const& outcome) {
            { std::lock_guard<std::mutex> lock{mutex};
                stall = outcome;
            }
            cv.notify_all();
        },
        cancel);
}

TEST_F(ARATrackerUnitTest, PollDeterminate)
{
    auto const deployment = taskDeployment(1000);
    EXPECT_CALL(mockConnection, fileSize(deployment.outputPath))
        .WillOnce(Return(250));

    auto const update = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(update.status, ProgressStatus::Running);
    EXPECT_EQ(update.percent, 25);
    EXPECT_EQ(update.bytesTransferred, 250);
}

// 100 is only reported once the helper exited cleanly
TEST_F(ARATrackerUnitTest, PollCapsRunningPercent)
{
    auto const deployment = taskDeployment(1000);
    EXPECT_CALL(mockConnection, fileSize(_))
        .WillOnce(Return(5000));

    auto const update = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(update.status, ProgressStatus::Running);
    EXPECT_EQ(update.percent, 99);
}

TEST_F(ARATrackerUnitTest, PollIndeterminate)
{
    auto const deployment = taskDeployment(0);
    EXPECT_CALL(mockConnection, fileSize(_))
        .WillOnce(Return(123));

    auto const update = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(update.percent, -1);
    EXPECT_EQ(update.bytesTransferred, 123);
}

TEST_F(ARATrackerUnitTest, PollCompleted)
{
    auto const deployment = taskDeployment(1000);
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 0}));

    auto const update = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(update.status, ProgressStatus::Completed);
    EXPECT_EQ(update.percent, 100);
    EXPECT_EQ(update.exitCode, 0);
}

TEST_F(ARATrackerUnitTest, PollTaskFailed)
{
    auto const deployment = taskDeployment(1000);
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{false, 3}));
    EXPECT_CALL(mockConnection, fileSize(_))
        .WillOnce(Return(500));

    auto const update = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(update.status, ProgressStatus::Exited);
    EXPECT_EQ(update.exitCode, 3);
    EXPECT_EQ(update.percent, 50);
}

// a service has no measurable progress and should never exit
TEST_F(ARATrackerUnitTest, PollService)
{
    auto const deployment = serviceDeployment();
    EXPECT_CALL(mockConnection, fileSize(_)).Times(0);
    EXPECT_CALL(mockConnection, status(_))
        .WillOnce(Return(ProcessStatus{true, -1}))
        .WillOnce(Return(ProcessStatus{false, 0}));

    auto const running = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(running.status, ProgressStatus::Running);
    EXPECT_EQ(running.percent, -1);

    auto const exited = tracker.poll(mockConnection, deployment);
    EXPECT_EQ(exited.status, ProgressStatus::Exited);
}

// the loop reports until every deployment finished, then ends on its own
TEST_F(ARATrackerUnitTest, TracksToCompletion)
{
    deployments = std::vector<Deployment>{taskDeployment(1000)};

    auto polls = std::atomic<int>{0};
    EXPECT_CALL(mockConnection, status(_))
        .WillRepeatedly(Invoke([&](ProcessHandle const&) {
            return (++polls < 3) ? ProcessStatus{true, -1} : ProcessStatus{false, 0};
        }));
    EXPECT_CALL(mockConnection, fileSize(_))
        .WillRepeatedly(Invoke([&](std::string const&) { return (uint64_t)(polls.load() * 300); }));

    startTracker();
    ASSERT_TRUE(waitUntil([&]() {
        return !updates.empty() && (updates.back().second.status == ProgressStatus::Completed);
    }));

    // the thread winds down without stop()
    for (int i = 0; (i < 100) && tracker.running(); i++) {
        std::this_thread::sleep_for(milliseconds{10});
    }
    EXPECT_FALSE(tracker.running());

    std::lock_guard<std::mutex> lock{mutex};
    ASSERT_EQ(updates.size(), 3);
    EXPECT_EQ(updates[0].second.percent, 30);
    EXPECT_EQ(updates[1].second.percent, 60);
    EXPECT_EQ(updates[2].second.percent, 100);
    EXPECT_FALSE(stall);
}

// finished deployments are not polled again
TEST_F(ARATrackerUnitTest, SkipsFinished)
{
    deployments = std::vector<Deployment>{taskDeployment(0), serviceDeployment()};

    EXPECT_CALL(mockConnection, status(_))
        .WillRepeatedly(Invoke([](ProcessHandle const& handle) {
            return (handle.pid == 4001) ? ProcessStatus{false, 0} : ProcessStatus{true, -1};
        }));

    startTracker();
    ASSERT_TRUE(waitUntil([&]() { return updates.size() >= 6; }));
    tracker.stop();

    std::lock_guard<std::mutex> lock{mutex};
    auto const taskUpdates = std::count_if(updates.begin(), updates.end(),
        [](std::pair<size_t, ProgressUpdate> const& entry) { return entry.first == 0; });
    EXPECT_EQ(taskUpdates, 1);
}

TEST_F(ARATrackerUnitTest, Stalls)
{
    deployments = std::vector<Deployment>{serviceDeployment()};

    EXPECT_CALL(mockConnection, status(_))
        .Times(config.stallThreshold)
        .WillRepeatedly(Invoke([](ProcessHandle const&) -> ProcessStatus {
            throw TimeoutExceeded("command on 10.0.0.5 timed out");
        }));

    startTracker();
    ASSERT_TRUE(waitUntil([&]() { return stall.has_value(); }));

    std::lock_guard<std::mutex> lock{mutex};
    EXPECT_EQ(stall->kind, ARA_ERR_ACQUISITION_STALLED);
    EXPECT_THAT(stall->message, ::testing::HasSubstr("10.0.0.5"));
    EXPECT_TRUE(updates.empty());
}

// a good poll resets the failure count
TEST_F(ARATrackerUnitTest, FailureCountResets)
{
    deployments = std::vector<Deployment>{serviceDeployment()};

    auto polls = std::atomic<int>{0};
    EXPECT_CALL(mockConnection, status(_))
        .WillRepeatedly(Invoke([&](ProcessHandle const&) -> ProcessStatus {
            // two failures, one success, repeated
            if ((++polls % 3) != 0) {
                throw std::runtime_error("channel failure");
            }
            return ProcessStatus{true, -1};
        }));

    startTracker();
    ASSERT_TRUE(waitUntil([&]() { return updates.size() >= 3; }));
    tracker.stop();

    std::lock_guard<std::mutex> lock{mutex};
    EXPECT_FALSE(stall);
}

TEST_F(ARATrackerUnitTest, StopIsPrompt)
{
    config.pollInterval = milliseconds{60000};
    deployments = std::vector<Deployment>{serviceDeployment()};

    startTracker();
    ASSERT_TRUE(waitUntil([&]() { return !updates.empty(); }));

    auto const started = std::chrono::steady_clock::now();
    tracker.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds{5000});
    EXPECT_FALSE(tracker.running());

    // repeatable
    tracker.stop();
}

TEST_F(ARATrackerUnitTest, EndsOnCancel)
{
    deployments = std::vector<Deployment>{serviceDeployment()};

    startTracker();
    ASSERT_TRUE(waitUntil([&]() { return !updates.empty(); }));
    cancel.cancel();

    for (int i = 0; (i < 100) && tracker.running(); i++) {
        std::this_thread::sleep_for(milliseconds{10});
    }
    EXPECT_FALSE(tracker.running());
}
