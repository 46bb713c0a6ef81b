/******************************************************************************\
 * ara_session_unit_test.hpp - Acquisition session state machine unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "frontend/AcquisitionSession.hpp"
#include "frontend/ArtifactLedger.hpp"

#include "MockRemote/Connection.hpp"
#include "MockRemote/Observer.hpp"
#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARASessionUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;
    ara::Config config;
    ara::Logger log;
    MockConnection::Nice mockConnection;
    MockTransport::Nice mockTransport;
    ara::ArtifactLedger ledger;
    EventRecorder recorder;

    // local helper binaries
    std::string browser_path;
    std::string imager_path;

    const std::string ADDRESS = "10.0.0.5";
    const std::string SECRET = "Tr0ub4dor&3-do-not-log";
    const std::string LOG_FILE = "session.1.log";

protected:
    ara::HelperRequest browserRequest(int port = 8080) const;
    ara::HelperRequest imagerRequest() const;

    // session against ADDRESS authenticating with SECRET, not started
    std::unique_ptr<ara::AcquisitionSession> makeSession(std::vector<ara::HelperRequest> helpers,
        ara::SessionObserver& observer);
    std::unique_ptr<ara::AcquisitionSession> makeSession(std::vector<ara::HelperRequest> helpers)
    {
        return makeSession(std::move(helpers), recorder);
    }

    ARASessionUnitTest();
    ~ARASessionUnitTest();
};
