/******************************************************************************\
 * ara_cleanup_unit_test.hpp - Cleanup coordination unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "frontend/CleanupCoordinator.hpp"

#include "MockRemote/Connection.hpp"
#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARACleanupUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;
    ara::Config config;
    ara::Logger log;
    MockConnection::Nice mockConnection;
    MockTransport::Nice mockTransport;
    ara::ServiceDeployer deployer;
    ara::ConnectionManager manager;
    ara::CleanupCoordinator coordinator;

    // connected to mockConnection, two helpers deployed
    ara::SessionResources resources;

    const std::string BROWSER_DIR = "/tmp/ara_file_browser.100001";
    const std::string IMAGER_DIR = "/tmp/ara_memory_imager.100002";

protected:
    static ara::Deployment deployed(ara_helper_kind_t kind, std::string const& dir, pid_t pid);

    ARACleanupUnitTest();
    ~ARACleanupUnitTest();
};
