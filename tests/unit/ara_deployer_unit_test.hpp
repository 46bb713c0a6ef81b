/******************************************************************************\
 * ara_deployer_unit_test.hpp - Helper deployment unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "frontend/CancelToken.hpp"
#include "frontend/ServiceDeployer.hpp"

#include "MockRemote/Connection.hpp"
#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARADeployerUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;
    ara::Config config;
    ara::Logger log;
    MockConnection::Nice mockConnection;
    ara::ServiceDeployer deployer;
    ara::CancelToken cancel;

    // local helper binaries
    std::string browser_path;
    std::string imager_path;

protected:
    // file browser listening on 8080
    ara::HelperRequest browserRequest() const;
    // memory imager writing mem.raw
    ara::HelperRequest imagerRequest() const;

    ARADeployerUnitTest();
    ~ARADeployerUnitTest();
};
