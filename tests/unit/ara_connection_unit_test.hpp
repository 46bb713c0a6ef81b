/******************************************************************************\
 * ara_connection_unit_test.hpp - Connection manager unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "frontend/CancelToken.hpp"
#include "frontend/ConnectionManager.hpp"

#include "MockRemote/Connection.hpp"
#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARAConnectionUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;
    ara::Config config;
    ara::Logger log;
    MockConnection::Nice mockConnection;
    MockTransport::Nice mockTransport;
    ara::ConnectionManager manager;
    ara::CancelToken cancel;
    ara::Target target;

    const std::string SECRET = "hunter2-never-log";

protected:
    ara::Credential credential() const { return ara::Credential{"admin", SECRET.c_str()}; }

    ARAConnectionUnitTest();
    ~ARAConnectionUnitTest();
};
