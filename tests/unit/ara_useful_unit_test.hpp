/******************************************************************************\
 * ara_useful_unit_test.hpp - /useful unit tests for the acquisition core
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <unistd.h>
#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include "useful/ara_argv.hpp"
#include "useful/ara_log.h"
#include "useful/ara_split.hpp"
#include "useful/ara_wrappers.hpp"

#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARAUsefulUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;

protected:
    ARAUsefulUnitTest();
    ~ARAUsefulUnitTest();
};
