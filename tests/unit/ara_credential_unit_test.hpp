/******************************************************************************\
 * ara_credential_unit_test.hpp - Credential and configuration unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "frontend/Config.hpp"
#include "frontend/Credential.hpp"
#include "frontend/Interfaces.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARACredentialUnitTest : public ::testing::Test
{
protected:
    const std::string USERNAME = "forensic";
    const std::string SECRET = "s3cr3t-Pa55";

protected:
    ARACredentialUnitTest();
    ~ARACredentialUnitTest();
};

// Environment variables set by a test are removed again with the fixture
class ARAConfigUnitTest : public ::testing::Test
{
protected:
    std::vector<std::string> set_vars;

    void setVar(std::string const& name, std::string const& value);

protected:
    ARAConfigUnitTest();
    ~ARAConfigUnitTest();
};
