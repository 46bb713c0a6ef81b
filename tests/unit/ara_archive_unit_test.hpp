/******************************************************************************\
 * ara_archive_unit_test.hpp - Helper package archive unit tests
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

#include "frontend/transfer/Archive.hpp"

#include "MockRemote/Scratch.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// the fixture for unit testing the helper package archive
class ARAArchiveUnitTest : public ::testing::Test
{
protected:
    ScratchDir scratch;

    // path of the package under test
    std::string archive_path;

    // the archive to be used for testing
    ara::Archive archive;

    // string constants
    const std::string TEST_FILE_NAME = "archive_test_file";

protected:
    // entry names in the finished tarball, in order
    std::vector<std::string> readEntries(std::string const& path);

    ARAArchiveUnitTest();
    ~ARAArchiveUnitTest();
};
