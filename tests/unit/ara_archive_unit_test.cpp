/******************************************************************************\
 * ara_archive_unit_test.cpp - Helper package archive unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <sys/stat.h>
#include <sys/types.h>

#include <archive.h>
#include <archive_entry.h>

#include "ara_archive_unit_test.hpp"

using namespace ara;

ARAArchiveUnitTest::ARAArchiveUnitTest()
    : scratch{}
    , archive_path{scratch.path() + "/helper.tar"}
    , archive{archive_path}
{}

ARAArchiveUnitTest::~ARAArchiveUnitTest()
{}

std::vector<std::string>
ARAArchiveUnitTest::readEntries(std::string const& path)
{
    auto result = std::vector<std::string>{};

    auto reader = take_pointer_ownership(archive_read_new(), archive_read_free);
    archive_read_support_format_all(reader.get());
    if (archive_read_open_filename(reader.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        ADD_FAILURE() << "failed to open " << path << ": " << archive_error_string(reader.get());
        return result;
    }

    struct archive_entry *entry = nullptr;
    while (archive_read_next_header(reader.get(), &entry) == ARCHIVE_OK) {
        result.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(reader.get());
    }
    return result;
}

// the binary and its support files end up side by side
TEST_F(ARAArchiveUnitTest, PackagesFiles)
{
    auto const binary = scratch.writeFile("fbrowser", "#!/bin/sh\nexit 0\n");
    auto const support = scratch.writeFile(TEST_FILE_NAME + ".conf", "port=8080\n");

    ASSERT_NO_THROW(archive.addPath("fbrowser", binary));
    ASSERT_NO_THROW(archive.addPath(TEST_FILE_NAME + ".conf", support));

    auto const& path = archive.finalize();
    EXPECT_EQ(path, archive_path);
    EXPECT_EQ(archive.entries(), (std::vector<std::string>{"fbrowser", TEST_FILE_NAME + ".conf"}));
    EXPECT_EQ(readEntries(path), (std::vector<std::string>{"fbrowser", TEST_FILE_NAME + ".conf"}));
}

// directories are added recursively
TEST_F(ARAArchiveUnitTest, PackagesDirectory)
{
    auto const dir = scratch.path() + "/lib";
    ASSERT_EQ(mkdir(dir.c_str(), 0700), 0);
    scratch.writeFile("lib/libhelper.so", "ELF");

    ASSERT_NO_THROW(archive.addPath("lib", dir));
    auto const entries = readEntries(archive.finalize());

    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0], "lib");
    EXPECT_EQ(entries[1], "lib/libhelper.so");
}

// two files with one name would overwrite each other on the target
TEST_F(ARAArchiveUnitTest, RejectsCollision)
{
    auto const first = scratch.writeFile("one", "1");
    auto const second = scratch.writeFile("two", "2");

    ASSERT_NO_THROW(archive.addPath("helper", first));
    EXPECT_THROW(archive.addPath("helper", second), std::runtime_error);
}

TEST_F(ARAArchiveUnitTest, RejectsMissingFile)
{
    EXPECT_THROW(archive.addPath("missing", scratch.path() + "/does_not_exist"), std::runtime_error);
}

TEST_F(ARAArchiveUnitTest, NoAddAfterFinalize)
{
    auto const file = scratch.writeFile("late", "x");
    archive.finalize();
    EXPECT_THROW(archive.addPath("late", file), std::runtime_error);
}

// the package is removed from disk with the archive
TEST_F(ARAArchiveUnitTest, RemovedOnDestruction)
{
    auto const path = scratch.path() + "/scoped.tar";
    { auto scoped = Archive{path};
        scoped.addPath("late", scratch.writeFile("late", "x"));
        scoped.finalize();
        EXPECT_TRUE(pathExists(path.c_str()));
    }
    EXPECT_FALSE(pathExists(path.c_str()));
}
