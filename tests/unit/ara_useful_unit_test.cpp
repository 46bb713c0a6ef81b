/******************************************************************************\
 * ara_useful_unit_test.cpp - /useful unit tests for the acquisition core
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_useful_unit_test.hpp"

using namespace ara;

ARAUsefulUnitTest::ARAUsefulUnitTest()
{}

ARAUsefulUnitTest::~ARAUsefulUnitTest()
{}

// split::string puts the unsplit remainder in the last element
TEST_F(ARAUsefulUnitTest, SplitString)
{
    auto const [group, pid] = split::string<2>("4242 4243");
    EXPECT_EQ(group, "4242");
    EXPECT_EQ(pid, "4243");

    auto const [first, rest] = split::string<2>("a b c");
    EXPECT_EQ(first, "a");
    EXPECT_EQ(rest, "b c");

    auto const [only, missing] = split::string<2>("lonely");
    EXPECT_EQ(only, "lonely");
    EXPECT_EQ(missing, "");
}

TEST_F(ARAUsefulUnitTest, SplitLines)
{
    auto const lines = split::lines("  first\n\n\tsecond  \r\n\nthird");
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "third");

    EXPECT_TRUE(split::lines("").empty());
    EXPECT_TRUE(split::lines("\n \n").empty());
}

TEST_F(ARAUsefulUnitTest, RemoveLeadingWhitespace)
{
    EXPECT_EQ(split::removeLeadingWhitespace("  padded\t\n"), "padded");
    EXPECT_EQ(split::removeLeadingWhitespace(" \t "), "");
}

// every word is single quoted, embedded quotes survive the remote shell
TEST_F(ARAUsefulUnitTest, ShellQuote)
{
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote(""), "''");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote("$(reboot); `id`"), "'$(reboot); `id`'");
}

TEST_F(ARAUsefulUnitTest, ManagedArgvShellString)
{
    auto argv = ManagedArgv{"rm", "-rf", "--"};
    argv.add(std::string{"/tmp/ara_file browser.123456"});

    EXPECT_EQ(argv.size(), 5);
    EXPECT_EQ(argv.get()[4], nullptr);
    EXPECT_EQ(argv.shellString(), "'rm' '-rf' '--' '/tmp/ara_file browser.123456'");

    auto copy = argv;
    copy.replace(0, "ls");
    EXPECT_EQ(copy.shellString(), "'ls' '-rf' '--' '/tmp/ara_file browser.123456'");
    EXPECT_STREQ(argv.get()[0], "rm");

    EXPECT_THROW(argv.add((char const*)nullptr), std::logic_error);
    EXPECT_THROW(argv.replace(4, "x"), std::out_of_range);
}

TEST_F(ARAUsefulUnitTest, ManagedArgvEmpty)
{
    auto const argv = ManagedArgv{};
    EXPECT_TRUE(argv.empty());
    EXPECT_EQ(argv.shellString(), "");
}

// enabled logger writes <dir>/<name>.<suffix>.log
TEST_F(ARAUsefulUnitTest, LoggerWritesFile)
{
    { auto log = Logger{true, scratch.path(), "unit", 7};
        ASSERT_TRUE(log.enabled());
        log.write("session %d: %s\n", 3, "CONNECTING -> CONNECTED");
    }

    auto const contents = scratch.readFile("unit.7.log");
    EXPECT_NE(contents.find("session 3: CONNECTING -> CONNECTED"), std::string::npos);
}

TEST_F(ARAUsefulUnitTest, LoggerDisabled)
{
    auto log = Logger{};
    EXPECT_FALSE(log.enabled());
    // no file, no crash
    log.write("ignored %d\n", 1);

    auto off = Logger{false, scratch.path(), "off", 1};
    off.write("ignored\n");
    EXPECT_FALSE(pathExists((scratch.path() + "/off.1.log").c_str()));
}

TEST_F(ARAUsefulUnitTest, Basename)
{
    EXPECT_EQ(cstr::basename("/tmp/ara_memory_imager.123456/mem.raw"), "mem.raw");
    EXPECT_EQ(cstr::basename("helper"), "helper");
}

TEST_F(ARAUsefulUnitTest, RemoveDirectory)
{
    auto const dir = cstr::mkdtemp(scratch.path() + "/treeXXXXXX");
    auto const sub = cstr::mkdtemp(dir + "/subXXXXXX");
    { auto file = std::ofstream{sub + "/leaf"};
        file << "x";
    }

    ASSERT_TRUE(dirHasPerms(dir.c_str(), R_OK | W_OK | X_OK));
    removeDirectory(dir);
    EXPECT_FALSE(pathExists(dir.c_str()));
}

TEST_F(ARAUsefulUnitTest, PathChecks)
{
    auto const file = scratch.path() + "/helper";
    { auto out = std::ofstream{file};
        out << "#!/bin/sh\n";
    }

    EXPECT_TRUE(fileHasPerms(file.c_str(), R_OK));
    EXPECT_FALSE(dirHasPerms(file.c_str(), R_OK));
    EXPECT_TRUE(dirHasPerms(scratch.path().c_str(), W_OK | X_OK));
    EXPECT_FALSE(fileHasPerms(scratch.path().c_str(), R_OK));
    EXPECT_FALSE(fileHasPerms((scratch.path() + "/missing").c_str(), R_OK));
    EXPECT_FALSE(fileHasPerms(nullptr, R_OK));
    EXPECT_FALSE(pathExists(nullptr));

    EXPECT_THROW(cstr::mkdtemp(scratch.path() + "/missing/dirXXXXXX"), std::runtime_error);
    EXPECT_THROW(file::open(scratch.path() + "/missing/file", "rb"), std::runtime_error);
    EXPECT_THROW(fd_handle{-1}, std::runtime_error);

    // removing nothing is not an error
    EXPECT_NO_THROW(removeDirectory(scratch.path() + "/missing"));
}

TEST_F(ARAUsefulUnitTest, GetenvOrDefault)
{
    ASSERT_EQ(setenv("ARA_TEST_VALUE", "set", 1), 0);
    EXPECT_STREQ(getenvOrDefault("ARA_TEST_VALUE", "fallback"), "set");
    ASSERT_EQ(unsetenv("ARA_TEST_VALUE"), 0);
    EXPECT_STREQ(getenvOrDefault("ARA_TEST_VALUE", "fallback"), "fallback");
}
