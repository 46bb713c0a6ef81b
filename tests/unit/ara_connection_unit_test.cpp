/******************************************************************************\
 * ara_connection_unit_test.cpp - Connection manager unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <future>
#include <thread>

#include "ara_connection_unit_test.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

using namespace ara;
using std::chrono::milliseconds;

ARAConnectionUnitTest::ARAConnectionUnitTest()
    : scratch{}
    , config{testConfig(scratch)}
    , log{}
    , mockConnection{}
    , mockTransport{mockConnection}
    , manager{config, mockTransport, log}
    , cancel{}
    , target{"10.0.0.5", "", Reachability::Unknown}
{}

ARAConnectionUnitTest::~ARAConnectionUnitTest()
{}

TEST_F(ARAConnectionUnitTest, Connects)
{
    EXPECT_CALL(mockTransport, open(_, _, _)).Times(1);

    auto const connection = manager.connect(target, credential(), milliseconds{1000}, cancel);
    ASSERT_NE(connection, nullptr);
    EXPECT_EQ(connection->host(), "10.0.0.5");
}

// the transport sees the secret, and only while it is opening
TEST_F(ARAConnectionUnitTest, CredentialLentToTransport)
{
    auto seen = std::string{};
    EXPECT_CALL(mockTransport, open(_, _, _))
        .WillOnce(Invoke([&](Target const&, Credential const& credential, milliseconds) {
            seen = std::string(credential.secret(), credential.secretLength());
            return std::unique_ptr<Connection>{new ConnectionProxy{mockConnection}};
        }));

    manager.connect(target, credential(), milliseconds{1000}, cancel);
    EXPECT_EQ(seen, SECRET);
}

// bad credentials fail on the first attempt
TEST_F(ARAConnectionUnitTest, AuthenticationNotRetried)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .Times(1)
        .WillOnce(Throw(AuthenticationError("authentication as admin on 10.0.0.5 failed")));

    try {
        manager.connect(target, credential(), milliseconds{1000}, cancel);
        FAIL() << "connect succeeded";
    } catch (AuthenticationError const& ex) {
        EXPECT_EQ(std::string{ex.what()}.find(SECRET), std::string::npos);
    }
}

TEST_F(ARAConnectionUnitTest, TransientFailuresRetried)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .Times(3)
        .WillOnce(Throw(NetworkUnreachable("connection refused")))
        .WillOnce(Throw(TimeoutExceeded("handshake timed out")))
        .WillOnce(Invoke([&](Target const&, Credential const&, milliseconds) {
            return std::unique_ptr<Connection>{new ConnectionProxy{mockConnection}};
        }));

    auto const connection = manager.connect(target, credential(), milliseconds{2000}, cancel);
    EXPECT_NE(connection, nullptr);
}

TEST_F(ARAConnectionUnitTest, GivesUpAfterAttempts)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .Times(config.connectAttempts)
        .WillRepeatedly(Throw(NetworkUnreachable("no route to host")));

    EXPECT_THROW(manager.connect(target, credential(), milliseconds{2000}, cancel), NetworkUnreachable);
}

// the last per-attempt error decides the kind
TEST_F(ARAConnectionUnitTest, ReportsTimeout)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .WillRepeatedly(Throw(TimeoutExceeded("banner exchange timed out")));

    EXPECT_THROW(manager.connect(target, credential(), milliseconds{2000}, cancel), TimeoutExceeded);
}

TEST_F(ARAConnectionUnitTest, NullConnectionIsUnreachable)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .WillRepeatedly(Invoke([](Target const&, Credential const&, milliseconds) {
            return std::unique_ptr<Connection>{};
        }));

    EXPECT_THROW(manager.connect(target, credential(), milliseconds{2000}, cancel), NetworkUnreachable);
}

// other failures are not part of the retry policy
TEST_F(ARAConnectionUnitTest, OtherErrorsPropagate)
{
    EXPECT_CALL(mockTransport, open(_, _, _))
        .Times(1)
        .WillOnce(Throw(std::runtime_error("libssh2_session_init failed")));

    EXPECT_THROW(manager.connect(target, credential(), milliseconds{2000}, cancel), std::runtime_error);
}

TEST_F(ARAConnectionUnitTest, CancelledBeforeConnect)
{
    EXPECT_CALL(mockTransport, open(_, _, _)).Times(0);

    cancel.cancel();
    EXPECT_THROW(manager.connect(target, credential(), milliseconds{1000}, cancel), UserCancelled);
}

// cancellation ends the backoff wait early
TEST_F(ARAConnectionUnitTest, CancelledDuringBackoff)
{
    config.backoffBase = milliseconds{5000};
    config.connectAttempts = 3;

    auto opened = std::promise<void>{};
    EXPECT_CALL(mockTransport, open(_, _, _))
        .Times(1)
        .WillOnce(Invoke([&](Target const&, Credential const&, milliseconds) -> std::unique_ptr<Connection> {
            opened.set_value();
            throw NetworkUnreachable("connection refused");
        }));

    auto const started = std::chrono::steady_clock::now();
    auto connecting = std::async(std::launch::async, [&]() {
        return manager.connect(target, credential(), milliseconds{30000}, cancel);
    });

    opened.get_future().wait();
    cancel.cancel();

    EXPECT_THROW(connecting.get(), UserCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds{4000});
}

TEST_F(ARAConnectionUnitTest, Probe)
{
    EXPECT_CALL(mockTransport, reachable(_, _))
        .WillOnce(Return(true))
        .WillOnce(Return(false));

    EXPECT_EQ(manager.probe(target, milliseconds{100}).reachability, Reachability::Reachable);
    EXPECT_EQ(manager.probe(target, milliseconds{100}).reachability, Reachability::Unreachable);
}

TEST_F(ARAConnectionUnitTest, Disconnect)
{
    EXPECT_CALL(mockConnection, close()).Times(1);

    auto connection = manager.connect(target, credential(), milliseconds{1000}, cancel);
    manager.disconnect(connection.get());
    manager.disconnect(nullptr);
}
