/******************************************************************************\
 * unit_tests.cpp - Unit test driver
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <stdlib.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

class ARA_Environment : public ::testing::Environment
{
public:
    void SetUp() override {
        // Settings from the calling shell must not leak into the tests
        for (auto&& var : { ARA_DBG_ENV_VAR, ARA_LOG_DIR_ENV_VAR, ARA_STAGE_DIR_ENV_VAR,
            ARA_EVIDENCE_DIR_ENV_VAR, ARA_REMOTE_BASE_ENV_VAR, ARA_SSH_PORT_ENV_VAR,
            ARA_SSH_KNOWNHOSTS_PATH_ENV_VAR, ARA_CONNECT_TIMEOUT_ENV_VAR, ARA_CONNECT_ATTEMPTS_ENV_VAR,
            ARA_BACKOFF_BASE_ENV_VAR, ARA_HEALTH_CHECK_ATTEMPTS_ENV_VAR, ARA_HEALTH_CHECK_INTERVAL_ENV_VAR,
            ARA_HEALTH_CHECK_TIMEOUT_ENV_VAR, ARA_POLL_INTERVAL_ENV_VAR, ARA_STALL_THRESHOLD_ENV_VAR,
            ARA_CLEANUP_ATTEMPTS_ENV_VAR, ARA_CLEANUP_RETRY_DELAY_ENV_VAR, ARA_SECRET_ENV_VAR }) {
            unsetenv(var);
        }
    }
};

int main(int argc, char **argv) {
    ::testing::AddGlobalTestEnvironment(new ARA_Environment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
