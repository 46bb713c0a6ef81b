/******************************************************************************\
 * ara_fe_iface_test.hpp - C interface unit tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "gtest/gtest.h"

#include "anubis_remote_fe.h"

// The fixture for testing C interface results
class ARAFEIfaceTest : public ::testing::Test
{
protected:
	ARAFEIfaceTest()
	{}

	// never leave the process wide runtime behind for the next test
	~ARAFEIfaceTest() override
	{
		ara_fini();
	}
};

static const auto SUCCESS = int{0};
static const auto FAILURE = int{1};
