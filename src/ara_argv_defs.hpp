/******************************************************************************\
 * ara_argv_defs.hpp - A header file to define the strong argv interface
 *
 * Copyright 2018-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

// Strong argv defs below
#include "useful/ara_argv.hpp"

struct AcquireArgv : public ara::Argv {
    using Option    = ara::Argv::Option;
    using Parameter = ara::Argv::Parameter;

    static constexpr Option Help  { "help",  'h' };
    static constexpr Option Wait  { "wait",  'w' };
    static constexpr Option Debug { "debug",  1 };

    static constexpr Parameter Host          { "host",           't' };
    static constexpr Parameter Domain        { "domain",         'd' };
    static constexpr Parameter User          { "user",           'u' };
    static constexpr Parameter Kind          { "kind",           'k' };
    static constexpr Parameter Binary        { "binary",         'b' };
    static constexpr Parameter Port          { "port",           'p' };
    static constexpr Parameter Arg           { "arg",            'a' };
    static constexpr Parameter File          { "file",           'f' };
    static constexpr Parameter Output        { "output",         'o' };
    static constexpr Parameter ExpectedBytes { "expected-bytes", 'e' };
    static constexpr Parameter EvidenceDir   { "evidence-dir",    2 };

    static constexpr GNUOption long_options[] = {
        Help,
        Wait,
        Debug,
        Host,
        Domain,
        User,
        Kind,
        Binary,
        Port,
        Arg,
        File,
        Output,
        ExpectedBytes,
        EvidenceDir,
        long_options_done
    };
};
