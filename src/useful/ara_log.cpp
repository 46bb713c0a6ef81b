/******************************************************************************\
 * ara_log.cpp - Functions relating to creating and writing log files.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ara_defs.h"

#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <sys/syscall.h>

#include <string>

#include "ara_log.h"

ara_log_t*
_ara_create_log(char const* directory, char const* filename, int suffix)
{
    if (filename == nullptr) {
        return nullptr;
    }

    auto const logDir = std::string{(directory != nullptr) ? directory : ARA_DEFAULT_LOG_DIR};
    auto const logPath = logDir + "/" + filename + "." + std::to_string(suffix) + ".log";

    // append so that retried sessions in the same process keep earlier output
    auto const logFile = fopen(logPath.c_str(), "a");
    if (logFile == nullptr) {
        fprintf(stderr, "warning: failed to create log file %s: %s\n", logPath.c_str(), strerror(errno));
        return nullptr;
    }

    // unbuffered, so that a crash does not lose the last lines
    setvbuf(logFile, nullptr, _IONBF, 0);

    return logFile;
}

int
_ara_close_log(ara_log_t* log_file)
{
    if (log_file != nullptr) {
        return fclose(log_file);
    }
    return 0;
}

int
_ara_write_log(ara_log_t* log_file, const char *fmt, ...)
{
    if ((log_file == nullptr) || (fmt == nullptr)) {
        return 1;
    }

    // timestamp prefix
    char stamp[32];
    auto const now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    va_list vargs;
    va_start(vargs, fmt);

    // keep prefix and message together when sessions log from several threads
    flockfile(log_file);
    fprintf(log_file, "%s [%ld] ", stamp, (long)syscall(SYS_gettid));
    vfprintf(log_file, fmt, vargs);
    funlockfile(log_file);

    va_end(vargs);

    return 0;
}
