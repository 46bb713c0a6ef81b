/******************************************************************************\
 * ara_log.h - Header file for the log interface.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _ARA_LOG_H
#define _ARA_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE ara_log_t;

// create a new logfile in directory with format <filename>.<suffix>.log
// returns NULL if the file could not be created
ara_log_t* _ara_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _ara_close_log(ara_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _ara_write_log(ara_log_t* log_file, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#ifdef __cplusplus
}

#include <string>
#include <memory>

namespace ara {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<ara_log_t, int(*)(ara_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _ara_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_ara_create_log(dir, filename.c_str(), suffix), _ara_close_log};
        }
    }

    // disabled logger
    Logger() : logFile{nullptr, _ara_close_log} {}

    bool enabled() const { return logFile != nullptr; }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _ara_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }
};

} /* namespace ara */

#endif /* __cplusplus */

#endif /* _ARA_LOG_H */
