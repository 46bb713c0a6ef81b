/******************************************************************************\
 * ara_wrappers.hpp - RAII and exception wrappers around the POSIX calls the
 *                    core makes on local files, directories and descriptors.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include "ara_defs.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>

#include <fcntl.h>
#include <ftw.h>
#include <libgen.h>
#include <unistd.h>

namespace ara {

// Wrap a raw pointer from a C allocator in a unique_ptr that frees it with
// destructor, e.g. take_pointer_ownership(opendir(path), closedir)
template <typename T, typename Destr>
inline static auto
take_pointer_ownership(T*&& expiring, Destr&& destructor) -> std::unique_ptr<T, decltype(&destructor)>
{
    static_assert(!std::is_rvalue_reference<decltype(destructor)>::value);
    return std::unique_ptr<T, decltype(&destructor)>{expiring, destructor};
}

inline static char const*
getenvOrDefault(char const* name, char const* fallback)
{
    auto const value = ::getenv(name);
    return (value != nullptr) ? value : fallback;
}

static inline std::string
errnoString()
{
    return std::string{strerror(errno)};
}

namespace cstr {
    // libc versions edit their argument in place, these work on a private copy
    static inline std::vector<char> writableCopy(std::string const& str) {
        return std::vector<char>(str.c_str(), str.c_str() + str.size() + 1);
    }

    // Create a unique directory from a template ending in XXXXXX
    static inline std::string mkdtemp(std::string const& pathTemplate) {
        auto path = writableCopy(pathTemplate);
        if (::mkdtemp(path.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed on " + pathTemplate + ": " + errnoString());
        }
        return std::string{path.data()};
    }

    // Last component of path
    static inline std::string basename(std::string const& path) {
        auto copy = writableCopy(path);
        auto const base = ::basename(copy.data());
        if (base == nullptr) {
            throw std::runtime_error("basename failed on " + path);
        }
        return std::string{base};
    }
} /* namespace ara::cstr */

// Buffered local file access for the scp transfers
namespace file {
    using handle = std::unique_ptr<FILE, decltype(&std::fclose)>;

    static inline handle open(std::string const& path, char const* mode)
    {
        if (auto fp = take_pointer_ownership(fopen(path.c_str(), mode), std::fclose)) {
            return fp;
        }
        throw std::runtime_error("failed to open " + path + ": " + errnoString());
    }

    // Returns the item count read, 0 at end of file
    static inline size_t read(void* ptr, size_t size, size_t nmemb, FILE* fp)
    {
        auto const count = fread(ptr, size, nmemb, fp);
        if (ferror(fp)) {
            throw std::runtime_error("read failed: " + errnoString());
        }
        return count;
    }

    static inline void write(void const* ptr, size_t size, size_t nmemb, FILE* fp)
    {
        if (fwrite(ptr, size, nmemb, fp) != nmemb) {
            throw std::runtime_error("write failed: " + errnoString());
        }
    }
} /* namespace ara::file */

/*
** Owns a file descriptor or socket and closes it on destruction. Construct
** straight from the result of open() or socket(), a negative value throws.
*/
class fd_handle {
private: // members
    int m_fd = -1;

public: // interface
    int fd() const { return m_fd; }

public: // Constructor/destructors
    fd_handle() = default;

    fd_handle(int fd)
        : m_fd{fd}
    {
        if (m_fd < 0) {
            throw std::runtime_error("invalid file descriptor: " + errnoString());
        }
    }

    fd_handle(fd_handle&& other)
        : m_fd{other.m_fd}
    {
        other.m_fd = -1;
    }

    fd_handle& operator=(fd_handle&& other)
    {
        if (this != &other) {
            if (m_fd >= 0) {
                ::close(m_fd);
            }
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    ~fd_handle()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    fd_handle(const fd_handle&) = delete;
    fd_handle& operator=(const fd_handle&) = delete;
};

// path exists, is of type (S_IFDIR, S_IFREG) and grants perms to this process
static inline bool
hasTypeAndPerms(char const* path, mode_t type, int perms)
{
    struct stat st;
    if ((path == nullptr) || (::stat(path, &st) != 0)) {
        return false;
    }
    return ((st.st_mode & S_IFMT) == type) && (::access(path, perms) == 0);
}

static inline bool
dirHasPerms(char const* dirPath, int perms)
{
    return hasTypeAndPerms(dirPath, S_IFDIR, perms);
}

static inline bool
fileHasPerms(char const* filePath, int perms)
{
    return hasTypeAndPerms(filePath, S_IFREG, perms);
}

static inline bool
pathExists(char const* path)
{
    struct stat st;
    return (path != nullptr) && (::stat(path, &st) == 0);
}

// Recursively remove a local directory tree. Missing paths are not an error.
static inline void
removeDirectory(std::string const& path)
{
    if (!pathExists(path.c_str())) {
        return;
    }

    // depth first, so directories are empty by the time they are reached
    auto const removeEntry = [](char const* entry, struct stat const*, int, struct FTW*) {
        return ::remove(entry);
    };
    if (::nftw(path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
        throw std::runtime_error("failed to remove " + path + ": " + errnoString());
    }
}

} /* namespace ara */
