/******************************************************************************\
 * Archive.cpp - Tarball of a helper binary and its support files.
 *
 * Copyright 2013-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <dirent.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <stdexcept>

#include "Archive.hpp"

#include "useful/ara_wrappers.hpp"

namespace ara {

decltype(Archive::m_entryScratchpad)& Archive::freshEntry() {
    if (m_entryScratchpad) {
        archive_entry_clear(m_entryScratchpad.get());
        return m_entryScratchpad;
    } else {
        throw std::runtime_error(m_archivePath + " tried to add a path after finalizing");
    }
}

Archive::Archive(const std::string& archivePath)
    : m_archPtr{archive_write_new(), archive_write_free}
    , m_entryScratchpad{archive_entry_new(), archive_entry_free}
    , m_readBuf{new char[ARA_BLOCK_SIZE]}
    , m_archivePath{}
    , m_entries{}
{
    if (m_archPtr == nullptr) {
        throw std::runtime_error("archive_write_new failed");
    }
    if (m_entryScratchpad == nullptr) {
        throw std::runtime_error("archive_entry_new failed");
    }

    if (archive_write_set_format_gnutar(m_archPtr.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(m_archPtr.get()));
    }

    if (archive_write_open_filename(m_archPtr.get(), archivePath.c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(archivePath + ": " + archive_error_string(m_archPtr.get()));
    }

    // we own the file from here on
    m_archivePath = archivePath;
}

const std::string& Archive::finalize() {
    if (m_archPtr) {
        if (archive_write_close(m_archPtr.get()) != ARCHIVE_OK) {
            throw std::runtime_error(m_archivePath + " failed to close: "
                + archive_error_string(m_archPtr.get()));
        }
    }
    m_archPtr.reset();
    m_entryScratchpad.reset();
    m_readBuf.reset();
    return m_archivePath;
}

static void archiveWriteRetry(struct archive* arch, struct archive_entry* entry) {
    while (true) {
        switch (archive_write_header(arch, entry)) {
            case ARCHIVE_RETRY:
                continue;
            case ARCHIVE_FATAL:
                throw std::runtime_error(archive_error_string(arch));
            default: return;
        }
    }
}

void Archive::addDir(const std::string& entryPath, const std::string& dirPath) {
    if (auto dirHandle = take_pointer_ownership(opendir(dirPath.c_str()), closedir)) {
        errno = 0;
        for (struct dirent *d = readdir(dirHandle.get()); d != nullptr;
            d = readdir(dirHandle.get())) {

            // make sure not . or ..
            if (!strcmp(d->d_name, ".") || !strcmp(d->d_name, "..")) {
                continue;
            }

            // recursively add to archive
            addPath(entryPath + "/" + d->d_name, dirPath + "/" + d->d_name);
            errno = 0;
        }

        // check for failure on readdir
        if (errno != 0) {
            throw std::runtime_error(dirPath + " had readdir failure: " + strerror(errno));
        }
    } else {
        throw std::runtime_error(dirPath + " failed opendir call: " + strerror(errno));
    }
}

void Archive::addFile(const std::string& entryPath, const std::string& filePath) {
    // copy data from file to archive
    auto const source = fd_handle{ open(filePath.c_str(), O_RDONLY) };
    while (true) {
        auto const readLen = read(source.fd(), m_readBuf.get(), ARA_BLOCK_SIZE);
        if (readLen < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(filePath + " failed read call: " + strerror(errno));
        } else if (readLen == 0) {
            break;
        }

        auto const writeLen = archive_write_data(m_archPtr.get(), m_readBuf.get(), readLen);
        if (writeLen < 0) {
            throw std::runtime_error(filePath + " failed archive_write_data: " +
                archive_error_string(m_archPtr.get()));
        } else if (writeLen != readLen) {
            throw std::runtime_error(filePath + " had archive_write_data length mismatch for "
                + entryPath);
        }
    }
}

void Archive::addPath(const std::string& entryPath, const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st)) {
        throw std::runtime_error(path + " failed stat call: " + strerror(errno));
    }

    // reject unsupported types before anything is written
    if (!S_ISDIR(st.st_mode) && !S_ISREG(st.st_mode)) {
        throw std::runtime_error(path + " has invalid file type.");
    }

    // top level names must not collide, the target unpacks into one directory
    if (entryPath.find('/') == std::string::npos) {
        if (std::find(m_entries.begin(), m_entries.end(), entryPath) != m_entries.end()) {
            throw std::runtime_error(path + " collides with an existing entry named " + entryPath);
        }
        m_entries.push_back(entryPath);
    }

    // create archive entry from stat
    { auto& entryPtr = freshEntry();
        archive_entry_copy_stat(entryPtr.get(), &st);
        archive_entry_set_pathname(entryPtr.get(), entryPath.c_str());
        archiveWriteRetry(m_archPtr.get(), entryPtr.get());
    }

    // call proper file/diradd functions
    if (S_ISDIR(st.st_mode)) {
        addDir(entryPath, path);
    } else {
        addFile(entryPath, path);
    }
}

} /* namespace ara */
