/******************************************************************************\
 * Archive.hpp - Tarball of a helper binary and its support files.
 *
 * Copyright 2013-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <unistd.h>
#include <fcntl.h>

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>
#include <vector>

namespace ara {

class Archive {
private: // variables
    static constexpr size_t ARA_BLOCK_SIZE = 65536;

    std::unique_ptr<struct archive,       decltype(&archive_write_free)> m_archPtr;
    std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> m_entryScratchpad;
    std::unique_ptr<char[]> m_readBuf;
    std::string m_archivePath;
    std::vector<std::string> m_entries;

private: // functions
    // refresh the entry scratchpad without reallocating
    decltype(m_entryScratchpad)& freshEntry();
    // recursively add directory and contents to archive
    void addDir(const std::string& entryPath, const std::string& dirPath);
    // block-copy file to archive
    void addFile(const std::string& entryPath, const std::string& filePath);

public: // interface
    // finalize and return path to tarball; after, only valid operations are to destruct
    const std::string& finalize();
    // set up archive entry and call addDir / addFile based on stat. entry
    // paths must be unique
    void addPath(const std::string& entryPath, const std::string& path);
    // top level entry names added so far
    std::vector<std::string> const& entries() const { return m_entries; }

public: // Constructor/destructors
    // create archive on disk and set format
    Archive(const std::string& archivePath);
    // remove archive from disk
    ~Archive() {
        if (!m_archivePath.empty()) {
            unlink(m_archivePath.c_str());
        }
    }

    // Archive has file ownership on disk.
    // We must ensure that gets cleaned up during destructor.
    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;
    Archive(Archive&&) = delete;
    Archive& operator=(Archive&&) = delete;
};

} /* namespace ara */
