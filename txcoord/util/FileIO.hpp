/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef TXCOORD_UTIL_FILE_IO_HPP
#define TXCOORD_UTIL_FILE_IO_HPP

#include "Data.hpp"
#include "Status.hpp"
#include <mutex>

namespace txcoord {

extern std::recursive_mutex gFileMutex;
typedef std::lock_guard<std::recursive_mutex> AutoFileLock;

/**
 * Puts a slash on the end of a filename (if necessary).
 */
std::string
fileSlashify(const std::string &path);

/**
 * Ensures that a directory exists, creating it if not.
 */
Status
fileEnsureDir(const std::string &dir);

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

/**
 * Reads a file from disk.
 */
Status
fileLoad(DataChunk &result, const std::string &path);

/**
 * Writes a file to disk.
 */
Status
fileSave(DataSlice data, const std::string &path);

/**
 * Writes a file to disk by way of a temporary file,
 * so readers see either the old contents or the new ones.
 */
Status
fileSaveAtomic(DataSlice data, const std::string &path);

/**
 * Deletes a file recursively.
 */
Status
fileDelete(const std::string &path);

} // namespace txcoord

#endif
