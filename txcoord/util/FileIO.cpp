/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include "Debug.hpp"
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace txcoord {

std::recursive_mutex gFileMutex;

std::string
fileSlashify(const std::string &path)
{
    if (path.empty())
        return "./";
    return path.back() == '/' ? path : path + '/';
}

Status
fileEnsureDir(const std::string &dir)
{
    AutoFileLock lock(gFileMutex);

    if (!fileExists(dir))
    {
        mode_t process_mask = umask(0);
        int e = mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
        umask(process_mask);

        if (e)
            return TXC_ERROR(TXC_CC_FileError, "Could not create directory " + dir);
    }

    return Status();
}

bool
fileExists(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    return 0 == access(path.c_str(), F_OK);
}

Status
fileLoad(DataChunk &result, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
        return TXC_ERROR(TXC_CC_FileError, "Cannot open for reading: " + path);

    fseek(fp, 0, SEEK_END);
    size_t size = ftell(fp);
    fseek(fp, 0, SEEK_SET);

    result.resize(size);
    if (fread(result.data(), 1, size, fp) != size)
    {
        fclose(fp);
        return TXC_ERROR(TXC_CC_FileError, "Cannot read file: " + path);
    }

    fclose(fp);
    return Status();
}

Status
fileSave(DataSlice data, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "wb");
    if (!fp)
        return TXC_ERROR(TXC_CC_FileError, "Cannot open for writing: " + path);

    if (data.size() && 1 != fwrite(data.data(), data.size(), 1, fp))
    {
        fclose(fp);
        return TXC_ERROR(TXC_CC_FileError, "Cannot write file: " + path);
    }

    if (fflush(fp) || fsync(fileno(fp)))
    {
        fclose(fp);
        return TXC_ERROR(TXC_CC_FileError, "Cannot flush file: " + path);
    }

    fclose(fp);
    return Status();
}

Status
fileSaveAtomic(DataSlice data, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    const auto temp = path + ".tmp";
    TXC_CHECK(fileSave(data, temp));
    if (rename(temp.c_str(), path.c_str()))
        return TXC_ERROR(TXC_CC_FileError, "Cannot replace file: " + path);

    return Status();
}

static Status
fileDeleteRecursive(const std::string &path)
{
    // First, be sure the file exists:
    struct stat statbuf;
    if (stat(path.c_str(), &statbuf))
        return Status();

    // If this is a directory, delete the contents:
    if (S_ISDIR(statbuf.st_mode))
    {
        DIR *dir = opendir(path.c_str());
        if (!dir)
            return TXC_ERROR(TXC_CC_FileError, "Cannot open directory for deletion");

        struct dirent *de;
        while (nullptr != (de = readdir(dir)))
        {
            // These two are not real entries:
            if (!strcmp(de->d_name, ".") || !strcmp(de->d_name, ".."))
                continue;

            Status s = fileDeleteRecursive(fileSlashify(path) + de->d_name);
            if (!s)
            {
                closedir(dir);
                return s;
            }
        }
        closedir(dir);
    }

    // Actually remove the thing:
    if (remove(path.c_str()))
        return TXC_ERROR(TXC_CC_FileError, "Cannot delete file " + path);

    return Status();
}

Status
fileDelete(const std::string &path)
{
    TXC_DebugLog("Deleting %s", path.c_str());
    return fileDeleteRecursive(path);
}

} // namespace txcoord
