// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "file_access.h"
#include <sys/stat.h>
#include <unistd.h>

using namespace hvk;


bool hvk::itemExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) == 0)
        return true;

    if (errno == ENOENT)
        return false;

    THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");
}


uint64_t hvk::getFileSize(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), "stat");

    return fileInfo.st_size;
}


void hvk::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void hvk::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) //throw FileError
{
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                    L"%x", L'\n' + fmtPath(pathFrom)),
                                         L"%y", L'\n' + fmtPath(pathTo)), "rename");
}


void hvk::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath));

    auto checkIsFolder = [&](const struct stat& info)
    {
        if (!S_ISDIR(info.st_mode))
            throw FileError(errorMsg, replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))));
    };

    struct stat dirInfo = {};
    if (::stat(dirPath.c_str(), &dirInfo) == 0)
        return checkIsFolder(dirInfo); //usual case: already there

    if (errno != ENOENT)
        THROW_LAST_FILE_ERROR(errorMsg, "stat");

    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    if (::mkdir(dirPath.c_str(), S_IRWXU | S_IRWXG | S_IRWXO /*umask applies*/) != 0)
    {
        if (errno != EEXIST)
            THROW_LAST_FILE_ERROR(errorMsg, "mkdir");

        //created concurrently by another thread
        if (::stat(dirPath.c_str(), &dirInfo) != 0)
            THROW_LAST_FILE_ERROR(errorMsg, "stat");
        checkIsFolder(dirInfo);
    }
}
