// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include "file_path.h"
#include "file_error.h"


namespace hvk
{
bool itemExists(const Zstring& itemPath); //throw FileError; symlinks are not followed

uint64_t getFileSize(const Zstring& filePath); //throw FileError; follows symlinks

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

//same file system only; an existing target file is replaced atomically
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo); //throw FileError

void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857
