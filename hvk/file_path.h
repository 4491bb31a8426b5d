// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace hvk
{
const Zchar FILE_NAME_SEPARATOR = '/'; //local and FTP paths alike

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //none for "/" and single-component relative paths

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

Zstring expandTilde(const Zstring& path); //"~/logs" => "/home/<user>/logs"
}

#endif //FILE_PATH_H_3984678473567247567
