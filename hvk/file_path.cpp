// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

using namespace hvk;


std::optional<Zstring> hvk::getParentFolderPath(const Zstring& itemPath)
{
    Zstring path = itemPath;
    trim(path, TrimSide::right, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return std::nullopt; //"", "/", "name"

    return pos == 0 ? Zstring(1, FILE_NAME_SEPARATOR) : path.substr(0, pos);
}


Zstring hvk::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (basePath.empty() || relPath.empty())
        return basePath + relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


Zstring hvk::expandTilde(const Zstring& path)
{
    if (path != Zstr("~") && !startsWith(path, Zstr("~/")))
        return path;

    Zstring homePath;
    if (const char* home = ::getenv("HOME"))
        homePath = home;
    else if (const passwd* pw = ::getpwuid(::getuid())) //not thread-safe: startup only
        if (pw->pw_dir)
            homePath = pw->pw_dir;

    if (homePath.empty())
        return path;

    return appendPath(homePath, path.substr(std::min<size_t>(path.size(), 2)));
}
