// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "sys_info.h"
#include "file_io.h"

using namespace hvk;


MemoryStatus hvk::impl::parseMemInfo(const std::string& memInfo) //throw SysError
{
    //e.g. "MemTotal:       16314780 kB"
    std::optional<uint64_t> totalKb;
    std::optional<uint64_t> availableKb;

    split(memInfo, '\n', [&](const std::string_view line)
    {
        const std::string_view key = beforeFirst(line, ':', IfNotFoundReturn::none);
        std::string_view value = afterFirst(line, ':', IfNotFoundReturn::none);
        value = beforeLast(trimCpy(value), ' ', IfNotFoundReturn::all); //strip " kB"

        if (key == "MemTotal")
            totalKb = stringTo<uint64_t>(value);
        else if (key == "MemAvailable")
            availableKb = stringTo<uint64_t>(value);
    });

    if (!totalKb || !availableKb || *totalKb == 0)
        throw SysError(L"Unexpected /proc/meminfo format.");

    MemoryStatus ms;
    ms.totalBytes     = *totalKb * 1024;
    ms.availableBytes = std::min(*availableKb, *totalKb) * 1024;
    ms.usedPercent    = 100.0 * static_cast<double>(ms.totalBytes - ms.availableBytes) / static_cast<double>(ms.totalBytes);
    return ms;
}


MemoryStatus hvk::getMemoryStatus() //throw FileError
{
    const Zstring memInfoPath = Zstr("/proc/meminfo");
    try
    {
        return impl::parseMemInfo(getFileContent(memInfoPath, nullptr)); //throw FileError, SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(memInfoPath)), e.toString()); }
}
