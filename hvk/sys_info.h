// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef SYSTEM_H_4189731847832147508915
#define SYSTEM_H_4189731847832147508915

#include "file_error.h"


namespace hvk
{
struct MemoryStatus
{
    uint64_t totalBytes     = 0;
    uint64_t availableBytes = 0;
    double   usedPercent    = 0; //[0, 100]
};
MemoryStatus getMemoryStatus(); //throw FileError

namespace impl
{
//parse the contents of /proc/meminfo
MemoryStatus parseMemInfo(const std::string& memInfo); //throw SysError
}
}

#endif //SYSTEM_H_4189731847832147508915
