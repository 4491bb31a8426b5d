// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FMT_UNIT_8702184019487324
#define FMT_UNIT_8702184019487324

#include <cstdint>
#include <string>


namespace hvk
{
std::wstring formatFilesizeShort(int64_t filesize); //"999 bytes", "1.50 MB", "12.3 GB": three significant digits, decimal units

std::wstring formatProgressPercent(double fraction /*[0, 1]*/, int decPlaces = 0 /*[0, 9]*/); //rounded down: 100% means done

std::wstring formatNumber(int64_t n); //with the locale's thousands separator
}

#endif //FMT_UNIT_8702184019487324
