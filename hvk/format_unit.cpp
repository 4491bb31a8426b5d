// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "format_unit.h"
#include <algorithm>
#include <cmath>
#include <cwchar>
#include "i18n.h"

using namespace hvk;


namespace
{
std::wstring printDouble(int decPlaces, double value)
{
    wchar_t buffer[64] = {};
    const int charsWritten = std::swprintf(buffer, std::size(buffer), L"%.*f", decPlaces, value);
    return charsWritten > 0 ? std::wstring(buffer, charsWritten) : std::wstring();
}
}


std::wstring hvk::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) < 1000)
        return _P("1 byte", "%x bytes", size);

    const wchar_t* const unitFmt[] = { L"%x KB", L"%x MB", L"%x GB", L"%x TB", L"%x PB" };

    double sizeInUnit = static_cast<double>(size) / 1000;
    size_t unit = 0;
    for (; unit + 1 < std::size(unitFmt) && std::abs(sizeInUnit) >= 999.5; ++unit)
        sizeInUnit /= 1000;

    //three significant digits; round *before* choosing the precision: 9.999 => "10.0", not "10.00"
    const double absVal = std::abs(sizeInUnit);
    const int decPlaces = absVal < 9.995 ? 2 : absVal < 99.95 ? 1 : 0;

    return replaceCpy(hvk::translate(unitFmt[unit]), L"%x", printDouble(decPlaces, sizeInUnit));
}


std::wstring hvk::formatProgressPercent(double fraction, int decPlaces)
{
    decPlaces = std::clamp(decPlaces, 0, 9);

    const double scale = std::pow(10, decPlaces);
    const double percent = std::floor(fraction * 100 * scale) / scale;

    return printDouble(decPlaces, percent) + L'%';
}


std::wstring hvk::formatNumber(int64_t n)
{
    wchar_t buffer[64] = {};
    const int charsWritten = std::swprintf(buffer, std::size(buffer), L"%'lld", static_cast<long long>(n)); //grouping per setlocale(LC_ALL, "")
    return charsWritten > 0 ? std::wstring(buffer, charsWritten) : numberTo<std::wstring>(n);
}
