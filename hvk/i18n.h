// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include <cassert>
#include "string_tools.h"
#include "format_unit.h"


/* user-visible text goes through these macros:
    _("Cannot read file %x.")
    _P("1 byte", "%x bytes", byteCount)    => %x is replaced by the formatted number

   English only: the macros keep all messages greppable for a later translation layer */
#define HVK_WIDE_LITERAL(s) HVK_CONCAT_WIDE(L, s)
#define HVK_CONCAT_WIDE(X, Y) X ## Y

#define _(s)        hvk::translate(HVK_WIDE_LITERAL(s))
#define _P(s, p, n) hvk::translatePlural(HVK_WIDE_LITERAL(s), HVK_WIDE_LITERAL(p), n)


namespace hvk
{
inline
std::wstring translate(const wchar_t* text) { return text; }


inline
std::wstring translatePlural(const wchar_t* singular, const wchar_t* plural, int64_t n)
{
    const std::wstring& text = n == 1 || n == -1 ? singular : plural;
    assert(contains(std::wstring(plural), L"%x"));
    return replaceCpy(text, L"%x", formatNumber(n));
}
}

#endif //I18_N_H_3843489325044253425456
