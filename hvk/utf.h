// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include "string_tools.h"


namespace hvk
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);









//----------------------- implementation ----------------------------------
namespace impl
{
static_assert(sizeof(wchar_t) == sizeof(char32_t));

using CodePoint = char32_t;
const CodePoint REPLACEMENT_CHAR = U'\xfffd';
const CodePoint CODE_POINT_MAX   = U'\x10ffff';


inline
void codePointToUtf8(CodePoint cp, std::string& output)
{
    //https://en.wikipedia.org/wiki/UTF-8
    if (cp <= 0x7f)
        output += static_cast<char>(cp);
    else if (cp <= 0x7ff)
    {
        output += static_cast<char>((cp >> 6)          | 0xc0);
        output += static_cast<char>((cp        & 0x3f) | 0x80);
    }
    else if (cp <= 0xffff)
    {
        output += static_cast<char>((cp >> 12)         | 0xe0);
        output += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
        output += static_cast<char>((cp        & 0x3f) | 0x80);
    }
    else if (cp <= CODE_POINT_MAX)
    {
        output += static_cast<char>((cp >> 18)          | 0xf0);
        output += static_cast<char>(((cp >> 12) & 0x3f) | 0x80);
        output += static_cast<char>(((cp >> 6)  & 0x3f) | 0x80);
        output += static_cast<char>((cp         & 0x3f) | 0x80);
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, output);
}


//returns REPLACEMENT_CHAR for invalid sequences; "it" is advanced by at least one byte
inline
CodePoint utf8ToCodePoint(std::string_view::const_iterator& it, std::string_view::const_iterator itEnd)
{
    const auto getByte = [](char c) { return static_cast<unsigned char>(c); };

    const unsigned char head = getByte(*it++);
    if (head < 0x80)
        return head;

    size_t trailCount = 0;
    CodePoint cp = 0;
    if      ((head & 0xe0) == 0xc0) { trailCount = 1; cp = head & 0x1f; }
    else if ((head & 0xf0) == 0xe0) { trailCount = 2; cp = head & 0x0f; }
    else if ((head & 0xf8) == 0xf0) { trailCount = 3; cp = head & 0x07; }
    else
        return REPLACEMENT_CHAR;

    for (size_t i = 0; i < trailCount; ++i)
    {
        if (it == itEnd || (getByte(*it) & 0xc0) != 0x80)
            return REPLACEMENT_CHAR;
        cp = (cp << 6) | (getByte(*it++) & 0x3f);
    }
    return cp <= CODE_POINT_MAX ? cp : REPLACEMENT_CHAR;
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());
    for (auto it = str.begin(); it != str.end();)
        output += static_cast<wchar_t>(utf8ToCodePoint(it, str.end()));
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), output);
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto view = impl::makeView(str);
    using SourceChar = typename decltype(view)::value_type;
    using TargetChar = typename TargetString::value_type;

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(view);
    else if constexpr (std::is_same_v<SourceChar, char>)
        return TargetString(impl::utf8ToWide(view));
    else
        return TargetString(impl::wideToUtf8(view));
}
}

#endif //UTF_H_01832479146991573473545
