// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>


//free functions for std::string, std::wstring, their views, C strings and single characters
namespace hvk
{
template <class Char> bool isWhiteSpace(Char c); //' ', \t, \n, \v, \f, \r
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only, independent of locale

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix); //FTP reply keywords

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

//onStringPart receives a view for each part, including empty ones: "a,,b" => "a", "", "b"
template <class S, class Char, class Function> void split (const S& str, Char delimiter, Function onStringPart);
template <class S, class Pred, class Function> void split2(const S& str, Pred isDelimiter, Function onStringPart);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S>              void trim(S& str, TrimSide side = TrimSide::both);
template <class S, class Pred>  void trim(S& str, TrimSide side, Pred trimThisChar);
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);

template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S& str); //surrounding whitespace is ignored; 0 on error

template <class S, class Num> S printNumber(const char* format, const Num& number); //std::snprintf() for a single number

inline
std::string_view makeStringView(std::string_view::const_iterator first, std::string_view::const_iterator last)
{
    return {first == last ? nullptr : &*first, static_cast<size_t>(last - first)};
}







//---------------------- implementation ----------------------
namespace impl
{
template <class Char>
std::basic_string_view<Char> makeView(const std::basic_string<Char>& str) { return str; }

template <class Char>
std::basic_string_view<Char> makeView(std::basic_string_view<Char> str) { return str; }

inline std::string_view  makeView(const char*    str) { return str; }
inline std::wstring_view makeView(const wchar_t* str) { return str; }
inline std::string_view  makeView(const char&    ch)  { return {&ch, 1}; }
inline std::wstring_view makeView(const wchar_t& ch)  { return {&ch, 1}; }


enum class FindDirection
{
    first,
    last,
};

//position and length of "term" within "str"; npos if not found
template <FindDirection dir, class S, class T>
std::pair<size_t, size_t> findTerm(const S& str, const T& term)
{
    const auto s = makeView(str);
    const auto t = makeView(term);
    assert(!t.empty());
    return {dir == FindDirection::first ? s.find(t) : s.rfind(t), t.size()};
}

template <FindDirection dir, bool takeAfter, class S, class T>
S cutAtTerm(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto [pos, len] = findTerm<dir>(str, term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    const auto s = makeView(str);
    return S(takeAfter ? s.substr(pos + len) : s.substr(0, pos));
}
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == ' ' || (c >= '\t' && c <= '\r');
}


template <class Char> inline
bool isLineBreak(Char c) { return c == '\r' || c == '\n'; }


template <class Char> inline
bool isDigit(Char c) { return c >= '0' && c <= '9'; }


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::makeView(str).find(impl::makeView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return impl::makeView(str).starts_with(impl::makeView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return impl::makeView(str).ends_with(impl::makeView(postfix));
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto s = impl::makeView(str);
    const auto p = impl::makeView(prefix);

    auto toLower = [](auto c) { return c >= 'A' && c <= 'Z' ? static_cast<decltype(c)>(c - 'A' + 'a') : c; };

    return s.size() >= p.size() &&
           std::equal(p.begin(), p.end(), s.begin(), [&](auto lhs, auto rhs) { return toLower(lhs) == toLower(rhs); });
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr) { return impl::cutAtTerm<impl::FindDirection::last, true>(str, term, infr); }

template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr) { return impl::cutAtTerm<impl::FindDirection::last, false>(str, term, infr); }

template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr) { return impl::cutAtTerm<impl::FindDirection::first, true>(str, term, infr); }

template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr) { return impl::cutAtTerm<impl::FindDirection::first, false>(str, term, infr); }


template <class S, class Pred, class Function> inline
void split2(const S& str, Pred isDelimiter, Function onStringPart)
{
    const auto s = impl::makeView(str);

    size_t partStart = 0;
    for (size_t i = 0; i < s.size(); ++i)
        if (isDelimiter(s[i]))
        {
            onStringPart(s.substr(partStart, i - partStart));
            partStart = i + 1;
        }
    onStringPart(s.substr(partStart));
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    split2(str, [delimiter](Char c) { return c == delimiter; }, onStringPart);
}


template <class S, class Pred> inline
void trim(S& str, TrimSide side, Pred trimThisChar)
{
    auto s = impl::makeView(str);

    if (side != TrimSide::right)
        while (!s.empty() && trimThisChar(s.front()))
            s.remove_prefix(1);

    if (side != TrimSide::left)
        while (!s.empty() && trimThisChar(s.back()))
            s.remove_suffix(1);

    str = S(s);
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    trim(str, side, [](auto c) { return isWhiteSpace(c); });
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    S output = str;
    trim(output, side);
    return output;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::makeView(oldTerm);
    const auto newView = impl::makeView(newTerm);
    assert(!oldView.empty());

    S output;
    size_t pos = 0;
    for (size_t hit = 0; !oldView.empty() && (hit = str.find(oldView, pos)) != S::npos; pos = hit + oldView.size())
        output.append(str, pos, hit - pos).append(newView);

    if (pos != 0)
        str = std::move(output.append(str, pos));
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    char buffer[32] = {};
    const char* const last = std::to_chars(std::begin(buffer), std::end(buffer), number).ptr;
    return S(std::cbegin(buffer), last); //ASCII digits: valid for char and wchar_t targets
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);

    std::string ascii;
    for (const auto c : impl::makeView(str))
        ascii += static_cast<char>(c);
    trim(ascii);

    const char* first = ascii.data();
    if (!ascii.empty() && ascii[0] == '+')
        ++first;

    Num number = 0;
    if (std::from_chars(first, ascii.data() + ascii.size(), number).ec != std::errc())
        return 0;
    return number;
}


template <class S, class Num> inline
S printNumber(const char* format, const Num& number)
{
    char buffer[64] = {};
    const int charsWritten = std::snprintf(buffer, sizeof(buffer), format, number);
    return 0 < charsWritten && charsWritten < static_cast<int>(sizeof(buffer)) ? S(buffer, charsWritten) : S();
}
}

#endif //STRING_TOOLS_H_213458973046
