// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include "string_tools.h"
#include "zstring.h"


namespace hvk
{
struct TimeComp //calendar fields of a local time; TimeComp() means "invalid"
{
    int year   = 0;
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc); //TimeComp() on error

const Zchar* const formatIsoDateTag     = Zstr("%Y-%m-%d");          //2001-08-23
const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //2001-08-23 14:55:02

//std::strftime() syntax; empty string for TimeComp()
Zstring formatTime(const Zchar* format, const TimeComp& tc);

//inverse of formatTime() for the numeric fields %Y, %m, %d; other characters must match literally
//parseTime(formatIsoDateTag, "2001-08-23") => {2001, 8, 23}; TimeComp() on error
TimeComp parseTime(std::string_view format, std::string_view str);

//"[-][d.]HH:MM:SS", e.g. 90061 => "1.01:01:01"
Zstring formatTimeSpan(int64_t timeInSec);








//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (!::localtime_r(&utc, &ctc))
        return TimeComp();

    return {ctc.tm_year + 1900, ctc.tm_mon + 1, ctc.tm_mday, ctc.tm_hour, ctc.tm_min, ctc.tm_sec};
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp())
        return Zstring();

    std::tm ctc = {};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;
    std::mktime(&ctc); //fill in tm_wday, tm_yday for %a, %j, ...

    Zchar buffer[128] = {};
    return Zstring(buffer, std::strftime(buffer, std::size(buffer), format, &ctc));
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    TimeComp tc;
    size_t pos = 0;

    auto readDigits = [&](size_t count, int minVal, int maxVal, int& out)
    {
        const std::string_view digits = str.substr(pos, count);
        if (digits.size() != count || !std::all_of(digits.begin(), digits.end(), isDigit<char>))
            return false;

        out = stringTo<int>(digits);
        pos += count;
        return minVal <= out && out <= maxVal;
    };

    for (size_t i = 0; i < format.size(); ++i)
        if (format[i] == '%' && i + 1 < format.size())
        {
            const bool ok = [&]
            {
                switch (format[++i])
                {
                    case 'Y': return readDigits(4, 0, 9999, tc.year);
                    case 'm': return readDigits(2, 1,   12, tc.month);
                    case 'd': return readDigits(2, 1,   31, tc.day);
                }
                return false;
            }();
            if (!ok)
                return TimeComp();
        }
        else if (pos < str.size() && str[pos] == format[i])
            ++pos;
        else
            return TimeComp();

    return pos == str.size() ? tc : TimeComp();
}


inline
Zstring formatTimeSpan(int64_t timeInSec)
{
    Zstring output;
    if (timeInSec < 0)
    {
        output += Zstr('-');
        timeInSec = -timeInSec;
    }

    const int64_t days = timeInSec / (24 * 3600);
    if (days > 0)
        output += numberTo<Zstring>(days) + Zstr('.');

    auto twoDigits = [](int64_t n) { return n < 10 ? Zstr('0') + numberTo<Zstring>(n) : numberTo<Zstring>(n); };

    return output + twoDigits(timeInSec / 3600 % 24) + Zstr(':') +
           twoDigits(timeInSec / 60 % 60) + Zstr(':') +
           twoDigits(timeInSec % 60);
}
}

#endif //TIME_H_8457092814324342453627
