// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <cassert>
#include <ctime>
#include <vector>
#include "time.h"
#include "i18n.h"


namespace hvk
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_ERROR   ? stats.error :
           entry.type == MSG_TYPE_WARNING ? stats.warning : stats.info);
    return stats;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


//"[12:01:15]  Error:  first line
//                     continuation lines are indented below the message"
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::string prefix = '[' + formatTime(formatIsoTimeTag, getLocalTime(entry.time)) + "]  " +
                               utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const std::string indent(utfTo<std::wstring>(prefix).size(), ' '); //count code points, not bytes

    std::string output = prefix;
    bool firstLine = true;
    split(trimCpy(entry.message), '\n', [&](std::string_view line)
    {
        if (line.empty()) //collapse blank lines
            return;
        if (!firstLine)
            output += '\n' + indent;
        output += line;
        firstLine = false;
    });
    return output + '\n';
}
}

#endif //ERROR_LOG_H_8917590832147915
