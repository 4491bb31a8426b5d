// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <functional>
#include "error_log.h"
#include "thread.h"

/*  side channel for errors that have no caller to report to:
    - best-effort session close while discarding a broken connection
    - cleanup of partial downloads while an exception is in flight
    - process-wide library initialization

    the application fetches the collected entries into the run log once the run is over  */

namespace hvk
{
namespace impl
{
struct ExtraLog
{
    ~ExtraLog()
    {
        if (!log.empty() && onShutdown)
            onShutdown(log);
    }

    ErrorLog log;
    std::function<void(const ErrorLog& log)> onShutdown; //entries nobody fetched
};

//all writers are joined before main() returns
inline
Protected<ExtraLog>& getExtraLog()
{
    static Protected<ExtraLog> extraLog;
    return extraLog;
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& onShutdown)
{
    impl::getExtraLog().access([&](impl::ExtraLog& el) { el.onShutdown = onShutdown; });
}


inline
ErrorLog fetchExtraLog()
{
    return impl::getExtraLog().access([](impl::ExtraLog& el) { return std::exchange(el.log, {}); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::getExtraLog().access([&](impl::ExtraLog& el) { logMsg(el.log, msg, MSG_TYPE_ERROR); });
}


inline
void logExtraWarning(const std::wstring& msg) //nothrow!
{
    impl::getExtraLog().access([&](impl::ExtraLog& el) { logMsg(el.log, msg, MSG_TYPE_WARNING); });
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
