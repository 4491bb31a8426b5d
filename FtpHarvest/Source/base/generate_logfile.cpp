// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "generate_logfile.h"
#include <hvk/file_access.h>
#include <hvk/file_io.h>
#include <hvk/format_unit.h>

using namespace hvk;
using namespace fhv;


std::wstring fhv::generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    //assemble summary box
    std::vector<std::wstring> summary;

    const std::wstring tabSpace(4, L' ');

    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(s.startTime));
    summary.push_back(utfTo<std::wstring>(formatTime(formatIsoDateTimeTag, tc)) + L"  FtpHarvest");
    summary.push_back(L"");
    summary.push_back(tabSpace + getFinalStatusLabel(s.finalStatus));

    const ErrorLogStats logCount = getStats(log);
    if (logCount.error   > 0) summary.push_back(tabSpace + _("Errors:")   + L' ' + formatNumber(logCount.error));
    if (logCount.warning > 0) summary.push_back(tabSpace + _("Warnings:") + L' ' + formatNumber(logCount.warning));

    summary.push_back(tabSpace + _("Files found:") + L' ' + formatNumber(s.totalFiles)); //show always, even if 0!
    summary.push_back(tabSpace + _("Completed:")   + L' ' + formatNumber(s.harvest.completed) +
                      L" (" + formatFilesizeShort(s.harvest.totalBytes) + L')');
    if (s.harvest.skipped > 0) summary.push_back(tabSpace + _("Skipped:") + L' ' + formatNumber(s.harvest.skipped));
    if (s.harvest.failed  > 0) summary.push_back(tabSpace + _("Failed:")  + L' ' + formatNumber(s.harvest.failed));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.harvest.totalTime).count();
    summary.push_back(tabSpace + _("Total time:") + L' ' + utfTo<std::wstring>(formatTimeSpan(totalTimeSec)));

    size_t sepLineLen = 0;
    for (const std::wstring& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::wstring output(sepLineLen + 1, L'_');
    output += L'\n';

    for (const std::wstring& str : summary) { output += L'|'; output += str; output += L'\n'; }

    output += L'|';
    output.append(sepLineLen, L'_');
    output += L'\n';

    return output;
}


Zstring fhv::saveLogFile(const ProcessSummary& summary, //throw FileError, X
                         const ErrorLog& log,
                         const Zstring& logFolderPath,
                         const std::function<void(const std::wstring& msg)>& notifyStatus /*throw X*/)
{
    createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(summary.startTime));
    if (tc == TimeComp())
        throw FileError(L"Failed to determine current time: " + numberTo<std::wstring>(summary.startTime.time_since_epoch().count()));

    const Zstring logFilePath = appendPath(logFolderPath, Zstr("FtpHarvest ") + formatTime(Zstr("%Y-%m-%d %H%M%S"), tc) + Zstr(".log"));

    std::string buffer = utfTo<std::string>(generateLogHeader(summary, log));
    buffer += '\n';

    for (const LogEntry& entry : log)
        buffer += formatMessage(entry); //includes line break

    auto notifyUnbufferedIO = [notifyStatus,
                               bytesWritten_ = int64_t(0),
                               msg_ = replaceCpy(_("Saving file %x..."), L"%x", fmtPath(logFilePath))]
         (int64_t bytesDelta) mutable
    {
        if (notifyStatus)
            notifyStatus(msg_ + L" (" + formatFilesizeShort(bytesWritten_ += bytesDelta) + L')'); //throw X
    };

    setFileContent(logFilePath, buffer, notifyUnbufferedIO); //throw FileError, X
    return logFilePath;
}
