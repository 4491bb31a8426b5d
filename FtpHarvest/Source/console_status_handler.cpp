// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "console_status_handler.h"
#include <algorithm>
#include <ostream>
#include <hvk/format_unit.h>

using namespace hvk;
using namespace fhv;


std::wstring fhv::formatFileCounter(size_t fileIndex, size_t fileCount)
{
    const std::wstring countTxt = numberTo<std::wstring>(fileCount);
    const size_t width = std::max<size_t>(3, countTxt.size());

    std::wstring indexTxt = numberTo<std::wstring>(fileIndex);
    if (indexTxt.size() < width)
        indexTxt.insert(0, width - indexTxt.size(), L'0');

    std::wstring countPadded = countTxt;
    if (countPadded.size() < width)
        countPadded.insert(0, width - countPadded.size(), L'0');

    return L'[' + indexTxt + L'/' + countPadded + L']';
}


std::wstring fhv::formatTransferEvent(const TransferEvent& event)
{
    const std::wstring prefix   = formatFileCounter(event.fileIndex, event.fileCount) + L' ';
    const std::wstring fileName = utfTo<std::wstring>(event.fileName);
    const std::wstring sizeTxt  = event.fileSize ? L" (" + formatFilesizeShort(static_cast<int64_t>(*event.fileSize)) + L')' : L"";

    auto appendError = [&](std::wstring line)
    {
        if (!event.errorMsg.empty())
            line += L"\n" + event.errorMsg;
        return line;
    };

    switch (event.type)
    {
        case TransferEventType::downloading:
            if (event.attempt > 1)
                return prefix + _("Downloading:") + L' ' + fileName + sizeTxt + L" [" +
                       replaceCpy(replaceCpy(_("attempt %x/%y"), L"%x", numberTo<std::wstring>(event.attempt)),
                                  L"%y", numberTo<std::wstring>(event.maxAttempts)) + L']';
            return prefix + _("Downloading:") + L' ' + fileName + sizeTxt;

        case TransferEventType::skipped:
            return prefix + _("Skipped (exists):") + L' ' + fileName + sizeTxt;

        case TransferEventType::sizeMismatch:
            return appendError(prefix + _("Incomplete local file, downloading again:") + L' ' + fileName);

        case TransferEventType::completed:
            return prefix + _("Completed:") + L' ' + fileName + sizeTxt;

        case TransferEventType::retry:
            return appendError(prefix + replaceCpy(replaceCpy(_("Retry %x/%y:"), L"%x", numberTo<std::wstring>(event.attempt)),
                                                   L"%y", numberTo<std::wstring>(event.maxAttempts)) + L' ' + fileName);

        case TransferEventType::vetoed:
            return appendError(prefix + _("Skipped due to memory usage:") + L' ' + fileName);

        case TransferEventType::failed:
            if (event.attempt > 0)
                return appendError(prefix + _P("Failed after 1 attempt:", "Failed after %x attempts:", event.attempt) + L' ' + fileName);
            return appendError(prefix + _("Failed:") + L' ' + fileName);
    }
    assert(false);
    return prefix + fileName;
}


std::wstring fhv::formatProgressBar(int64_t bytesDone, const std::optional<uint64_t>& bytesTotal, size_t barWidth)
{
    if (!bytesTotal || *bytesTotal == 0)
        return formatFilesizeShort(bytesDone);

    const double fraction = std::clamp(static_cast<double>(bytesDone) / static_cast<double>(*bytesTotal), 0.0, 1.0);
    const size_t filled = static_cast<size_t>(fraction * barWidth);

    return L'[' + std::wstring(filled, L'#') + std::wstring(barWidth - filled, L'-') + L"] " +
           formatProgressPercent(fraction, 1) + L"  " +
           formatFilesizeShort(bytesDone) + L" / " + formatFilesizeShort(static_cast<int64_t>(*bytesTotal));
}


std::wstring fhv::formatMemoryStatus(const MemoryStatus& ms)
{
    return replaceCpy(replaceCpy(replaceCpy(_("Memory: %x used, %y of %z available"),
                                            L"%x", formatProgressPercent(ms.usedPercent / 100, 1)),
                                 L"%y", formatFilesizeShort(static_cast<int64_t>(ms.availableBytes))),
                      L"%z", formatFilesizeShort(static_cast<int64_t>(ms.totalBytes)));
}


std::wstring fhv::formatHarvestSnapshot(const TransferSnapshot& snapshot)
{
    return _("Completed:") + L' ' + formatNumber(snapshot.completed) + L"  " +
           _("Skipped:")   + L' ' + formatNumber(snapshot.skipped)   + L"  " +
           _("Failed:")    + L' ' + formatNumber(snapshot.failed)    + L"  " +
           _("Downloaded:") + L' ' + formatFilesizeShort(snapshot.totalBytes);
}

//----------------------------------------------------------------------------------

ConsoleStatusHandler::ConsoleStatusHandler(std::ostream& out, bool interactive, const std::atomic<bool>& cancelRequested) :
    out_(out),
    interactive_(interactive),
    cancelRequested_(cancelRequested) {}


ConsoleStatusHandler::~ConsoleStatusHandler()
{
    clearStatusLine();
}


void ConsoleStatusHandler::printLine(const std::wstring& line)
{
    clearStatusLine();
    out_ << utfTo<std::string>(line) << '\n' << std::flush;
}


void ConsoleStatusHandler::printStatusLine(const std::wstring& line)
{
    if (!interactive_)
        return;

    std::string lineUtf = utfTo<std::string>(line);
    const size_t lineLen = utfTo<std::wstring>(lineUtf).size();

    if (lineLen < statusLineLen_) //overwrite remainder of previous status
        lineUtf.append(statusLineLen_ - lineLen, ' ');

    out_ << '\r' << lineUtf << std::flush;
    statusLineLen_ = lineLen;
}


void ConsoleStatusHandler::clearStatusLine()
{
    if (statusLineLen_ > 0)
    {
        out_ << '\r' << std::string(statusLineLen_, ' ') << '\r' << std::flush;
        statusLineLen_ = 0;
    }
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type)
{
    const MessageType logType = [&]
    {
        switch (type)
        {
            case MsgType::info:
                return MSG_TYPE_INFO;
            case MsgType::warning:
                return MSG_TYPE_WARNING;
            case MsgType::error:
                break;
        }
        return MSG_TYPE_ERROR;
    }();

    logMsg(errorLog_, msg, logType);

    if (logType == MSG_TYPE_INFO)
        printLine(msg);
    else
        printLine(getMessageTypeLabel(logType) + L": " + msg);
}


void ConsoleStatusHandler::updateStatus(std::wstring&& msg)
{
    printStatusLine(msg);
}


void ConsoleStatusHandler::reportEvent(const TransferEvent& event)
{
    const MsgType type = [&]
    {
        switch (event.type)
        {
            case TransferEventType::downloading:
            case TransferEventType::skipped:
            case TransferEventType::completed:
                return MsgType::info;
            case TransferEventType::sizeMismatch:
            case TransferEventType::retry:
                return MsgType::warning;
            case TransferEventType::vetoed:
            case TransferEventType::failed:
                break;
        }
        return MsgType::error;
    }();

    const std::wstring line = formatTransferEvent(event);

    logMsg(errorLog_, line, type == MsgType::info ? MSG_TYPE_INFO : type == MsgType::warning ? MSG_TYPE_WARNING : MSG_TYPE_ERROR);
    printLine(line);
}


void ConsoleStatusHandler::updateFileProgress(const FileProgress& progress)
{
    printStatusLine(formatFileCounter(progress.fileIndex, progress.fileCount) + L' ' + utfTo<std::wstring>(progress.fileName) + L"  " +
                    formatProgressBar(progress.bytesDone, progress.bytesTotal, 30));
}


void ConsoleStatusHandler::reportSummary(const TransferSnapshot& snapshot, const std::optional<MemoryStatus>& memStatus)
{
    std::wstring msg = replaceCpy(_("Progress after %x files:"), L"%x", formatNumber(snapshot.resultCount())) + L' ' + formatHarvestSnapshot(snapshot);
    if (memStatus)
        msg += L"\n" + formatMemoryStatus(*memStatus);

    logMessage(msg, MsgType::info);
}


void ConsoleStatusHandler::requestUiUpdate() //throw AbortProcess
{
    if (cancelRequested_ && !aborted_)
    {
        aborted_ = true;
        logMessage(_("Stop requested by user."), MsgType::warning);
    }
    if (aborted_)
        throw AbortProcess();
}
