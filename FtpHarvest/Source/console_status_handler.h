// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef CONSOLE_STATUS_HANDLER_H_5092834750928347
#define CONSOLE_STATUS_HANDLER_H_5092834750928347

#include <atomic>
#include <iosfwd>
#include <hvk/error_log.h>
#include "base/harvest_callback.h"


namespace fhv
{
//print progress to the terminal and collect everything in an ErrorLog
class ConsoleStatusHandler : public HarvestCallback
{
public:
    ConsoleStatusHandler(std::ostream& out,
                         bool interactive, //status line + progress bar
                         const std::atomic<bool>& cancelRequested /*e.g. set by SIGINT handler*/);
    ~ConsoleStatusHandler();

    void logMessage        (const std::wstring& msg, MsgType type) override;
    void updateStatus      (std::wstring&& msg) override;
    void reportEvent       (const TransferEvent& event) override;
    void updateFileProgress(const FileProgress& progress) override;
    void reportSummary     (const TransferSnapshot& snapshot, const std::optional<hvk::MemoryStatus>& memStatus) override;
    void requestUiUpdate   () override; //throw AbortProcess

    //print without logging
    void printLine(const std::wstring& line);

    bool abortRequested() const { return aborted_; }

    const hvk::ErrorLog& getErrorLog() const { return errorLog_; }
    hvk::ErrorLog&       getErrorLog()       { return errorLog_; }

private:
    ConsoleStatusHandler           (const ConsoleStatusHandler&) = delete;
    ConsoleStatusHandler& operator=(const ConsoleStatusHandler&) = delete;

    void printStatusLine(const std::wstring& line);
    void clearStatusLine();

    std::ostream& out_;
    const bool interactive_;
    const std::atomic<bool>& cancelRequested_;
    bool aborted_ = false;

    size_t statusLineLen_ = 0; //currently shown
    hvk::ErrorLog errorLog_;
};


std::wstring formatFileCounter(size_t fileIndex, size_t fileCount); //"[007/120]"
std::wstring formatTransferEvent(const TransferEvent& event);
std::wstring formatProgressBar(int64_t bytesDone, const std::optional<uint64_t>& bytesTotal, size_t barWidth);

std::wstring formatMemoryStatus(const hvk::MemoryStatus& ms);
std::wstring formatHarvestSnapshot(const TransferSnapshot& snapshot);
}

#endif //CONSOLE_STATUS_HANDLER_H_5092834750928347
