// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef HARVEST_CALLBACK_H_48257827842345454545
#define HARVEST_CALLBACK_H_48257827842345454545

#include <chrono>
#include <optional>
#include <hvk/sys_info.h>
#include "transfer_stats.h"


namespace fhv
{
enum class TransferEventType
{
    downloading,
    skipped,
    sizeMismatch, //existing local file differs from remote size => download again
    completed,
    retry,
    vetoed,
    failed,
};

struct TransferEvent
{
    TransferEventType type = TransferEventType::failed;
    size_t fileIndex = 0; //1-based
    size_t fileCount = 0;
    Zstring fileName;
    std::optional<uint64_t> fileSize; //downloading: remote size; skipped: local size; completed: bytes written
    int attempt     = 0;
    int maxAttempts = 0;
    std::wstring errorMsg; //retry, vetoed, failed
};

struct FileProgress
{
    size_t fileIndex = 0;
    size_t fileCount = 0;
    Zstring fileName;
    int64_t bytesDone = 0;
    std::optional<uint64_t> bytesTotal;
};


//context of transfer threads: non-blocking sink (see ProgressChannel)
struct TransferCallback
{
    virtual ~TransferCallback() {}

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //noexcept!
    virtual void reportEvent(const TransferEvent& event) = 0;            //
    virtual void updateFileProgress(const FileProgress& progress) = 0;  //
};


class AbortProcess {};

//context of orchestrating thread: human-facing progress
struct HarvestCallback
{
    virtual ~HarvestCallback() {}

    using MsgType = TransferCallback::MsgType;

    //log only
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X

    //UI info only, should *not* be logged
    virtual void updateStatus(std::wstring&& msg) = 0; //throw X

    virtual void reportEvent(const TransferEvent& event) = 0;           //throw X
    virtual void updateFileProgress(const FileProgress& progress) = 0;  //throw X

    virtual void reportSummary(const TransferSnapshot& snapshot, const std::optional<hvk::MemoryStatus>& memStatus) = 0; //throw X

    //opportunity to abort: called periodically
    virtual void requestUiUpdate() = 0; //throw AbortProcess
};


constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100);
}

#endif //HARVEST_CALLBACK_H_48257827842345454545
