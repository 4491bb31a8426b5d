// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef TRANSFER_WORKER_H_5098723450982374
#define TRANSFER_WORKER_H_5098723450982374

#include "admission_guard.h"
#include "harvest_callback.h"
#include "session_pool.h"


namespace fhv
{
struct TransferConfig
{
    Zstring targetFolder;
    int maxAttempts = 3;
    std::chrono::milliseconds retryDelay{5000}; //linear backoff: retryDelay * attempt
    size_t chunkSize = 8 * 1024 * 1024; //write to disk in blocks of this size
    int64_t progressIntervalBytes = 10 * 1024 * 1024;
    bool verifyExistingSize = true;
};


struct RetryClock
{
    virtual ~RetryClock() {}
    virtual void sleep(std::chrono::milliseconds duration) = 0; //throw ThreadStopRequest
};

struct SystemRetryClock : public RetryClock
{
    void sleep(std::chrono::milliseconds duration) override { hvk::interruptibleSleep(duration); } //throw ThreadStopRequest
};


struct TransferItem
{
    size_t fileIndex = 0; //1-based
    size_t fileCount = 0;
    Zstring remotePath;   //server-absolute
};

//flat layout: <target folder>/<file name>
Zstring getTargetFilePath(const Zstring& targetFolder, const Zstring& remotePath);


/*  per remote path:
    Pending -> CheckingLocal -> {SkippedDone | AdmissionCheck} -> {Vetoed | Attempting}
            -> {Succeeded | RetryBackoff -> Attempting | ExhaustedFailed}

    stateless between calls => one instance may serve all transfer threads          */
class TransferWorker
{
public:
    TransferWorker(SessionPool& sessionPool,
                   AdmissionGuard& admissionGuard,
                   ConcurrencyPermit& networkPermit,
                   const TransferConfig& cfg,
                   RetryClock& clock,
                   TransferCallback& callback);

    TransferResult process(const TransferItem& item); //throw ThreadStopRequest

private:
    TransferWorker           (const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    enum class State
    {
        checkingLocal,
        admissionCheck,
        attempting,
        retryBackoff,
        done,
    };

    struct Context;
    State checkLocal   (Context& ctx); //throw ThreadStopRequest
    State checkAdmission(Context& ctx); //
    State attempt      (Context& ctx); //
    State backoff      (Context& ctx); //

    std::optional<uint64_t> getRemoteSizeForExisting(const Context& ctx); //throw FileError, ThreadStopRequest

    int64_t downloadFile(RemoteSession& session, const Context& ctx, const std::optional<uint64_t>& remoteSize); //throw FileError, ThreadStopRequest

    TransferEvent makeEvent(const Context& ctx, TransferEventType type) const;

    SessionPool& sessionPool_;
    AdmissionGuard& admissionGuard_;
    ConcurrencyPermit& networkPermit_;
    const TransferConfig cfg_;
    RetryClock& clock_;
    TransferCallback& callback_;
};
}

#endif //TRANSFER_WORKER_H_5098723450982374
