// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "transfer_worker.h"
#include <hvk/extra_log.h>
#include <hvk/file_io.h>
#include <hvk/scope_guard.h>

using namespace hvk;
using namespace fhv;


Zstring fhv::getTargetFilePath(const Zstring& targetFolder, const Zstring& remotePath)
{
    return appendPath(targetFolder, getItemName(remotePath));
}


struct TransferWorker::Context
{
    TransferItem item;
    Zstring fileName;
    Zstring targetPath;
    int attemptNo = 0;
    TransferResult result;
};


TransferWorker::TransferWorker(SessionPool& sessionPool,
                               AdmissionGuard& admissionGuard,
                               ConcurrencyPermit& networkPermit,
                               const TransferConfig& cfg,
                               RetryClock& clock,
                               TransferCallback& callback) :
    sessionPool_(sessionPool),
    admissionGuard_(admissionGuard),
    networkPermit_(networkPermit),
    cfg_(cfg),
    clock_(clock),
    callback_(callback)
{
    if (cfg.maxAttempts < 1 || cfg.chunkSize == 0 || cfg.progressIntervalBytes < 1)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


TransferResult TransferWorker::process(const TransferItem& item) //throw ThreadStopRequest
{
    Context ctx;
    ctx.item       = item;
    ctx.fileName   = getItemName(item.remotePath);
    ctx.targetPath = getTargetFilePath(cfg_.targetFolder, item.remotePath);

    for (State state = State::checkingLocal; state != State::done;)
        switch (state)
        {
            case State::checkingLocal:
                state = checkLocal(ctx); //throw ThreadStopRequest
                break;
            case State::admissionCheck:
                state = checkAdmission(ctx); //throw ThreadStopRequest
                break;
            case State::attempting:
                state = attempt(ctx); //throw ThreadStopRequest
                break;
            case State::retryBackoff:
                state = backoff(ctx); //throw ThreadStopRequest
                break;
            case State::done:
                assert(false);
                break;
        }

    ctx.result.attempts = ctx.attemptNo;
    return ctx.result;
}


TransferWorker::State TransferWorker::checkLocal(Context& ctx) //throw ThreadStopRequest
{
    interruptionPoint(); //throw ThreadStopRequest
    try
    {
        if (!itemExists(ctx.targetPath)) //throw FileError
            return State::admissionCheck;

        const uint64_t localSize = getFileSize(ctx.targetPath); //throw FileError

        if (cfg_.verifyExistingSize)
        {
            std::optional<uint64_t> remoteSize;
            try
            {
                remoteSize = getRemoteSizeForExisting(ctx); //throw FileError, ThreadStopRequest
            }
            catch (const FileError& e) //size unknown => presence suffices
            {
                callback_.logMessage(e.toString(), TransferCallback::MsgType::warning);
            }

            if (remoteSize && *remoteSize != localSize)
            {
                TransferEvent event = makeEvent(ctx, TransferEventType::sizeMismatch);
                event.fileSize = remoteSize;
                event.errorMsg = replaceCpy(replaceCpy(_("Local file size %x does not match remote file size %y."),
                                                       L"%x", formatNumber(static_cast<int64_t>(localSize))),
                                            L"%y", formatNumber(static_cast<int64_t>(*remoteSize)));
                callback_.reportEvent(event);

                removeFilePlain(ctx.targetPath); //throw FileError
                return State::admissionCheck;
            }
        }

        ctx.result.outcome = TransferOutcome::skipped;
        ctx.result.bytes   = static_cast<int64_t>(localSize);

        TransferEvent event = makeEvent(ctx, TransferEventType::skipped);
        event.fileSize = localSize;
        callback_.reportEvent(event);
        return State::done;
    }
    catch (const FileError& e) //local file system trouble: retrying won't help
    {
        ctx.result.outcome  = TransferOutcome::failed;
        ctx.result.bytes    = 0;
        ctx.result.errorMsg = e.toString();

        TransferEvent event = makeEvent(ctx, TransferEventType::failed);
        event.errorMsg = e.toString();
        callback_.reportEvent(event);
        return State::done;
    }
}


std::optional<uint64_t> TransferWorker::getRemoteSizeForExisting(const Context& ctx) //throw FileError, ThreadStopRequest
{
    PermitHolder permit(networkPermit_); //throw ThreadStopRequest

    std::unique_ptr<RemoteSession> session = sessionPool_.acquire(); //throw FileError, ThreadStopRequest
    auto guardSession = makeGuard<ScopeGuardRunMode::onFail>([&] { sessionPool_.discard(std::move(session)); });

    const std::optional<uint64_t> remoteSize = session->getFileSize(ctx.item.remotePath); //throw FileError, ThreadStopRequest

    guardSession.dismiss();
    sessionPool_.release(std::move(session));
    return remoteSize;
}


TransferWorker::State TransferWorker::checkAdmission(Context& ctx) //throw ThreadStopRequest
{
    interruptionPoint(); //throw ThreadStopRequest

    double usedPercent = 0;
    try
    {
        if (admissionGuard_.shouldAdmit(usedPercent)) //throw FileError
            return State::attempting;
    }
    catch (const FileError& e) //can't tell => admit
    {
        callback_.logMessage(e.toString(), TransferCallback::MsgType::warning);
        return State::attempting;
    }

    ctx.result.outcome  = TransferOutcome::failed;
    ctx.result.bytes    = 0;
    ctx.result.errorMsg = replaceCpy(replaceCpy(_("Memory usage of %x exceeds the threshold of %y."),
                                                L"%x", formatProgressPercent(usedPercent / 100, 1)),
                                     L"%y", formatProgressPercent(admissionGuard_.getThreshold() / 100, 1));

    TransferEvent event = makeEvent(ctx, TransferEventType::vetoed);
    event.errorMsg = ctx.result.errorMsg;
    callback_.reportEvent(event);
    return State::done;
}


TransferWorker::State TransferWorker::attempt(Context& ctx) //throw ThreadStopRequest
{
    ++ctx.attemptNo;
    interruptionPoint(); //throw ThreadStopRequest
    try
    {
        PermitHolder permit(networkPermit_); //throw ThreadStopRequest

        std::unique_ptr<RemoteSession> session = sessionPool_.acquire(); //throw FileError, ThreadStopRequest
        //transport error => connection state unknown
        auto guardSession = makeGuard<ScopeGuardRunMode::onFail>([&] { sessionPool_.discard(std::move(session)); });

        std::optional<uint64_t> remoteSize;
        try
        {
            remoteSize = session->getFileSize(ctx.item.remotePath); //throw FileError, ThreadStopRequest
        }
        catch (const FileError& e) //best effort: size unknown => download anyway
        {
            callback_.logMessage(e.toString(), TransferCallback::MsgType::warning);
        }

        TransferEvent eventStart = makeEvent(ctx, TransferEventType::downloading);
        eventStart.fileSize = remoteSize;
        callback_.reportEvent(eventStart);

        const int64_t bytesWritten = downloadFile(*session, ctx, remoteSize); //throw FileError, ThreadStopRequest

        guardSession.dismiss();
        sessionPool_.release(std::move(session));

        ctx.result.outcome = TransferOutcome::completed;
        ctx.result.bytes   = bytesWritten; //successful attempt only
        ctx.result.errorMsg.clear();

        TransferEvent eventDone = makeEvent(ctx, TransferEventType::completed);
        eventDone.fileSize = bytesWritten;
        callback_.reportEvent(eventDone);
        return State::done;
    }
    catch (const FileError& e)
    {
        ctx.result.errorMsg = e.toString();

        if (ctx.attemptNo < cfg_.maxAttempts)
        {
            TransferEvent event = makeEvent(ctx, TransferEventType::retry);
            event.errorMsg = e.toString();
            callback_.reportEvent(event);
            return State::retryBackoff;
        }

        ctx.result.outcome = TransferOutcome::failed;
        ctx.result.bytes   = 0;

        TransferEvent event = makeEvent(ctx, TransferEventType::failed);
        event.errorMsg = e.toString();
        callback_.reportEvent(event);
        return State::done;
    }
}


TransferWorker::State TransferWorker::backoff(Context& ctx) //throw ThreadStopRequest
{
    clock_.sleep(cfg_.retryDelay * ctx.attemptNo); //throw ThreadStopRequest
    return State::attempting;
}


int64_t TransferWorker::downloadFile(RemoteSession& session, const Context& ctx, const std::optional<uint64_t>& remoteSize) //throw FileError, ThreadStopRequest
{
    const Zstring tempPath = getPathWithTempName(ctx.targetPath); //throw FileError
    int64_t bytesWritten = 0;
    {
        FileOutputPlain fileOut(tempPath); //throw FileError
        //not closed => ~FileOutputPlain() deletes the partial file

        std::string buffer;
        buffer.reserve(cfg_.chunkSize);

        int64_t nextProgress = cfg_.progressIntervalBytes;

        session.downloadFile(ctx.item.remotePath, [&](const void* data, size_t dataSize) //throw FileError, ThreadStopRequest
        {
            interruptionPoint(); //throw ThreadStopRequest

            buffer.append(static_cast<const char*>(data), dataSize);
            if (buffer.size() >= cfg_.chunkSize)
            {
                fileOut.write(buffer.data(), buffer.size()); //throw FileError
                buffer.clear();
            }

            bytesWritten += dataSize;
            if (bytesWritten >= nextProgress) //coarse progress: per interval crossed, not per chunk
            {
                callback_.updateFileProgress({ctx.item.fileIndex, ctx.item.fileCount, ctx.fileName, bytesWritten, remoteSize});
                nextProgress = (bytesWritten / cfg_.progressIntervalBytes + 1) * cfg_.progressIntervalBytes;
            }
        });

        if (!buffer.empty())
            fileOut.write(buffer.data(), buffer.size()); //throw FileError

        if (remoteSize && *remoteSize != static_cast<uint64_t>(bytesWritten))
            throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(ctx.item.remotePath)),
                            replaceCpy(replaceCpy(_("Unexpected size of data stream.\nExpected: %x bytes\nActual: %y bytes"),
                                                  L"%x", numberTo<std::wstring>(*remoteSize)),
                                       L"%y", numberTo<std::wstring>(bytesWritten)));
        fileOut.close(); //throw FileError
    }
    HVK_ON_SCOPE_FAIL(try { removeFilePlain(tempPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    moveAndRenameItem(tempPath, ctx.targetPath); //throw FileError
    return bytesWritten;
}


TransferEvent TransferWorker::makeEvent(const Context& ctx, TransferEventType type) const
{
    TransferEvent event;
    event.type        = type;
    event.fileIndex   = ctx.item.fileIndex;
    event.fileCount   = ctx.item.fileCount;
    event.fileName    = ctx.fileName;
    event.attempt     = ctx.attemptNo;
    event.maxAttempts = cfg_.maxAttempts;
    return event;
}
