// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "orchestrator.h"
#include <set>
#include <hvk/extra_log.h>
#include <hvk/file_access.h>
#include <hvk/format_unit.h>
#include <hvk/utf.h>
#include "progress_channel.h"

using namespace hvk;
using namespace fhv;


void fhv::validateRemotePaths(const std::vector<Zstring>& remotePaths) //throw FileError
{
    std::set<Zstring> fileNames;

    for (const Zstring& remotePath : remotePaths)
    {
        if (!startsWith(remotePath, Zstr('/')) || endsWith(remotePath, Zstr('/')))
            throw FileError(replaceCpy(_("Invalid remote file path %x."), L"%x", fmtPath(remotePath)),
                            _("Expected a server-absolute path to a file."));

        //flat target layout: two remote folders must not map to the same local file
        if (!fileNames.insert(getItemName(remotePath)).second)
            throw FileError(replaceCpy(_("Invalid remote file path %x."), L"%x", fmtPath(remotePath)),
                            replaceCpy(_("File name %x occurs more than once."), L"%x", fmtPath(getItemName(remotePath))));
    }
}


Orchestrator::Orchestrator(const OrchestratorConfig& cfg,
                           SessionFactory& sessionFactory,
                           const MemorySampler& memorySampler,
                           RetryClock* clock) :
    cfg_(cfg),
    sessionFactory_(sessionFactory),
    memorySampler_(memorySampler),
    clock_(clock)
{
    if (cfg.workerCount == 0 || cfg.permitCount == 0 || cfg.poolCapacity == 0 || cfg.summaryInterval < 1 || !memorySampler)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


namespace
{
std::optional<MemoryStatus> trySampleMemory(const MemorySampler& sampler)
{
    try
    {
        return sampler(); //throw FileError
    }
    catch (const FileError& e)
    {
        logExtraWarning(e.toString());
        return std::nullopt;
    }
}
}


HarvestSummary Orchestrator::run(const std::vector<Zstring>& remotePaths, HarvestCallback& cb) //throw FileError, X
{
    const auto startTime = std::chrono::steady_clock::now();

    validateRemotePaths(remotePaths); //throw FileError

    if (cfg_.transfer.targetFolder.empty())
        throw FileError(_("Target folder is missing."));
    createDirectoryIfMissingRecursion(cfg_.transfer.targetFolder); //throw FileError

    cb.logMessage(replaceCpy(replaceCpy(_("Downloading %x files with %y threads."),
                                        L"%x", formatNumber(remotePaths.size())),
                             L"%y", numberTo<std::wstring>(cfg_.workerCount)), HarvestCallback::MsgType::info); //throw X

    //exactly one terminal result per path:
    TransferStats stats;
    Protected<std::vector<char>> recorded(std::vector<char>(remotePaths.size(), false));

    auto recordResult = [&](size_t pathIdx, const TransferResult& result)
    {
        const bool firstResult = recorded.access([&](std::vector<char>& flags)
        {
            return !std::exchange(flags[pathIdx], true);
        });
        if (firstResult)
            stats.record(result);
        else
            assert(false);
    };

    SystemRetryClock systemClock;
    RetryClock& clock = clock_ ? *clock_ : systemClock;

    //declaration order matters: all transfer threads are joined before pool and channel go out of scope
    ProgressChannel channel;

    SessionPool sessionPool(sessionFactory_, cfg_.poolCapacity, cfg_.connectionDelay,
                            [&channel](const std::wstring& msg) { channel.logMessage(msg, TransferCallback::MsgType::info); });

    AdmissionGuard admissionGuard(cfg_.memoryThresholdPercent, memorySampler_);
    ConcurrencyPermit networkPermit(cfg_.permitCount);

    TransferWorker worker(sessionPool, admissionGuard, networkPermit, cfg_.transfer, clock, channel);

    WorkerGroup transferThreads(cfg_.workerCount, Zstr("Transfer"));

    for (size_t i = 0; i < remotePaths.size(); ++i)
        transferThreads.run([&, i, item = TransferItem{i + 1, remotePaths.size(), remotePaths[i]}]
        {
            TransferResult result;
            try
            {
                result = worker.process(item); //throw ThreadStopRequest
            }
            catch (const std::exception& e)
            {
                result = TransferResult();
                result.errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(item.remotePath)) + L"\n\n" + utfTo<std::wstring>(e.what());

                TransferEvent event;
                event.type      = TransferEventType::failed;
                event.fileIndex = item.fileIndex;
                event.fileCount = item.fileCount;
                event.fileName  = getItemName(item.remotePath);
                event.errorMsg  = result.errorMsg;
                channel.reportEvent(event);
            }
            recordResult(i, result);
        });

    transferThreads.notifyWhenDone([&channel] { channel.notifyAllDone(); /*noexcept*/ });

    HarvestSummary summary;
    int lastResultCount = 0;

    auto reportProgress = [&]
    {
        const TransferSnapshot snap = stats.snapshot();
        if (snap.resultCount() == lastResultCount)
            return;

        cb.updateStatus(replaceCpy(replaceCpy(_("Processed %x of %y files"),
                                              L"%x", formatNumber(snap.resultCount())),
                                   L"%y", formatNumber(remotePaths.size()))); //throw X

        if (snap.resultCount() / cfg_.summaryInterval > lastResultCount / cfg_.summaryInterval)
            cb.reportSummary(snap, trySampleMemory(memorySampler_)); //throw X

        lastResultCount = snap.resultCount();
    };

    for (;;)
    {
        const bool allDone = channel.waitForRequests(UI_UPDATE_INTERVAL, cb); //throw X
        reportProgress(); //throw X

        if (allDone)
            break;

        try
        {
            cb.requestUiUpdate(); //throw AbortProcess
        }
        catch (AbortProcess&) { requestStop(); }

        if (stopRequested_)
        {
            cb.logMessage(_("Stop requested: waiting for running transfers to cancel..."), HarvestCallback::MsgType::warning); //throw X

            transferThreads.stopAndJoin();
            summary.stopped = true;

            channel.waitForRequests(std::chrono::milliseconds(0), cb); //throw X; forward what was queued until the join
            break;
        }
    }

    if (summary.stopped)
    {
        size_t unprocessedCount = 0;
        for (size_t i = 0; i < remotePaths.size(); ++i)
            if (!recorded.access([i](const std::vector<char>& flags) { return flags[i] != 0; }))
            {
                TransferResult result;
                result.errorMsg = _("Stopped");
                recordResult(i, result);
                ++unprocessedCount;
            }

        if (unprocessedCount > 0)
            cb.logMessage(replaceCpy(_("%x files were not processed due to cancellation."), L"%x", formatNumber(unprocessedCount)),
                          HarvestCallback::MsgType::warning); //throw X
    }

    reportProgress(); //throw X

    const SessionPool::PoolStats poolStats = sessionPool.getStats();
    cb.logMessage(replaceCpy(_("FTP connections created: %x"), L"%x", formatNumber(poolStats.created)), HarvestCallback::MsgType::info); //throw X

    const TransferSnapshot snap = stats.snapshot();
    assert(snap.resultCount() == static_cast<int>(remotePaths.size()));

    summary.completed  = snap.completed;
    summary.skipped    = snap.skipped;
    summary.failed     = snap.failed;
    summary.totalBytes = snap.totalBytes;
    summary.totalTime  = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    return summary;
}
