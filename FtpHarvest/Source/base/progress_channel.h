// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef PROGRESS_CHANNEL_H_4589723405982734
#define PROGRESS_CHANNEL_H_4589723405982734

#include <map>
#include <variant>
#include <hvk/thread.h>
#include "harvest_callback.h"


namespace fhv
{
/*  actor pattern: transfer threads push, the orchestrating thread pulls
    - pushing never blocks on the console
    - events are forwarded in the order they were pushed
    - file progress is coalesced: only the latest state per file is forwarded      */
class ProgressChannel : public TransferCallback
{
public:
    ProgressChannel() {}

    //non-blocking: context of worker thread
    void logMessage(const std::wstring& msg, MsgType type) override
    {
        pushRequest(LogMsgRequest{msg, type});
    }

    void reportEvent(const TransferEvent& event) override
    {
        pushRequest(event);
    }

    void updateFileProgress(const FileProgress& progress) override
    {
        std::lock_guard dummy(lockRequest_);
        progressByFile_[progress.fileIndex] = progress; //dropped silently if not yet fetched
    }

    void notifyAllDone() //noexcept
    {
        {
            std::lock_guard dummy(lockRequest_);
            assert(!finishNowRequest_);
            finishNowRequest_ = true;
        }
        conditionNewRequest_.notify_all();
    }

    //context of main thread: forward everything queued; waits at most "maxWait" for the first request
    //returns true after notifyAllDone() once all requests have been forwarded
    bool waitForRequests(std::chrono::milliseconds maxWait, HarvestCallback& cb) //throw X
    {
        assert(hvk::runningOnMainThread());
        std::vector<Request> requests;
        std::map<size_t, FileProgress> progress;
        bool finishNow = false;
        {
            std::unique_lock dummy(lockRequest_);
            conditionNewRequest_.wait_for(dummy, maxWait, [this] { return !requests_.empty() || !progressByFile_.empty() || finishNowRequest_; });

            requests.swap(requests_);
            progress.swap(progressByFile_);
            finishNow = finishNowRequest_;
        }

        //call back outside of mutex scope:
        for (const Request& req : requests)
            if (const auto logReq = std::get_if<LogMsgRequest>(&req))
                cb.logMessage(logReq->msg, logReq->type); //throw X
            else
                cb.reportEvent(std::get<TransferEvent>(req)); //throw X

        for (const auto& [fileIndex, fp] : progress)
            cb.updateFileProgress(fp); //throw X

        return finishNow;
    }

private:
    ProgressChannel           (const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    struct LogMsgRequest
    {
        std::wstring msg;
        MsgType type = MsgType::error;
    };
    using Request = std::variant<LogMsgRequest, TransferEvent>;

    void pushRequest(Request&& req)
    {
        {
            std::lock_guard dummy(lockRequest_);
            requests_.push_back(std::move(req));
        }
        conditionNewRequest_.notify_all();
    }

    std::mutex lockRequest_;
    std::condition_variable conditionNewRequest_;
    std::vector<Request> requests_;
    std::map<size_t, FileProgress> progressByFile_;
    bool finishNowRequest_ = false;
};
}

#endif //PROGRESS_CHANNEL_H_4589723405982734
