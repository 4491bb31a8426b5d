// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef SESSION_POOL_H_0923847509238475
#define SESSION_POOL_H_0923847509238475

#include <chrono>
#include <functional>
#include "concurrency_permit.h"
#include "../afs/remote_session.h"


namespace fhv
{
/*  reuse (healthy) sessions between transfer threads
    - idle + checked out <= capacity: a checkout slot is taken before pop/create
    - sessions are validated before reuse; broken ones are discarded
    - creation is serialized and rate-limited                                   */
class SessionPool
{
public:
    SessionPool(SessionFactory& factory,
                size_t capacity,
                std::chrono::milliseconds connectionDelay,
                const std::function<void(const std::wstring& msg)>& logInfo /*noexcept; optional*/);
    ~SessionPool();

    //context of worker thread:
    std::unique_ptr<RemoteSession> acquire(); //throw FileError, ThreadStopRequest

    void release(std::unique_ptr<RemoteSession>&& session); //noexcept
    void discard(std::unique_ptr<RemoteSession>&& session); //noexcept

    bool validate(RemoteSession& session); //throw ThreadStopRequest

    void shutdown(); //noexcept

    struct PoolStats
    {
        size_t created    = 0; //monotonous
        size_t idle       = 0;
        size_t checkedOut = 0;
    };
    PoolStats getStats();

private:
    SessionPool           (const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    std::unique_ptr<RemoteSession> createSession(); //throw FileError, ThreadStopRequest

    static void closeSession(std::unique_ptr<RemoteSession>&& session); //noexcept

    struct PoolState
    {
        std::vector<std::unique_ptr<RemoteSession>> idleSessions;
        size_t created    = 0;
        size_t checkedOut = 0;
        bool shutDown = false;
    };

    SessionFactory& factory_;
    const size_t capacity_;
    const std::chrono::milliseconds connectionDelay_;
    const std::function<void(const std::wstring& msg)> logInfo_;

    ConcurrencyPermit slots_;
    hvk::Protected<PoolState> state_;

    //serialize + rate-limit session creation:
    std::mutex lockCreation_;
    std::condition_variable conditionCreationDone_;
    bool creationActive_ = false;
    std::optional<std::chrono::steady_clock::time_point> lastCreationTime_; //owned by the thread with creationActive_ set
};
}

#endif //SESSION_POOL_H_0923847509238475
