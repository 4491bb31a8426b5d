// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "session_pool.h"
#include <hvk/extra_log.h>

using namespace hvk;
using namespace fhv;


SessionPool::SessionPool(SessionFactory& factory,
                         size_t capacity,
                         std::chrono::milliseconds connectionDelay,
                         const std::function<void(const std::wstring& msg)>& logInfo) :
    factory_(factory),
    capacity_(capacity),
    connectionDelay_(connectionDelay),
    logInfo_(logInfo),
    slots_(capacity) {}


SessionPool::~SessionPool()
{
    shutdown();
}


std::unique_ptr<RemoteSession> SessionPool::acquire() //throw FileError, ThreadStopRequest
{
    slots_.acquire(); //throw ThreadStopRequest
    HVK_ON_SCOPE_FAIL(slots_.release());

    auto checkOut = [&](std::unique_ptr<RemoteSession>&& session) //throw FileError
    {
        const bool shutDown = state_.access([](PoolState& ps)
        {
            if (!ps.shutDown)
                ++ps.checkedOut;
            return ps.shutDown;
        });
        if (shutDown)
        {
            closeSession(std::move(session));
            throw FileError(_("Connection pool was shut down."));
        }
        return std::move(session);
    };

    for (;;) //popped session is owned by our slot: neither idle nor checked out while validating
    {
        std::unique_ptr<RemoteSession> session;

        const bool shutDown = state_.access([&](PoolState& ps)
        {
            if (!ps.shutDown && !ps.idleSessions.empty())
            {
                session = std::move(ps.idleSessions.back    ());
                /**/                ps.idleSessions.pop_back();
            }
            return ps.shutDown;
        });
        if (shutDown)
            throw FileError(_("Connection pool was shut down."));

        if (!session)
            break;

        if (validate(*session)) //server may have closed the idle connection
            return checkOut(std::move(session)); //throw FileError

        closeSession(std::move(session));
    }

    return checkOut(createSession()); //throw FileError, ThreadStopRequest
}


std::unique_ptr<RemoteSession> SessionPool::createSession() //throw FileError, ThreadStopRequest
{
    {
        std::unique_lock dummy(lockCreation_);
        interruptibleWait(conditionCreationDone_, dummy, [this] { return !creationActive_; }); //throw ThreadStopRequest
        creationActive_ = true;
    }
    HVK_ON_SCOPE_EXIT
    (
        {
            std::lock_guard dummy(lockCreation_);
            creationActive_ = false;
        }
        conditionCreationDone_.notify_all();
    );

    if (lastCreationTime_)
    {
        const auto now = std::chrono::steady_clock::now();
        if (now < *lastCreationTime_ + connectionDelay_)
            interruptibleSleep(*lastCreationTime_ + connectionDelay_ - now); //throw ThreadStopRequest
    }
    lastCreationTime_ = std::chrono::steady_clock::now(); //rate-limit failed attempts, too

    std::unique_ptr<RemoteSession> session = factory_.createSession(); //throw FileError, ThreadStopRequest

    const size_t createdTotal = state_.access([](PoolState& ps) { return ++ps.created; });

    if (logInfo_)
        logInfo_(replaceCpy(_("Created new FTP connection (total: %x)"), L"%x", numberTo<std::wstring>(createdTotal)));

    return session;
}


void SessionPool::release(std::unique_ptr<RemoteSession>&& session) //noexcept
{
    assert(session);
    std::unique_ptr<RemoteSession> surplus;

    state_.access([&](PoolState& ps)
    {
        assert(ps.checkedOut > 0);
        --ps.checkedOut;

        if (!ps.shutDown && ps.idleSessions.size() + ps.checkedOut < capacity_)
            ps.idleSessions.push_back(std::move(session));
        else
            surplus = std::move(session);
    });

    if (surplus)
        closeSession(std::move(surplus)); //outside the lock, but before the slot is free again

    slots_.release();
}


void SessionPool::discard(std::unique_ptr<RemoteSession>&& session) //noexcept
{
    assert(session);
    state_.access([&](PoolState& ps)
    {
        assert(ps.checkedOut > 0);
        --ps.checkedOut;
    });

    closeSession(std::move(session));
    slots_.release();
}


bool SessionPool::validate(RemoteSession& session) //throw ThreadStopRequest
{
    try
    {
        session.testConnection(); //throw FileError
        return true;
    }
    catch (const FileError&) { return false; }
}


void SessionPool::shutdown() //noexcept
{
    std::vector<std::unique_ptr<RemoteSession>> idleSessions;

    state_.access([&](PoolState& ps)
    {
        ps.shutDown = true;
        idleSessions.swap(ps.idleSessions);
    });

    for (std::unique_ptr<RemoteSession>& session : idleSessions)
        closeSession(std::move(session));
}


SessionPool::PoolStats SessionPool::getStats()
{
    return state_.access([](const PoolState& ps)
    {
        return PoolStats{ps.created, ps.idleSessions.size(), ps.checkedOut};
    });
}


void SessionPool::closeSession(std::unique_ptr<RemoteSession>&& session) //noexcept
{
    try
    {
        session->close(); //throw FileError
    }
    catch (const FileError& e) { logExtraError(e.toString()); }

    session.reset();
}
