// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include "fake_remote.h"

using namespace hvk;
using namespace fhv;
using namespace fhv::test;
using namespace std::chrono_literals;


TEST(SessionPool, IdleSessionIsReused)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    std::vector<std::wstring> infoMsgs;
    SessionPool pool(factory, 2, 0ms, [&](const std::wstring& msg) { infoMsgs.push_back(msg); });

    std::unique_ptr<RemoteSession> session = pool.acquire();
    RemoteSession* const sessionRaw = session.get();
    pool.release(std::move(session));

    std::unique_ptr<RemoteSession> session2 = pool.acquire();
    EXPECT_EQ(session2.get(), sessionRaw);
    EXPECT_EQ(server.sessionsCreated.load(), 1);
    EXPECT_EQ(server.testCalls.load(), 1); //validated before reuse
    pool.release(std::move(session2));

    ASSERT_EQ(infoMsgs.size(), 1u);
    EXPECT_TRUE(contains(infoMsgs[0], L"1"));
}


TEST(SessionPool, BrokenIdleSessionIsReplaced)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    SessionPool pool(factory, 2, 0ms, nullptr);

    pool.release(pool.acquire());
    server.failConnectionTest = true;

    std::unique_ptr<RemoteSession> session = pool.acquire();
    EXPECT_EQ(server.sessionsCreated.load(), 2);
    EXPECT_EQ(server.closeCalls.load(), 1);
    EXPECT_EQ(server.sessionsAlive.load(), 1);

    const SessionPool::PoolStats stats = pool.getStats();
    EXPECT_EQ(stats.created, 2u);
    EXPECT_EQ(stats.checkedOut, 1u);
    EXPECT_EQ(stats.idle, 0u);
    pool.discard(std::move(session));
}


TEST(SessionPool, CreationFailurePropagates)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    SessionPool pool(factory, 1, 0ms, nullptr);

    server.createFailuresLeft = 1;
    EXPECT_THROW(pool.acquire(), FileError);

    //slot was given back
    std::unique_ptr<RemoteSession> session = pool.acquire();
    EXPECT_EQ(pool.getStats().checkedOut, 1u);
    pool.release(std::move(session));
}


TEST(SessionPool, CapacityIsNeverExceeded)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    SessionPool pool(factory, 3, 0ms, nullptr);

    std::atomic<int> checkedOutNow{0};
    std::atomic<int> checkedOutMax{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&, t]
        {
            for (int i = 0; i < 50; ++i)
            {
                std::unique_ptr<RemoteSession> session = pool.acquire();

                const int now = ++checkedOutNow;
                for (int maxVal = checkedOutMax; now > maxVal && !checkedOutMax.compare_exchange_weak(maxVal, now);)
                    ;
                std::this_thread::yield();
                --checkedOutNow;

                if ((i + t) % 5 == 0)
                    pool.discard(std::move(session));
                else
                    pool.release(std::move(session));
            }
        });
    for (std::thread& t : threads)
        t.join();

    EXPECT_LE(checkedOutMax.load(), 3);
    EXPECT_LE(server.sessionsAliveMax.load(), 3);

    const SessionPool::PoolStats stats = pool.getStats();
    EXPECT_EQ(stats.checkedOut, 0u);
    EXPECT_LE(stats.idle, 3u);
}


TEST(SessionPool, CreationIsRateLimited)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    SessionPool pool(factory, 2, 100ms, nullptr);

    const auto startTime = std::chrono::steady_clock::now();
    std::unique_ptr<RemoteSession> s1 = pool.acquire();
    std::unique_ptr<RemoteSession> s2 = pool.acquire();
    EXPECT_GE(std::chrono::steady_clock::now() - startTime, 100ms);

    pool.release(std::move(s1));
    pool.release(std::move(s2));
}


TEST(SessionPool, ShutdownClosesAllSessions)
{
    FakeServer server;
    FakeSessionFactory factory(server);
    SessionPool pool(factory, 2, 0ms, nullptr);

    std::unique_ptr<RemoteSession> s1 = pool.acquire();
    pool.release(pool.acquire());
    EXPECT_EQ(server.sessionsAlive.load(), 2);

    pool.shutdown();
    EXPECT_EQ(server.sessionsAlive.load(), 1); //idle session closed

    pool.release(std::move(s1)); //not returned to the pool anymore
    EXPECT_EQ(server.sessionsAlive.load(), 0);
    EXPECT_EQ(pool.getStats().idle, 0u);

    EXPECT_THROW(pool.acquire(), FileError);
}
