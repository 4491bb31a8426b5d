// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include "fake_remote.h"
#include "../FtpHarvest/Source/base/progress_channel.h"

using namespace hvk;
using namespace fhv;
using namespace fhv::test;
using namespace std::chrono_literals;


namespace
{
TransferEvent makeEvent(TransferEventType type, size_t fileIndex)
{
    TransferEvent event;
    event.type = type;
    event.fileIndex = fileIndex;
    event.fileCount = 100;
    event.fileName = Zstr("f.nc");
    return event;
}
}


TEST(ProgressChannel, EventsKeepPushOrder)
{
    ProgressChannel channel;
    RecordingHarvestCallback cb;

    channel.reportEvent(makeEvent(TransferEventType::downloading, 1));
    channel.logMessage(L"between", TransferCallback::MsgType::warning);
    channel.reportEvent(makeEvent(TransferEventType::completed, 1));

    EXPECT_FALSE(channel.waitForRequests(0ms, cb));

    ASSERT_EQ(cb.events.size(), 2u);
    EXPECT_EQ(cb.events[0].type, TransferEventType::downloading);
    EXPECT_EQ(cb.events[1].type, TransferEventType::completed);
    ASSERT_EQ(cb.messages.size(), 1u);
    EXPECT_EQ(cb.messages[0].first, L"between");
}


TEST(ProgressChannel, FileProgressIsCoalesced)
{
    ProgressChannel channel;
    RecordingHarvestCallback cb;

    for (int64_t bytes = 10; bytes <= 50; bytes += 10)
        channel.updateFileProgress({3, 5, Zstr("c.nc"), bytes, 50});
    channel.updateFileProgress({4, 5, Zstr("d.nc"), 7, std::nullopt});

    channel.waitForRequests(0ms, cb);

    ASSERT_EQ(cb.progressUpdates.size(), 2u);
    EXPECT_EQ(cb.progressUpdates[0].fileIndex, 3u);
    EXPECT_EQ(cb.progressUpdates[0].bytesDone, 50);
    EXPECT_EQ(cb.progressUpdates[1].fileIndex, 4u);
}


TEST(ProgressChannel, DoneAfterWorkersFinish)
{
    ProgressChannel channel;
    RecordingHarvestCallback cb;

    std::thread worker([&]
    {
        for (size_t i = 1; i <= 100; ++i)
            channel.reportEvent(makeEvent(TransferEventType::completed, i));
        channel.notifyAllDone();
    });

    const auto startTime = std::chrono::steady_clock::now();
    while (!channel.waitForRequests(10s, cb))
        ;
    worker.join();

    EXPECT_LT(std::chrono::steady_clock::now() - startTime, 10s); //woken up, not timed out
    ASSERT_EQ(cb.events.size(), 100u);
    for (size_t i = 0; i < cb.events.size(); ++i)
        EXPECT_EQ(cb.events[i].fileIndex, i + 1);
}
