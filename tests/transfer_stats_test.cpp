// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include "../FtpHarvest/Source/base/transfer_stats.h"

using namespace fhv;


TEST(TransferStats, RecordOutcomes)
{
    TransferStats stats;
    stats.record(TransferOutcome::completed, 100);
    stats.record(TransferOutcome::skipped, 40);
    stats.record(TransferResult{TransferOutcome::failed, 0, 3, L"Connection reset."});

    const TransferSnapshot s = stats.snapshot();
    EXPECT_EQ(s.completed, 1);
    EXPECT_EQ(s.skipped, 1);
    EXPECT_EQ(s.failed, 1);
    EXPECT_EQ(s.totalBytes, 140);
    EXPECT_EQ(s.resultCount(), 3);
}


TEST(TransferStats, ConcurrentRecordingLosesNothing)
{
    TransferStats stats;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&stats]
        {
            for (int i = 0; i < 1000; ++i)
                stats.record(i % 3 == 0 ? TransferOutcome::failed : TransferOutcome::completed, i % 3 == 0 ? 0 : 10);
        });

    //snapshots taken meanwhile are always consistent
    for (int i = 0; i < 100; ++i)
    {
        const TransferSnapshot s = stats.snapshot();
        EXPECT_EQ(s.totalBytes, s.completed * 10);
    }

    for (std::thread& t : threads)
        t.join();

    const TransferSnapshot s = stats.snapshot();
    EXPECT_EQ(s.resultCount(), 8000);
    EXPECT_EQ(s.failed, 8 * 334);
    EXPECT_EQ(s.completed, 8 * 666);
    EXPECT_EQ(s.totalBytes, 8 * 666 * 10);
}
