// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <sstream>
#include <gtest/gtest.h>
#include "../FtpHarvest/Source/console_status_handler.h"

using namespace hvk;
using namespace fhv;


TEST(ConsoleStatusHandler, FileCounter)
{
    EXPECT_EQ(formatFileCounter(7, 120), L"[007/120]");
    EXPECT_EQ(formatFileCounter(1, 5), L"[001/005]");
    EXPECT_EQ(formatFileCounter(42, 1234), L"[0042/1234]");
}


TEST(ConsoleStatusHandler, EventLines)
{
    TransferEvent event;
    event.fileIndex = 3;
    event.fileCount = 10;
    event.fileName = Zstr("CS_x.nc");
    event.maxAttempts = 3;

    event.type = TransferEventType::retry;
    event.attempt = 2;
    event.errorMsg = L"Connection reset by peer.";
    const std::wstring retryLine = formatTransferEvent(event);
    EXPECT_TRUE(startsWith(retryLine, L"[003/010] "));
    EXPECT_TRUE(contains(retryLine, L"2/3"));
    EXPECT_TRUE(contains(retryLine, L"CS_x.nc"));
    EXPECT_TRUE(contains(retryLine, L"Connection reset by peer."));

    event.type = TransferEventType::failed;
    event.attempt = 3;
    EXPECT_TRUE(contains(formatTransferEvent(event), L"3 attempts"));

    event.type = TransferEventType::downloading;
    event.attempt = 1;
    event.errorMsg.clear();
    EXPECT_FALSE(contains(formatTransferEvent(event), L"attempt"));
}


TEST(ConsoleStatusHandler, ProgressBar)
{
    const std::wstring bar = formatProgressBar(50, 100, 10);
    EXPECT_TRUE(startsWith(bar, L"[#####-----]"));

    EXPECT_TRUE(startsWith(formatProgressBar(500, 100, 4), L"[####]")); //clamped
    EXPECT_FALSE(contains(formatProgressBar(50, std::nullopt, 10), L"["));
}


TEST(ConsoleStatusHandler, EverythingIsLogged)
{
    std::ostringstream out;
    const std::atomic<bool> cancelRequested{false};
    ConsoleStatusHandler handler(out, false /*interactive*/, cancelRequested);

    handler.logMessage(L"hello", HarvestCallback::MsgType::info);
    handler.logMessage(L"careful", HarvestCallback::MsgType::warning);

    TransferEvent event;
    event.type = TransferEventType::failed;
    event.fileIndex = 1;
    event.fileCount = 1;
    event.fileName = Zstr("a.nc");
    handler.reportEvent(event);

    handler.updateStatus(L"not shown");
    handler.updateFileProgress({1, 1, Zstr("a.nc"), 5, 10});

    const ErrorLogStats stats = getStats(handler.getErrorLog());
    EXPECT_EQ(stats.info, 1);
    EXPECT_EQ(stats.warning, 1);
    EXPECT_EQ(stats.error, 1);

    const std::string text = out.str();
    EXPECT_TRUE(contains(text, "hello\n"));
    EXPECT_TRUE(contains(text, "careful"));
    EXPECT_TRUE(contains(text, "a.nc"));
    EXPECT_FALSE(contains(text, "not shown")); //no status line if not interactive
}


TEST(ConsoleStatusHandler, CancelThrowsOnce)
{
    std::ostringstream out;
    std::atomic<bool> cancelRequested{false};
    ConsoleStatusHandler handler(out, true /*interactive*/, cancelRequested);

    EXPECT_NO_THROW(handler.requestUiUpdate());
    EXPECT_FALSE(handler.abortRequested());

    cancelRequested = true;
    EXPECT_THROW(handler.requestUiUpdate(), AbortProcess);
    EXPECT_THROW(handler.requestUiUpdate(), AbortProcess);
    EXPECT_TRUE(handler.abortRequested());
    EXPECT_EQ(getStats(handler.getErrorLog()).warning, 1);
}
