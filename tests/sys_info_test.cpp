// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <gtest/gtest.h>
#include <hvk/sys_info.h>

using namespace hvk;


TEST(SysInfo, ParseMemInfo)
{
    const MemoryStatus ms = impl::parseMemInfo("MemTotal:       16000000 kB\n"
                                               "MemFree:         1000000 kB\n"
                                               "MemAvailable:    4000000 kB\n"
                                               "Buffers:          200000 kB\n");
    EXPECT_EQ(ms.totalBytes,     16000000ULL * 1024);
    EXPECT_EQ(ms.availableBytes,  4000000ULL * 1024);
    EXPECT_DOUBLE_EQ(ms.usedPercent, 75.0);
}


TEST(SysInfo, ParseMemInfoErrors)
{
    EXPECT_THROW(impl::parseMemInfo("MemTotal: 16000000 kB\n"), SysError);
    EXPECT_THROW(impl::parseMemInfo("MemTotal: 0 kB\nMemAvailable: 0 kB\n"), SysError);
    EXPECT_THROW(impl::parseMemInfo(""), SysError);
}


TEST(SysInfo, LiveMemoryStatus)
{
    const MemoryStatus ms = getMemoryStatus();
    EXPECT_GT(ms.totalBytes, 0u);
    EXPECT_LE(ms.availableBytes, ms.totalBytes);
    EXPECT_GE(ms.usedPercent, 0);
    EXPECT_LE(ms.usedPercent, 100);
}
