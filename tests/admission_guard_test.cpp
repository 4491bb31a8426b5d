// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <gtest/gtest.h>
#include "fake_remote.h"

using namespace hvk;
using namespace fhv;
using namespace fhv::test;


namespace
{
bool admitsAt(double thresholdPercent, double usedPercent)
{
    double sampled = -1;
    const bool admitted = AdmissionGuard(thresholdPercent, makeMemorySampler(usedPercent)).shouldAdmit(sampled);
    EXPECT_EQ(sampled, usedPercent);
    return admitted;
}
}


TEST(AdmissionGuard, ThresholdIsInclusive)
{
    EXPECT_TRUE (admitsAt(90, 89.9));
    EXPECT_TRUE (admitsAt(90, 90));
    EXPECT_FALSE(admitsAt(90, 90.1));
    EXPECT_TRUE (admitsAt(100, 100));
}


TEST(AdmissionGuard, PressureIsSampledEachTime)
{
    double usedPercent = 50;
    AdmissionGuard guard(80, [&] { return MemoryStatus{1000, 0, usedPercent}; });

    double sampled = 0;
    EXPECT_EQ(guard.checkPressure(), 50);
    EXPECT_TRUE(guard.shouldAdmit(sampled));
    EXPECT_EQ(sampled, 50);

    usedPercent = 95;
    EXPECT_EQ(guard.checkPressure(), 95);
    EXPECT_FALSE(guard.shouldAdmit(sampled));
    EXPECT_EQ(sampled, 95);
}


TEST(AdmissionGuard, SamplingErrorIsReported)
{
    AdmissionGuard guard(90, []() -> MemoryStatus { throw FileError(L"Cannot read file \"/proc/meminfo\"."); });

    double sampled = 0;
    EXPECT_THROW(guard.checkPressure(), FileError);
    EXPECT_THROW(guard.shouldAdmit(sampled), FileError);
}


TEST(AdmissionGuard, InvalidThresholdIsRejected)
{
    EXPECT_THROW(AdmissionGuard(0, makeMemorySampler(10)), std::logic_error);
    EXPECT_THROW(AdmissionGuard(101, makeMemorySampler(10)), std::logic_error);
    EXPECT_THROW(AdmissionGuard(90, MemorySampler()), std::logic_error);
}
