// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef ADMISSION_GUARD_H_9823457092384572
#define ADMISSION_GUARD_H_9823457092384572

#include <functional>
#include <hvk/sys_info.h>


namespace fhv
{
using MemorySampler = std::function<hvk::MemoryStatus()>; //throw FileError


//veto new transfer attempts while the host runs short of memory
class AdmissionGuard
{
public:
    AdmissionGuard(double thresholdPercent, const MemorySampler& sampler);

    double checkPressure(); //throw FileError; used memory in percent [0, 100]

    //threshold is inclusive: admits while usedPercent <= threshold
    bool shouldAdmit(double& usedPercent); //throw FileError

    double getThreshold() const { return thresholdPercent_; }

private:
    const double thresholdPercent_;
    const MemorySampler sampler_;
};
}

#endif //ADMISSION_GUARD_H_9823457092384572
