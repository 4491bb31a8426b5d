// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "admission_guard.h"

using namespace hvk;
using namespace fhv;


AdmissionGuard::AdmissionGuard(double thresholdPercent, const MemorySampler& sampler) :
    thresholdPercent_(thresholdPercent),
    sampler_(sampler)
{
    if (!(0 < thresholdPercent && thresholdPercent <= 100) || !sampler)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


double AdmissionGuard::checkPressure() //throw FileError
{
    return sampler_().usedPercent; //throw FileError
}


bool AdmissionGuard::shouldAdmit(double& usedPercent) //throw FileError
{
    usedPercent = checkPressure(); //throw FileError
    return usedPercent <= thresholdPercent_;
}
