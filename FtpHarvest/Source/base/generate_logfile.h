// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef GENERATE_LOGFILE_H_2093485702934857
#define GENERATE_LOGFILE_H_2093485702934857

#include <chrono>
#include <hvk/error_log.h>
#include "orchestrator.h"
#include "return_codes.h"


namespace fhv
{
struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    HarvestResult finalStatus = HarvestResult::finishedSuccess;
    size_t totalFiles = 0; //discovered
    HarvestSummary harvest;
};


std::wstring generateLogHeader(const ProcessSummary& s, const hvk::ErrorLog& log);

//"FtpHarvest 2025-09-15 015052.log"
Zstring saveLogFile(const ProcessSummary& summary, //throw FileError, X
                    const hvk::ErrorLog& log,
                    const Zstring& logFolderPath,
                    const std::function<void(const std::wstring& msg)>& notifyStatus /*throw X; optional*/);
}

#endif //GENERATE_LOGFILE_H_2093485702934857
