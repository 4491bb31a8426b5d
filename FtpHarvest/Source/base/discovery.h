// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef DISCOVERY_H_2983475092384752
#define DISCOVERY_H_2983475092384752

#include <hvk/time.h>
#include "harvest_callback.h"
#include "../afs/remote_session.h"


namespace fhv
{
struct DiscoveryConfig
{
    Zstring basePath; //server-absolute, e.g. "/SIR_SAR_L2"
    hvk::TimeComp startDate; //only year and month are considered
    hvk::TimeComp endDate;   //
    Zstring fileExtension = Zstr(".nc");
    std::chrono::milliseconds folderScanDelay{500};
};


//"<base>/<YYYY>/<MM>" for each month in [start, end]; empty if start > end
std::vector<Zstring> generateMonthFolders(const Zstring& basePath, const hvk::TimeComp& startDate, const hvk::TimeComp& endDate);

//unix-style LIST output => file paths with matching extension
std::vector<Zstring> parseListing(const Zstring& folderPath, const std::vector<std::string>& rawLines, const Zstring& fileExtension);

//returns remote file paths in scan order
std::vector<Zstring> discoverRemoteFiles(RemoteSession& session, const DiscoveryConfig& cfg, HarvestCallback& cb); //throw AbortProcess, X
}

#endif //DISCOVERY_H_2983475092384752
