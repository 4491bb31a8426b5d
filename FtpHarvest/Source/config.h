// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef CONFIG_H_0982734509827345
#define CONFIG_H_0982734509827345

#include <hvk/time.h>
#include <hvk/sys_error.h>
#include "base/discovery.h"
#include "base/orchestrator.h"


namespace fhv
{
struct HarvestConfig
{
    Zstring serverPhrase = Zstr("ftp://science-pds.cryosat.esa.int/SIR_SAR_L2"); //see parseFtpLoginPhrase()
    Zstring username; //overrides user name of login phrase
    Zstring targetFolder = Zstr("~/CS2_SIR_SAR_L2E");

    hvk::TimeComp startDate{2020, 8,  1};
    hvk::TimeComp endDate  {2025, 9, 30};
    Zstring fileExtension = Zstr(".nc");

    size_t chunkSize = 8 * 1024 * 1024;
    size_t workerCount  = 3;
    size_t permitCount  = 3;
    size_t poolCapacity = 3;
    double memoryThresholdPercent = 90;
    int maxAttempts = 3;
    int retryDelaySec = 5;
    int connectionDelaySec = 2;
    int timeoutSec = 180;
    int64_t progressIntervalBytes = 10 * 1024 * 1024;
    int summaryInterval = 20;
    int folderScanDelayMs = 500;
    bool verifyExistingSize = true;
    Zstring logFolder; //empty: no log file
};

//unknown keys are ignored; type mismatch is an error
void parseConfig(const std::string& jsonStream, HarvestConfig& cfg); //throw SysError

HarvestConfig readConfig(const Zstring& filePath); //throw FileError

void validateConfig(const HarvestConfig& cfg); //throw FileError


struct CommandLineArgs
{
    std::optional<Zstring> cfgFilePath;
    std::optional<Zstring> targetFolder;
    std::optional<Zstring> username;
    std::optional<hvk::TimeComp> startDate;
    std::optional<hvk::TimeComp> endDate;
    bool showHelp = false;
};

//ftpharvest [config.json] [--target DIR] [--user NAME] [--from YYYY-MM-DD] [--to YYYY-MM-DD]
CommandLineArgs parseCommandLine(const std::vector<Zstring>& args); //throw SysError

void applyCommandLine(const CommandLineArgs& args, HarvestConfig& cfg);

std::wstring getCommandLineSyntax();

//----------------------------------------------------------------------
OrchestratorConfig getOrchestratorConfig(const HarvestConfig& cfg, const Zstring& targetFolderPath);
DiscoveryConfig    getDiscoveryConfig   (const HarvestConfig& cfg, const Zstring& basePath);

//target folder with "~" resolved
Zstring getTargetFolderPath(const HarvestConfig& cfg);
}

#endif //CONFIG_H_0982734509827345
