// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpHarvest/Source/config.h"

using namespace hvk;
using namespace fhv;


TEST(Config, DefaultsAreValid)
{
    const HarvestConfig cfg;
    EXPECT_NO_THROW(validateConfig(cfg));
    EXPECT_EQ(cfg.workerCount, 3u);
    EXPECT_EQ(cfg.chunkSize, 8u * 1024 * 1024);
    EXPECT_EQ(cfg.memoryThresholdPercent, 90);
    EXPECT_EQ(cfg.fileExtension, Zstr(".nc"));
}


TEST(Config, ParseOverridesGivenKeysOnly)
{
    HarvestConfig cfg;
    parseConfig(R"({
        "server": "ftp://example.com/data",
        "targetFolder": "/srv/out",
        "startDate": "2021-01-15",
        "endDate": "2021-03-01",
        "workerCount": 5,
        "memoryThresholdPercent": 75.5,
        "verifyExistingSize": false,
        "unknownKey": [1, 2, 3],
        "logFolder": null
    })", cfg);

    EXPECT_EQ(cfg.serverPhrase, Zstr("ftp://example.com/data"));
    EXPECT_EQ(cfg.targetFolder, Zstr("/srv/out"));
    EXPECT_EQ(cfg.startDate, (TimeComp{2021, 1, 15}));
    EXPECT_EQ(cfg.endDate,   (TimeComp{2021, 3, 1}));
    EXPECT_EQ(cfg.workerCount, 5u);
    EXPECT_EQ(cfg.memoryThresholdPercent, 75.5);
    EXPECT_FALSE(cfg.verifyExistingSize);

    EXPECT_EQ(cfg.permitCount, 3u); //untouched
    EXPECT_EQ(cfg.maxAttempts, 3);
    EXPECT_TRUE(cfg.logFolder.empty());
}


TEST(Config, ParseErrors)
{
    HarvestConfig cfg;
    EXPECT_THROW(parseConfig(R"({"workerCount": "many"})", cfg), SysError);
    EXPECT_THROW(parseConfig(R"({"workerCount": -1})", cfg), SysError);
    EXPECT_THROW(parseConfig(R"({"maxAttempts": 2.5})", cfg), SysError);
    EXPECT_THROW(parseConfig(R"({"startDate": "2021/01/15"})", cfg), SysError);
    EXPECT_THROW(parseConfig(R"([1, 2])", cfg), SysError);

    try
    {
        parseConfig("{\n  \"workerCount\": 3,\n  oops\n}", cfg);
        FAIL();
    }
    catch (const SysError& e) { EXPECT_TRUE(contains(e.toString(), L"row 3")); }
}


TEST(Config, Validation)
{
    auto expectInvalid = [](const std::function<void(HarvestConfig& cfg)>& modify)
    {
        HarvestConfig cfg;
        modify(cfg);
        EXPECT_THROW(validateConfig(cfg), FileError);
    };
    expectInvalid([](HarvestConfig& cfg) { cfg.workerCount = 0; });
    expectInvalid([](HarvestConfig& cfg) { cfg.permitCount = 0; });
    expectInvalid([](HarvestConfig& cfg) { cfg.poolCapacity = 0; });
    expectInvalid([](HarvestConfig& cfg) { cfg.maxAttempts = 0; });
    expectInvalid([](HarvestConfig& cfg) { cfg.memoryThresholdPercent = 0; });
    expectInvalid([](HarvestConfig& cfg) { cfg.memoryThresholdPercent = 100.5; });
    expectInvalid([](HarvestConfig& cfg) { cfg.targetFolder = Zstr("  "); });
    expectInvalid([](HarvestConfig& cfg) { cfg.startDate = TimeComp{2024, 5, 1}; cfg.endDate = TimeComp{2024, 4, 30}; });

    HarvestConfig cfg;
    cfg.memoryThresholdPercent = 100;
    cfg.startDate = cfg.endDate = TimeComp{2024, 5, 1};
    EXPECT_NO_THROW(validateConfig(cfg));
}


TEST(Config, CommandLine)
{
    const CommandLineArgs cla = parseCommandLine({Zstr("my.json"), Zstr("--target"), Zstr("/tmp/out"), Zstr("--from"), Zstr("2022-02-01"), Zstr("--user"), Zstr("me")});
    ASSERT_TRUE(cla.cfgFilePath);
    EXPECT_EQ(*cla.cfgFilePath, Zstr("my.json"));
    EXPECT_EQ(cla.targetFolder, Zstr("/tmp/out"));
    EXPECT_EQ(cla.username, Zstr("me"));
    EXPECT_EQ(cla.startDate, (TimeComp{2022, 2, 1}));
    EXPECT_FALSE(cla.endDate);
    EXPECT_FALSE(cla.showHelp);

    HarvestConfig cfg;
    applyCommandLine(cla, cfg);
    EXPECT_EQ(cfg.targetFolder, Zstr("/tmp/out"));
    EXPECT_EQ(cfg.username, Zstr("me"));
    EXPECT_EQ(cfg.startDate, (TimeComp{2022, 2, 1}));
    EXPECT_EQ(cfg.endDate, (TimeComp{2025, 9, 30}));

    EXPECT_TRUE(parseCommandLine({Zstr("-h")}).showHelp);
}


TEST(Config, CommandLineErrors)
{
    EXPECT_THROW(parseCommandLine({Zstr("--target")}), SysError);
    EXPECT_THROW((parseCommandLine({Zstr("--target"), Zstr("--user")})), SysError);
    EXPECT_THROW(parseCommandLine({Zstr("--bogus")}), SysError);
    EXPECT_THROW((parseCommandLine({Zstr("a.json"), Zstr("b.json")})), SysError);
    EXPECT_THROW((parseCommandLine({Zstr("--to"), Zstr("yesterday")})), SysError);
}


TEST(Config, ConversionToComponentConfigs)
{
    HarvestConfig cfg;
    cfg.retryDelaySec = 7;
    cfg.targetFolder = Zstr("/data/out/");

    const Zstring targetFolder = getTargetFolderPath(cfg);
    EXPECT_EQ(targetFolder, Zstr("/data/out"));

    const OrchestratorConfig oc = getOrchestratorConfig(cfg, targetFolder);
    EXPECT_EQ(oc.transfer.retryDelay, std::chrono::seconds(7));
    EXPECT_EQ(oc.transfer.targetFolder, Zstr("/data/out"));
    EXPECT_EQ(oc.connectionDelay, std::chrono::seconds(2));

    const DiscoveryConfig dc = getDiscoveryConfig(cfg, Zstr("/SIR_SAR_L2"));
    EXPECT_EQ(dc.folderScanDelay, std::chrono::milliseconds(500));
    EXPECT_EQ(dc.fileExtension, Zstr(".nc"));
}
