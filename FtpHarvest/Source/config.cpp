// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "config.h"
#include <charconv>
#include <hvk/file_io.h>
#include <hvk/file_path.h>
#include <hvk/json.h>

using namespace hvk;
using namespace fhv;


namespace
{
std::wstring fmtKey(const std::string& key) { return L'"' + utfTo<std::wstring>(key) + L'"'; }


const JsonValue* getValue(const JsonValue& root, const std::string& key, JsonValue::Type expectedType, const wchar_t* expectedTypeName) //throw SysError
{
    const JsonValue* jval = getChildFromJsonObject(root, key);
    if (!jval || jval->type == JsonValue::Type::null) //missing => keep default
        return nullptr;

    if (jval->type != expectedType)
        throw SysError(replaceCpy(replaceCpy(_("Value of %x must be %y."), L"%x", fmtKey(key)), L"%y", expectedTypeName));
    return jval;
}


template <class Num>
Num parseNumber(const std::string& key, const std::string& str) //throw SysError
{
    Num number{};
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), number);
    if (rv.ec != std::errc() || rv.ptr != str.data() + str.size())
        throw SysError(replaceCpy(replaceCpy(_("Invalid number %y for %x."), L"%x", fmtKey(key)), L"%y", utfTo<std::wstring>(str)));
    return number;
}


void readString(const JsonValue& root, const std::string& key, Zstring& val) //throw SysError
{
    if (const JsonValue* jval = getValue(root, key, JsonValue::Type::string, L"a string"))
        val = utfTo<Zstring>(jval->primVal);
}


template <class Num>
void readNumber(const JsonValue& root, const std::string& key, Num& val) //throw SysError
{
    if (const JsonValue* jval = getValue(root, key, JsonValue::Type::number, L"a number"))
        val = parseNumber<Num>(key, jval->primVal); //throw SysError
}


void readBool(const JsonValue& root, const std::string& key, bool& val) //throw SysError
{
    if (const JsonValue* jval = getValue(root, key, JsonValue::Type::boolean, L"true or false"))
        val = jval->primVal == "true";
}


TimeComp parseDate(const std::string_view str) //throw SysError
{
    const TimeComp tc = parseTime(formatIsoDateTag, trimCpy(str));
    if (tc == TimeComp())
        throw SysError(replaceCpy(_("Invalid date %x: expected format YYYY-MM-DD."), L"%x", utfTo<std::wstring>(str)));
    return tc;
}


void readDate(const JsonValue& root, const std::string& key, TimeComp& val) //throw SysError
{
    if (const JsonValue* jval = getValue(root, key, JsonValue::Type::string, L"a date string"))
        try
        {
            val = parseDate(jval->primVal); //throw SysError
        }
        catch (const SysError& e) { throw SysError(fmtKey(key) + L": " + e.toString()); }
}
}


void fhv::parseConfig(const std::string& jsonStream, HarvestConfig& cfg) //throw SysError
{
    JsonValue root;
    try
    {
        root = parseJson(jsonStream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw SysError(replaceCpy(replaceCpy(_("JSON syntax error in row %x, column %y."),
                                             L"%x", numberTo<std::wstring>(e.row + 1)),
                                  L"%y", numberTo<std::wstring>(e.col + 1)));
    }

    if (root.type != JsonValue::Type::object)
        throw SysError(_("Configuration must be a JSON object."));

    readString(root, "server",       cfg.serverPhrase);
    readString(root, "username",     cfg.username);
    readString(root, "targetFolder", cfg.targetFolder);
    readDate  (root, "startDate",    cfg.startDate);
    readDate  (root, "endDate",      cfg.endDate);
    readString(root, "fileExtension", cfg.fileExtension);

    readNumber(root, "chunkSize",              cfg.chunkSize);
    readNumber(root, "workerCount",            cfg.workerCount);
    readNumber(root, "permitCount",            cfg.permitCount);
    readNumber(root, "poolCapacity",           cfg.poolCapacity);
    readNumber(root, "memoryThresholdPercent", cfg.memoryThresholdPercent);
    readNumber(root, "maxAttempts",            cfg.maxAttempts);
    readNumber(root, "retryDelaySec",          cfg.retryDelaySec);
    readNumber(root, "connectionDelaySec",     cfg.connectionDelaySec);
    readNumber(root, "timeoutSec",             cfg.timeoutSec);
    readNumber(root, "progressIntervalBytes",  cfg.progressIntervalBytes);
    readNumber(root, "summaryInterval",        cfg.summaryInterval);
    readNumber(root, "folderScanDelayMs",      cfg.folderScanDelayMs);
    readBool  (root, "verifyExistingSize",     cfg.verifyExistingSize);
    readString(root, "logFolder",              cfg.logFolder);
}


HarvestConfig fhv::readConfig(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError

    HarvestConfig cfg;
    try
    {
        parseConfig(stream, cfg); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Configuration file %x is corrupted."), L"%x", fmtPath(filePath)), e.toString());
    }
    return cfg;
}


void fhv::validateConfig(const HarvestConfig& cfg) //throw FileError
{
    auto checkMin = [](const wchar_t* name, int64_t value, int64_t minVal) //throw FileError
    {
        if (value < minVal)
            throw FileError(_("Invalid configuration."),
                            replaceCpy(replaceCpy(replaceCpy(_("%x is %y, but must be at least %z."),
                                                             L"%x", name),
                                                  L"%y", numberTo<std::wstring>(value)),
                                       L"%z", numberTo<std::wstring>(minVal)));
    };
    checkMin(L"workerCount",           static_cast<int64_t>(cfg.workerCount), 1);
    checkMin(L"permitCount",           static_cast<int64_t>(cfg.permitCount), 1);
    checkMin(L"poolCapacity",          static_cast<int64_t>(cfg.poolCapacity), 1);
    checkMin(L"chunkSize",             static_cast<int64_t>(cfg.chunkSize), 1);
    checkMin(L"maxAttempts",           cfg.maxAttempts, 1);
    checkMin(L"retryDelaySec",         cfg.retryDelaySec, 0);
    checkMin(L"connectionDelaySec",    cfg.connectionDelaySec, 0);
    checkMin(L"timeoutSec",            cfg.timeoutSec, 1);
    checkMin(L"progressIntervalBytes", cfg.progressIntervalBytes, 1);
    checkMin(L"summaryInterval",       cfg.summaryInterval, 1);
    checkMin(L"folderScanDelayMs",     cfg.folderScanDelayMs, 0);

    if (!(0 < cfg.memoryThresholdPercent && cfg.memoryThresholdPercent <= 100))
        throw FileError(_("Invalid configuration."), _("memoryThresholdPercent must be greater than 0 and at most 100."));

    if (std::make_pair(cfg.startDate.year, cfg.startDate.month) > std::make_pair(cfg.endDate.year, cfg.endDate.month) ||
        (cfg.startDate.year == cfg.endDate.year && cfg.startDate.month == cfg.endDate.month && cfg.startDate.day > cfg.endDate.day))
        throw FileError(_("Invalid configuration."),
                        replaceCpy(replaceCpy(_("Start date %x is after end date %y."),
                                              L"%x", utfTo<std::wstring>(formatTime(formatIsoDateTag, cfg.startDate))),
                                   L"%y", utfTo<std::wstring>(formatTime(formatIsoDateTag, cfg.endDate))));

    if (trimCpy(cfg.targetFolder).empty())
        throw FileError(_("Invalid configuration."), _("Target folder is missing."));

    if (trimCpy(cfg.serverPhrase).empty())
        throw FileError(_("Invalid configuration."), _("Server is missing."));
}


CommandLineArgs fhv::parseCommandLine(const std::vector<Zstring>& args) //throw SysError
{
    CommandLineArgs cla;

    for (auto it = args.begin(); it != args.end(); ++it)
    {
        const Zstring& arg = *it;

        auto getOptionValue = [&]() -> Zstring //throw SysError
        {
            if (++it == args.end() || startsWith(*it, Zstr("--")))
                throw SysError(replaceCpy(_("Missing value for command line option %x."), L"%x", utfTo<std::wstring>(arg)));
            return *it;
        };

        if (arg == Zstr("--help") || arg == Zstr("-h"))
            cla.showHelp = true;
        else if (arg == Zstr("--target"))
            cla.targetFolder = getOptionValue(); //throw SysError
        else if (arg == Zstr("--user"))
            cla.username = getOptionValue(); //throw SysError
        else if (arg == Zstr("--from"))
            cla.startDate = parseDate(getOptionValue()); //throw SysError
        else if (arg == Zstr("--to"))
            cla.endDate = parseDate(getOptionValue()); //throw SysError
        else if (startsWith(arg, Zstr("-")))
            throw SysError(replaceCpy(_("Unknown command line option %x."), L"%x", utfTo<std::wstring>(arg)));
        else if (!cla.cfgFilePath)
            cla.cfgFilePath = arg;
        else
            throw SysError(replaceCpy(_("Unexpected command line argument %x."), L"%x", utfTo<std::wstring>(arg)));
    }
    return cla;
}


void fhv::applyCommandLine(const CommandLineArgs& args, HarvestConfig& cfg)
{
    if (args.targetFolder) cfg.targetFolder = *args.targetFolder;
    if (args.username)     cfg.username     = *args.username;
    if (args.startDate)    cfg.startDate    = *args.startDate;
    if (args.endDate)      cfg.endDate      = *args.endDate;
}


std::wstring fhv::getCommandLineSyntax()
{
    return L"ftpharvest [config.json] [--target DIR] [--user NAME] [--from YYYY-MM-DD] [--to YYYY-MM-DD]";
}


Zstring fhv::getTargetFolderPath(const HarvestConfig& cfg)
{
    Zstring folderPath = expandTilde(trimCpy(cfg.targetFolder));
    if (endsWith(folderPath, FILE_NAME_SEPARATOR) && folderPath.size() > 1)
        folderPath.pop_back();
    return folderPath;
}


OrchestratorConfig fhv::getOrchestratorConfig(const HarvestConfig& cfg, const Zstring& targetFolderPath)
{
    OrchestratorConfig oc;
    oc.workerCount  = cfg.workerCount;
    oc.permitCount  = cfg.permitCount;
    oc.poolCapacity = cfg.poolCapacity;
    oc.connectionDelay = std::chrono::seconds(cfg.connectionDelaySec);
    oc.memoryThresholdPercent = cfg.memoryThresholdPercent;
    oc.summaryInterval = cfg.summaryInterval;

    oc.transfer.targetFolder          = targetFolderPath;
    oc.transfer.maxAttempts           = cfg.maxAttempts;
    oc.transfer.retryDelay            = std::chrono::seconds(cfg.retryDelaySec);
    oc.transfer.chunkSize             = cfg.chunkSize;
    oc.transfer.progressIntervalBytes = cfg.progressIntervalBytes;
    oc.transfer.verifyExistingSize    = cfg.verifyExistingSize;
    return oc;
}


DiscoveryConfig fhv::getDiscoveryConfig(const HarvestConfig& cfg, const Zstring& basePath)
{
    DiscoveryConfig dc;
    dc.basePath        = basePath;
    dc.startDate       = cfg.startDate;
    dc.endDate         = cfg.endDate;
    dc.fileExtension   = cfg.fileExtension;
    dc.folderScanDelay = std::chrono::milliseconds(cfg.folderScanDelayMs);
    return dc;
}
