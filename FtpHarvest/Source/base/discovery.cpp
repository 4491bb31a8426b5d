// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "discovery.h"
#include <hvk/file_path.h>
#include <hvk/format_unit.h>
#include <hvk/thread.h>

using namespace hvk;
using namespace fhv;


std::vector<Zstring> fhv::generateMonthFolders(const Zstring& basePath, const TimeComp& startDate, const TimeComp& endDate)
{
    const Zstring baseFolder = basePath == Zstr("/") ? Zstring() : basePath;
    std::vector<Zstring> folders;

    int year  = startDate.year;
    int month = startDate.month;

    while (year < endDate.year || (year == endDate.year && month <= endDate.month))
    {
        folders.push_back(baseFolder + FILE_NAME_SEPARATOR + printNumber<Zstring>(Zstr("%04d"), year) +
                          FILE_NAME_SEPARATOR + printNumber<Zstring>(Zstr("%02d"), month));
        if (++month > 12)
        {
            month = 1;
            ++year;
        }
    }
    return folders;
}


std::vector<Zstring> fhv::parseListing(const Zstring& folderPath, const std::vector<std::string>& rawLines, const Zstring& fileExtension)
{
    std::vector<Zstring> filePaths;

    for (const std::string& line : rawLines)
    {
        //"-rw-r--r--   1 ftp      ftp      12345678 Aug 03 09:15 CS_OFFL_SIR_SAR_2__20200803T091500.nc"
        std::vector<std::string_view> fields;
        split2(line, [](char c) { return isWhiteSpace(c); }, [&](const std::string_view block)
        {
            if (!block.empty())
                fields.push_back(block);
        });

        if (fields.size() < 9)
            continue;

        if (startsWith(fields[0], 'd')) //directory
            continue;

        const Zstring fileName(fields.back());

        if (!fileExtension.empty() && !endsWith(fileName, fileExtension))
            continue;

        filePaths.push_back(appendPath(folderPath, fileName));
    }
    return filePaths;
}


std::vector<Zstring> fhv::discoverRemoteFiles(RemoteSession& session, const DiscoveryConfig& cfg, HarvestCallback& cb) //throw AbortProcess, X
{
    const std::vector<Zstring> folders = generateMonthFolders(cfg.basePath, cfg.startDate, cfg.endDate);

    cb.logMessage(replaceCpy(_("Scanning %x folders..."), L"%x", formatNumber(folders.size())), HarvestCallback::MsgType::info); //throw X

    std::vector<Zstring> filePaths;

    for (size_t i = 0; i < folders.size(); ++i)
    {
        const Zstring& folderPath = folders[i];

        cb.updateStatus(replaceCpy(replaceCpy(replaceCpy(_("Scanning folder %x (%y of %z)"),
                                                         L"%x", fmtPath(folderPath)),
                                              L"%y", numberTo<std::wstring>(i + 1)),
                                   L"%z", numberTo<std::wstring>(folders.size()))); //throw X
        try
        {
            const std::vector<Zstring> folderFiles = parseListing(folderPath, session.listDirectory(folderPath) /*throw FileError*/, cfg.fileExtension);

            cb.logMessage(replaceCpy(replaceCpy(_("Found %x files in %y"),
                                                L"%x", numberTo<std::wstring>(folderFiles.size())),
                                     L"%y", fmtPath(folderPath)), HarvestCallback::MsgType::info); //throw X

            filePaths.insert(filePaths.end(), folderFiles.begin(), folderFiles.end());
        }
        catch (const FileError& e) //missing month folders are expected at the edges of the date range
        {
            cb.logMessage(e.toString(), HarvestCallback::MsgType::warning); //throw X
        }

        cb.requestUiUpdate(); //throw AbortProcess

        if (i + 1 < folders.size())
            interruptibleSleep(cfg.folderScanDelay); //plain sleep on main thread; be nice to the server
    }

    cb.logMessage(replaceCpy(_("Total files found: %x"), L"%x", formatNumber(filePaths.size())), HarvestCallback::MsgType::info); //throw X
    return filePaths;
}
