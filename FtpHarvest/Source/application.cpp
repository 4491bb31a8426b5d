// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <csignal>
#include <clocale>
#include <iostream>
#include <hvk/extra_log.h>
#include <hvk/file_access.h>
#include <hvk/format_unit.h>
#include <hvk/sys_info.h>
#include <termios.h>
#include <unistd.h>
#include "afs/ftp.h"
#include "base/generate_logfile.h"
#include "config.h"
#include "console_status_handler.h"

using namespace hvk;
using namespace fhv;


namespace
{
std::atomic<bool> cancelRequested{false}; //set by SIGINT
static_assert(std::atomic<bool>::is_always_lock_free); //=> async-signal-safe


extern "C" void onSigInt(int /*sig*/)
{
    cancelRequested = true;
}


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


void showSyntaxHelp()
{
    std::cout << utfTo<std::string>(_("Syntax:") + L"\n\n" +
                                    getCommandLineSyntax() + L"\n\n" +
                                    L"config.json" + L'\n' +
                                    _("Optional configuration file. Missing settings use their default values.") + L"\n\n" +
                                    L"--target DIR" + L'\n' +
                                    _("Local folder receiving the downloaded files.") + L"\n\n" +
                                    L"--user NAME" + L'\n' +
                                    _("FTP user name. Prompted for if neither configured nor part of the server phrase.") + L"\n\n" +
                                    L"--from YYYY-MM-DD  --to YYYY-MM-DD" + L'\n' +
                                    _("Range of monthly folders to scan.")) + '\n';
}


std::string readConsoleLine(const std::wstring& prompt, bool echoInput) //throw SysError
{
    std::cout << utfTo<std::string>(prompt) << std::flush;

    std::optional<termios> termOld;
    if (!echoInput && ::isatty(STDIN_FILENO))
    {
        termios tio = {};
        if (::tcgetattr(STDIN_FILENO, &tio) != 0)
            THROW_LAST_SYS_ERROR("tcgetattr");
        termOld = tio;

        tio.c_lflag &= ~ECHO;
        if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &tio) != 0)
            THROW_LAST_SYS_ERROR("tcsetattr");
    }
    HVK_ON_SCOPE_EXIT
    (
        if (termOld)
        {
            ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &*termOld); //best effort
            std::cout << '\n' << std::flush; //user's "enter" was not echoed
        }
    );

    std::string line;
    if (!std::getline(std::cin, line))
        throw SysError(_("Input stream was closed."));

    return trimCpy(line, TrimSide::right);
}


std::wstring formatBox(const std::vector<std::wstring>& lines)
{
    size_t width = 0;
    for (const std::wstring& line : lines) width = std::max(width, line.size());

    std::wstring output = L'+' + std::wstring(width + 2, L'-') + L"+\n";
    for (const std::wstring& line : lines)
        output += L"| " + line + std::wstring(width - line.size(), L' ') + L" |\n";
    output += L'+' + std::wstring(width + 2, L'-') + L'+';
    return output;
}


std::wstring fmtDate(const TimeComp& tc) { return utfTo<std::wstring>(formatTime(formatIsoDateTag, tc)); }


void logMemoryStatus(ConsoleStatusHandler& handler)
{
    try
    {
        handler.logMessage(formatMemoryStatus(getMemoryStatus() /*throw FileError*/), HarvestCallback::MsgType::info);
    }
    catch (const FileError& e) { handler.logMessage(e.toString(), HarvestCallback::MsgType::warning); }
}


HarvestResult getFinalStatus(const ConsoleStatusHandler& handler, const HarvestSummary& summary)
{
    if (handler.abortRequested() || summary.stopped)
        return HarvestResult::aborted;

    const ErrorLogStats logCount = getStats(handler.getErrorLog());
    if (summary.failed > 0 || logCount.error > 0)
        return HarvestResult::finishedError;
    if (logCount.warning > 0)
        return HarvestResult::finishedWarning;
    return HarvestResult::finishedSuccess;
}


FhvReturnCode runHarvest(const std::vector<Zstring>& commandArgs)
{
    const auto startTime = std::chrono::system_clock::now();

    //-------------------- configuration --------------------
    HarvestConfig cfg;
    try
    {
        const CommandLineArgs cla = parseCommandLine(commandArgs); //throw SysError
        if (cla.showHelp)
        {
            showSyntaxHelp();
            return FHV_RC_SUCCESS;
        }

        if (cla.cfgFilePath)
            cfg = readConfig(*cla.cfgFilePath); //throw FileError
        applyCommandLine(cla, cfg);

        validateConfig(cfg); //throw FileError
    }
    catch (const SysError& e)
    {
        notifyAppError(e.toString() + L"\n\n" + _("Syntax:") + L' ' + getCommandLineSyntax());
        return FHV_RC_EXCEPTION;
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        return FHV_RC_EXCEPTION;
    }

    FtpLoginPhrase loginPhrase = parseFtpLoginPhrase(cfg.serverPhrase);
    if (!cfg.username.empty())
        loginPhrase.login.username = cfg.username;
    loginPhrase.login.timeoutSec = cfg.timeoutSec;

    const Zstring targetFolderPath = getTargetFolderPath(cfg);

    std::cout << utfTo<std::string>(formatBox(
    {
        L"FtpHarvest",
        _("Server:") + L' ' + getFtpDisplayPath(loginPhrase.login, loginPhrase.basePath),
        _("Date range:") + L' ' + fmtDate(cfg.startDate) + L" - " + fmtDate(cfg.endDate),
    })) << "\n\n";

    //-------------------- credentials --------------------
    try
    {
        if (loginPhrase.login.username.empty())
            loginPhrase.login.username = utfTo<Zstring>(trimCpy(readConsoleLine(_("FTP user name:") + L' ', true /*echoInput*/))); //throw SysError

        if (!loginPhrase.login.password || loginPhrase.login.password->empty())
            loginPhrase.login.password = utfTo<Zstring>(readConsoleLine(_("FTP password:") + L' ', false /*echoInput*/)); //throw SysError
    }
    catch (const SysError& e)
    {
        notifyAppError(e.toString());
        return FHV_RC_EXCEPTION;
    }

    //-------------------- harvest --------------------
    ConsoleStatusHandler handler(std::cout, ::isatty(STDOUT_FILENO) != 0, cancelRequested);

    ProcessSummary processSummary;
    processSummary.startTime = startTime;

    handler.logMessage(_("FTP library:") + L' ' + getFtpLibraryVersion(), HarvestCallback::MsgType::info);
    logMemoryStatus(handler);

    const std::unique_ptr<SessionFactory> sessionFactory = createFtpSessionFactory(loginPhrase.login);
    try
    {
        //step 1: discovery over a single session
        handler.printLine(L"\n[1/2] " + _("Scanning remote folders..."));

        std::vector<Zstring> remotePaths;
        {
            std::unique_ptr<RemoteSession> session = sessionFactory->createSession(); //throw FileError
            HVK_ON_SCOPE_EXIT(try { session->close(); /*throw FileError*/ }
            catch (const FileError& e) { logExtraError(e.toString()); });

            remotePaths = discoverRemoteFiles(*session, getDiscoveryConfig(cfg, loginPhrase.basePath), handler); //throw AbortProcess
        }
        processSummary.totalFiles = remotePaths.size();

        //step 2: download
        handler.printLine(L"\n[2/2] " + _("Downloading files..."));
        handler.printLine(formatBox(
        {
            _("Target folder:")    + L' ' + utfTo<std::wstring>(targetFolderPath),
            _("Total files:")      + L' ' + formatNumber(remotePaths.size()),
            _("Worker threads:")   + L' ' + numberTo<std::wstring>(cfg.workerCount),
            _("Max attempts:")     + L' ' + numberTo<std::wstring>(cfg.maxAttempts),
            _("Chunk size:")       + L' ' + formatFilesizeShort(static_cast<int64_t>(cfg.chunkSize)),
            _("Memory threshold:") + L' ' + formatProgressPercent(cfg.memoryThresholdPercent / 100),
            _("Timeout:")          + L' ' + utfTo<std::wstring>(formatTimeSpan(cfg.timeoutSec)),
            _("Connection delay:") + L' ' + utfTo<std::wstring>(formatTimeSpan(cfg.connectionDelaySec)),
        }));

        Orchestrator orchestrator(getOrchestratorConfig(cfg, targetFolderPath), *sessionFactory, getMemoryStatus, nullptr /*clock*/);
        processSummary.harvest = orchestrator.run(remotePaths, handler); //throw FileError
    }
    catch (AbortProcess&) {} //discovery cancelled
    catch (const FileError& e) { handler.logMessage(e.toString(), HarvestCallback::MsgType::error); }

    logMemoryStatus(handler);

    //errors from best-effort cleanup that didn't make it into the console
    for (const LogEntry& entry : fetchExtraLog())
        handler.getErrorLog().push_back(entry);

    processSummary.finalStatus = getFinalStatus(handler, processSummary.harvest);

    handler.printLine(L'\n' + generateLogHeader(processSummary, handler.getErrorLog()));

    if (!cfg.logFolder.empty())
        try
        {
            const Zstring logFilePath = saveLogFile(processSummary, handler.getErrorLog(), expandTilde(cfg.logFolder), nullptr /*notifyStatus*/); //throw FileError
            handler.printLine(replaceCpy(_("Log file: %x"), L"%x", fmtPath(logFilePath)));
        }
        catch (const FileError& e)
        {
            notifyAppError(e.toString());
            processSummary.finalStatus = std::max(processSummary.finalStatus, HarvestResult::finishedError);
        }

    return mapToReturnCode(processSummary.finalStatus);
}
}


int main(int argc, char* argv[])
{
    std::setlocale(LC_ALL, ""); //use the user's number format and character set

    initExtraLog([](const ErrorLog& log) //unfetched entries at shutdown
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    struct sigaction sa = {};
    sa.sa_handler = onSigInt;
    ::sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGINT, &sa, nullptr) != 0)
        notifyAppError(formatSystemError("sigaction(SIGINT)", getLastError()));

    std::vector<Zstring> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    FhvReturnCode rc = FHV_RC_SUCCESS;
    try
    {
        ftpInit();
        HVK_ON_SCOPE_EXIT(ftpTeardown());

        raiseReturnCode(rc, runHarvest(args));
    }
    catch (const std::exception& e)
    {
        notifyAppError(utfTo<std::wstring>(e.what()));
        raiseReturnCode(rc, FHV_RC_EXCEPTION);
    }
    return rc;
}
