// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "ftp.h"
#include <algorithm>
#include <fcntl.h>
#include <hvk/open_ssl.h>
#include <hvk/thread.h>
#include <hvk/utf.h>
#include <libcurl/curl_wrap.h>

using namespace hvk;
using namespace fhv;


namespace
{
constexpr ZstringView ftpPrefix = Zstr("ftp:");


int getEffectivePort(const FtpLogin& login) { return login.portCfg > 0 ? login.portCfg : DEFAULT_PORT_FTP; }


//user names are percent-encoded only where the phrase syntax requires it: '@', ':' and '%' itself
Zstring decodeFtpUsername(Zstring name)
{
    replace(name, Zstr("%40"), Zstr('@'));
    replace(name, Zstr("%3A"), Zstr(':'));
    replace(name, Zstr("%3a"), Zstr(':'));
    replace(name, Zstr("%25"), Zstr('%'));
    return name;
}


//"data\\2020//08/" => "/data/2020/08"
Zstring sanitizeServerPath(ZstringView path)
{
    Zstring output;
    split2(path, [](Zchar c) { return c == Zstr('/') || c == Zstr('\\'); }, [&](ZstringView comp)
    {
        if (!comp.empty())
            output += Zstr('/') + Zstring(comp);
    });
    return output.empty() ? Zstring(Zstr("/")) : output;
}


//curl calls back into plain C functions with a void* context: forward to the lambda passed as context
template <class Lambda>
size_t forwardWrite(char* buffer, size_t size, size_t nitems, void* lambda)
{
    return (*static_cast<Lambda*>(lambda))(buffer, size * nitems);
}

template <class Lambda>
int forwardSockOpt(void* lambda, curl_socket_t curlfd, curlsocktype /*purpose*/)
{
    return (*static_cast<Lambda*>(lambda))(curlfd);
}

template <class Lambda>
int forwardXferInfo(void* lambda, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/)
{
    return (*static_cast<Lambda*>(lambda))();
}

//================================================================================================================

class FtpSession : public RemoteSession
{
public:
    explicit FtpSession(const FtpLogin& login) :
        login_(login),
        usernameUtf8_(utfTo<std::string>(login.username)),
        passwordUtf8_(utfTo<std::string>(login.password ? *login.password : Zstring())) {}

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    std::vector<std::string> listDirectory(const Zstring& folderPath) override //throw FileError
    {
        try
        {
            std::string listing;
            auto appendListing = [&](const char* buffer, size_t len) { listing.append(buffer, len); return len; };

            //plain LIST after a single CWD: LIST arguments are interpreted differently by every server
            perform(folderPath, true /*isDir*/, CURLFTPMETHOD_SINGLECWD,
            {
                {CURLOPT_WRITEDATA, &appendListing},
                {CURLOPT_WRITEFUNCTION, &forwardWrite<decltype(appendListing)>},
            }); //throw SysError, ThreadStopRequest

            std::vector<std::string> lines;
            for (const std::string_view line : splitFtpResponse(listing))
                lines.emplace_back(line);
            return lines;
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(getFtpDisplayPath(login_, folderPath))), e.toString()); }
    }

    std::optional<uint64_t> getFileSize(const Zstring& filePath) override //throw FileError
    {
        try
        {
            //in ASCII mode servers report the converted size or refuse SIZE altogether
            ensureBinaryMode(); //throw SysError

            //"*": keep going on 4xx/5xx replies; parseFtpSizeResponse() tells "not supported" from real errors
            return parseFtpSizeResponse(runQuoteCommand("*SIZE " + utfTo<std::string>(filePath))); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getFtpDisplayPath(login_, filePath))), e.toString()); }
    }

    void downloadFile(const Zstring& filePath, //throw FileError, X
                      const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override
    {
        std::exception_ptr writeException; //must not unwind through libcurl's C frames

        auto onData = [&](const char* buffer, size_t len) -> size_t
        {
            try
            {
                writeBlock(buffer, len); //throw X
                return len;
            }
            catch (...)
            {
                writeException = std::current_exception();
                return 0; //!= len => CURLE_WRITE_ERROR
            }
        };

        try
        {
            perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_WRITEDATA, &onData},
                {CURLOPT_WRITEFUNCTION, &forwardWrite<decltype(onData)>},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //no extra SIZE: read until the server closes the data connection
            }); //throw SysError, ThreadStopRequest
        }
        catch (const SysError& e)
        {
            if (writeException)
                std::rethrow_exception(writeException);

            throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFtpDisplayPath(login_, filePath))), e.toString());
        }
    }

    void testConnection() override //throw FileError
    {
        try
        {
            //any well-formed reply proves that control connection and login are alive
            const std::string reply = runQuoteCommand("*NOOP"); //throw SysError

            for (const std::string_view line : splitFtpResponse(reply))
                for (const char* status : {"200 ", "500 ", "502 "})
                    if (startsWith(line, status))
                        return;

            throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(reply) + L')');
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(login_.server)), e.toString()); }
    }

    void close() override //throw FileError
    {
        if (easyHandle_)
            ::curl_easy_cleanup(std::exchange(easyHandle_, nullptr)); //QUIT on the cached control connection
    }

private:
    std::vector<CurlOption> getSessionOptions(const std::string& url, char* errorBuf, std::string& replyLines) const
    {
        static_assert(LIBCURL_VERSION_MAJOR > 7 || (LIBCURL_VERSION_MAJOR == 7 && LIBCURL_VERSION_MINOR >= 67)); //CURLFTPMETHOD_NOCWD with absolute paths

        curl_write_callback appendReply = [](char* buffer, size_t size, size_t nitems, void* replyBuf)
        {
            static_cast<std::string*>(replyBuf)->append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options
        {
            {CURLOPT_ERRORBUFFER, errorBuf},
            {CURLOPT_HEADERDATA, &replyLines},
            {CURLOPT_HEADERFUNCTION, appendReply},
            {CURLOPT_URL, url.c_str()},
            {CURLOPT_PORT, getEffectivePort(login_)},
            {CURLOPT_NOSIGNAL, 1L}, //required for multi-threaded use
            {CURLOPT_FTP_SKIP_PASV_IP, 0L}, //some servers hand out a data address different from the control connection's
            {CURLOPT_TCP_KEEPALIVE, 1L}, //control connection is idle during long downloads

            //no CURLOPT_TIMEOUT: it would cap the total transfer time
            {CURLOPT_CONNECTTIMEOUT, login_.timeoutSec},
            {CURLOPT_SERVER_RESPONSE_TIMEOUT, login_.timeoutSec},
            {CURLOPT_LOW_SPEED_TIME, login_.timeoutSec},
            {CURLOPT_LOW_SPEED_LIMIT, 1L}, //stalled: less than 1 byte/s for "timeoutSec"

            //archive servers often run with self-signed or expired certificates
            {CURLOPT_CAINFO, 0L},
            {CURLOPT_SSL_VERIFYPEER, 0L},
            {CURLOPT_SSL_VERIFYHOST, 0L},
        };

        //empty user name => libcurl logs in as "anonymous"
        if (!login_.username.empty())
        {
            options.emplace_back(CURLOPT_USERNAME, usernameUtf8_.c_str());
            options.emplace_back(CURLOPT_PASSWORD, passwordUtf8_.c_str());
        }

        if (login_.useTls) //explicit FTPS (RFC 4217) for control and data connection
        {
            options.emplace_back(CURLOPT_USE_SSL,    CURLUSESSL_ALL);
            options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
        }
        return options;
    }

    //returns the server's reply lines
    std::string perform(const Zstring& serverPath, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions) //throw SysError, ThreadStopRequest
    {
        if (easyHandle_)
            ::curl_easy_reset(easyHandle_); //options only: the cached connection survives
        else if (!(easyHandle_ = ::curl_easy_init()))
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

        char errorBuf[CURL_ERROR_SIZE] = {};
        std::string replyLines;

        const std::string url = getCurlUrl(serverPath, isDir); //throw SysError; libcurl copies option strings during setopt

        for (const CurlOption& option : getSessionOptions(url, errorBuf, replyLines))
            setCurlOption(easyHandle_, option); //throw SysError

        assert(pathMethod != CURLFTPMETHOD_MULTICWD); //one CWD per path component: too slow
        setCurlOption(easyHandle_, {CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        //libcurl doesn't set FD_CLOEXEC on its sockets
        std::optional<SysError> socketError;
        auto onSocketCreated = [&](curl_socket_t curlfd)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) != -1)
                return CURL_SOCKOPT_OK;

            socketError = SysError(formatSystemError("fcntl(FD_CLOEXEC)", getLastError()));
            return CURL_SOCKOPT_ERROR;
        };
        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTDATA, &onSocketCreated}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTFUNCTION, &forwardSockOpt<decltype(onSocketCreated)>}); //throw SysError

        //called at least once per second, even while the server is silent
        std::optional<ThreadStopRequest> stopRequest;
        auto onProgress = [&]
        {
            try
            {
                interruptionPoint(); //throw ThreadStopRequest
                return 0;
            }
            catch (const ThreadStopRequest& e)
            {
                stopRequest = e;
                return 1; //=> CURLE_ABORTED_BY_CALLBACK
            }
        };
        setCurlOption(easyHandle_, {CURLOPT_XFERINFODATA, &onProgress}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_XFERINFOFUNCTION, &forwardXferInfo<decltype(onProgress)>}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_NOPROGRESS, 0L}); //throw SysError

        for (const CurlOption& option : extraOptions)
            setCurlOption(easyHandle_, option); //throw SysError

        const CURLcode rc = ::curl_easy_perform(easyHandle_);

        if (socketError)
            throw* socketError;
        if (stopRequest)
            throw* stopRequest; //throw ThreadStopRequest

        if (rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rc), getErrorDetails(errorBuf, replyLines)));

        return replyLines;
    }

    //libcurl's error text plus the server's last reply line and its status meaning
    std::wstring getErrorDetails(const char* errorBuf, const std::string& replyLines)
    {
        std::wstring details = trimCpy(utfTo<std::wstring>(errorBuf));

        if (const std::vector<std::string_view> lines = splitFtpResponse(replyLines);
            !lines.empty())
            if (const std::string_view lastReply = trimCpy(lines.back());
                !lastReply.empty())
                details += (details.empty() ? L"" : L"\n") + utfTo<std::wstring>(lastReply);

        long ftpStatusCode = 0;
        if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode) == CURLE_OK &&
            400 <= ftpStatusCode && ftpStatusCode < 600)
            details += L'\n' + formatFtpStatus(static_cast<int>(ftpStatusCode));

        return details;
    }

    //FTP command on the control connection only, no data transfer
    std::string runQuoteCommand(const std::string& ftpCmd) //throw SysError
    {
        curl_slist* quote = ::curl_slist_append(nullptr, ftpCmd.c_str());
        if (!quote)
            throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        HVK_ON_SCOPE_EXIT(::curl_slist_free_all(quote));

        return perform(Zstr("/"), true /*isDir*/, CURLFTPMETHOD_NOCWD,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError, ThreadStopRequest
    }

    //"TYPE I" once per control connection: libcurl reconnects transparently => track the socket
    void ensureBinaryMode() //throw SysError
    {
        if (const std::optional<curl_socket_t> socket = getActiveSocket(); //throw SysError
            socket && *socket == binaryModeSocket_)
            return;

        runQuoteCommand("TYPE I"); //throw SysError

        const std::optional<curl_socket_t> socket = getActiveSocket(); //throw SysError
        if (!socket)
            throw SysError(L"Curl failed to cache FTP session.");
        binaryModeSocket_ = *socket;
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (!easyHandle_)
            return std::nullopt;

        curl_socket_t socket = CURL_SOCKET_BAD;
        if (const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &socket);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));

        if (socket == CURL_SOCKET_BAD)
            return std::nullopt;
        return socket;
    }

    //"ftp://server//enc%20oded/path[/]": "//" = absolute path, so that NOCWD/SINGLECWD skip the CWD to the login folder
    std::string getCurlUrl(const Zstring& serverPath, bool isDir) //throw SysError
    {
        if (trimCpy(login_.server).empty())
            throw SysError(_("Server name must not be empty."));

        std::string url = utfTo<std::string>(Zstring(ftpPrefix) + Zstr("//") + login_.server) + '/';

        split(utfTo<std::string>(serverPath), '/', [&](std::string_view comp)
        {
            if (comp.empty())
                return;

            char* compEnc = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
            if (!compEnc)
                throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', L"", L"Conversion failure"));
            HVK_ON_SCOPE_EXIT(::curl_free(compEnc));

            url += '/';
            url += compEnc;
        });

        if (isDir)
            url += '/'; //libcurl: directory URLs end with a slash
        return url;
    }

    const FtpLogin login_;
    const std::string usernameUtf8_;
    const std::string passwordUtf8_;
    CURL* easyHandle_ = nullptr;
    curl_socket_t binaryModeSocket_ = CURL_SOCKET_BAD;
};


class FtpSessionFactory : public SessionFactory
{
public:
    explicit FtpSessionFactory(const FtpLogin& login) : login_(login) {}

    std::unique_ptr<RemoteSession> createSession() override //throw FileError
    {
        auto session = std::make_unique<FtpSession>(login_);
        session->testConnection(); //throw FileError; libcurl connects and logs in on first use
        return session;
    }

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return getFtpDisplayPath(login_, itemPath); }

private:
    const FtpLogin login_;
};
}


void fhv::ftpInit()
{
    libcurlInit();
}


void fhv::ftpTeardown()
{
    libcurlTearDown();
}


std::wstring fhv::getFtpLibraryVersion()
{
    return getLibcurlVersion();
}


std::vector<std::string_view> fhv::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;
    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; }, [&](std::string_view line)
    {
        if (!line.empty()) //"\r\n" yields an empty part
            lines.push_back(line);
    });
    return lines;
}


std::optional<uint64_t> fhv::parseFtpSizeResponse(const std::string& buf) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);

    for (const std::string_view line : lines)
    {
        if (startsWith(line, "213 ")) //RFC 3659: "213 <size>"; libcurl tolerates text in between => size is the trailing number
        {
            const auto itSize = std::find_if_not(line.rbegin(), line.rend(), isDigit<char>).base();
            if (itSize != line.end())
                return stringTo<uint64_t>(makeStringView(itSize, line.end()));
            break;
        }

        //"5xy " => SIZE not supported for this item, e.g. "550 Could not get file size."
        if (line.size() >= 4 && line[0] == '5' && isDigit(line[1]) && isDigit(line[2]) && line[3] == ' ')
            return std::nullopt;
    }

    const int ftpStatusCode = !lines.empty() && lines.back().size() >= 3 ? stringTo<int>(lines.back().substr(0, 3)) : 0;

    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(buf) + L')' +
                   (ftpStatusCode != 0 ? L'\n' + formatFtpStatus(ftpStatusCode) : L""));
}


std::wstring fhv::formatFtpStatus(int sc)
{
    struct StatusText
    {
        int code;
        const wchar_t* text;
    };
    //codes a download client runs into; https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    static const StatusText statusTexts[] =
    {
        {213, L"File status."},
        {226, L"Closing data connection. Requested file action successful."},
        {421, L"Service not available, closing control connection."},
        {425, L"Cannot open data connection."},
        {426, L"Connection closed; transfer aborted."},
        {430, L"Invalid username or password."},
        {450, L"Requested file action not taken."},
        {451, L"Local error in processing."},
        {500, L"Syntax error, command unrecognized or command line too long."},
        {501, L"Syntax error in parameters or arguments."},
        {502, L"Command not implemented."},
        {503, L"Bad sequence of commands."},
        {530, L"User not logged in."},
        {534, L"Could not connect to server; issue regarding SSL."},
        {550, L"File unavailable, e.g. file not found, no access."},
    };

    const std::wstring prefix = L"FTP status " + numberTo<std::wstring>(sc);

    for (const StatusText& st : statusTexts)
        if (st.code == sc)
            return prefix + L": " + st.text;

    return prefix + L'.';
}


std::wstring fhv::getFtpDisplayPath(const FtpLogin& login, const Zstring& serverPath)
{
    Zstring displayPath = Zstring(ftpPrefix) + Zstr("//");

    if (!login.username.empty())
        displayPath += login.username + Zstr('@');

    displayPath += login.server;

    if (const int port = getEffectivePort(login);
        port != DEFAULT_PORT_FTP)
        displayPath += Zstr(':') + numberTo<Zstring>(port);

    if (serverPath != Zstr("/"))
        displayPath += serverPath;

    return utfTo<std::wstring>(displayPath);
}


std::unique_ptr<SessionFactory> fhv::createFtpSessionFactory(const FtpLogin& login)
{
    return std::make_unique<FtpSessionFactory>(login);
}


FtpLoginPhrase fhv::parseFtpLoginPhrase(const Zstring& phrase) //noexcept
{
    ZstringView rest = trimCpy(ZstringView(phrase));

    if (startsWithAsciiNoCase(rest, ftpPrefix))
        rest.remove_prefix(ftpPrefix.size());
    trim(rest, TrimSide::left, [](Zchar c) { return c == Zstr('/') || c == Zstr('\\'); });

    FtpLoginPhrase output;
    FtpLogin& login = output.login;

    //the password may contain '@', the server name can't
    const ZstringView credentials = beforeLast(rest, Zstr('@'), IfNotFoundReturn::none);
    const ZstringView location    =  afterLast(rest, Zstr('@'), IfNotFoundReturn::all);

    login.username = decodeFtpUsername(Zstring(beforeFirst(credentials, Zstr(':'), IfNotFoundReturn::all)));
    login.password = Zstring(afterFirst(credentials, Zstr(':'), IfNotFoundReturn::none));

    const ZstringView fullPath = beforeFirst(location, Zstr('|'), IfNotFoundReturn::all);
    const ZstringView options  =  afterFirst(location, Zstr('|'), IfNotFoundReturn::none);

    const size_t pathStart = std::min(fullPath.find_first_of(Zstr("/\\")), fullPath.size());
    const ZstringView serverPort = fullPath.substr(0, pathStart);
    output.basePath = sanitizeServerPath(fullPath.substr(pathStart));

    login.server  = trimCpy(Zstring(beforeLast(serverPort, Zstr(':'), IfNotFoundReturn::all)));
    login.portCfg = stringTo<int>(afterLast(serverPort, Zstr(':'), IfNotFoundReturn::none)); //0 if missing

    split(options, Zstr('|'), [&](ZstringView opt)
    {
        opt = trimCpy(opt);
        const ZstringView optValue = afterFirst(opt, Zstr('='), IfNotFoundReturn::none);

        if (startsWith(opt, Zstr("timeout=")))
            login.timeoutSec = std::max(1, stringTo<int>(optValue));
        else if (opt == Zstr("ssl"))
            login.useTls = true;
        else if (startsWith(opt, Zstr("pass64=")))
            login.password = utfTo<Zstring>(stringDecodeBase64(optValue));
        else if (opt == Zstr("pwprompt"))
            login.password = std::nullopt;
        //else: unknown option => ignore
    });
    return output;
}
