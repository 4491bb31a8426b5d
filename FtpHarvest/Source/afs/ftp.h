// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include "remote_session.h"


namespace fhv
{
//call once on main thread:
void ftpInit();
void ftpTeardown();

std::wstring getFtpLibraryVersion(); //e.g. "libcurl/7.88.1 OpenSSL/3.0.11"

//-------------------------------------------------------

const int DEFAULT_PORT_FTP = 21; //TLS enabled? => same for explicit FTP, but *implicit* FTP uses port 990

struct FtpLogin
{
    Zstring server;
    int portCfg = 0; //use if > 0, DEFAULT_PORT_FTP otherwise
    Zstring username;
    std::optional<Zstring> password = Zstr(""); //none given => prompt before creating the first session
    bool useTls = false;
    int timeoutSec = 180;
};


struct FtpLoginPhrase
{
    FtpLogin login;
    Zstring basePath; //server-absolute: leading slash, no trailing slash
};

/* syntax: [ftp://][<user>[:<password>]@]<server>[:port][/<base-path>][|option_name=value]

   e.g. ftp://science-pds.cryosat.esa.int/SIR_SAR_L2
        ftp://user%40example.com@private.example.com:222/data|pass64=c2VjcmV0cGFzc3dvcmQ|ssl|timeout=60  */
FtpLoginPhrase parseFtpLoginPhrase(const Zstring& phrase); //noexcept

std::wstring getFtpDisplayPath(const FtpLogin& login, const Zstring& serverPath);

//sessions are created with the login as is => resolve "pwprompt" (password = none) before!
std::unique_ptr<SessionFactory> createFtpSessionFactory(const FtpLogin& login);

//-------------------------------------------------------
//server response parsing:

std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

//"213 <size>" => size; 5xx => none (SIZE not supported); anything else => error
std::optional<uint64_t> parseFtpSizeResponse(const std::string& buf); //throw SysError

std::wstring formatFtpStatus(int sc);
}

#endif //FTP_H_745895742383425326568678
