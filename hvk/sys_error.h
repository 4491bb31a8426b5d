// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef SYS_ERROR_H_3284791347018951324534
#define SYS_ERROR_H_3284791347018951324534

#include <cerrno>
#include "scope_guard.h" //
#include "i18n.h"        //commonly needed together with error reporting
#include "zstring.h"     //


namespace hvk
{
//low-level error: technical, untranslated details only (errno, libcurl, OpenSSL)
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};


using ErrorCode = int;

inline ErrorCode getLastError() { return errno; }

//"ENOENT: No such file or directory [open]"
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);


//read errno right away: any further system call may overwrite it
#define THROW_LAST_SYS_ERROR(functionName) \
    do { const hvk::ErrorCode ecLast = hvk::getLastError(); throw hvk::SysError(hvk::formatSystemError(functionName, ecLast)); } while (false)
}

#endif //SYS_ERROR_H_3284791347018951324534
