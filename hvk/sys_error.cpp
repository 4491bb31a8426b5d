// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "sys_error.h"
#include <cstring>

using namespace hvk;


std::wstring hvk::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    const ErrorCode ecBefore = getLastError();
    HVK_ON_SCOPE_EXIT(errno = ecBefore); //formatting must not disturb the caller's errno

    const char* name = ::strerrorname_np(ec); //glibc 2.32: "ENOENT"; nullptr for unknown codes
    const std::wstring errorCode = name ? utfTo<std::wstring>(name) :
                                   replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));

    char buffer[256] = {};
    const char* description = ::strerror_r(ec, buffer, sizeof(buffer)); //GNU variant: may return a static string instead of "buffer"

    return formatSystemError(functionName, errorCode, description ? utfTo<std::wstring>(description) : std::wstring());
}


std::wstring hvk::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring msg = trimCpy(errorMsg);
    if (!msg.empty())
        output += (output.empty() ? L"" : L": ") + msg;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
