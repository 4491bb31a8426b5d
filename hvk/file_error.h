// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FILE_ERROR_H_839567308565656789
#define FILE_ERROR_H_839567308565656789

#include "sys_error.h"


namespace hvk
{
//failed operation on a local or remote item: message for the end user, optionally followed by technical details
class FileError
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};


//read errno right away: any further system call may overwrite it
#define THROW_LAST_FILE_ERROR(msg, functionName) \
    do { const hvk::ErrorCode ecLast = hvk::getLastError(); throw hvk::FileError(msg, hvk::formatSystemError(functionName, ecLast)); } while (false)


inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); }
}

#endif //FILE_ERROR_H_839567308565656789
