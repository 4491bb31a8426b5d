// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef REMOTE_SESSION_H_48230957823049578234
#define REMOTE_SESSION_H_48230957823049578234

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <hvk/file_error.h>


namespace fhv
{
/*  one authenticated connection to the remote server:
    - owned by exactly one thread at a time (see SessionPool)
    - may die silently on the server side => testConnection() before reuse      */
class RemoteSession
{
public:
    virtual ~RemoteSession() {}

    //raw LIST output, one entry per line (empty lines removed)
    virtual std::vector<std::string> listDirectory(const Zstring& folderPath) = 0; //throw FileError

    //none if the server does not support SIZE (or not for this item)
    virtual std::optional<uint64_t> getFileSize(const Zstring& filePath) = 0; //throw FileError

    virtual void downloadFile(const Zstring& filePath, //throw FileError, X
                              const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) = 0;

    virtual void testConnection() = 0; //throw FileError

    //graceful shutdown; best effort
    virtual void close() = 0; //throw FileError

protected:
    RemoteSession() {}

private:
    RemoteSession           (const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;
};


class SessionFactory
{
public:
    virtual ~SessionFactory() {}

    //returns a connected session: login done + liveness verified
    virtual std::unique_ptr<RemoteSession> createSession() = 0; //throw FileError

    virtual std::wstring getDisplayPath(const Zstring& itemPath) const = 0;
};
}

#endif //REMOTE_SESSION_H_48230957823049578234
