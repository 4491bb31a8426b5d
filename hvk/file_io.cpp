// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "file_io.h"
#include <fcntl.h>
#include <unistd.h>
#include "extra_log.h"

using namespace hvk;


namespace
{
const size_t ioBlockSize = 256 * 1024;
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath) : filePath_(filePath) //throw FileError
{
    fd_ = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666 /*umask applies*/);
    if (fd_ == invalidFileHandle)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open");
}


FileOutputPlain::~FileOutputPlain()
{
    if (fd_ == invalidFileHandle)
        return;

    ::close(fd_); //file is deleted anyway
    if (::unlink(filePath_.c_str()) != 0)
        logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath_)) + L"\n\n" +
                      formatSystemError("unlink", getLastError()));
}


void FileOutputPlain::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    const char* data = static_cast<const char*>(buffer);

    while (bytesToWrite > 0)
    {
        const ssize_t bytesWritten = ::write(fd_, data, bytesToWrite); //may return short
        if (bytesWritten < 0 && errno == EINTR)
            continue;

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //buggy drivers: no progress and no error
                errno = ENOSPC;
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "write");
        }
        data         += bytesWritten;
        bytesToWrite -= bytesWritten;
    }
}


void FileOutputPlain::close() //throw FileError
{
    if (::close(std::exchange(fd_, invalidFileHandle)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "close");
}


Zstring hvk::getPathWithTempName(const Zstring& filePath) //throw FileError
{
    uint32_t rnd = 0;
    if (::getentropy(&rnd, sizeof(rnd)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "getentropy");

    return filePath + Zstr('.') + printNumber<Zstring>(Zstr("%08x"), static_cast<unsigned int>(rnd)) + Zstr(".tmp");
}


std::string hvk::getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath));

    const int fd = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), "open");
    HVK_ON_SCOPE_EXIT(::close(fd));

    std::string output;
    for (;;)
    {
        const size_t offset = output.size();
        output.resize(offset + ioBlockSize);

        const ssize_t bytesRead = ::read(fd, output.data() + offset, ioBlockSize);
        if (bytesRead < 0 && errno == EINTR)
        {
            output.resize(offset);
            continue;
        }
        if (bytesRead < 0)
            THROW_LAST_FILE_ERROR(errorMsg, "read");

        output.resize(offset + bytesRead);
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X

        if (bytesRead == 0)
            return output;
    }
}


void hvk::setFileContent(const Zstring& filePath, std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const Zstring tempPath = getPathWithTempName(filePath); //throw FileError
    {
        FileOutputPlain tempFile(tempPath); //throw FileError

        for (size_t offset = 0; offset < bytes.size(); offset += ioBlockSize)
        {
            const size_t blockSize = std::min(bytes.size() - offset, ioBlockSize);
            tempFile.write(bytes.data() + offset, blockSize); //throw FileError
            if (notifyUnbufferedIO) notifyUnbufferedIO(blockSize); //throw X
        }
        tempFile.close(); //throw FileError
    }
    HVK_ON_SCOPE_FAIL(try { removeFilePlain(tempPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    moveAndRenameItem(tempPath, filePath); //throw FileError
}
