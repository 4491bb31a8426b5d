// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include <functional>
#include <string_view>
#include "file_access.h"


namespace hvk
{
//new file, written sequentially: call close() when done, otherwise the incomplete file is deleted by the destructor
class FileOutputPlain
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError; ERROR if existing
    ~FileOutputPlain();

    void write(const void* buffer, size_t bytesToWrite); //throw FileError
    void close(); //throw FileError

    const Zstring& getFilePath() const { return filePath_; }

private:
    FileOutputPlain           (const FileOutputPlain&) = delete;
    FileOutputPlain& operator=(const FileOutputPlain&) = delete;

    static constexpr int invalidFileHandle = -1;

    int fd_ = invalidFileHandle;
    const Zstring filePath_;
};


//"<filePath>.<8 random hex digits>.tmp"
Zstring getPathWithTempName(const Zstring& filePath); //throw FileError

using IoCallback = std::function<void(int64_t bytesDelta)>; //throw X

std::string getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//write to a temporary file first, then replace "filePath"
void setFileContent(const Zstring& filePath, std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X
}

#endif //FILE_IO_H_89578342758342572345
