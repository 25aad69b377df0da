// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "file_io.h"
#include <stdexcept>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "extra_log.h"

using namespace sfm;


FileBase::~FileBase()
{
    if (fd_ != -1)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    if (fd_ == -1)
        throw std::logic_error("FileBase::close() called twice for " + utfTo<std::string>(filePath_));

    //Linux releases the descriptor even if close() fails: never retry
    if (::close(std::exchange(fd_, -1)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "close");
}


namespace
{
int openFile(const Zstring& filePath, int flags, const std::wstring& errorMsg) //throw FileError
{
    const int fd = ::open(filePath.c_str(), flags | O_CLOEXEC, 0666 /*umask applies*/);
    if (fd == -1)
        THROW_LAST_FILE_ERROR(errorMsg, "open");
    return fd;
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) : //throw FileError
    FileBase(openFile(filePath, O_RDONLY, replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath))), filePath) {}


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0)
        throw std::logic_error("FileInputPlain::tryRead: zero bytes requested");

    ssize_t bytesRead = 0;
    do
        bytesRead = ::read(getFd(), buffer, bytesToRead);
    while (bytesRead < 0 && errno == EINTR);

    if (bytesRead < 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), "read");

    return static_cast<size_t>(bytesRead);
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath, WriteMode mode) : //throw FileError
    FileBase(openFile(filePath, O_WRONLY | O_CREAT | (mode == WriteMode::append ? O_APPEND : O_TRUNC),
                      replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath))), filePath) {}


uint64_t FileOutputPlain::getFileSize() //throw FileError
{
    struct stat fileInfo = {};
    if (::fstat(getFd(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getFilePath())), "fstat");

    return fileInfo.st_size;
}


void FileOutputPlain::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    const char* pos = static_cast<const char*>(buffer);
    const char* const posEnd = pos + bytesToWrite;

    while (pos != posEnd)
    {
        const ssize_t bytesWritten = ::write(getFd(), pos, posEnd - pos);
        if (bytesWritten < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), "write");
        }
        if (bytesWritten == 0) //no progress: treat like a full disk
            throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), formatSystemError("write", ENOSPC));

        pos += bytesWritten;
    }
}


std::string sfm::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string content;
    std::vector<char> buffer(FileBase::defaultBlockSize);

    while (const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size())) //throw FileError
        content.append(buffer.data(), bytesRead);

    fileIn.close(); //throw FileError
    return content;
}


void sfm::setFileContent(const Zstring& filePath, std::string_view content) //throw FileError
{
    FileOutputPlain fileOut(filePath, WriteMode::truncate); //throw FileError
    fileOut.write(content.data(), content.size()); //throw FileError
    fileOut.close(); //throw FileError
}
