// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_IO_H_5810239476510384
#define FILE_IO_H_5810239476510384

#include "file_access.h"


namespace sfm
{
//unbuffered sequential file access on a POSIX file descriptor
class FileBase
{
public:
    static constexpr size_t defaultBlockSize = 256 * 1024;

    const Zstring& getFilePath() const { return filePath_; }

    //explicit close() reports errors; ~FileBase() can only log them
    void close(); //throw FileError

protected:
    FileBase(int fd, const Zstring& filePath) : fd_(fd), filePath_(filePath) {}
    ~FileBase();

    int getFd() const { return fd_; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    int fd_ = -1;
    const Zstring filePath_;
};


class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //0 means EOF, anything else may be short; bytesToRead > 0
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


enum class WriteMode
{
    truncate, //start from scratch
    append,   //continue an incomplete copy
};

//content written so far stays on disk even without close(): a later run resumes from it
class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const Zstring& filePath, WriteMode mode); //throw FileError

    uint64_t getFileSize(); //throw FileError

    void write(const void* buffer, size_t bytesToWrite); //throw FileError
};


std::string getFileContent(const Zstring& filePath); //throw FileError
void setFileContent(const Zstring& filePath, std::string_view content); //throw FileError
}

#endif //FILE_IO_H_5810239476510384
