// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_ERROR_H_3095718263401928
#define FILE_ERROR_H_3095718263401928

#include "sys_error.h"


namespace sfm
{
//user-facing failure of a file or folder operation: "msg" names the item, "details" the system cause
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


//errno is read first: constructing the message may change it
#define THROW_LAST_FILE_ERROR(msg, functionName) \
    do { const sfm::ErrorCode ecFile = sfm::getLastError(); throw sfm::FileError(msg, sfm::formatSystemError(functionName, ecFile)); } while (false)


inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
}

#endif //FILE_ERROR_H_3095718263401928
