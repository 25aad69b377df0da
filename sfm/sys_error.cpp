// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerror_r, strerrorname_np
#include <vector>

using namespace sfm;


namespace
{
//"ENOENT" rather than a bare number: glibc knows the names of all its codes
std::wstring getErrorCodeName(ErrorCode ec)
{
    if (const char* name = ::strerrorname_np(ec))
        return utfTo<std::wstring>(std::string_view(name));

    return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
}
}


std::wstring sfm::getSystemErrorDescription(ErrorCode ec)
{
    const ErrorCode ecBackup = getLastError(); //caller might still need it
    SFM_ON_SCOPE_EXIT(errno = ecBackup);

    char buffer[512] = {};
    const char* description = ::strerror_r(ec, buffer, sizeof(buffer)); //GNU variant: may ignore "buffer"
    if (!description)
        return std::wstring();

    return trimCpy(utfTo<std::wstring>(std::string_view(description)));
}


std::wstring sfm::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, getErrorCodeName(ec), getSystemErrorDescription(ec));
}


//"ENOENT: No such file or directory [open]"
std::wstring sfm::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::vector<std::wstring> parts;
    for (const std::wstring& part : {trimCpy(errorCode), trimCpy(errorMsg)})
        if (!part.empty())
            parts.push_back(part);

    std::wstring output;
    for (const std::wstring& part : parts)
        output += (output.empty() ? L"" : L": ") + part;

    if (!functionName.empty())
        output += (output.empty() ? L"[" : L" [") + utfTo<std::wstring>(functionName) + L']';

    return output;
}
