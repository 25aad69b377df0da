// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef SYS_ERROR_H_1840276395018273
#define SYS_ERROR_H_1840276395018273

#include <cerrno>
#include "i18n.h"
#include "scope_guard.h"
#include "utf.h"
#include "zstring.h"


namespace sfm
{
using ErrorCode = int; //errno

inline ErrorCode getLastError() { return errno; } //errno is a macro: no "::"

//"ECONNRESET: Connection reset by peer [recv]"
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);

std::wstring getSystemErrorDescription(ErrorCode ec); //empty if unknown


//technical detail of a failed system or library call; not meant to be shown without context
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    virtual ~SysError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public sfm::SysError { X(const std::wstring& msg) : SysError(msg) {} };


//keeps errno: callers may react on ENOENT
class SysErrorCode : public SysError
{
public:
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


//macro: read errno before "throw" allocates and possibly changes it
#define THROW_LAST_SYS_ERROR(functionName) \
    do { const sfm::ErrorCode ecThrow = sfm::getLastError(); throw sfm::SysErrorCode(functionName, ecThrow); } while (false)


//throw SysError if "expr" is false or null
#define ASSERT_SYSERROR(expr) SFM_ASSERT_SYSERROR_IMPL(expr, #expr)
#define SFM_ASSERT_SYSERROR_IMPL(expr, exprStr) \
    do { if (!sfm::impl::checkTrue(expr)) throw sfm::SysError(L"Assertion failed: \"" L ## exprStr L"\""); } while (false)

namespace impl
{
inline bool checkTrue(bool b) { return b; }
inline bool checkTrue(const void* p) { return p != nullptr; }
bool checkTrue(int) = delete; //int is not a condition
}
}

#endif //SYS_ERROR_H_1840276395018273
