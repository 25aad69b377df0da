// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef LIBSSH2_WRAP_H_4028173659102847
#define LIBSSH2_WRAP_H_4028173659102847

#include <iterator>
#include <string>
#include <sfm/string_tools.h>
//-------------------------------------------------
#include <libssh2_sftp.h>
//-------------------------------------------------

#ifndef LIBSSH2_SFTP_H
    #error libssh2_sftp.h header guard changed
#endif

/*  libssh2 helpers taking std::string:
    the library's convenience macros use strlen() and cannot carry embedded sizes  */

namespace sfm
{
inline unsigned int sshLen(const std::string& str) { return static_cast<unsigned int>(str.size()); }


inline char* sshUserAuthList(LIBSSH2_SESSION* session, const std::string& username)
{
    return ::libssh2_userauth_list(session, username.c_str(), sshLen(username));
}


inline int sshUserAuthPassword(LIBSSH2_SESSION* session, const std::string& username, const std::string& password)
{
    return ::libssh2_userauth_password_ex(session, username.c_str(), sshLen(username),
                                          password.c_str(), sshLen(password), nullptr /*passwd_change_cb*/);
}


inline int sshUserAuthKeyboardInteractive(LIBSSH2_SESSION* session, const std::string& username,
                                          LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC((*responseCallback)))
{
    return ::libssh2_userauth_keyboard_interactive_ex(session, username.c_str(), sshLen(username), responseCallback);
}


inline LIBSSH2_SFTP_HANDLE* sftpOpenFile(LIBSSH2_SFTP* sftp, const std::string& path)
{
    return ::libssh2_sftp_open_ex(sftp, path.c_str(), sshLen(path), LIBSSH2_FXF_READ, 0 /*mode*/, LIBSSH2_SFTP_OPENFILE);
}


inline LIBSSH2_SFTP_HANDLE* sftpOpenFolder(LIBSSH2_SFTP* sftp, const std::string& path)
{
    return ::libssh2_sftp_open_ex(sftp, path.c_str(), sshLen(path), 0 /*flags*/, 0 /*mode*/, LIBSSH2_SFTP_OPENDIR);
}


//follows symlinks
inline int sftpStat(LIBSSH2_SFTP* sftp, const std::string& path, LIBSSH2_SFTP_ATTRIBUTES& attribs)
{
    return ::libssh2_sftp_stat_ex(sftp, path.c_str(), sshLen(path), LIBSSH2_SFTP_STAT, &attribs);
}

//------------------------------------------------------------------------------------------

struct SshCodeName
{
    long code;
    const wchar_t* name;
};

#define SFM_SSH_CODE_NAME(code) SshCodeName{code, SFM_SSH_WIDEN(#code)}
#define SFM_SSH_WIDEN(str) L ## str

inline
std::wstring findCodeName(const SshCodeName* first, const SshCodeName* last, long code, const wchar_t* fallbackPrefix)
{
    for (const SshCodeName* it = first; it != last; ++it)
        if (it->code == code)
            return it->name;
    return fallbackPrefix + numberTo<std::wstring>(code);
}


inline
std::wstring formatSshStatusCode(int sc)
{
    static const SshCodeName names[] =
    {
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_NONE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SOCKET_NONE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_BANNER_RECV),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_BANNER_SEND),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_INVALID_MAC),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_KEX_FAILURE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_ALLOC),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SOCKET_SEND),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_TIMEOUT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_HOSTKEY_INIT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_HOSTKEY_SIGN),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_DECRYPT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SOCKET_DISCONNECT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_PROTO),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_PASSWORD_EXPIRED),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_METHOD_NONE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_AUTHENTICATION_FAILED),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_CHANNEL_FAILURE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_CHANNEL_CLOSED),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SOCKET_TIMEOUT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SFTP_PROTOCOL),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_REQUEST_DENIED),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_METHOD_NOT_SUPPORTED),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_INVAL),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_EAGAIN),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_BAD_USE),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_SOCKET_RECV),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_ENCRYPT),
        SFM_SSH_CODE_NAME(LIBSSH2_ERROR_BAD_SOCKET),
    };
    return findCodeName(std::begin(names), std::end(names), sc, L"SSH status ");
}


inline
std::wstring formatSftpStatusCode(unsigned long sc)
{
    static const SshCodeName names[] =
    {
        SFM_SSH_CODE_NAME(LIBSSH2_FX_OK),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_EOF),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NO_SUCH_FILE),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_PERMISSION_DENIED),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_FAILURE),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_BAD_MESSAGE),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NO_CONNECTION),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_CONNECTION_LOST),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_OP_UNSUPPORTED),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_INVALID_HANDLE),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NO_SUCH_PATH),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_FILE_ALREADY_EXISTS),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_WRITE_PROTECT),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NO_MEDIA),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_QUOTA_EXCEEDED),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_LOCK_CONFLICT),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_DIR_NOT_EMPTY),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_NOT_A_DIRECTORY),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_INVALID_FILENAME),
        SFM_SSH_CODE_NAME(LIBSSH2_FX_LINK_LOOP),
    };
    return findCodeName(std::begin(names), std::end(names), static_cast<long>(sc), L"SFTP status ");
}

#undef SFM_SSH_CODE_NAME
#undef SFM_SSH_WIDEN
}

#else
#error libssh2_wrap.h included twice: include it from .cpp files only
#endif //LIBSSH2_WRAP_H_4028173659102847
