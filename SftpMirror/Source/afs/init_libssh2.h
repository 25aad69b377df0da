// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef INIT_LIBSSH2_H_6109283746501928
#define INIT_LIBSSH2_H_6109283746501928

#include <sfm/sys_error.h>


namespace mirror
{
//SFTP initialization/shutdown: create one instance on the main thread *before* the first SSH session
//and destroy it only after all sessions are gone
class Libssh2Initializer
{
public:
    Libssh2Initializer(); //throw SysError
    ~Libssh2Initializer();

private:
    Libssh2Initializer           (const Libssh2Initializer&) = delete;
    Libssh2Initializer& operator=(const Libssh2Initializer&) = delete;
};
}

#endif //INIT_LIBSSH2_H_6109283746501928
