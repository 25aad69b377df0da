// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef SFTP_H_8127364509182736
#define SFTP_H_8127364509182736

#include "abstract.h"


namespace mirror
{
const int DEFAULT_PORT_SFTP = 22;

struct SftpLogin
{
    Zstring server;
    int port = DEFAULT_PORT_SFTP;
    Zstring username;
    Zstring password;
    //other settings not specific to SFTP session:
    int timeoutSec = 30; //network inactivity; valid range: [1, inf)
};

//- sessions are created on demand and reused across threads
//- host keys are accepted without verification
//- requires a living Libssh2Initializer
std::unique_ptr<RemoteFileSystem> createSftpFileSystem(const SftpLogin& login);

}

#endif //SFTP_H_8127364509182736
