// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef SOCKET_H_7730198264510394
#define SOCKET_H_7730198264510394

#include <string_view>
#include "sys_error.h"
#include "zstring.h"


namespace sfm
{
using SocketType = int;
const SocketType invalidSocket = -1;


//owns a connected, blocking stream socket
class Socket
{
public:
    //TCP: first address of "server" that accepts within "timeoutSec"; Nagle disabled
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec); //throw SysError

    //AF_UNIX
    explicit Socket(const Zstring& socketPath); //throw SysError

    ~Socket();

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


void writeSocket(SocketType socket, std::string_view bytes); //throw SysError

//make pending and future I/O of *other* threads on this socket fail immediately; the descriptor stays valid
void shutdownSocketBoth(SocketType socket); //throw SysError

void setNonBlocking(SocketType socket, bool nonBlocking); //throw SysError
}

#endif //SOCKET_H_7730198264510394
