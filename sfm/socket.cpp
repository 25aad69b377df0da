// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "socket.h"
#include <optional>
#include "i18n.h"
#include "scope_guard.h"
#include "string_tools.h"
#include "utf.h"
#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <netinet/tcp.h> //TCP_NODELAY
#include <netdb.h>
#include <poll.h>

using namespace sfm;


namespace
{
std::wstring getGaiErrorName(int rcGai)
{
    struct GaiName
    {
        int code;
        const wchar_t* name;
    };
    static const GaiName names[] =
    {
        {EAI_ADDRFAMILY, L"EAI_ADDRFAMILY"},
        {EAI_AGAIN,      L"EAI_AGAIN"},
        {EAI_BADFLAGS,   L"EAI_BADFLAGS"},
        {EAI_FAIL,       L"EAI_FAIL"},
        {EAI_FAMILY,     L"EAI_FAMILY"},
        {EAI_MEMORY,     L"EAI_MEMORY"},
        {EAI_NODATA,     L"EAI_NODATA"},
        {EAI_NONAME,     L"EAI_NONAME"},
        {EAI_SERVICE,    L"EAI_SERVICE"},
        {EAI_SOCKTYPE,   L"EAI_SOCKTYPE"},
        {EAI_SYSTEM,     L"EAI_SYSTEM"},
        {EAI_OVERFLOW,   L"EAI_OVERFLOW"},
    };
    for (const GaiName& gn : names)
        if (gn.code == rcGai)
            return gn.name;
    return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(rcGai));
}


[[noreturn]] void throwGaiError(int rcGai) //throw SysError
{
    if (rcGai == EAI_SYSTEM) //details are in errno
        THROW_LAST_SYS_ERROR("getaddrinfo");

    throw SysError(formatSystemError("getaddrinfo", getGaiErrorName(rcGai), utfTo<std::wstring>(std::string_view(::gai_strerror(rcGai)))));
}


//non-blocking connect() bounded by "timeoutSec"
void connectWithTimeout(SocketType sock, const addrinfo& ai, int timeoutSec) //throw SysError
{
    if (::connect(sock, ai.ai_addr, ai.ai_addrlen) == 0)
        return;

    if (errno != EINPROGRESS)
        THROW_LAST_SYS_ERROR("connect");

    pollfd pfd{.fd = sock, .events = POLLOUT};
    int rv = 0;
    do
        rv = ::poll(&pfd, 1, timeoutSec * 1000);
    while (rv < 0 && errno == EINTR);

    if (rv < 0)
        THROW_LAST_SYS_ERROR("poll");
    if (rv == 0)
        throw SysError(formatSystemError("connect, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));

    int connectError = 0;
    socklen_t optLen = sizeof(connectError);
    if (::getsockopt(sock, SOL_SOCKET, SO_ERROR, &connectError, &optLen) != 0)
        THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

    if (connectError != 0)
        throw SysError(formatSystemError("connect, SO_ERROR", connectError));
}


SocketType openTcpConnection(const addrinfo& ai, int timeoutSec) //throw SysError
{
    const SocketType sock = ::socket(ai.ai_family, ai.ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai.ai_protocol);
    if (sock == invalidSocket)
        THROW_LAST_SYS_ERROR("socket");
    SFM_ON_SCOPE_FAIL(::close(sock));

    connectWithTimeout(sock, ai, timeoutSec); //throw SysError
    setNonBlocking(sock, false);              //

    const int noDelay = 1;
    if (::setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

    return sock;
}
}


Socket::Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError
{
    if (trimCpy(server).empty())
        throw SysError(_("Server name must not be empty."));

    addrinfo hints{};
    hints.ai_flags    = AI_ADDRCONFIG; //no AAAA lookup on IPv4-only hosts
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addrList = nullptr;
    if (const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &addrList);
        rcGai != 0)
        throwGaiError(rcGai);
    SFM_ON_SCOPE_EXIT(::freeaddrinfo(addrList));

    if (!addrList)
        throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

    //e.g. IPv6 and IPv4 address: first one to connect wins, first error is reported
    std::optional<SysError> firstError;
    for (const addrinfo* ai = addrList; ai; ai = ai->ai_next)
        try
        {
            socket_ = openTcpConnection(*ai, timeoutSec); //throw SysError
            return;
        }
        catch (const SysError& e)
        {
            if (!firstError)
                firstError = e;
        }

    throw *firstError;
}


Socket::Socket(const Zstring& socketPath) //throw SysError
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socketPath.empty() || socketPath.size() >= sizeof(addr.sun_path))
        throw SysError(formatSystemError("connect", L"", replaceCpy<std::wstring>(L"Invalid socket path %x.", L"%x", utfTo<std::wstring>(socketPath))));
    socketPath.copy(addr.sun_path, socketPath.size());

    const SocketType sock = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock == invalidSocket)
        THROW_LAST_SYS_ERROR("socket");
    SFM_ON_SCOPE_FAIL(::close(sock));

    int rv = 0;
    do
        rv = ::connect(sock, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    while (rv != 0 && errno == EINTR);

    if (rv != 0)
        THROW_LAST_SYS_ERROR("connect");

    socket_ = sock;
}


Socket::~Socket() { ::close(socket_); }


void sfm::writeSocket(SocketType socket, std::string_view bytes) //throw SysError
{
    while (!bytes.empty())
    {
        const ssize_t bytesSent = ::send(socket, bytes.data(), bytes.size(), MSG_NOSIGNAL); //peer gone: EPIPE instead of SIGPIPE
        if (bytesSent < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_SYS_ERROR("send");
        }
        if (bytesSent == 0)
            throw SysError(formatSystemError("send", L"", L"Zero bytes processed."));

        ASSERT_SYSERROR(static_cast<size_t>(bytesSent) <= bytes.size());
        bytes.remove_prefix(bytesSent);
    }
}


void sfm::shutdownSocketBoth(SocketType socket) //throw SysError
{
    if (::shutdown(socket, SHUT_RDWR) != 0)
        THROW_LAST_SYS_ERROR("shutdown");
}


void sfm::setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    const int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    const int flagsNew = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (flagsNew != flags && ::fcntl(socket, F_SETFL, flagsNew) != 0)
        THROW_LAST_SYS_ERROR("fcntl(F_SETFL)");
}
