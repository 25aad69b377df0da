// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "init_libssh2.h"
#include <libssh2/libssh2_wrap.h>
#include <openssl/ssl.h>

using namespace sfm;
using namespace mirror;


Libssh2Initializer::Libssh2Initializer() //throw SysError
{
    //explicit init: libssh2 relies on OpenSSL's crypto, and its error strings end up in our messages
    if (::OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr) != 1)
        throw SysError(formatSystemError("OPENSSL_init_ssl", L"", L"Unexpected failure."));

    if (const int rc = ::libssh2_init(0);
        rc != 0)
        throw SysError(formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));
}


Libssh2Initializer::~Libssh2Initializer()
{
    ::libssh2_exit();
    //OpenSSL cleans up by itself at process exit
}
