// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef EXTRA_LOG_H_4419027365102847
#define EXTRA_LOG_H_4419027365102847

#include <functional>
#include <iostream>
#include "thread.h"
#include "utf.h"

/*  errors without a caller to report to:
    cleanup in destructors, failures while another exception is in flight  */

namespace sfm
{
namespace impl
{
using ExtraLogHandler = std::function<void(const std::wstring& msg)>;

inline Protected<ExtraLogHandler>& getExtraLogHandler()
{
    static Protected<ExtraLogHandler> handler;
    return handler;
}
}


//"onError" must not throw; runs under a lock: it must not call logExtraError() itself
inline
void setExtraLogHandler(const std::function<void(const std::wstring& msg)>& onError)
{
    impl::getExtraLogHandler().access([&](impl::ExtraLogHandler& handler) { handler = onError; });
}


//without a handler, the message goes to stderr
inline
void logExtraError(const std::wstring& msg) //noexcept
{
    impl::getExtraLogHandler().access([&](impl::ExtraLogHandler& handler)
    {
        if (handler)
            handler(msg);
        else
            std::cerr << utfTo<std::string>(msg) << '\n';
    });
}
}

#endif //EXTRA_LOG_H_4419027365102847
