// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace sfm;


//visible in "top -H" and core dumps; names beyond 15 chars are cut by the kernel
void sfm::setCurrentThreadName(const Zstring& threadName)
{
    [[maybe_unused]] const int rv = ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0); //failure is harmless
}
