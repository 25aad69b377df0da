// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef PERF_H_3302918475610294
#define PERF_H_3302918475610294

#include <chrono>


namespace sfm
{
//measures from construction; steady clock: NTP and DST adjustments do not count
class StopWatch
{
public:
    std::chrono::nanoseconds elapsed() const { return std::chrono::steady_clock::now() - startTime_; }

    double elapsedSec() const { return std::chrono::duration<double>(elapsed()).count(); }

private:
    const std::chrono::steady_clock::time_point startTime_ = std::chrono::steady_clock::now();
};
}

#endif //PERF_H_3302918475610294
