// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef ERROR_LOG_H_2291047583610294
#define ERROR_LOG_H_2291047583610294

#include <ctime>
#include <vector>
#include "utf.h"


namespace sfm
{
enum MessageType
{
    MSG_TYPE_DEBUG   = 0x1,
    MSG_TYPE_INFO    = 0x2,
    MSG_TYPE_WARNING = 0x4,
    MSG_TYPE_ERROR   = 0x8,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;


inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


struct ErrorLogStats
{
    int debug   = 0;
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
    {
        int& count = entry.type == MSG_TYPE_DEBUG   ? stats.debug   :
                     entry.type == MSG_TYPE_INFO    ? stats.info    :
                     entry.type == MSG_TYPE_WARNING ? stats.warning : stats.error;
        ++count;
    }
    return stats;
}
}

#endif //ERROR_LOG_H_2291047583610294
