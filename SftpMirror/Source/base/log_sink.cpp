// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "log_sink.h"
#include <cassert>
#include <iostream>
#include <syslog.h>

using namespace sfm;
using namespace mirror;


namespace
{
int getSyslogPriority(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_DEBUG:
            return LOG_DEBUG;
        case MSG_TYPE_INFO:
            return LOG_INFO;
        case MSG_TYPE_WARNING:
            return LOG_WARNING;
        case MSG_TYPE_ERROR:
            return LOG_ERR;
    }
    assert(false);
    return LOG_ERR;
}


const char* getConsoleLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_DEBUG:
            return "DEBUG";
        case MSG_TYPE_INFO:
            return "INFO";
        case MSG_TYPE_WARNING:
            return "WARNING";
        case MSG_TYPE_ERROR:
            return "ERROR";
    }
    assert(false);
    return "ERROR";
}
}


std::string mirror::formatSingleLine(const std::wstring& msg)
{
    std::wstring line = trimCpy(msg);
    replace(line, L"\n\n", L' ');
    replace(line, L'\n', L' ');
    return utfTo<std::string>(line);
}


SyslogSink::SyslogSink(const char* ident, bool verbose) : verbose_(verbose)
{
    ::openlog(ident, LOG_PID, LOG_DAEMON);
}


SyslogSink::~SyslogSink()
{
    ::closelog();
}


void SyslogSink::writeMessage(const std::wstring& msg, MessageType type)
{
    if (type == MSG_TYPE_DEBUG && !verbose_)
        return;

    const std::string line = formatSingleLine(msg);

    ::syslog(getSyslogPriority(type), "%s", line.c_str());

    std::cout << '[' << getConsoleLabel(type) << "] " << line << std::endl; //flush: stdout is usually a pipe to the service manager
}
