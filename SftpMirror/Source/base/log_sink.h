// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef LOG_SINK_H_8810293746501928
#define LOG_SINK_H_8810293746501928

#include <sfm/error_log.h>
#include <sfm/thread.h>


namespace mirror
{
//thread-safe; every message is also kept in memory to derive the final run status
class LogSink
{
public:
    virtual ~LogSink() {}

    void logMessage(const std::wstring& msg, sfm::MessageType type) //noexcept
    {
        log_.access([&](sfm::ErrorLog& log)
        {
            sfm::logMsg(log, msg, type);
            writeMessage(msg, type); //serialized by the lock
        });
    }

    void logInfo   (const std::wstring& msg) { logMessage(msg, sfm::MSG_TYPE_INFO); }
    void logWarning(const std::wstring& msg) { logMessage(msg, sfm::MSG_TYPE_WARNING); }
    void logError  (const std::wstring& msg) { logMessage(msg, sfm::MSG_TYPE_ERROR); }
    void logDebug  (const std::wstring& msg) { logMessage(msg, sfm::MSG_TYPE_DEBUG); }

    sfm::ErrorLog getLog() { return log_.access([](const sfm::ErrorLog& log) { return log; }); }

protected:
    LogSink() {}

private:
    LogSink           (const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    virtual void writeMessage(const std::wstring& msg, sfm::MessageType type) = 0; //noexcept

    sfm::Protected<sfm::ErrorLog> log_;
};


//memory only
class NullLogSink : public LogSink
{
private:
    void writeMessage(const std::wstring& msg, sfm::MessageType type) override {}
};


//system journal plus "[LEVEL] message" on stdout
class SyslogSink : public LogSink
{
public:
    SyslogSink(const char* ident /*must outlive SyslogSink*/, bool verbose);
    ~SyslogSink();

private:
    void writeMessage(const std::wstring& msg, sfm::MessageType type) override;

    const bool verbose_;
};

//journal and console show one line per message: FileError details go after the main text
std::string formatSingleLine(const std::wstring& msg);
}

#endif //LOG_SINK_H_8810293746501928
