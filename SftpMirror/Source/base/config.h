// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef CONFIG_H_4410293857610293
#define CONFIG_H_4410293857610293

#include <chrono>
#include <functional>
#include <optional>
#include <vector>
#include <sfm/zstring.h>


namespace mirror
{
//invalid command line or environment: reported before any remote contact
class ConfigError
{
public:
    explicit ConfigError(const std::wstring& msg) : msg_(msg) {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};


struct MirrorTimeouts
{
    std::chrono::seconds listing         {300};
    std::chrono::seconds remoteSize      {300};
    std::chrono::seconds fileSizeFallback {60};
    std::chrono::seconds fileFetch      {3600};
    std::chrono::seconds folderFetch    {7200};
    std::chrono::seconds gracePeriod       {5}; //graceful stop => forced stop
};


struct MirrorConfig
{
    Zstring server;
    Zstring remotePath; //no trailing slash, except for root "/"
    Zstring localPath;
    size_t parallelJobs = 3; //fan-out within one folder transfer
    bool forceAll = false;   //no size comparison
    int port = 22;
    int networkTimeoutSec = 30;
    Zstring metricsSocketPath = Zstr("/run/telegraf/telegraf.sock");
    bool verbose = false;

    MirrorTimeouts timeouts; //not configurable from the command line
};


//args: without program name; no value if help was requested
std::optional<MirrorConfig> parseCommandLine(const std::vector<Zstring>& args); //throw ConfigError

std::wstring getUsageText();


struct Credentials
{
    Zstring username;
    Zstring password;
};

//SFTP_USERNAME, SFTP_PASSWORD: missing or empty is an error
Credentials readCredentials(const std::function<std::optional<Zstring>(const Zstring& name)>& getEnvironmentVar); //throw ConfigError
}

#endif //CONFIG_H_4410293857610293
