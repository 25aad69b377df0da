// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <sfm/file_path.h>
#include <sfm/i18n.h>
#include <sfm/utf.h>

using namespace sfm;
using namespace mirror;


namespace
{
const char* optionJobs          = "--jobs";
const char* optionJobsShort     = "-j";
const char* optionAll           = "--all";
const char* optionAllShort      = "-a";
const char* optionPort          = "--port";
const char* optionPortShort     = "-p";
const char* optionTimeout       = "--timeout";
const char* optionMetricsSocket = "--metrics-socket";
const char* optionVerbose       = "--verbose";
const char* optionVerboseShort  = "-v";
const char* optionHelp          = "--help";
const char* optionHelpShort     = "-h";


bool isNumber(const Zstring& str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](Zchar c) { return isDigit(c); });
}


int parsePositiveInt(const Zstring& option, const Zstring& value) //throw ConfigError
{
    if (!isNumber(value) || value.size() > 9 || stringTo<int>(value) <= 0)
        throw ConfigError(replaceCpy(replaceCpy(_("Invalid value %y for option %x: a positive number is expected."),
                                                L"%x", utfTo<std::wstring>(option)),
                                     L"%y", L'"' + utfTo<std::wstring>(value) + L'"'));
    return stringTo<int>(value);
}
}


std::optional<MirrorConfig> mirror::parseCommandLine(const std::vector<Zstring>& args) //throw ConfigError
{
    MirrorConfig cfg;
    std::vector<Zstring> positionalArgs;

    auto isOption = [](const Zstring& arg) { return startsWith(arg, Zstr('-')) && arg != Zstr("-"); };

    for (auto it = args.begin(); it != args.end(); ++it)
    {
        if (!isOption(*it))
        {
            positionalArgs.push_back(*it);
            continue;
        }

        //"--option=value" and "--option value" are both fine
        Zstring option = *it;
        std::optional<Zstring> inlineValue;
        if (startsWith(option, Zstr("--")) && contains(option, Zstr('=')))
        {
            inlineValue = afterFirst(option, Zstr('='), IfNotFoundReturn::none);
            option      = beforeFirst(option, Zstr('='), IfNotFoundReturn::all);
        }

        auto getValue = [&]() -> Zstring //throw ConfigError
        {
            if (inlineValue)
                return *inlineValue;
            if (++it == args.end())
                throw ConfigError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
            return *it;
        };
        auto noValue = [&] //throw ConfigError
        {
            if (inlineValue)
                throw ConfigError(replaceCpy(_("Option %x does not take a value."), L"%x", utfTo<std::wstring>(option)));
        };

        if (option == optionHelp || option == optionHelpShort)
            return std::nullopt;
        else if (option == optionJobs || option == optionJobsShort)
            cfg.parallelJobs = parsePositiveInt(option, getValue()); //throw ConfigError
        else if (option == optionPort || option == optionPortShort)
        {
            cfg.port = parsePositiveInt(option, getValue()); //throw ConfigError
            if (cfg.port > 65535)
                throw ConfigError(replaceCpy(_("Invalid port number %x."), L"%x", numberTo<std::wstring>(cfg.port)));
        }
        else if (option == optionTimeout)
            cfg.networkTimeoutSec = parsePositiveInt(option, getValue()); //throw ConfigError
        else if (option == optionMetricsSocket)
        {
            cfg.metricsSocketPath = getValue(); //throw ConfigError
            if (cfg.metricsSocketPath.empty())
                throw ConfigError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
        }
        else if (option == optionAll || option == optionAllShort)
        {
            noValue(); //throw ConfigError
            cfg.forceAll = true;
        }
        else if (option == optionVerbose || option == optionVerboseShort)
        {
            noValue(); //throw ConfigError
            cfg.verbose = true;
        }
        else
            throw ConfigError(replaceCpy(_("Unknown option %x."), L"%x", utfTo<std::wstring>(option)));
    }

    if (positionalArgs.size() != 3)
        throw ConfigError(_P("Three arguments are expected: server, remote path and local path. Found 1 argument.",
                             "Three arguments are expected: server, remote path and local path. Found %x arguments.", positionalArgs.size()));

    cfg.server     = positionalArgs[0];
    cfg.remotePath = positionalArgs[1];
    cfg.localPath  = positionalArgs[2];

    if (trimCpy(cfg.server).empty())
        throw ConfigError(_("Server name must not be empty."));
    if (cfg.remotePath.empty())
        throw ConfigError(_("Remote path must not be empty."));
    if (cfg.localPath.empty())
        throw ConfigError(_("Local path must not be empty."));

    cfg.remotePath = removeTrailingSeparators(cfg.remotePath); //"/data/" => "/data", but "/" stays

    return cfg;
}


std::wstring mirror::getUsageText()
{
    return
        L"Usage: sftp_mirror <server> <remotePath> <localPath> [options]\n"
        L"\n"
        L"Mirror a remote SFTP directory into a local directory. Items whose size matches are skipped.\n"
        L"Credentials are read from the environment variables SFTP_USERNAME and SFTP_PASSWORD.\n"
        L"\n"
        L"Options:\n"
        L"  -j, --jobs N             Number of parallel download jobs (default: 3)\n"
        L"  -a, --all                Re-download all items without size comparison\n"
        L"  -p, --port N             SFTP server port (default: 22)\n"
        L"      --timeout SEC        Network inactivity time-out in seconds (default: 30)\n"
        L"      --metrics-socket P   Telegraf socket path (default: /run/telegraf/telegraf.sock)\n"
        L"  -v, --verbose            Log debug messages\n"
        L"  -h, --help               Show this help\n";
}


Credentials mirror::readCredentials(const std::function<std::optional<Zstring>(const Zstring& name)>& getEnvironmentVar) //throw ConfigError
{
    auto getRequiredVar = [&](const Zstring& name) //throw ConfigError
    {
        const std::optional<Zstring> value = getEnvironmentVar(name);
        if (!value || value->empty())
            throw ConfigError(utfTo<std::wstring>(name) + L" environment variable not set");
        return *value;
    };

    Credentials cred;
    cred.username = getRequiredVar(Zstr("SFTP_USERNAME")); //throw ConfigError
    cred.password = getRequiredVar(Zstr("SFTP_PASSWORD")); //
    return cred;
}
