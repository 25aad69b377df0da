// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <map>
#include <gtest/gtest.h>
#include <sfm/string_tools.h>
#include <base/config.h>

using namespace sfm;
using namespace mirror;


namespace
{
std::wstring getConfigError(const std::vector<Zstring>& args)
{
    try
    {
        parseCommandLine(args);
    }
    catch (const ConfigError& e) { return e.toString(); }
    return std::wstring();
}
}


TEST(CommandLine, Defaults)
{
    const std::optional<MirrorConfig> cfg = parseCommandLine({"sftp.example.com", "/data/", "/srv/mirror"});
    ASSERT_TRUE(cfg);

    EXPECT_EQ(cfg->server, "sftp.example.com");
    EXPECT_EQ(cfg->remotePath, "/data");
    EXPECT_EQ(cfg->localPath, "/srv/mirror");
    EXPECT_EQ(cfg->parallelJobs, 3u);
    EXPECT_FALSE(cfg->forceAll);
    EXPECT_EQ(cfg->port, 22);
    EXPECT_EQ(cfg->networkTimeoutSec, 30);
    EXPECT_EQ(cfg->metricsSocketPath, "/run/telegraf/telegraf.sock");
    EXPECT_FALSE(cfg->verbose);

    EXPECT_EQ(cfg->timeouts.listing,          std::chrono::seconds(300));
    EXPECT_EQ(cfg->timeouts.remoteSize,       std::chrono::seconds(300));
    EXPECT_EQ(cfg->timeouts.fileSizeFallback, std::chrono::seconds(60));
    EXPECT_EQ(cfg->timeouts.fileFetch,        std::chrono::seconds(3600));
    EXPECT_EQ(cfg->timeouts.folderFetch,      std::chrono::seconds(7200));
}


TEST(CommandLine, AllOptions)
{
    const std::optional<MirrorConfig> cfg = parseCommandLine({"-j", "8", "host", "--all", "/remote", "--port=2222",
                                                              "/local", "--timeout", "45", "--metrics-socket", "/tmp/t.sock", "-v"});
    ASSERT_TRUE(cfg);

    EXPECT_EQ(cfg->server, "host");
    EXPECT_EQ(cfg->remotePath, "/remote");
    EXPECT_EQ(cfg->localPath, "/local");
    EXPECT_EQ(cfg->parallelJobs, 8u);
    EXPECT_TRUE(cfg->forceAll);
    EXPECT_EQ(cfg->port, 2222);
    EXPECT_EQ(cfg->networkTimeoutSec, 45);
    EXPECT_EQ(cfg->metricsSocketPath, "/tmp/t.sock");
    EXPECT_TRUE(cfg->verbose);
}


TEST(CommandLine, LongAndShortFormsAgree)
{
    const std::optional<MirrorConfig> cfgLong  = parseCommandLine({"h", "/r", "/l", "--jobs", "5", "--all", "--port", "23", "--verbose"});
    const std::optional<MirrorConfig> cfgShort = parseCommandLine({"h", "/r", "/l", "-j", "5", "-a", "-p", "23", "-v"});
    ASSERT_TRUE(cfgLong && cfgShort);

    EXPECT_EQ(cfgLong->parallelJobs, cfgShort->parallelJobs);
    EXPECT_EQ(cfgLong->forceAll, cfgShort->forceAll);
    EXPECT_EQ(cfgLong->port, cfgShort->port);
    EXPECT_EQ(cfgLong->verbose, cfgShort->verbose);
}


TEST(CommandLine, RootRemotePathIsKept)
{
    const std::optional<MirrorConfig> cfg = parseCommandLine({"host", "/", "/local"});
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->remotePath, "/");
}


TEST(CommandLine, HelpWinsOverEverythingElse)
{
    EXPECT_FALSE(parseCommandLine({"--help"}));
    EXPECT_FALSE(parseCommandLine({"host", "-h"}));
    EXPECT_FALSE(getUsageText().empty());
}


TEST(CommandLine, InvalidArguments)
{
    EXPECT_TRUE(contains(getConfigError({"host", "/remote"}), L"Found 2 arguments"));
    EXPECT_TRUE(contains(getConfigError({"host", "/r", "/l", "extra"}), L"Found 4 arguments"));
    EXPECT_TRUE(contains(getConfigError({}), L"Found 0 arguments"));

    EXPECT_EQ(getConfigError({"host", "/r", "/l", "--bogus"}), L"Unknown option --bogus.");
    EXPECT_EQ(getConfigError({"host", "/r", "/l", "--jobs"}), L"A value is expected after --jobs.");
    EXPECT_EQ(getConfigError({"host", "/r", "/l", "-j", "0"}), L"Invalid value \"0\" for option -j: a positive number is expected.");
    EXPECT_EQ(getConfigError({"host", "/r", "/l", "--jobs=abc"}), L"Invalid value \"abc\" for option --jobs: a positive number is expected.");
    EXPECT_EQ(getConfigError({"host", "/r", "/l", "--all=yes"}), L"Option --all does not take a value.");
    EXPECT_EQ(getConfigError({"host", "/r", "/l", "-p", "70000"}), L"Invalid port number 70000.");

    EXPECT_EQ(getConfigError({" ", "/r", "/l"}), L"Server name must not be empty.");
    EXPECT_EQ(getConfigError({"host", "", "/l"}), L"Remote path must not be empty.");
    EXPECT_EQ(getConfigError({"host", "/r", ""}), L"Local path must not be empty.");
}


TEST(CommandLine, DashIsPositional)
{
    const std::optional<MirrorConfig> cfg = parseCommandLine({"host", "/r", "-"});
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->localPath, "-");
}


TEST(Credentials, ReadFromEnvironment)
{
    const std::map<Zstring, Zstring> env{{"SFTP_USERNAME", "alice"}, {"SFTP_PASSWORD", "s3cret"}};

    const Credentials cred = readCredentials([&](const Zstring& name) -> std::optional<Zstring>
    {
        if (auto it = env.find(name); it != env.end())
            return it->second;
        return std::nullopt;
    });
    EXPECT_EQ(cred.username, "alice");
    EXPECT_EQ(cred.password, "s3cret");
}


TEST(Credentials, MissingOrEmptyIsAnError)
{
    auto getError = [](const std::map<Zstring, Zstring>& env)
    {
        try
        {
            readCredentials([&](const Zstring& name) -> std::optional<Zstring>
            {
                if (auto it = env.find(name); it != env.end())
                    return it->second;
                return std::nullopt;
            });
        }
        catch (const ConfigError& e) { return e.toString(); }
        return std::wstring();
    };

    EXPECT_EQ(getError({{"SFTP_PASSWORD", "pw"}}), L"SFTP_USERNAME environment variable not set");
    EXPECT_EQ(getError({{"SFTP_USERNAME", "bob"}}), L"SFTP_PASSWORD environment variable not set");
    EXPECT_EQ(getError({{"SFTP_USERNAME", "bob"}, {"SFTP_PASSWORD", ""}}), L"SFTP_PASSWORD environment variable not set");
}
