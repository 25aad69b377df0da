// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <iostream>
#include <csignal>
#include <sfm/extra_log.h>
#include <sfm/file_access.h>
#include <sfm/thread.h>
#include "afs/init_libssh2.h"
#include "afs/sftp.h"
#include "base/config.h"
#include "base/log_sink.h"
#include "base/metrics_sink.h"
#include "base/mirror_scheduler.h"
#include "base/return_codes.h"

using namespace sfm;
using namespace mirror;


namespace
{
//SIGINT/SIGTERM must be blocked in *all* threads: call before creating the first one
sigset_t blockTerminationSignals() //throw SysError
{
    sigset_t sigSet{};
    ::sigemptyset(&sigSet);
    ::sigaddset(&sigSet, SIGINT);
    ::sigaddset(&sigSet, SIGTERM);

    if (const int rv = ::pthread_sigmask(SIG_BLOCK, &sigSet, nullptr);
        rv != 0)
        throw SysError(formatSystemError("pthread_sigmask", static_cast<ErrorCode>(rv)));

    return sigSet;
}


//consumes termination requests synchronously: no async-signal-safety constraints
InterruptibleThread startSignalWatcher(const sigset_t& sigSet, LogSink& log, RunContext& ctx)
{
    return InterruptibleThread([sigSet, &log, &ctx]
    {
        setCurrentThreadName(Zstr("Signal watcher"));

        const timespec pollInterval{.tv_sec = 0, .tv_nsec = 100'000'000};
        for (;;)
        {
            interruptionPoint(); //throw ThreadStopRequest

            const int signum = ::sigtimedwait(&sigSet, nullptr, &pollInterval);
            if (signum < 0)
            {
                if (errno != EAGAIN && errno != EINTR)
                    log.logError(formatSystemError("sigtimedwait", getLastError()));
                continue;
            }

            ctx.requestCancel(); //graceful stop; the transfer in flight escalates after the grace period
            log.logWarning(L"Received signal " + numberTo<std::wstring>(signum) + L", stopping downloads...");
        }
    });
}


int runApplication(const MirrorConfig& cfg, const Credentials& cred, const sigset_t& sigSet)
{
    SyslogSink log("sftp_mirror", cfg.verbose);

    setExtraLogHandler([&log](const std::wstring& msg) { log.logError(msg); });
    SFM_ON_SCOPE_EXIT(setExtraLogHandler(nullptr));

    RunContext ctx;
    InterruptibleThread signalWatcher = startSignalWatcher(sigSet, log, ctx);

    bool fatalError = false;
    try
    {
        const Libssh2Initializer sshInit; //throw SysError

        createDirectoryIfMissingRecursion(cfg.localPath); //throw FileError

        SftpLogin login;
        login.server     = cfg.server;
        login.port       = cfg.port;
        login.username   = cred.username;
        login.password   = cred.password;
        login.timeoutSec = cfg.networkTimeoutSec;

        //destroy sessions before libssh2 shutdown
        const std::unique_ptr<RemoteFileSystem> sftpFs = createSftpFileSystem(login);

        TelegrafMetricsSink metrics(cfg.metricsSocketPath);

        runMirror(cfg, *sftpFs, metrics, log, ctx);
    }
    catch (const FileError& e) { fatalError = true; log.logError(L"Fatal error: " + e.toString()); }
    catch (const SysError&  e) { fatalError = true; log.logError(L"Fatal error: " + e.toString()); }
    catch (const std::exception& e) { fatalError = true; log.logError(L"Fatal error: " + utfTo<std::wstring>(std::string_view(e.what()))); }

    if (ctx.cancelRequested())
        log.logWarning(L"Mirror stopped by signal");

    const RunResult runResult = getRunResult(getStats(log.getLog()), ctx.cancelRequested());
    log.logDebug(getFinalStatusLabel(runResult));

    if (fatalError)
        return MIRROR_RC_FAILURE;

    return mapToReturnCode(runResult);
}
}


int main(int argc, char* argv[])
{
    sigset_t sigSet{};
    try
    {
        sigSet = blockTerminationSignals(); //throw SysError
    }
    catch (const SysError& e)
    {
        std::cerr << "Error: " << utfTo<std::string>(e.toString()) << std::endl;
        return MIRROR_RC_FAILURE;
    }

    std::optional<MirrorConfig> cfg;
    try
    {
        cfg = parseCommandLine(std::vector<Zstring>(argv + 1, argv + argc)); //throw ConfigError
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << utfTo<std::string>(e.toString()) << "\n\n" << utfTo<std::string>(getUsageText());
        return MIRROR_RC_FAILURE;
    }

    if (!cfg) //help requested
    {
        std::cout << utfTo<std::string>(getUsageText());
        return MIRROR_RC_SUCCESS;
    }

    Credentials cred;
    try
    {
        cred = readCredentials([](const Zstring& name) { return getEnvironmentVar(name); }); //throw ConfigError
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << utfTo<std::string>(e.toString()) << std::endl;
        return MIRROR_RC_FAILURE;
    }

    return runApplication(*cfg, cred, sigSet);
}
