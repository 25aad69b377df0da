// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "mirror_scheduler.h"
#include <algorithm>
#include <functional>
#include <sfm/file_path.h>
#include "diff_decider.h"
#include "transfer_executor.h"
#include "../afs/native.h"

using namespace sfm;
using namespace mirror;


namespace
{
const char* MEASUREMENT_DOWNLOAD = "sftp_mirror_download";
const char* MEASUREMENT_SUMMARY  = "sftp_mirror_summary";


std::wstring formatDuration(double durationSec)
{
    return printNumber<std::wstring>(L"%.2f", durationSec) + L's';
}


class MirrorRun
{
public:
    MirrorRun(const MirrorConfig& cfg, RemoteFileSystem& fs, MetricsSink& metrics, LogSink& log, RunContext& ctx) :
        cfg_(cfg),
        metrics_(metrics),
        log_(log),
        ctx_(ctx),
        remote_(fs, cfg.remotePath, cfg.timeouts, log, ctx),
        decider_(remote_, cfg.localPath, cfg.forceAll, log),
        executor_(remote_, cfg.timeouts, log, ctx) {}

    RunSummary run()
    {
        log_.logInfo(L"Starting mirror: " + utfTo<std::wstring>(cfg_.server + cfg_.remotePath) + L" -> " + utfTo<std::wstring>(cfg_.localPath));

        RemoteListing listing = remote_.listRootFolder();

        log_.logInfo(L"Found " + numberTo<std::wstring>(listing.files.size()) + L" files and " +
                     numberTo<std::wstring>(listing.folders.size()) + L" directories");

        //date-stamped folder names: most recent data first, in case the run gets interrupted
        std::sort(listing.folders.begin(), listing.folders.end(), std::greater<>());

        [&]
        {
            for (const Zstring& folderName : listing.folders)
            {
                if (stopRequested())
                    return;
                processFolder(folderName);
            }

            for (const Zstring& fileName : listing.files)
            {
                if (stopRequested())
                    return;
                processFile(fileName);
            }
        }();

        const RunSummary summary = stats_.getSummary();

        log_.logInfo(formatSummaryLine(summary));

        sendMetric(MEASUREMENT_SUMMARY, getSummaryFields(summary),
        {
            {"server",      utfTo<std::string>(cfg_.server)},
            {"remote_path", utfTo<std::string>(cfg_.remotePath)},
        });
        return summary;
    }

private:
    MirrorRun           (const MirrorRun&) = delete;
    MirrorRun& operator=(const MirrorRun&) = delete;

    bool stopRequested()
    {
        if (!ctx_.cancelRequested())
            return false;

        log_.logWarning(L"Stop requested, exiting...");
        return true;
    }

    void processFolder(const Zstring& folderName)
    {
        const std::wstring folderNameW = utfTo<std::wstring>(folderName);

        const bool download = decider_.shouldDownload(folderName, true /*isFolder*/);
        if (ctx_.cancelRequested()) //size query was interrupted
            return;

        if (!download)
        {
            log_.logInfo(L"Skipping directory " + folderNameW + L" (size matches)");
            stats_.addSkipped();
            return;
        }

        log_.logInfo(L"Downloading directory: " + folderNameW);

        const Zstring localFolderPath = appendPath(cfg_.localPath, folderName);
        const StopWatch stopWatch;

        const bool success = executor_.fetchFolder(folderName, localFolderPath, cfg_.parallelJobs);
        const double durationSec = stopWatch.elapsedSec();

        if (!success)
        {
            if (!ctx_.cancelRequested())
                log_.logError(L"Failed to download directory " + folderNameW);
            return;
        }

        //remote side only reports success: measure what actually arrived
        std::optional<uint64_t> localSize;
        try
        {
            localSize = getLocalSizeRecursive(localFolderPath); //throw FileError
        }
        catch (const FileError& e) { log_.logWarning(e.toString()); }

        if (localSize && *localSize > 0)
            stats_.addFolderDownload(*localSize);

        log_.logInfo(L"Downloaded directory " + folderNameW + L" in " + formatDuration(durationSec));

        if (localSize && *localSize > 0)
            sendMetric(MEASUREMENT_DOWNLOAD, getTransferFields(*localSize, durationSec),
            {
                {"server", utfTo<std::string>(cfg_.server)},
                {"type",   "directory"},
                {"item",   utfTo<std::string>(folderName)},
            });
    }

    void processFile(const Zstring& fileName)
    {
        const std::wstring fileNameW = utfTo<std::wstring>(fileName);

        const bool download = decider_.shouldDownload(fileName, false /*isFolder*/);
        if (ctx_.cancelRequested())
            return;

        if (!download)
        {
            log_.logInfo(L"Skipping file " + fileNameW + L" (size matches)");
            stats_.addSkipped();
            return;
        }

        log_.logInfo(L"Downloading file: " + fileNameW);

        const TransferOutcome outcome = executor_.fetchFile(fileName, appendPath(cfg_.localPath, fileName));

        if (!outcome.succeeded)
        {
            if (!ctx_.cancelRequested())
                log_.logError(L"Failed to download file " + fileNameW);
            return;
        }

        stats_.addFileDownload(outcome.bytesTransferred, outcome.durationSec);

        log_.logInfo(L"Downloaded " + fileNameW + L" (" + numberTo<std::wstring>(outcome.bytesTransferred) + L" bytes) in " + formatDuration(outcome.durationSec));

        sendMetric(MEASUREMENT_DOWNLOAD, getTransferFields(outcome.bytesTransferred, outcome.durationSec),
        {
            {"server", utfTo<std::string>(cfg_.server)},
            {"type",   "file"},
            {"item",   utfTo<std::string>(fileName)},
        });
    }

    //metrics are best effort: never fail the run
    void sendMetric(const std::string& measurement, const MetricFields& fields, const MetricTags& tags)
    {
        try
        {
            metrics_.sendMetric(measurement, fields, tags); //throw SysError
        }
        catch (const SysError& e) { log_.logWarning(L"Failed to send InfluxDB metric: " + e.toString()); }
    }

    const MirrorConfig& cfg_;
    MetricsSink& metrics_;
    LogSink& log_;
    RunContext& ctx_;

    RemoteCatalog remote_;
    DiffDecider decider_;
    TransferExecutor executor_;
    StatsCollector stats_; //starts the run clock
};
}


RunSummary mirror::runMirror(const MirrorConfig& cfg, RemoteFileSystem& fs, MetricsSink& metrics, LogSink& log, RunContext& ctx)
{
    MirrorRun mirrorRun(cfg, fs, metrics, log, ctx);
    return mirrorRun.run();
}
