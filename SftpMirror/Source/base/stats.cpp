// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "stats.h"
#include <numeric>
#include <sfm/i18n.h>

using namespace sfm;
using namespace mirror;


RunSummary StatsCollector::getSummary() const
{
    RunSummary summary;
    summary.filesDownloaded = stats_.filesDownloaded;
    summary.filesSkipped    = stats_.filesSkipped;
    summary.bytesDownloaded = stats_.bytesDownloaded;
    summary.durationSec     = runTime_.elapsedSec();

    if (!stats_.perFileDurations.empty())
        summary.avgFileDurationSec = std::accumulate(stats_.perFileDurations.begin(), stats_.perFileDurations.end(), 0.0) /
                                     stats_.perFileDurations.size();
    return summary;
}


std::wstring mirror::formatSummaryLine(const RunSummary& summary)
{
    return L"Mirror complete. Downloaded " + numberTo<std::wstring>(summary.filesDownloaded) +
           L" items, skipped " + numberTo<std::wstring>(summary.filesSkipped) +
           L", total " + numberTo<std::wstring>(summary.bytesDownloaded) +
           L" bytes in " + printNumber<std::wstring>(L"%.2f", summary.durationSec) + L"s";
}


MetricFields mirror::getSummaryFields(const RunSummary& summary)
{
    return
    {
        {"files_downloaded",          static_cast<double>(summary.filesDownloaded)},
        {"files_skipped",             static_cast<double>(summary.filesSkipped)},
        {"bytes_downloaded",          static_cast<double>(summary.bytesDownloaded)},
        {"duration_seconds",          summary.durationSec},
        {"avg_file_duration_seconds", summary.avgFileDurationSec},
    };
}


MetricFields mirror::getTransferFields(uint64_t bytes, double durationSec)
{
    return
    {
        {"bytes",            static_cast<double>(bytes)},
        {"duration_seconds", durationSec},
        {"bytes_per_second", durationSec > 0 ? static_cast<double>(bytes) / durationSec : 0.0},
    };
}
