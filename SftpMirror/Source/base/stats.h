// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef STATS_H_3391028475610293
#define STATS_H_3391028475610293

#include <vector>
#include <sfm/perf.h>
#include "metrics_sink.h"


namespace mirror
{
struct MirrorRunStats
{
    int filesDownloaded = 0; //files and folders
    int filesSkipped    = 0; //
    uint64_t bytesDownloaded = 0;
    std::vector<double> perFileDurations; //files only [s]
};


struct RunSummary
{
    int filesDownloaded = 0;
    int filesSkipped    = 0;
    uint64_t bytesDownloaded = 0;
    double durationSec = 0;
    double avgFileDurationSec = 0; //0 if no file was downloaded
};


//single writer: the scheduler thread
class StatsCollector
{
public:
    void addFileDownload(uint64_t bytes, double durationSec)
    {
        ++stats_.filesDownloaded;
        stats_.bytesDownloaded += bytes;
        stats_.perFileDurations.push_back(durationSec);
    }

    void addFolderDownload(uint64_t bytes)
    {
        ++stats_.filesDownloaded;
        stats_.bytesDownloaded += bytes;
    }

    void addSkipped() { ++stats_.filesSkipped; }

    const MirrorRunStats& getStats() const { return stats_; }

    RunSummary getSummary() const;

private:
    MirrorRunStats stats_;
    const sfm::StopWatch runTime_; //starts at construction = run start
};


std::wstring formatSummaryLine(const RunSummary& summary);

MetricFields getSummaryFields(const RunSummary& summary);

//per transfer: bytes, duration_seconds, bytes_per_second (0 for zero duration)
MetricFields getTransferFields(uint64_t bytes, double durationSec);
}

#endif //STATS_H_3391028475610293
