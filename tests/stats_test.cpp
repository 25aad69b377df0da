// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/return_codes.h>
#include <base/stats.h>

using namespace sfm;
using namespace mirror;


namespace
{
double getField(const MetricFields& fields, const std::string& name)
{
    for (const auto& [key, value] : fields)
        if (key == name)
            return value;
    ADD_FAILURE() << "missing field " << name;
    return -1;
}
}


TEST(StatsCollector, CountsAndAverages)
{
    StatsCollector stats;
    stats.addFileDownload(100, 1.0);
    stats.addFileDownload(300, 3.0);
    stats.addFolderDownload(1000); //no per-file duration
    stats.addSkipped();
    stats.addSkipped();

    const RunSummary summary = stats.getSummary();
    EXPECT_EQ(summary.filesDownloaded, 3);
    EXPECT_EQ(summary.filesSkipped, 2);
    EXPECT_EQ(summary.bytesDownloaded, 1400u);
    EXPECT_DOUBLE_EQ(summary.avgFileDurationSec, 2.0);
    EXPECT_GE(summary.durationSec, 0);

    EXPECT_EQ(stats.getStats().perFileDurations.size(), 2u);
}


TEST(StatsCollector, NoFilesMeansZeroAverage)
{
    StatsCollector stats;
    stats.addFolderDownload(10);

    EXPECT_EQ(stats.getSummary().avgFileDurationSec, 0);
}


TEST(StatsCollector, SummaryLine)
{
    RunSummary summary;
    summary.filesDownloaded = 4;
    summary.filesSkipped = 7;
    summary.bytesDownloaded = 123456;
    summary.durationSec = 12.346;

    EXPECT_EQ(formatSummaryLine(summary), L"Mirror complete. Downloaded 4 items, skipped 7, total 123456 bytes in 12.35s");
}


TEST(StatsCollector, MetricFields)
{
    RunSummary summary;
    summary.filesDownloaded = 2;
    summary.filesSkipped = 1;
    summary.bytesDownloaded = 500;
    summary.durationSec = 10;
    summary.avgFileDurationSec = 2.5;

    const MetricFields fields = getSummaryFields(summary);
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(getField(fields, "files_downloaded"), 2);
    EXPECT_EQ(getField(fields, "files_skipped"), 1);
    EXPECT_EQ(getField(fields, "bytes_downloaded"), 500);
    EXPECT_EQ(getField(fields, "duration_seconds"), 10);
    EXPECT_EQ(getField(fields, "avg_file_duration_seconds"), 2.5);

    const MetricFields transfer = getTransferFields(1000, 4);
    EXPECT_EQ(getField(transfer, "bytes"), 1000);
    EXPECT_EQ(getField(transfer, "duration_seconds"), 4);
    EXPECT_EQ(getField(transfer, "bytes_per_second"), 250);

    EXPECT_EQ(getField(getTransferFields(1000, 0), "bytes_per_second"), 0); //no division by zero
}


TEST(ReturnCodes, RunResult)
{
    ErrorLogStats logStats;
    EXPECT_EQ(getRunResult(logStats, false), RunResult::finishedSuccess);

    logStats.warning = 1;
    EXPECT_EQ(getRunResult(logStats, false), RunResult::finishedWarning);

    logStats.error = 2;
    EXPECT_EQ(getRunResult(logStats, false), RunResult::finishedError);
    EXPECT_EQ(getRunResult(logStats, true), RunResult::aborted);
}


TEST(ReturnCodes, OnlyStopFailsTheProcess)
{
    EXPECT_EQ(mapToReturnCode(RunResult::finishedSuccess), MIRROR_RC_SUCCESS);
    EXPECT_EQ(mapToReturnCode(RunResult::finishedWarning), MIRROR_RC_SUCCESS);
    EXPECT_EQ(mapToReturnCode(RunResult::finishedError), MIRROR_RC_SUCCESS);
    EXPECT_EQ(mapToReturnCode(RunResult::aborted), MIRROR_RC_FAILURE);

    EXPECT_EQ(getFinalStatusLabel(RunResult::aborted), L"Stopped");
    EXPECT_EQ(getFinalStatusLabel(RunResult::finishedError), L"Completed with errors");
}
