// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef MIRROR_SCHEDULER_H_9920183746510293
#define MIRROR_SCHEDULER_H_9920183746510293

#include "config.h"
#include "log_sink.h"
#include "metrics_sink.h"
#include "run_context.h"
#include "stats.h"
#include "../afs/abstract.h"


namespace mirror
{
/*  one mirror run, driven by the calling thread:
    1. list the remote root
    2. folders, newest first (descending names), each as a whole
    3. files, in listing order
    4. summary log line and metric

    - the cancellation flag is checked before each item
    - a failed item is logged and the run continues: no retries       */
RunSummary runMirror(const MirrorConfig& cfg, RemoteFileSystem& fs, MetricsSink& metrics, LogSink& log, RunContext& ctx);
}

#endif //MIRROR_SCHEDULER_H_9920183746510293
