// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "transfer_executor.h"
#include <sfm/perf.h>
#include "timed_task.h"

using namespace sfm;
using namespace mirror;


void TransferExecutor::logTimeOut(const Zstring& itemName, std::chrono::seconds timeout)
{
    log_.logError(replaceCpy(_("Cannot download %x."), L"%x", fmtPath(remote_.getDisplayPath(itemName))) + L"\n\n" +
                  _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", timeout.count()));
}


TransferOutcome TransferExecutor::fetchFile(const Zstring& itemName, const Zstring& targetFilePath)
{
    if (ctx_.cancelRequested())
        return {};

    const StopWatch stopWatch;

    const TaskResult<uint64_t> result = runTimedTask(Zstr("File download"), [&remote = remote_, itemName, targetFilePath]
    {
        return remote.fetchFile(itemName, targetFilePath); //throw FileError, ThreadStopRequest
    },
    {timeouts_.fileFetch, timeouts_.gracePeriod}, [&] { remote_.abortPendingIo(); }, ctx_);

    TransferOutcome outcome;
    outcome.durationSec = stopWatch.elapsedSec();

    switch (result.status)
    {
        case TaskStatus::completed:
            outcome.succeeded = true;
            outcome.bytesTransferred = *result.value;
            break;
        case TaskStatus::failed:
            log_.logError(result.errorMsg);
            break;
        case TaskStatus::timedOut:
            logTimeOut(itemName, timeouts_.fileFetch);
            break;
        case TaskStatus::cancelled: //expected consequence of shutdown
            break;
    }
    return outcome;
}


bool TransferExecutor::fetchFolder(const Zstring& itemName, const Zstring& targetFolderPath, size_t parallelOps)
{
    if (ctx_.cancelRequested())
        return false;

    const TaskResult<void> result = runTimedTask(Zstr("Folder download"), [&remote = remote_, itemName, targetFolderPath, parallelOps]
    {
        remote.fetchFolder(itemName, targetFolderPath, parallelOps); //throw FileError, ThreadStopRequest
    },
    {timeouts_.folderFetch, timeouts_.gracePeriod}, [&] { remote_.abortPendingIo(); }, ctx_);

    switch (result.status)
    {
        case TaskStatus::completed:
            return true;
        case TaskStatus::failed:
            log_.logError(result.errorMsg);
            break;
        case TaskStatus::timedOut:
            logTimeOut(itemName, timeouts_.folderFetch);
            break;
        case TaskStatus::cancelled:
            break;
    }
    return false;
}
