// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef TRANSFER_EXECUTOR_H_7719203846501928
#define TRANSFER_EXECUTOR_H_7719203846501928

#include "remote_catalog.h"


namespace mirror
{
struct TransferOutcome
{
    bool succeeded = false;
    uint64_t bytesTransferred = 0;
    double durationSec = 0;
};


//one attempt per call, bounded by the time-out and stopped on cancellation:
//failures are logged with their details, cancellation is not
class TransferExecutor
{
public:
    TransferExecutor(RemoteCatalog& remote, const MirrorTimeouts& timeouts, LogSink& log, RunContext& ctx) :
        remote_(remote), timeouts_(timeouts), log_(log), ctx_(ctx) {}

    TransferOutcome fetchFile(const Zstring& itemName, const Zstring& targetFilePath);

    bool fetchFolder(const Zstring& itemName, const Zstring& targetFolderPath, size_t parallelOps);

private:
    TransferExecutor           (const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    void logTimeOut(const Zstring& itemName, std::chrono::seconds timeout);

    RemoteCatalog& remote_;
    const MirrorTimeouts timeouts_;
    LogSink& log_;
    RunContext& ctx_;
};
}

#endif //TRANSFER_EXECUTOR_H_7719203846501928
