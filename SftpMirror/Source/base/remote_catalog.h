// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef REMOTE_CATALOG_H_6601928374650192
#define REMOTE_CATALOG_H_6601928374650192

#include <optional>
#include "config.h"
#include "log_sink.h"
#include "run_context.h"
#include "../afs/abstract.h"


namespace mirror
{
struct RemoteListing
{
    std::vector<Zstring> files;   //in server order
    std::vector<Zstring> folders; //
};


//remote side of one mirror run: items are named relative to the remote root folder
class RemoteCatalog
{
public:
    RemoteCatalog(RemoteFileSystem& fs, const Zstring& remoteRoot, const MirrorTimeouts& timeouts, LogSink& log, RunContext& ctx) :
        fs_(fs), remoteRoot_(remoteRoot), timeouts_(timeouts), log_(log), ctx_(ctx) {}

    //direct children of the remote root; symlinks and special files are left out
    //failure is logged and yields an empty listing
    RemoteListing listRootFolder();

    //folder: recursive content size; file: size, retried once with the short time-out
    //no value on failure, time-out or cancellation
    std::optional<uint64_t> getItemSize(const Zstring& itemName, bool isFolder);

    //blocking transfers: run them via TransferExecutor
    uint64_t fetchFile(const Zstring& itemName, const Zstring& targetFilePath); //throw FileError, ThreadStopRequest
    void fetchFolder(const Zstring& itemName, const Zstring& targetFolderPath, size_t parallelOps); //throw FileError, ThreadStopRequest

    void abortPendingIo() { fs_.abortPendingIo(); } //noexcept; context: any thread

    bool cancelRequested() const { return ctx_.cancelRequested(); }

    std::wstring getDisplayPath(const Zstring& itemName) const;

private:
    RemoteCatalog           (const RemoteCatalog&) = delete;
    RemoteCatalog& operator=(const RemoteCatalog&) = delete;

    Zstring getItemPath(const Zstring& itemName) const;

    RemoteFileSystem& fs_;
    const Zstring remoteRoot_;
    const MirrorTimeouts timeouts_;
    LogSink& log_;
    RunContext& ctx_;
};
}

#endif //REMOTE_CATALOG_H_6601928374650192
