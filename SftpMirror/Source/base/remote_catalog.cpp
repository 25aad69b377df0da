// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "remote_catalog.h"
#include <sfm/file_path.h>
#include "timed_task.h"

using namespace sfm;
using namespace mirror;


namespace
{
std::wstring formatTimeOut(std::chrono::seconds timeout)
{
    return _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", timeout.count());
}
}


Zstring RemoteCatalog::getItemPath(const Zstring& itemName) const
{
    return appendPath(remoteRoot_, itemName);
}


std::wstring RemoteCatalog::getDisplayPath(const Zstring& itemName) const
{
    return fs_.getDisplayPath(getItemPath(itemName));
}


RemoteListing RemoteCatalog::listRootFolder()
{
    const TaskResult<std::vector<RemoteFileSystem::Item>> result =
        runTimedTask(Zstr("Remote listing"),
                     [&fs = fs_, folderPath = remoteRoot_] { return fs.getFolderContent(folderPath); /*throw FileError, ThreadStopRequest*/ },
    {timeouts_.listing, timeouts_.gracePeriod}, [&] { fs_.abortPendingIo(); }, ctx_);

    switch (result.status)
    {
        case TaskStatus::completed:
            break;
        case TaskStatus::failed:
            log_.logError(_("Error listing remote directory:") + L' ' + result.errorMsg);
            return {};
        case TaskStatus::timedOut:
            log_.logError(_("Error listing remote directory:") + L' ' +
                          replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(fs_.getDisplayPath(remoteRoot_))) + L' ' + formatTimeOut(timeouts_.listing));
            return {};
        case TaskStatus::cancelled:
            return {};
    }

    RemoteListing listing;
    for (const RemoteFileSystem::Item& item : *result.value)
        switch (item.type)
        {
            case RemoteFileSystem::ItemType::file:
                listing.files.push_back(item.itemName);
                break;
            case RemoteFileSystem::ItemType::folder:
                listing.folders.push_back(item.itemName);
                break;
            case RemoteFileSystem::ItemType::other:
                log_.logDebug(replaceCpy(_("Ignoring %x: neither file nor directory."), L"%x", fmtPath(getDisplayPath(item.itemName))));
                break;
        }
    return listing;
}


std::optional<uint64_t> RemoteCatalog::getItemSize(const Zstring& itemName, bool isFolder)
{
    const Zstring itemPath = getItemPath(itemName);

    auto runSizeQuery = [&](std::chrono::seconds timeout) -> std::optional<uint64_t>
    {
        const TaskResult<uint64_t> result = runTimedTask(Zstr("Remote size"), [&fs = fs_, itemPath, isFolder]
        {
            return isFolder ?
                   getFolderSizeRecursive(fs, itemPath) : //throw FileError, ThreadStopRequest
                   fs.getFileSize(itemPath);              //
        },
        {timeout, timeouts_.gracePeriod}, [&] { fs_.abortPendingIo(); }, ctx_);

        switch (result.status)
        {
            case TaskStatus::completed:
                return *result.value;
            case TaskStatus::failed:
                log_.logDebug(result.errorMsg);
                break;
            case TaskStatus::timedOut:
                log_.logDebug(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(fs_.getDisplayPath(itemPath))) + L' ' + formatTimeOut(timeout));
                break;
            case TaskStatus::cancelled:
                break;
        }
        return std::nullopt;
    };

    if (const std::optional<uint64_t> size = runSizeQuery(timeouts_.remoteSize))
        return size;

    if (!isFolder && !ctx_.cancelRequested()) //new attempt on a fresh connection: the failed one was discarded
        return runSizeQuery(timeouts_.fileSizeFallback);

    return std::nullopt;
}


uint64_t RemoteCatalog::fetchFile(const Zstring& itemName, const Zstring& targetFilePath) //throw FileError, ThreadStopRequest
{
    return copyFileToLocal(fs_, getItemPath(itemName), targetFilePath); //throw FileError, ThreadStopRequest
}


void RemoteCatalog::fetchFolder(const Zstring& itemName, const Zstring& targetFolderPath, size_t parallelOps) //throw FileError, ThreadStopRequest
{
    copyFolderToLocal(fs_, getItemPath(itemName), targetFolderPath, parallelOps); //throw FileError, ThreadStopRequest
}
