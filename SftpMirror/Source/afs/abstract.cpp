// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "abstract.h"
#include <algorithm>
#include <sfm/file_access.h>
#include <sfm/file_io.h>
#include <sfm/thread.h>

using namespace sfm;
using namespace mirror;


uint64_t mirror::getFolderSizeRecursive(RemoteFileSystem& fs, const Zstring& folderPath) //throw FileError, ThreadStopRequest
{
    uint64_t totalBytes = 0;

    std::vector<Zstring> workload{folderPath};
    while (!workload.empty())
    {
        const Zstring currentPath = std::move(workload.back());
        workload.pop_back();

        interruptionPoint(); //throw ThreadStopRequest

        for (const RemoteFileSystem::Item& item : fs.getFolderContent(currentPath)) //throw FileError, ThreadStopRequest
            switch (item.type)
            {
                case RemoteFileSystem::ItemType::file:
                    totalBytes += item.fileSize;
                    break;
                case RemoteFileSystem::ItemType::folder:
                    workload.push_back(appendPath(currentPath, item.itemName));
                    break;
                case RemoteFileSystem::ItemType::other:
                    break;
            }
    }
    return totalBytes;
}


uint64_t mirror::copyFileToLocal(RemoteFileSystem& fs, const Zstring& filePath, const Zstring& targetFilePath) //throw FileError, ThreadStopRequest
{
    const uint64_t remoteSize = fs.getFileSize(filePath); //throw FileError, ThreadStopRequest

    if (const std::optional<Zstring> parentPath = getParentFolderPath(targetFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    uint64_t localSize = 0;
    if (const std::optional<sfm::ItemType> type = getItemTypeIfExists(targetFilePath)) //throw FileError
    {
        if (*type == sfm::ItemType::folder)
            throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetFilePath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(targetFilePath))));
        localSize = getFileSize(targetFilePath); //throw FileError
    }

    //continue an interrupted copy; a local file that is not shorter can't be a prefix of the remote content
    const uint64_t startOffset = 0 < localSize && localSize < remoteSize ? localSize : 0;

    std::unique_ptr<RemoteFileSystem::InputStream> streamIn = fs.getInputStream(filePath, startOffset); //throw FileError, ThreadStopRequest

    FileOutputPlain fileOut(targetFilePath, startOffset > 0 ? WriteMode::append : WriteMode::truncate); //throw FileError

    std::vector<char> buffer(FileBase::defaultBlockSize);
    for (;;)
    {
        interruptionPoint(); //throw ThreadStopRequest

        const size_t bytesRead = streamIn->tryRead(buffer.data(), buffer.size()); //throw FileError, ThreadStopRequest
        if (bytesRead == 0) //EOF
            break;

        fileOut.write(buffer.data(), bytesRead); //throw FileError
    }

    const uint64_t finalSize = fileOut.getFileSize(); //throw FileError
    fileOut.close(); //throw FileError
    return finalSize;
}


void mirror::copyFolderToLocal(RemoteFileSystem& fs, const Zstring& folderPath, const Zstring& targetFolderPath, size_t parallelOps) //throw FileError, ThreadStopRequest
{
    createDirectoryIfMissingRecursion(targetFolderPath); //throw FileError

    Protected<std::optional<FileError>> firstError; //outlive worker threads!
    auto reportError = [&firstError](const FileError& e)
    {
        firstError.access([&](std::optional<FileError>& err) { if (!err) err = e; });
    };

    ThreadGroup<std::function<void()>> copyGroup(std::max<size_t>(parallelOps, 1), Zstr("Folder copy"));

    std::vector<std::pair<Zstring, Zstring>> workload{{folderPath, targetFolderPath}};
    while (!workload.empty())
    {
        const auto [sourcePath, targetPath] = std::move(workload.back());
        workload.pop_back();

        interruptionPoint(); //throw ThreadStopRequest

        std::vector<RemoteFileSystem::Item> items;
        try
        {
            items = fs.getFolderContent(sourcePath); //throw FileError, ThreadStopRequest
        }
        catch (const FileError& e) { reportError(e); continue; } //copy as much as possible

        for (const RemoteFileSystem::Item& item : items)
        {
            const Zstring itemSourcePath = appendPath(sourcePath, item.itemName);
            const Zstring itemTargetPath = appendPath(targetPath, item.itemName);

            switch (item.type)
            {
                case RemoteFileSystem::ItemType::folder:
                    try
                    {
                        createDirectoryIfMissingRecursion(itemTargetPath); //throw FileError
                        workload.emplace_back(itemSourcePath, itemTargetPath);
                    }
                    catch (const FileError& e) { reportError(e); }
                    break;

                case RemoteFileSystem::ItemType::file:
                    copyGroup.run([&fs, itemSourcePath, itemTargetPath, fileSize = item.fileSize, reportError]
                    {
                        try
                        {
                            //already complete from an earlier, interrupted run?
                            if (const std::optional<sfm::ItemType> type = getItemTypeIfExists(itemTargetPath); //throw FileError
                                type && *type == sfm::ItemType::file && getFileSize(itemTargetPath) == fileSize)
                                return;

                            copyFileToLocal(fs, itemSourcePath, itemTargetPath); //throw FileError, ThreadStopRequest
                        }
                        catch (const FileError& e) { reportError(e); }
                    });
                    break;

                case RemoteFileSystem::ItemType::other:
                    break;
            }
        }
    }

    copyGroup.wait(); //throw ThreadStopRequest

    firstError.access([](const std::optional<FileError>& err)
    {
        if (err)
            throw* err;
    });
}
