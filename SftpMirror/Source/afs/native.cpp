// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "native.h"
#include <vector>
#include <sfm/file_access.h>
#include <sfm/file_traverser.h>

using namespace sfm;
using namespace mirror;


std::optional<uint64_t> mirror::getLocalSizeRecursive(const Zstring& itemPath) //throw FileError
{
    std::optional<ItemType> type = getItemTypeIfExists(itemPath); //throw FileError
    if (!type)
        return std::nullopt;

    if (*type == ItemType::symlink) //e.g. a data folder moved to another volume
    {
        type = getItemTypeFollowLinksIfExists(itemPath); //throw FileError
        if (!type) //dangling
            return 0;
    }

    switch (*type)
    {
        case ItemType::file:
            return getFileSize(itemPath); //throw FileError
        case ItemType::symlink:
            return 0;
        case ItemType::folder:
            break;
    }

    uint64_t totalBytes = 0;

    std::vector<Zstring> workload{itemPath};
    while (!workload.empty())
    {
        const Zstring folderPath = std::move(workload.back());
        workload.pop_back();

        traverseFolder(folderPath,
        [&](const FileInfo&   fi) { totalBytes += fi.fileSize; },
        [&](const FolderInfo& fi) { workload.push_back(fi.fullPath); },
        nullptr); //throw FileError
    }
    return totalBytes;
}
