// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "file_access.h"
#include <sys/stat.h>

using namespace sfm;


std::optional<ItemType> sfm::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR) //ENOTDIR: some parent is a file
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file;
}


std::optional<ItemType> sfm::getItemTypeFollowLinksIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::stat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("stat", ec));
    }

    return S_ISDIR(itemInfo.st_mode) ? ItemType::folder : ItemType::file;
}


uint64_t sfm::getFileSize(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), "stat");

    return fileInfo.st_size;
}


void sfm::createDirectoryIfMissingRecursion(const Zstring& folderPath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(folderPath));

    if (const std::optional<ItemType> type = getItemTypeIfExists(folderPath)) //throw FileError
    {
        if (*type == ItemType::folder ||
            (*type == ItemType::symlink && getItemTypeFollowLinksIfExists(folderPath) == ItemType::folder)) //throw FileError
            return;

        throw FileError(errorMsg, replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPath))));
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(folderPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    if (::mkdir(folderPath.c_str(), 0777 /*umask applies*/) != 0)
    {
        const ErrorCode ec = getLastError();
        //parallel workers may race for the same folder
        if (ec == EEXIST && getItemTypeIfExists(folderPath) == ItemType::folder) //throw FileError
            return;

        throw FileError(errorMsg, formatSystemError("mkdir", ec));
    }
}
