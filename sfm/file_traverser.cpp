// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "file_traverser.h"
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "file_path.h"

using namespace sfm;


void sfm::traverseFolder(const Zstring& folderPath,
                         const std::function<void(const FileInfo&    fi)>& onFile,
                         const std::function<void(const FolderInfo&  fi)>& onFolder,
                         const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(folderPath.c_str());
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(folderPath)), "opendir");
    SFM_ON_SCOPE_EXIT(::closedir(folder));

    const int folderFd = ::dirfd(folder);

    for (;;)
    {
        errno = 0; //readdir() reports both end of stream and failure by nullptr
        const dirent* entry = ::readdir(folder);
        if (!entry)
        {
            if (errno != 0)
                THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(folderPath)), "readdir");
            return;
        }

        const std::string_view itemName = entry->d_name;
        if (itemName == "." || itemName == "..")
            continue;

        const Zstring itemPath = appendPath(folderPath, Zstring(itemName));

        struct stat itemInfo = {};
        if (::fstatat(folderFd, entry->d_name, &itemInfo, AT_SYMLINK_NOFOLLOW) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "fstatat");

        if (S_ISLNK(itemInfo.st_mode))
        {
            if (onSymlink)
                onSymlink({Zstring(itemName), itemPath});
        }
        else if (S_ISDIR(itemInfo.st_mode))
        {
            if (onFolder)
                onFolder({Zstring(itemName), itemPath});
        }
        else if (onFile) //regular file; devices, pipes and sockets report size 0
            onFile({Zstring(itemName), itemPath, S_ISREG(itemInfo.st_mode) ? static_cast<uint64_t>(itemInfo.st_size) : 0});
    }
}
