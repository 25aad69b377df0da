// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_9203847561203948
#define FILE_TRAVERSER_H_9203847561203948

#include <functional>
#include "file_error.h"


namespace sfm
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //apparent size [bytes]
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
};

//direct children only, without "." and ".."; symlinks are reported, never followed
//every callback is optional: pass nullptr to ignore an item type
void traverseFolder(const Zstring& folderPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,
                    const std::function<void(const FolderInfo&  fi)>& onFolder,
                    const std::function<void(const SymlinkInfo& si)>& onSymlink); //throw FileError
}

#endif //FILE_TRAVERSER_H_9203847561203948
