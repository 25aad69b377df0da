// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_ACCESS_H_6610293847561028
#define FILE_ACCESS_H_6610293847561028

#include <optional>
#include "file_error.h"
#include "file_path.h"


namespace sfm
{
enum class ItemType
{
    file, //including devices, pipes and sockets
    folder,
    symlink,
};

//symlinks are not followed; no value if the item (or a parent) does not exist
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

//symlinks are followed: never returns ItemType::symlink; no value for a dangling link, too
std::optional<ItemType> getItemTypeFollowLinksIfExists(const Zstring& itemPath); //throw FileError

uint64_t getFileSize(const Zstring& filePath); //throw FileError

//creates missing parents, too; existing folders (or symlinks to one) are fine
void createDirectoryIfMissingRecursion(const Zstring& folderPath); //throw FileError
}

#endif //FILE_ACCESS_H_6610293847561028
