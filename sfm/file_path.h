// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_PATH_H_1736492013874659
#define FILE_PATH_H_1736492013874659

#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace sfm
{
//POSIX paths only: local file system and SFTP share the same syntax

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or a single relative name

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//"/home/user/" -> "/home/user"; "/" stays "/"
Zstring removeTrailingSeparators(Zstring path);

//environment snapshot taken on first access: getenv() is not thread-safe
std::optional<Zstring> getEnvironmentVar(const ZstringView name);
}

#endif //FILE_PATH_H_1736492013874659
