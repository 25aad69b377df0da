// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef NATIVE_H_2039485716203948
#define NATIVE_H_2039485716203948

#include <optional>
#include <sfm/file_error.h>


namespace mirror
{
//- apparent size: sum of file content bytes, not allocated blocks
//- itemPath may be a file or a folder; a symlink at itemPath is followed, symlinks below it count 0
//- no value if itemPath does not exist
std::optional<uint64_t> getLocalSizeRecursive(const Zstring& itemPath); //throw FileError
}

#endif //NATIVE_H_2039485716203948
