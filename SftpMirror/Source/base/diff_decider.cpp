// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "diff_decider.h"
#include <sfm/file_path.h>
#include "../afs/native.h"

using namespace sfm;
using namespace mirror;


bool DiffDecider::shouldDownload(const Zstring& itemName, bool isFolder)
{
    if (forceAll_)
        return true;

    const Zstring localPath = appendPath(localRoot_, itemName);

    std::optional<uint64_t> localSize;
    try
    {
        localSize = getLocalSizeRecursive(localPath); //throw FileError
    }
    catch (const FileError& e)
    {
        log_.logWarning(e.toString()); //unreadable counts as missing: download again
    }

    if (!localSize)
        return true;

    const std::optional<uint64_t> remoteSize = remote_.getItemSize(itemName, isFolder);
    if (!remoteSize)
    {
        if (remote_.cancelRequested())
            return true;

        log_.logWarning(replaceCpy(_("Could not get remote size for %x, will download"), L"%x", utfTo<std::wstring>(itemName)));
        return true;
    }

    log_.logDebug(utfTo<std::wstring>(itemName) + L": " + _("remote size") + L' ' + numberTo<std::wstring>(*remoteSize) + L", " +
                  _("local size") + L' ' + numberTo<std::wstring>(*localSize));

    return *remoteSize != *localSize;
}
