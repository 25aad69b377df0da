// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef DIFF_DECIDER_H_2910384756102938
#define DIFF_DECIDER_H_2910384756102938

#include "remote_catalog.h"


namespace mirror
{
//size is the only criterion: no content, time stamp or permission comparison
class DiffDecider
{
public:
    DiffDecider(RemoteCatalog& remote, const Zstring& localRoot, bool forceAll, LogSink& log) :
        remote_(remote), localRoot_(localRoot), forceAll_(forceAll), log_(log) {}

    //- forceAll: always, without size queries
    //- missing local item: always
    //- unknown remote size: download, with a warning
    //- size query interrupted by a stop request: download, without a warning; caller checks for cancellation
    bool shouldDownload(const Zstring& itemName, bool isFolder);

private:
    RemoteCatalog& remote_;
    const Zstring localRoot_;
    const bool forceAll_;
    LogSink& log_;
};
}

#endif //DIFF_DECIDER_H_2910384756102938
