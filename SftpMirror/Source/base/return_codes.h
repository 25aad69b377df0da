// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef RETURN_CODES_H_5519283740192837
#define RETURN_CODES_H_5519283740192837

#include <cassert>
#include <sfm/error_log.h>
#include <sfm/i18n.h>


namespace mirror
{
enum MirrorReturnCode //as returned after process exit
{
    MIRROR_RC_SUCCESS = 0,
    MIRROR_RC_FAILURE = 1, //stopped, fatal error or invalid configuration
};


enum class RunResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
RunResult getRunResult(const sfm::ErrorLogStats& logStats, bool cancelled)
{
    if (cancelled)
        return RunResult::aborted;
    if (logStats.error > 0)
        return RunResult::finishedError;
    if (logStats.warning > 0)
        return RunResult::finishedWarning;
    return RunResult::finishedSuccess;
}


//failed items do not fail the run: the next run picks them up again
inline
MirrorReturnCode mapToReturnCode(RunResult runStatus)
{
    switch (runStatus)
    {
        case RunResult::finishedSuccess:
        case RunResult::finishedWarning:
        case RunResult::finishedError:
            return MIRROR_RC_SUCCESS;
        case RunResult::aborted:
            return MIRROR_RC_FAILURE;
    }
    assert(false);
    return MIRROR_RC_FAILURE;
}


inline
std::wstring getFinalStatusLabel(RunResult finalStatus)
{
    switch (finalStatus)
    {
        case RunResult::finishedSuccess:
            return _("Completed successfully");
        case RunResult::finishedWarning:
            return _("Completed with warnings");
        case RunResult::finishedError:
            return _("Completed with errors");
        case RunResult::aborted:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_5519283740192837
