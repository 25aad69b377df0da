// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef RUN_CONTEXT_H_7102938475610293
#define RUN_CONTEXT_H_7102938475610293

#include <atomic>
#include <functional>
#include <sfm/thread.h>


namespace mirror
{
//state shared between the mirror driver and the signal watcher thread
class RunContext
{
public:
    //context: any thread; idempotent
    void requestCancel()
    {
        cancelRequested_ = true;

        stopCurrentTransfer_.access([](const std::function<void()>& stopTransfer)
        {
            if (stopTransfer)
                stopTransfer(); //graceful: the driver escalates if needed
        });
    }

    bool cancelRequested() const { return cancelRequested_; }

    //- stopTransfer must be noexcept and stay callable until reset to nullptr
    //- never called concurrently with its own reset
    void setCurrentTransferStop(const std::function<void()>& stopTransfer)
    {
        stopCurrentTransfer_.access([&](std::function<void()>& st) { st = stopTransfer; });
    }

private:
    std::atomic<bool> cancelRequested_{false};
    sfm::Protected<std::function<void()>> stopCurrentTransfer_;
};
}

#endif //RUN_CONTEXT_H_7102938475610293
