// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef TIMED_TASK_H_3920184756102938
#define TIMED_TASK_H_3920184756102938

#include <future>
#include <optional>
#include <sfm/file_error.h>
#include <sfm/thread.h>
#include "run_context.h"


namespace mirror
{
enum class TaskStatus
{
    completed,
    failed,   //task threw FileError
    timedOut,
    cancelled,
};

template <class T>
struct TaskResult
{
    TaskStatus status = TaskStatus::failed;
    std::optional<T> value; //status == completed
    std::wstring errorMsg;  //status == failed
};

template <>
struct TaskResult<void>
{
    TaskStatus status = TaskStatus::failed;
    std::wstring errorMsg;
};


struct TaskLimits
{
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds gracePeriod; //between graceful stop request and forced stop
};


/*  run "fun" on a worker thread and wait for it, at most until the time-out or cancellation:
    1. graceful stop: ThreadStopRequest at the task's next interruption point
    2. forced stop after grace period: "forceStop" makes the task's blocked I/O fail
    3. wait until the task has ended: nothing outlives this call

    - fun: throw FileError, ThreadStopRequest; other exceptions are passed through
    - forceStop: noexcept, context: calling thread
    - the graceful stop is registered with RunContext for the duration of the call      */
template <class Function>
auto runTimedTask(const Zstring& threadName, Function&& fun, const TaskLimits& limits,
                  const std::function<void()>& forceStop, RunContext& ctx) -> TaskResult<decltype(fun())>;








//###################### implementation ######################
namespace impl
{
constexpr std::chrono::milliseconds TASK_POLL_INTERVAL(100);
}


template <class Function> inline
auto runTimedTask(const Zstring& threadName, Function&& fun, const TaskLimits& limits,
                  const std::function<void()>& forceStop, RunContext& ctx) -> TaskResult<decltype(fun())>
{
    using namespace sfm;
    using ResultType = decltype(fun());

    const auto deadline = std::chrono::steady_clock::now() + limits.timeout;

    std::packaged_task<ResultType()> pt(std::forward<Function>(fun)); //exceptions, including ThreadStopRequest, end up in the future
    std::future<ResultType> fut = pt.get_future();

    InterruptibleThread worker([pt = std::move(pt), threadName]() mutable
    {
        setCurrentThreadName(threadName);
        pt();
    });

    ctx.setCurrentTransferStop([&worker] { worker.requestStop(); });
    SFM_ON_SCOPE_EXIT(ctx.setCurrentTransferStop(nullptr)); //*before* ~InterruptibleThread

    TaskResult<ResultType> result;
    result.status = TaskStatus::completed;

    while (fut.wait_for(impl::TASK_POLL_INTERVAL) != std::future_status::ready)
        if (ctx.cancelRequested())
        {
            result.status = TaskStatus::cancelled;
            break;
        }
        else if (std::chrono::steady_clock::now() >= deadline)
        {
            result.status = TaskStatus::timedOut;
            break;
        }

    if (result.status != TaskStatus::completed)
    {
        worker.requestStop();

        if (fut.wait_for(limits.gracePeriod) != std::future_status::ready)
        {
            forceStop(); //noexcept
            fut.wait();
        }
    }
    worker.join();

    //task finished regardless of the stop request? => result is fine, unless the run was cancelled meanwhile
    if (result.status == TaskStatus::timedOut)
        return result;

    try
    {
        if constexpr (std::is_void_v<ResultType>)
            fut.get(); //throw FileError, ThreadStopRequest
        else
            result.value = fut.get(); //throw FileError, ThreadStopRequest

        if (ctx.cancelRequested())
            result.status = TaskStatus::cancelled;
    }
    catch (const FileError& e)
    {
        if (ctx.cancelRequested()) //failure is a consequence of stopping
            result.status = TaskStatus::cancelled;
        else
        {
            result.status = TaskStatus::failed;
            result.errorMsg = e.toString();
        }
    }
    catch (ThreadStopRequest&) { result.status = TaskStatus::cancelled; } //stop request only comes from RunContext or the time-out

    if (result.status == TaskStatus::cancelled)
        if constexpr (!std::is_void_v<ResultType>)
            result.value.reset();

    return result;
}
}

#endif //TIMED_TASK_H_3920184756102938
