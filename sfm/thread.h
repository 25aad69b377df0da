// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef THREAD_H_8302719460285713
#define THREAD_H_8302719460285713

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "scope_guard.h"
#include "string_tools.h"
#include "zstring.h"


namespace sfm
{
//thrown at an interruption point after InterruptibleThread::requestStop(); ends the thread quietly
class ThreadStopRequest {};

namespace impl { class StopState; }


//std::thread plus a stop request; the destructor stops and joins
class InterruptibleThread
{
public:
    InterruptibleThread() {}
    InterruptibleThread(InterruptibleThread&&) noexcept = default;

    template <class Function>
    explicit InterruptibleThread(Function&& f);

    ~InterruptibleThread()
    {
        if (joinable())
        {
            requestStop();
            join();
        }
    }

    bool joinable() const { return thread_.joinable(); }
    void requestStop(); //context: any thread
    void join() { thread_.join(); }

private:
    InterruptibleThread& operator=(InterruptibleThread&&) = delete;

    std::thread thread_;
    std::shared_ptr<impl::StopState> stopState_ = std::make_shared<impl::StopState>();
};


//context: worker thread; no-ops (plain waits) on threads not started as InterruptibleThread
void interruptionPoint(); //throw ThreadStopRequest

template <class Predicate>
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred); //throw ThreadStopRequest

template <class Rep, class Period>
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime); //throw ThreadStopRequest

void setCurrentThreadName(const Zstring& threadName);

//------------------------------------------------------------------------------------------

//value that is only reachable while holding its mutex
template <class T>
class Protected
{
public:
    Protected() {}
    explicit Protected(T value) : value_(std::move(value)) {}

    template <class Function>
    auto access(Function fun)
    {
        std::lock_guard guard(lock_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lock_;
    T value_{};
};

//------------------------------------------------------------------------------------------

//FIFO task queue with up to "maxThreads" workers, started as tasks arrive
//destruction stops all workers: tasks still queued are dropped
template <class Function>
class ThreadGroup
{
public:
    ThreadGroup(size_t maxThreads, const Zstring& groupName) : maxThreads_(maxThreads), groupName_(groupName)
    {
        if (maxThreads == 0)
            throw std::logic_error("ThreadGroup needs at least one thread");
    }

    ~ThreadGroup()
    {
        for (InterruptibleThread& worker : workers_)
            worker.requestStop(); //all at once, then ~InterruptibleThread joins each
    }

    //context: owner or worker thread
    void run(Function&& task)
    {
        {
            std::lock_guard guard(queue_->lock);
            queue_->tasks.push_back(std::move(task));
            ++queue_->unfinished;

            if (workers_.size() < std::min(queue_->unfinished, maxThreads_))
                addWorker();
        }
        queue_->taskAdded.notify_all();
    }

    //context: owner thread; blocks until every task ran
    void wait() //throw ThreadStopRequest
    {
        TaskQueue& queue = *queue_;
        std::unique_lock lock(queue.lock);
        interruptibleWait(queue.allDone, lock, [&queue] { return queue.unfinished == 0; }); //throw ThreadStopRequest
    }

private:
    ThreadGroup           (const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    struct TaskQueue
    {
        std::mutex lock;
        std::deque<Function> tasks;
        size_t unfinished = 0; //queued or running
        std::condition_variable taskAdded;
        std::condition_variable allDone;
    };

    //worker shares the queue, never "this"
    void addWorker()
    {
        const Zstring threadName = groupName_ + Zstr(" #") + numberTo<Zstring>(workers_.size() + 1);

        workers_.emplace_back([queue = queue_, threadName]
        {
            setCurrentThreadName(threadName);

            std::unique_lock lock(queue->lock);
            for (;;)
            {
                interruptibleWait(queue->taskAdded, lock, [&] { return !queue->tasks.empty(); }); //throw ThreadStopRequest

                Function task = std::move(queue->tasks.front());
                queue->tasks.pop_front();

                lock.unlock();
                task(); //throw ThreadStopRequest
                lock.lock();

                if (--queue->unfinished == 0)
                    queue->allDone.notify_all();
            }
        });
    }

    const size_t maxThreads_;
    const Zstring groupName_;
    std::shared_ptr<TaskQueue> queue_ = std::make_shared<TaskQueue>();
    std::vector<InterruptibleThread> workers_;
};








//###################### implementation ######################
namespace impl
{
class StopState
{
public:
    //context: any thread
    void requestStop()
    {
        {
            std::lock_guard guard(lock_);
            stopRequested_ = true;

            if (waitingOn_)
                waitingOn_->notify_all(); //without the cv's mutex: may get lost => waits are sliced
        }
        sleepInterrupted_.notify_all();
    }

    //context: owning thread from here on
    void throwIfStopped() //throw ThreadStopRequest
    {
        if (stopRequested_)
            throw ThreadStopRequest();
    }

    template <class Predicate>
    void wait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
    {
        setWaitingOn(&cv);
        SFM_ON_SCOPE_EXIT(setWaitingOn(nullptr));

        while (!cv.wait_for(lock, std::chrono::milliseconds(1), [&] { return stopRequested_ || pred(); }))
            ;
        throwIfStopped(); //throw ThreadStopRequest
    }

    template <class Rep, class Period>
    void sleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
    {
        std::unique_lock lock(lock_); //same mutex as requestStop(): no lost wake-up
        if (sleepInterrupted_.wait_for(lock, relTime, [this] { return stopRequested_.load(); }))
            throw ThreadStopRequest();
    }

private:
    void setWaitingOn(std::condition_variable* cv)
    {
        std::lock_guard guard(lock_);
        waitingOn_ = cv;
    }

    std::atomic<bool> stopRequested_{false};
    std::mutex lock_;
    std::condition_variable sleepInterrupted_;
    std::condition_variable* waitingOn_ = nullptr;
};


inline thread_local StopState* currentStopState = nullptr; //set for InterruptibleThread only
}


inline
void interruptionPoint() //throw ThreadStopRequest
{
    if (impl::currentStopState)
        impl::currentStopState->throwIfStopped(); //throw ThreadStopRequest
}


template <class Predicate> inline
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
{
    if (impl::currentStopState)
        impl::currentStopState->wait(cv, lock, pred); //throw ThreadStopRequest
    else
        cv.wait(lock, pred);
}


template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
{
    if (impl::currentStopState)
        impl::currentStopState->sleep(relTime); //throw ThreadStopRequest
    else
        std::this_thread::sleep_for(relTime);
}


template <class Function> inline
InterruptibleThread::InterruptibleThread(Function&& f)
{
    thread_ = std::thread([f = std::forward<Function>(f), stopState = stopState_]() mutable
    {
        impl::currentStopState = stopState.get();
        SFM_ON_SCOPE_EXIT(impl::currentStopState = nullptr);
        try
        {
            f(); //throw ThreadStopRequest
        }
        catch (ThreadStopRequest&) {}
    });
}


inline
void InterruptibleThread::requestStop() { stopState_->requestStop(); }
}

#endif //THREAD_H_8302719460285713
