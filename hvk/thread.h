// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef THREAD_H_7896323423432235246427
#define THREAD_H_7896323423432235246427

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "scope_guard.h"
#include "zstring.h"


namespace hvk
{
/* Cooperative cancellation for WorkerGroup threads:
    - WorkerGroup::stopAndJoin() raises the stop signal shared by all of its threads
    - the worker notices at the next interruption point and unwinds via ThreadStopRequest
    - outside of a WorkerGroup thread the functions below are plain waits/sleeps      */
class ThreadStopRequest {};

void interruptionPoint(); //throw ThreadStopRequest

template <class Predicate>
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred); //throw ThreadStopRequest

void interruptibleSleep(std::chrono::nanoseconds relTime); //throw ThreadStopRequest

void setCurrentThreadName(const Zstring& threadName);

bool runningOnMainThread();

//------------------------------------------------------------------------------------------

//value that can only be accessed while holding its mutex
template <class T>
class Protected
{
public:
    Protected() {}
    explicit Protected(T value) : value_(std::move(value)) {}

    template <class Function>
    auto access(Function fun) //fun: "auto (T&)"
    {
        std::lock_guard dummy(lock_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lock_;
    T value_{};
};

//------------------------------------------------------------------------------------------

namespace impl
{
class StopSignal
{
public:
    void raise();
    bool raised() const { return raised_; }

    void sleep(std::chrono::nanoseconds relTime); //throw ThreadStopRequest

    //foreign condition variables can't be signalled reliably without their mutex => waiters also poll
    void beginWait(std::condition_variable& cv);
    void endWait  (std::condition_variable& cv);

private:
    std::atomic<bool> raised_{false};

    std::mutex lock_;
    std::condition_variable wakeSleepers_;
    std::vector<std::condition_variable*> waitingOn_; //multiset: several workers may wait on the same cv
};

inline thread_local StopSignal* threadStopSignal = nullptr; //null: not a WorkerGroup thread
}


//FIFO task queue served by at most "threadCountMax" threads; threads are started on demand
class WorkerGroup
{
public:
    WorkerGroup(size_t threadCountMax, const Zstring& groupName);
    ~WorkerGroup() { stopAndJoin(); }

    //context of controlling OR worker thread, non-blocking
    void run(std::function<void()>&& task /*may throw ThreadStopRequest*/);

    //context of controlling thread: "onCompletion" runs once no task is pending (on a worker thread unless already idle)
    void notifyWhenDone(const std::function<void()>& onCompletion /*noexcept!*/);

    //context of controlling thread: interrupt running tasks and drop queued ones
    void stopAndJoin();

private:
    WorkerGroup           (const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void serveTasks(); //throw ThreadStopRequest

    const size_t threadCountMax_;
    const Zstring groupName_;

    impl::StopSignal stopSignal_;
    std::vector<std::thread> threads_;

    std::mutex lock_;
    std::condition_variable taskAvailable_;
    std::deque<std::function<void()>> tasks_;
    size_t tasksPending_ = 0; //queued + running
    std::vector<std::function<void()>> onDone_;
};








//###################### implementation ######################

template <class Predicate> inline
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
{
    impl::StopSignal* const signal = impl::threadStopSignal;
    if (!signal)
        return cv.wait(lock, pred);

    signal->beginWait(cv);
    HVK_ON_SCOPE_EXIT(signal->endWait(cv));

    while (!cv.wait_for(lock, std::chrono::milliseconds(10), [&] { return signal->raised() || pred(); }))
        ;
    if (signal->raised())
        throw ThreadStopRequest();
}
}

#endif //THREAD_H_7896323423432235246427
