// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "thread.h"
#include <algorithm>
#include <stdexcept>
#include <sys/prctl.h>
#include "string_tools.h"

using namespace hvk;


void impl::StopSignal::raise()
{
    {
        std::lock_guard dummy(lock_);
        raised_ = true;

        for (std::condition_variable* cv : waitingOn_)
            cv->notify_all(); //may be lost: waiters use a time out
    }
    wakeSleepers_.notify_all();
}


void impl::StopSignal::sleep(std::chrono::nanoseconds relTime) //throw ThreadStopRequest
{
    std::unique_lock dummy(lock_);
    if (wakeSleepers_.wait_for(dummy, relTime, [this] { return raised(); }))
        throw ThreadStopRequest();
}


void impl::StopSignal::beginWait(std::condition_variable& cv)
{
    std::lock_guard dummy(lock_);
    waitingOn_.push_back(&cv);
}


void impl::StopSignal::endWait(std::condition_variable& cv)
{
    std::lock_guard dummy(lock_);
    waitingOn_.erase(std::find(waitingOn_.begin(), waitingOn_.end(), &cv));
}


void hvk::interruptionPoint() //throw ThreadStopRequest
{
    if (impl::threadStopSignal && impl::threadStopSignal->raised())
        throw ThreadStopRequest();
}


void hvk::interruptibleSleep(std::chrono::nanoseconds relTime) //throw ThreadStopRequest
{
    if (impl::threadStopSignal)
        impl::threadStopSignal->sleep(relTime); //throw ThreadStopRequest
    else
        std::this_thread::sleep_for(relTime);
}


void hvk::setCurrentThreadName(const Zstring& threadName)
{
    ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0); //truncated to 15 chars
}


namespace
{
const std::thread::id mainThreadId = std::this_thread::get_id(); //static initialization runs on the main thread
}


bool hvk::runningOnMainThread()
{
    return mainThreadId == std::thread::id() /*still in static initialization*/ ||
           mainThreadId == std::this_thread::get_id();
}

//------------------------------------------------------------------------------------------

WorkerGroup::WorkerGroup(size_t threadCountMax, const Zstring& groupName) :
    threadCountMax_(threadCountMax),
    groupName_(groupName)
{
    if (threadCountMax == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void WorkerGroup::run(std::function<void()>&& task)
{
    {
        std::lock_guard dummy(lock_);
        tasks_.push_back(std::move(task));
        ++tasksPending_;

        if (threads_.size() < std::min(tasksPending_, threadCountMax_))
        {
            const Zstring threadName = groupName_ + Zstr('[') + numberTo<Zstring>(threads_.size() + 1) + Zstr('/') +
                                       numberTo<Zstring>(threadCountMax_) + Zstr(']');
            threads_.emplace_back([this, threadName]
            {
                setCurrentThreadName(threadName);
                impl::threadStopSignal = &stopSignal_;
                try
                {
                    serveTasks(); //throw ThreadStopRequest
                }
                catch (ThreadStopRequest&) {}
            });
        }
    }
    taskAvailable_.notify_one();
}


void WorkerGroup::serveTasks() //throw ThreadStopRequest
{
    std::unique_lock dummy(lock_);
    for (;;)
    {
        interruptibleWait(taskAvailable_, dummy, [this] { return !tasks_.empty(); }); //throw ThreadStopRequest

        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop_front();

        dummy.unlock();
        task(); //throw ThreadStopRequest
        dummy.lock();

        if (--tasksPending_ == 0 && !onDone_.empty())
        {
            const std::vector<std::function<void()>> callbacks = std::exchange(onDone_, {});
            dummy.unlock();
            for (const std::function<void()>& cb : callbacks)
                cb();
            dummy.lock();
        }
    }
}


void WorkerGroup::notifyWhenDone(const std::function<void()>& onCompletion)
{
    {
        std::lock_guard dummy(lock_);
        if (tasksPending_ > 0)
        {
            onDone_.push_back(onCompletion);
            return;
        }
    }
    onCompletion();
}


void WorkerGroup::stopAndJoin()
{
    stopSignal_.raise();

    std::vector<std::thread> threads;
    {
        std::lock_guard dummy(lock_);
        threads.swap(threads_);
    }
    for (std::thread& t : threads)
        t.join();
}
