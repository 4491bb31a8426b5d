// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef CONCURRENCY_PERMIT_H_2309845720934857
#define CONCURRENCY_PERMIT_H_2309845720934857

#include <hvk/thread.h>


namespace fhv
{
//counting permit; waiting is an interruption point
class ConcurrencyPermit
{
public:
    explicit ConcurrencyPermit(size_t permitCount) : available_(permitCount), permitCount_(permitCount)
    { if (permitCount == 0) throw std::logic_error(std::string(__FILE__) + '[' + hvk::numberTo<std::string>(__LINE__) + "] Contract violation!"); }

    void acquire() //throw ThreadStopRequest
    {
        std::unique_lock dummy(lockPermits_);
        hvk::interruptibleWait(conditionPermitFree_, dummy, [this] { return available_ > 0; }); //throw ThreadStopRequest
        --available_;
    }

    void release()
    {
        {
            std::lock_guard dummy(lockPermits_);
            assert(available_ < permitCount_);
            ++available_;
        }
        conditionPermitFree_.notify_one();
    }

    size_t getAvailable()
    {
        std::lock_guard dummy(lockPermits_);
        return available_;
    }

private:
    ConcurrencyPermit           (const ConcurrencyPermit&) = delete;
    ConcurrencyPermit& operator=(const ConcurrencyPermit&) = delete;

    std::mutex lockPermits_;
    std::condition_variable conditionPermitFree_;
    size_t available_;
    const size_t permitCount_;
};


class PermitHolder
{
public:
    explicit PermitHolder(ConcurrencyPermit& permit) : permit_(permit) { permit_.acquire(); } //throw ThreadStopRequest
    ~PermitHolder() { permit_.release(); }

private:
    PermitHolder           (const PermitHolder&) = delete;
    PermitHolder& operator=(const PermitHolder&) = delete;

    ConcurrencyPermit& permit_;
};
}

#endif //CONCURRENCY_PERMIT_H_2309845720934857
