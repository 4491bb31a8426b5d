// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef TRANSFER_STATS_H_3480957234095723
#define TRANSFER_STATS_H_3480957234095723

#include <cstdint>
#include <hvk/thread.h>


namespace fhv
{
enum class TransferOutcome
{
    completed,
    skipped,
    failed,
};


//terminal outcome of one remote path: exactly one per path
struct TransferResult
{
    TransferOutcome outcome = TransferOutcome::failed;
    int64_t bytes = 0; //completed: bytes of the successful attempt; skipped: size on disk; failed: 0
    int attempts = 0;
    std::wstring errorMsg; //failed only
};


struct TransferSnapshot
{
    int completed = 0;
    int skipped   = 0;
    int failed    = 0;
    int64_t totalBytes = 0;

    int resultCount() const { return completed + skipped + failed; }
};


//mutated by all transfer threads, read by the orchestrating thread
class TransferStats
{
public:
    void record(TransferOutcome outcome, int64_t bytesMoved)
    {
        stats_.access([&](TransferSnapshot& s)
        {
            switch (outcome)
            {
                case TransferOutcome::completed:
                    ++s.completed;
                    s.totalBytes += bytesMoved;
                    break;
                case TransferOutcome::skipped:
                    ++s.skipped;
                    s.totalBytes += bytesMoved;
                    break;
                case TransferOutcome::failed:
                    assert(bytesMoved == 0);
                    ++s.failed;
                    break;
            }
        });
    }

    void record(const TransferResult& result) { record(result.outcome, result.bytes); }

    //all four fields read under the same lock
    TransferSnapshot snapshot() const
    {
        return stats_.access([](const TransferSnapshot& s) { return s; });
    }

private:
    mutable hvk::Protected<TransferSnapshot> stats_;
};
}

#endif //TRANSFER_STATS_H_3480957234095723
