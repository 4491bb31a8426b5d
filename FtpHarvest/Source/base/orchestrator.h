// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef ORCHESTRATOR_H_2093847502938475
#define ORCHESTRATOR_H_2093847502938475

#include "transfer_worker.h"


namespace fhv
{
struct OrchestratorConfig
{
    size_t workerCount  = 3;
    size_t permitCount  = 3; //in-flight network operations, independent of worker count
    size_t poolCapacity = 3;
    std::chrono::milliseconds connectionDelay{2000};
    double memoryThresholdPercent = 90;
    int summaryInterval = 20; //results between two aggregate snapshots
    TransferConfig transfer;
};


struct HarvestSummary
{
    int completed = 0;
    int skipped   = 0;
    int failed    = 0;
    int64_t totalBytes = 0;
    bool stopped = false; //cancelled: paths not processed are counted as failed
    std::chrono::milliseconds totalTime{};
};


class Orchestrator
{
public:
    Orchestrator(const OrchestratorConfig& cfg,
                 SessionFactory& sessionFactory,
                 const MemorySampler& memorySampler,
                 RetryClock* clock /*optional: default is real time*/);

    //context of main thread:
    HarvestSummary run(const std::vector<Zstring>& remotePaths, HarvestCallback& cb); //throw FileError (invalid arguments), X

    //thread-safe: pending paths fail as "stopped", in-flight transfers stop at their next interruption point
    void requestStop() { stopRequested_ = true; }

private:
    Orchestrator           (const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    const OrchestratorConfig cfg_;
    SessionFactory& sessionFactory_;
    const MemorySampler memorySampler_;
    RetryClock* const clock_;

    std::atomic<bool> stopRequested_{false};
};


void validateRemotePaths(const std::vector<Zstring>& remotePaths); //throw FileError
}

#endif //ORCHESTRATOR_H_2093847502938475
