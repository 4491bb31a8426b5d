// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef FAKE_REMOTE_H_3098457230984572
#define FAKE_REMOTE_H_3098457230984572

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <cstdlib>
#include <map>
#include <hvk/file_io.h>
#include <hvk/thread.h>
#include "../FtpHarvest/Source/afs/remote_session.h"
#include "../FtpHarvest/Source/base/harvest_callback.h"
#include "../FtpHarvest/Source/base/transfer_worker.h"


namespace fhv::test
{
using namespace hvk;

//scripted in-memory FTP server shared by all fake sessions
class FakeServer
{
public:
    struct FileBehavior
    {
        std::string content;
        int failFirstDownloads = 0; //fail this many downloads, then succeed
        bool alwaysFail = false;
        bool sizeSupported = true;
        bool sizeFails = false;       //SIZE reply rejected, RETR works
        bool hangDownload = false;    //block until interrupted
        bool unexpectedError = false; //downloadFile throws something other than FileError
    };

    void addFile(const Zstring& path, const FileBehavior& fb)
    {
        std::lock_guard dummy(lock_);
        files_[path] = fb;
    }

    void addFolder(const Zstring& path, const std::vector<std::string>& listing)
    {
        std::lock_guard dummy(lock_);
        folders_[path] = listing;
    }

    //network calls (session creation included)
    int getNetworkCalls() const { return sessionsCreated + sizeCalls + downloadCalls + listCalls; }

    std::atomic<int> sessionsCreated{0};
    std::atomic<int> sizeCalls{0};
    std::atomic<int> downloadCalls{0};
    std::atomic<int> listCalls{0};
    std::atomic<int> testCalls{0};
    std::atomic<int> closeCalls{0};
    std::atomic<int> sessionsAlive{0};
    std::atomic<int> sessionsAliveMax{0};

    std::atomic<int> createFailuresLeft{0};
    std::atomic<bool> failConnectionTest{false};

    std::vector<std::string> listDirectory(const Zstring& folderPath) //throw FileError
    {
        ++listCalls;
        std::lock_guard dummy(lock_);
        auto it = folders_.find(folderPath);
        if (it == folders_.end())
            throw FileError(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(folderPath)), L"550 No such directory.");
        return it->second;
    }

    std::optional<uint64_t> getFileSize(const Zstring& filePath) //throw FileError
    {
        ++sizeCalls;
        std::lock_guard dummy(lock_);
        auto it = files_.find(filePath);
        if (it == files_.end())
            throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), L"550 No such file.");
        if (it->second.sizeFails)
            throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), L"500 SIZE not understood.");
        if (!it->second.sizeSupported)
            return std::nullopt;
        return it->second.content.size();
    }

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) //throw FileError, X
    {
        ++downloadCalls;

        FileBehavior fb;
        bool failNow = false;
        {
            std::lock_guard dummy(lock_);
            auto it = files_.find(filePath);
            if (it == files_.end())
                throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), L"550 No such file.");

            fb = it->second;
            if (it->second.alwaysFail)
                failNow = true;
            else if (it->second.failFirstDownloads > 0)
            {
                --it->second.failFirstDownloads;
                failNow = true;
            }
        }

        if (fb.unexpectedError)
            throw std::runtime_error("Unexpected transport state.");

        if (fb.hangDownload)
            for (;;)
                hvk::interruptibleSleep(std::chrono::milliseconds(10)); //throw ThreadStopRequest

        //deliver in small blocks to exercise buffering
        const size_t deliverSize = failNow ? fb.content.size() / 2 : fb.content.size();
        for (size_t pos = 0; pos < deliverSize; pos += 7)
            writeBlock(fb.content.data() + pos, std::min<size_t>(7, deliverSize - pos)); //throw X

        if (failNow)
            throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), L"Connection reset by peer.");
    }

private:
    std::mutex lock_;
    std::map<Zstring, FileBehavior> files_;
    std::map<Zstring, std::vector<std::string>> folders_;
};


class FakeRemoteSession : public RemoteSession
{
public:
    explicit FakeRemoteSession(FakeServer& server) : server_(server)
    {
        const int alive = ++server_.sessionsAlive;
        for (int maxAlive = server_.sessionsAliveMax; alive > maxAlive && !server_.sessionsAliveMax.compare_exchange_weak(maxAlive, alive);)
            ;
    }
    ~FakeRemoteSession() { --server_.sessionsAlive; }

    std::vector<std::string> listDirectory(const Zstring& folderPath) override { return server_.listDirectory(folderPath); }
    std::optional<uint64_t> getFileSize(const Zstring& filePath) override { return server_.getFileSize(filePath); }

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) override
    {
        server_.downloadFile(filePath, writeBlock);
    }

    void testConnection() override
    {
        ++server_.testCalls;
        if (server_.failConnectionTest)
            throw FileError(L"Connection test failed.");
    }

    void close() override { ++server_.closeCalls; }

private:
    FakeServer& server_;
};


class FakeSessionFactory : public SessionFactory
{
public:
    explicit FakeSessionFactory(FakeServer& server) : server_(server) {}

    std::unique_ptr<RemoteSession> createSession() override
    {
        ++server_.sessionsCreated;
        for (int left = server_.createFailuresLeft; left > 0;)
            if (server_.createFailuresLeft.compare_exchange_weak(left, left - 1))
                throw FileError(L"Unable to connect to fake server.");

        return std::make_unique<FakeRemoteSession>(server_);
    }

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return L"fake:" + utfTo<std::wstring>(itemPath); }

private:
    FakeServer& server_;
};

//----------------------------------------------------------------------------------

//records requested delays without waiting
class FakeRetryClock : public RetryClock
{
public:
    void sleep(std::chrono::milliseconds duration) override
    {
        hvk::interruptionPoint(); //throw ThreadStopRequest
        std::lock_guard dummy(lock_);
        sleeps_.push_back(duration);
    }

    std::vector<std::chrono::milliseconds> getSleeps()
    {
        std::lock_guard dummy(lock_);
        return sleeps_;
    }

private:
    std::mutex lock_;
    std::vector<std::chrono::milliseconds> sleeps_;
};


inline MemorySampler makeMemorySampler(double usedPercent)
{
    return [usedPercent] { return hvk::MemoryStatus{16ULL << 30, static_cast<uint64_t>((16ULL << 30) * (100 - usedPercent) / 100), usedPercent}; };
}

//----------------------------------------------------------------------------------

//worker-side sink for tests running TransferWorker directly
class RecordingTransferCallback : public TransferCallback
{
public:
    void logMessage(const std::wstring& msg, MsgType type) override
    {
        std::lock_guard dummy(lock_);
        messages.push_back(msg);
    }

    void reportEvent(const TransferEvent& event) override
    {
        std::lock_guard dummy(lock_);
        events.push_back(event);
    }

    void updateFileProgress(const FileProgress& progress) override
    {
        std::lock_guard dummy(lock_);
        progressUpdates.push_back(progress);
    }

    std::vector<TransferEventType> getEventTypes()
    {
        std::lock_guard dummy(lock_);
        std::vector<TransferEventType> types;
        for (const TransferEvent& e : events)
            types.push_back(e.type);
        return types;
    }

    std::mutex lock_;
    std::vector<std::wstring> messages;
    std::vector<TransferEvent> events;
    std::vector<FileProgress> progressUpdates;
};


//main-thread sink for orchestrator runs
class RecordingHarvestCallback : public HarvestCallback
{
public:
    void logMessage(const std::wstring& msg, MsgType type) override { messages.emplace_back(msg, type); }
    void updateStatus(std::wstring&& msg) override { lastStatus = std::move(msg); }

    void reportEvent(const TransferEvent& event) override
    {
        events.push_back(event);
        if (event.type == TransferEventType::downloading)
            ++downloadsStarted;
    }

    void updateFileProgress(const FileProgress& progress) override { progressUpdates.push_back(progress); }

    void reportSummary(const TransferSnapshot& snapshot, const std::optional<hvk::MemoryStatus>& memStatus) override
    {
        summaries.push_back(snapshot);
    }

    void requestUiUpdate() override //throw AbortProcess
    {
        if (abortOnDownloadsStarted && downloadsStarted >= *abortOnDownloadsStarted)
            throw AbortProcess();
    }

    size_t countEvents(TransferEventType type) const
    {
        return std::count_if(events.begin(), events.end(), [type](const TransferEvent& e) { return e.type == type; });
    }

    std::optional<int> abortOnDownloadsStarted;
    int downloadsStarted = 0;

    std::vector<std::pair<std::wstring, MsgType>> messages;
    std::wstring lastStatus;
    std::vector<TransferEvent> events;
    std::vector<FileProgress> progressUpdates;
    std::vector<TransferSnapshot> summaries;
};

//----------------------------------------------------------------------------------

class TempFolder
{
public:
    TempFolder()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "ftpharvest_test_XXXXXX").string();
        if (!::mkdtemp(pattern.data()))
            throw std::runtime_error("mkdtemp failed");
        path_ = pattern;
    }
    ~TempFolder()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const Zstring& getPath() const { return path_; }

    std::vector<Zstring> listFileNames() const
    {
        std::vector<Zstring> names;
        for (const auto& entry : std::filesystem::directory_iterator(path_))
            names.push_back(entry.path().filename().string());
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring path_;
};


inline std::string makeContent(size_t size, char seed)
{
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i)
        content[i] = static_cast<char>(seed + i % 23);
    return content;
}
}

#endif //FAKE_REMOTE_H_3098457230984572
