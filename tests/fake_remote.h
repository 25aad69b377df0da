// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef FAKE_REMOTE_H_8820193746501928
#define FAKE_REMOTE_H_8820193746501928

#include <algorithm>
#include <atomic>
#include <map>
#include <set>
#include <thread>
#include <sfm/file_path.h>
#include <sfm/thread.h>
#include <afs/abstract.h>


namespace mirror::test
{
//in-memory server tree; thread-safe like the SFTP implementation
class FakeRemoteFileSystem : public RemoteFileSystem
{
public:
    enum class Hang
    {
        none,
        interruptible, //honors ThreadStopRequest
        ignoresStop,   //only abortPendingIo() ends it
    };

    void addFolder(const Zstring& folderPath) { addNode(folderPath, {ItemType::folder, {}}); }
    void addFile(const Zstring& filePath, const std::string& content) { addNode(filePath, {ItemType::file, content}); }
    void addOther(const Zstring& itemPath) { addNode(itemPath, {ItemType::other, {}}); }

    void failListing(const Zstring& folderPath) { state_.access([&](State& s) { s.failingListings.insert(folderPath); }); }
    void failSize   (const Zstring& itemPath  ) { state_.access([&](State& s) { s.failingSizes   .insert(itemPath); }); }
    void failRead   (const Zstring& filePath  ) { state_.access([&](State& s) { s.failingReads   .insert(filePath); }); }

    //blocks every subsequent operation on itemPath
    void hangOn(const Zstring& itemPath, Hang hang) { state_.access([&](State& s) { s.hangingPaths[itemPath] = hang; }); }

    //each tryRead() takes at least this long
    void setReadDelay(std::chrono::milliseconds delay) { readDelay_ = delay; }

    std::vector<std::pair<Zstring, uint64_t>> getOpenedStreams() { return state_.access([](const State& s) { return s.openedStreams; }); }

    //highest number of input streams alive at the same time
    int getMaxOpenStreams() { return state_.access([](const State& s) { return s.maxOpenStreams; }); }

    int getSizeQueryCount() const { return sizeQueries_; }
    int getListingCount  () const { return listings_; }
    int getAbortCount    () const { return abortCount_; }

    //--------------------------------------------------------------------------------

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return L"fake:" + sfm::utfTo<std::wstring>(itemPath); }

    std::vector<Item> getFolderContent(const Zstring& folderPath) override
    {
        ++listings_;
        hangIfRequested(folderPath); //throw FileError, ThreadStopRequest

        return state_.access([&](const State& s)
        {
            if (s.failingListings.contains(folderPath))
                throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot read directory %x.", L"%x", sfm::fmtPath(getDisplayPath(folderPath))), L"Permission denied.");

            auto it = s.nodes.find(folderPath);
            if (it == s.nodes.end() || it->second.type != ItemType::folder)
                throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot open directory %x.", L"%x", sfm::fmtPath(getDisplayPath(folderPath))), L"No such file.");

            std::vector<Item> items;
            for (const Zstring& itemPath : s.insertionOrder)
                if (sfm::getParentFolderPath(itemPath) == folderPath)
                {
                    const Node& node = s.nodes.at(itemPath);
                    items.push_back({sfm::getItemName(itemPath), node.type, node.type == ItemType::file ? node.content.size() : 0});
                }
            return items;
        });
    }

    uint64_t getFileSize(const Zstring& filePath) override
    {
        ++sizeQueries_;
        hangIfRequested(filePath); //throw FileError, ThreadStopRequest

        return state_.access([&](const State& s) -> uint64_t
        {
            if (s.failingSizes.contains(filePath))
                throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot read file attributes of %x.", L"%x", sfm::fmtPath(getDisplayPath(filePath))), L"Failure.");

            auto it = s.nodes.find(filePath);
            if (it == s.nodes.end() || it->second.type != ItemType::file)
                throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot read file attributes of %x.", L"%x", sfm::fmtPath(getDisplayPath(filePath))), L"No such file.");
            return it->second.content.size();
        });
    }

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t startOffset) override
    {
        hangIfRequested(filePath); //throw FileError, ThreadStopRequest

        const auto [content, failing] = state_.access([&](State& s)
        {
            auto it = s.nodes.find(filePath);
            if (it == s.nodes.end() || it->second.type != ItemType::file)
                throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot open file %x.", L"%x", sfm::fmtPath(getDisplayPath(filePath))), L"No such file.");

            s.openedStreams.emplace_back(filePath, startOffset);
            s.maxOpenStreams = std::max(s.maxOpenStreams, ++s.openStreams);
            return std::make_pair(it->second.content, s.failingReads.contains(filePath));
        });
        return std::make_unique<FakeInputStream>(*this, content, startOffset, failing);
    }

    void abortPendingIo() override { ++abortCount_; }

private:
    struct Node
    {
        ItemType type = ItemType::file;
        std::string content;
    };

    struct State
    {
        std::map<Zstring, Node> nodes;
        std::vector<Zstring> insertionOrder; //server listing order
        std::set<Zstring> failingListings;
        std::set<Zstring> failingSizes;
        std::set<Zstring> failingReads;
        std::map<Zstring, Hang> hangingPaths;
        std::vector<std::pair<Zstring, uint64_t>> openedStreams;
        int openStreams = 0;
        int maxOpenStreams = 0;
    };

    class FakeInputStream : public InputStream
    {
    public:
        FakeInputStream(FakeRemoteFileSystem& fs, const std::string& content, uint64_t startOffset, bool failing) :
            fs_(fs), content_(content), pos_(std::min<size_t>(startOffset, content.size())), failing_(failing) {}

        ~FakeInputStream() { fs_.state_.access([](State& s) { --s.openStreams; }); }

        size_t tryRead(void* buffer, size_t bytesToRead) override
        {
            if (const std::chrono::milliseconds delay = fs_.readDelay_; delay.count() > 0)
                std::this_thread::sleep_for(delay);

            if (failing_ && pos_ > 0) //fail mid-transfer: partial content stays on disk
                throw sfm::FileError(L"Cannot read file.", L"Connection reset.");

            const size_t bytesRead = std::min<size_t>({bytesToRead, content_.size() - pos_, 3 /*force short reads*/});
            std::copy(content_.begin() + pos_, content_.begin() + pos_ + bytesRead, static_cast<char*>(buffer));
            pos_ += bytesRead;
            return bytesRead;
        }

    private:
        FakeRemoteFileSystem& fs_;
        const std::string content_;
        size_t pos_ = 0;
        const bool failing_;
    };

    void addNode(const Zstring& itemPath, const Node& node)
    {
        state_.access([&](State& s)
        {
            if (s.nodes.emplace(itemPath, node).second)
                s.insertionOrder.push_back(itemPath);
        });
    }

    void hangIfRequested(const Zstring& itemPath) //throw FileError, ThreadStopRequest
    {
        const Hang hang = state_.access([&](const State& s)
        {
            auto it = s.hangingPaths.find(itemPath);
            return it != s.hangingPaths.end() ? it->second : Hang::none;
        });
        if (hang == Hang::none)
            return;

        const int abortCountStart = abortCount_;
        const auto giveUpTime = std::chrono::steady_clock::now() + std::chrono::seconds(20); //never block a broken test forever

        while (abortCount_ == abortCountStart && std::chrono::steady_clock::now() < giveUpTime)
            if (hang == Hang::interruptible)
                sfm::interruptibleSleep(std::chrono::milliseconds(10)); //throw ThreadStopRequest
            else
                std::this_thread::sleep_for(std::chrono::milliseconds(10));

        throw sfm::FileError(sfm::replaceCpy<std::wstring>(L"Cannot access %x.", L"%x", sfm::fmtPath(getDisplayPath(itemPath))), L"Connection aborted.");
    }

    sfm::Protected<State> state_;
    std::atomic<int> sizeQueries_{0};
    std::atomic<int> listings_{0};
    std::atomic<int> abortCount_{0};
    std::chrono::milliseconds readDelay_{0}; //set before any transfer starts
};
}

#endif //FAKE_REMOTE_H_8820193746501928
