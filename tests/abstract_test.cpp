// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <afs/native.h>
#include "fake_remote.h"
#include "test_util.h"

using namespace sfm;
using namespace mirror;
using namespace mirror::test;


namespace
{
void addSampleTree(FakeRemoteFileSystem& fs)
{
    fs.addFolder("/data");
    fs.addFolder("/data/2024-05-01");
    fs.addFile  ("/data/2024-05-01/a.csv", "aaaaaaaaaa");
    fs.addFolder("/data/2024-05-01/raw");
    fs.addFile  ("/data/2024-05-01/raw/b.bin", std::string(1000, 'b'));
    fs.addOther ("/data/2024-05-01/current");
    fs.addFolder("/data/2024-05-01/empty");
}
}


TEST(RemoteFolderSize, SumsWholeSubtree)
{
    FakeRemoteFileSystem fs;
    addSampleTree(fs);

    EXPECT_EQ(getFolderSizeRecursive(fs, "/data/2024-05-01"), 1010u);
    EXPECT_EQ(getFolderSizeRecursive(fs, "/data/2024-05-01/empty"), 0u);
}


TEST(RemoteFolderSize, ListingErrorIsPropagated)
{
    FakeRemoteFileSystem fs;
    addSampleTree(fs);
    fs.failListing("/data/2024-05-01/raw");

    EXPECT_THROW(getFolderSizeRecursive(fs, "/data/2024-05-01"), FileError);
}


TEST(CopyFile, FreshDownloadCreatesParentFolders)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    fs.addFolder("/data");
    fs.addFile("/data/report.txt", "hello world");

    const Zstring targetPath = tmp("new/sub/report.txt");
    EXPECT_EQ(copyFileToLocal(fs, "/data/report.txt", targetPath), 11u);
    EXPECT_EQ(getFileContent(targetPath), "hello world");

    ASSERT_EQ(fs.getOpenedStreams().size(), 1u);
    EXPECT_EQ(fs.getOpenedStreams()[0].second, 0u);
}


TEST(CopyFile, ShorterLocalFileIsContinued)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    fs.addFolder("/data");
    fs.addFile("/data/big.bin", "0123456789");

    const Zstring targetPath = tmp("big.bin");
    writeLocalFile(targetPath, "0123");

    EXPECT_EQ(copyFileToLocal(fs, "/data/big.bin", targetPath), 10u);
    EXPECT_EQ(getFileContent(targetPath), "0123456789");

    ASSERT_EQ(fs.getOpenedStreams().size(), 1u);
    EXPECT_EQ(fs.getOpenedStreams()[0].second, 4u);
}


TEST(CopyFile, LongerLocalFileIsReplaced)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    fs.addFolder("/data");
    fs.addFile("/data/small.txt", "new");

    const Zstring targetPath = tmp("small.txt");
    writeLocalFile(targetPath, "much longer old content");

    EXPECT_EQ(copyFileToLocal(fs, "/data/small.txt", targetPath), 3u);
    EXPECT_EQ(getFileContent(targetPath), "new");
    EXPECT_EQ(fs.getOpenedStreams()[0].second, 0u);
}


TEST(CopyFile, ReadErrorKeepsPartialContent)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    fs.addFolder("/data");
    fs.addFile("/data/flaky.bin", "abcdefghij");
    fs.failRead("/data/flaky.bin");

    const Zstring targetPath = tmp("flaky.bin");
    EXPECT_THROW(copyFileToLocal(fs, "/data/flaky.bin", targetPath), FileError);

    EXPECT_EQ(getFileContent(targetPath), "abc"); //first chunk arrived: next run resumes from here
}


TEST(CopyFolder, CopiesFilesAndFoldersOnly)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    addSampleTree(fs);

    const Zstring targetPath = tmp("2024-05-01");
    copyFolderToLocal(fs, "/data/2024-05-01", targetPath, 3);

    EXPECT_EQ(getFileContent(tmp("2024-05-01/a.csv")), "aaaaaaaaaa");
    EXPECT_EQ(getFileContent(tmp("2024-05-01/raw/b.bin")), std::string(1000, 'b'));
    EXPECT_EQ(getItemTypeIfExists(tmp("2024-05-01/empty")), sfm::ItemType::folder);
    EXPECT_EQ(getItemTypeIfExists(tmp("2024-05-01/current")), std::nullopt);

    EXPECT_EQ(getLocalSizeRecursive(targetPath), 1010u);
}


TEST(CopyFolder, CompleteFilesAreNotFetchedAgain)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    addSampleTree(fs);

    writeLocalFile(tmp("2024-05-01/raw/b.bin"), std::string(1000, 'b'));

    copyFolderToLocal(fs, "/data/2024-05-01", tmp("2024-05-01"), 2);

    const std::vector<std::pair<Zstring, uint64_t>> opened = fs.getOpenedStreams();
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].first, "/data/2024-05-01/a.csv");
}


TEST(CopyFolder, FirstErrorIsReportedAfterCopyingTheRest)
{
    TempFolder tmp;
    FakeRemoteFileSystem fs;
    addSampleTree(fs);
    fs.failListing("/data/2024-05-01/raw");

    EXPECT_THROW(copyFolderToLocal(fs, "/data/2024-05-01", tmp("2024-05-01"), 1), FileError);

    EXPECT_EQ(getFileContent(tmp("2024-05-01/a.csv")), "aaaaaaaaaa");
}


TEST(CopyFolder, ParallelDownloadsStayWithinLimit)
{
    for (const size_t parallelOps : {1, 2, 4})
    {
        TempFolder tmp;
        FakeRemoteFileSystem fs;
        fs.addFolder("/data");
        fs.addFolder("/data/day");
        for (int i = 0; i < 8; ++i)
            fs.addFile("/data/day/part" + numberTo<Zstring>(i) + ".bin", std::string(30, 'p'));
        fs.setReadDelay(std::chrono::milliseconds(20)); //~200 ms per file

        copyFolderToLocal(fs, "/data/day", tmp("day"), parallelOps);

        EXPECT_EQ(fs.getOpenedStreams().size(), 8u);
        EXPECT_EQ(fs.getMaxOpenStreams(), static_cast<int>(parallelOps)) << "parallelOps: " << parallelOps;
        EXPECT_EQ(getLocalSizeRecursive(tmp("day")), 240u);
    }
}
