// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <unistd.h>
#include <gtest/gtest.h>
#include <afs/native.h>
#include "test_util.h"

using namespace sfm;
using namespace mirror;
using namespace mirror::test;


TEST(LocalSize, MissingItem)
{
    TempFolder tmp;
    EXPECT_EQ(getLocalSizeRecursive(tmp("nothing-here")), std::nullopt);
}


TEST(LocalSize, SingleFile)
{
    TempFolder tmp;
    writeLocalFile(tmp("data.bin"), std::string(1234, 'x'));

    EXPECT_EQ(getLocalSizeRecursive(tmp("data.bin")), 1234u);
}


TEST(LocalSize, EmptyFolderIsZero)
{
    TempFolder tmp;
    createDirectoryIfMissingRecursion(tmp("empty"));

    EXPECT_EQ(getLocalSizeRecursive(tmp("empty")), 0u);
}


TEST(LocalSize, NestedFolder)
{
    TempFolder tmp;
    writeLocalFile(tmp("2024-01-01/a.txt"), "12345");
    writeLocalFile(tmp("2024-01-01/sub/b.txt"), "123");
    writeLocalFile(tmp("2024-01-01/sub/deeper/c.txt"), std::string(100, 'c'));
    createDirectoryIfMissingRecursion(tmp("2024-01-01/sub/empty"));

    EXPECT_EQ(getLocalSizeRecursive(tmp("2024-01-01")), 108u);
}


TEST(LocalSize, NestedSymlinksAreNotFollowed)
{
    TempFolder tmp;
    writeLocalFile(tmp("target.bin"), std::string(500, 't'));
    writeLocalFile(tmp("folder/own.bin"), "1234");
    ASSERT_EQ(::symlink(tmp("target.bin").c_str(), tmp("folder/link.bin").c_str()), 0);

    EXPECT_EQ(getLocalSizeRecursive(tmp("folder")), 4u);
}


TEST(LocalSize, TopLevelSymlinkIsFollowed)
{
    TempFolder tmp;
    writeLocalFile(tmp("volume2/2024/a.txt"), "12345");
    writeLocalFile(tmp("volume2/2024/sub/b.txt"), "123");
    writeLocalFile(tmp("volume2/target.bin"), std::string(500, 't'));
    ASSERT_EQ(::symlink(tmp("volume2/2024").c_str(), tmp("2024").c_str()), 0);
    ASSERT_EQ(::symlink(tmp("volume2/target.bin").c_str(), tmp("link.bin").c_str()), 0);
    ASSERT_EQ(::symlink(tmp("gone").c_str(), tmp("dangling").c_str()), 0);

    EXPECT_EQ(getLocalSizeRecursive(tmp("2024")), 8u);
    EXPECT_EQ(getLocalSizeRecursive(tmp("link.bin")), 500u);
    EXPECT_EQ(getLocalSizeRecursive(tmp("dangling")), 0u);
}


TEST(LocalFolder, SymlinkToFolderCountsAsExisting)
{
    TempFolder tmp;
    createDirectoryIfMissingRecursion(tmp("volume2/2024"));
    writeLocalFile(tmp("file.txt"), "x");
    ASSERT_EQ(::symlink(tmp("volume2/2024").c_str(), tmp("2024").c_str()), 0);
    ASSERT_EQ(::symlink(tmp("file.txt").c_str(), tmp("file-link").c_str()), 0);

    EXPECT_NO_THROW(createDirectoryIfMissingRecursion(tmp("2024")));
    EXPECT_NO_THROW(createDirectoryIfMissingRecursion(tmp("2024/sub")));
    EXPECT_EQ(getItemTypeIfExists(tmp("volume2/2024/sub")), sfm::ItemType::folder);

    EXPECT_THROW(createDirectoryIfMissingRecursion(tmp("file-link")), FileError);
}
