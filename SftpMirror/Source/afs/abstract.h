// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef ABSTRACT_H_3310928475610293
#define ABSTRACT_H_3310928475610293

#include <functional>
#include <memory>
#include <vector>
#include <sfm/file_error.h>
#include <sfm/zstring.h>


namespace mirror
{
//remote side of a mirror: paths are absolute POSIX paths on the server
struct RemoteFileSystem
{
    virtual ~RemoteFileSystem() {}

    enum class ItemType
    {
        file,
        folder,
        other, //symlink, device, pipe: not mirrored
    };

    struct Item
    {
        Zstring itemName;
        ItemType type = ItemType::file;
        uint64_t fileSize = 0; //file only
    };

    struct InputStream
    {
        virtual ~InputStream() {}
        //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
        virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError, ThreadStopRequest
    };

    virtual std::wstring getDisplayPath(const Zstring& itemPath) const = 0;

    //- non-recursive
    //- "." and ".." are skipped
    virtual std::vector<Item> getFolderContent(const Zstring& folderPath) = 0; //throw FileError, ThreadStopRequest

    virtual uint64_t getFileSize(const Zstring& filePath) = 0; //throw FileError, ThreadStopRequest

    virtual std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t startOffset) = 0; //throw FileError, ThreadStopRequest

    //make blocked I/O of *all* threads fail immediately; callable from any thread
    virtual void abortPendingIo() = 0; //noexcept

protected:
    RemoteFileSystem() {}

private:
    RemoteFileSystem           (const RemoteFileSystem&) = delete;
    RemoteFileSystem& operator=(const RemoteFileSystem&) = delete;
};

//------------------------------------------------------------------------------------------

//sum of file sizes of the whole subtree; symlinks and special files count 0
uint64_t getFolderSizeRecursive(RemoteFileSystem& fs, const Zstring& folderPath); //throw FileError, ThreadStopRequest

//- creates missing parent folders of targetFilePath
//- continues an existing shorter local file, otherwise starts from scratch
//- returns final local file size
uint64_t copyFileToLocal(RemoteFileSystem& fs, const Zstring& filePath, const Zstring& targetFilePath); //throw FileError, ThreadStopRequest

//- copies the whole subtree using "parallelOps" worker threads
//- all files are attempted: first error is reported at the end
void copyFolderToLocal(RemoteFileSystem& fs, const Zstring& folderPath, const Zstring& targetFolderPath, size_t parallelOps); //throw FileError, ThreadStopRequest
}

#endif //ABSTRACT_H_3310928475610293
