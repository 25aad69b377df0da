// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>
#include <thread>
#include <gtest/gtest.h>
#include <base/metrics_sink.h>
#include "test_util.h"

using namespace sfm;
using namespace mirror;
using namespace mirror::test;


TEST(LineProtocol, Escaping)
{
    EXPECT_EQ(escapeLineProtocol("plain"), "plain");
    EXPECT_EQ(escapeLineProtocol("a b,c=d"), "a\\ b\\,c\\=d");
    EXPECT_EQ(escapeLineProtocol(""), "");
}


TEST(LineProtocol, FieldValues)
{
    EXPECT_EQ(formatFieldValue(0), "0.0");
    EXPECT_EQ(formatFieldValue(1234), "1234.0");
    EXPECT_EQ(formatFieldValue(0.5), "0.5");
    EXPECT_EQ(formatFieldValue(2.25), "2.25");
}


TEST(LineProtocol, CompleteLine)
{
    const std::chrono::system_clock::time_point timestamp{std::chrono::seconds(1700000000)};

    const std::string line = formatLineProtocol("sftp_mirror_download",
    {
        {"bytes", 1024},
        {"duration_seconds", 0.5},
        {"bytes_per_second", 2048},
    },
    {
        {"server", "sftp.example.com"},
        {"type", "file"},
        {"item", "my file,v2.dat"},
    }, timestamp);

    EXPECT_EQ(line, "sftp_mirror_download,server=sftp.example.com,type=file,item=my\\ file\\,v2.dat "
              "bytes=1024.0,duration_seconds=0.5,bytes_per_second=2048.0 1700000000000000000\n");
}


TEST(LineProtocol, NoTags)
{
    const std::chrono::system_clock::time_point timestamp{std::chrono::seconds(1)};

    EXPECT_EQ(formatLineProtocol("m", {{"f", 1}}, {}, timestamp), "m f=1.0 1000000000\n");
}


TEST(TelegrafMetricsSink, WritesOneLinePerRecord)
{
    TempFolder tmp;
    const Zstring socketPath = tmp("telegraf.sock");

    const int listenSocket = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    ASSERT_GE(listenSocket, 0);

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    ASSERT_LT(socketPath.size(), sizeof(addr.sun_path));
    std::memcpy(addr.sun_path, socketPath.c_str(), socketPath.size() + 1);

    ASSERT_EQ(::bind(listenSocket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listenSocket, 1), 0);

    std::string received;
    std::thread server([&]
    {
        const int conn = ::accept(listenSocket, nullptr, nullptr);
        if (conn < 0)
            return;
        char buffer[1024];
        for (;;)
        {
            const ssize_t bytesRead = ::read(conn, buffer, sizeof(buffer));
            if (bytesRead <= 0)
                break;
            received.append(buffer, bytesRead);
        }
        ::close(conn);
    });

    TelegrafMetricsSink sink(socketPath);
    EXPECT_NO_THROW(sink.sendMetric("sftp_mirror_summary", {{"files_downloaded", 2}}, {{"server", "host"}}));

    server.join();
    ::close(listenSocket);

    EXPECT_TRUE(startsWith(received, "sftp_mirror_summary,server=host files_downloaded=2.0 "));
    EXPECT_TRUE(endsWith(received, "\n"));
}


TEST(TelegrafMetricsSink, MissingSocketIsReported)
{
    TempFolder tmp;
    TelegrafMetricsSink sink(tmp("no-such.sock"));

    EXPECT_THROW(sink.sendMetric("m", {{"f", 1}}, {}), SysError);
}
