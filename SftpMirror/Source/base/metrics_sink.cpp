// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "metrics_sink.h"
#include <algorithm>
#include <cmath>
#include <sfm/socket.h>

using namespace sfm;
using namespace mirror;


std::string mirror::escapeLineProtocol(std::string_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const char c : str)
    {
        if (c == ',' || c == ' ' || c == '=')
            output += '\\';
        output += c;
    }
    return output;
}


std::string mirror::formatFieldValue(double value)
{
    std::string output = numberTo<std::string>(value);

    if (std::isfinite(value) && std::none_of(output.begin(), output.end(), [](char c) { return c == '.' || c == 'e'; }))
        output += ".0";
    return output;
}


std::string mirror::formatLineProtocol(const std::string& measurement, const MetricFields& fields, const MetricTags& tags,
                                       std::chrono::system_clock::time_point timestamp)
{
    std::string line = escapeLineProtocol(measurement);

    for (const auto& [key, value] : tags)
        line += ',' + escapeLineProtocol(key) + '=' + escapeLineProtocol(value);

    line += ' ';
    for (auto it = fields.begin(); it != fields.end(); ++it)
    {
        if (it != fields.begin())
            line += ',';
        line += escapeLineProtocol(it->first) + '=' + formatFieldValue(it->second);
    }

    const int64_t timestampNs = std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp.time_since_epoch()).count();
    line += ' ' + numberTo<std::string>(timestampNs) + '\n';
    return line;
}


void TelegrafMetricsSink::sendMetric(const std::string& measurement, const MetricFields& fields, const MetricTags& tags) //throw SysError
{
    const std::string line = formatLineProtocol(measurement, fields, tags, std::chrono::system_clock::now());

    Socket socket(socketPath_); //throw SysError
    writeSocket(socket.get(), line); //throw SysError
}
