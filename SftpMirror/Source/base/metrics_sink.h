// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef METRICS_SINK_H_1029384756019283
#define METRICS_SINK_H_1029384756019283

#include <chrono>
#include <string>
#include <vector>
#include <sfm/sys_error.h>


namespace mirror
{
using MetricFields = std::vector<std::pair<std::string, double>>;      //ordered as written
using MetricTags   = std::vector<std::pair<std::string, std::string>>; //

class MetricsSink
{
public:
    virtual ~MetricsSink() {}

    virtual void sendMetric(const std::string& measurement, const MetricFields& fields, const MetricTags& tags) = 0; //throw SysError
};


//InfluxDB line protocol over a local stream socket: one connection per record
class TelegrafMetricsSink : public MetricsSink
{
public:
    explicit TelegrafMetricsSink(const Zstring& socketPath) : socketPath_(socketPath) {}

    void sendMetric(const std::string& measurement, const MetricFields& fields, const MetricTags& tags) override; //throw SysError

private:
    const Zstring socketPath_;
};

//------------------------------------------------------------------------------------------

//backslash before ',', ' ' and '=': measurement names, tag keys/values and field keys
std::string escapeLineProtocol(std::string_view str);

//float formatting: integral values keep a ".0" suffix
std::string formatFieldValue(double value);

//"measurement,tag1=val1,tag2=val2 field1=val1,field2=val2 timestampNs\n"
std::string formatLineProtocol(const std::string& measurement, const MetricFields& fields, const MetricTags& tags,
                               std::chrono::system_clock::time_point timestamp);
}

#endif //METRICS_SINK_H_1029384756019283
