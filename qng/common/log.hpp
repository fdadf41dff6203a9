#pragma once

#include <boost/filesystem.hpp>
#include <boost/log/sources/logger.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/util.hpp>

namespace qng
{
class LogConfig
{
public:
    LogConfig();
    qng::ErrorCode DeserializeJson(bool&, qng::Ptree&);
    void SerializeJson(qng::Ptree&) const;
    qng::ErrorCode UpgradeJson(bool&, uint32_t, qng::Ptree&) const;

    bool Network() const;
    bool Rpc() const;
    bool LogToCerr() const;
    bool Flush() const;
    uintmax_t MaxSize() const;
    uintmax_t RotationSize() const;

    static uint32_t constexpr VERSION = 1;

private:
    bool network_;
    bool rpc_;
    bool log_to_cerr_;
    bool flush_;
    uintmax_t max_size_;
    uintmax_t rotation_size_;
};

class Log
{
public:
    Log() = delete;

    static void Init(const boost::filesystem::path&, const qng::LogConfig&);
    static void Error(const std::string&);
    static void Network(const std::string&);
    static void Rpc(const std::string&);

    static qng::LogConfig config_;
    static boost::log::sources::logger_mt logger_;
};
} // namespace qng
