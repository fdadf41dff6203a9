#include <qng/common/log.hpp>

#include <atomic>
#include <iostream>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

uint32_t constexpr qng::LogConfig::VERSION;
qng::LogConfig qng::Log::config_;
boost::log::sources::logger_mt qng::Log::logger_;

qng::LogConfig::LogConfig()
    : network_(true),
      rpc_(true),
      log_to_cerr_(false),
      flush_(true),
      max_size_(16 * 1024 * 1024),
      rotation_size_(4 * 1024 * 1024)
{
}

qng::ErrorCode qng::LogConfig::DeserializeJson(bool& upgraded,
                                               qng::Ptree& ptree)
{
    qng::ErrorCode error_code = qng::ErrorCode::SUCCESS;
    try
    {
        error_code = qng::ErrorCode::JSON_CONFIG_LOG_VERSION;
        std::string version_str = ptree.get<std::string>("version");
        uint32_t version = 0;
        bool error = qng::StringToUint(version_str, version);
        IF_ERROR_RETURN(error, error_code);

        error_code = UpgradeJson(upgraded, version, ptree);
        IF_NOT_SUCCESS_RETURN(error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_NETWORK;
        network_ = ptree.get<bool>("network");

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_RPC;
        rpc_ = ptree.get<bool>("rpc");

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_TO_CERR;
        log_to_cerr_ = ptree.get<bool>("log_to_cerr");

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_MAX_SIZE;
        max_size_ = ptree.get<uintmax_t>("max_size");

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_ROTATION_SIZE;
        rotation_size_ = ptree.get<uintmax_t>("rotation_size");

        error_code = qng::ErrorCode::JSON_CONFIG_LOG_FLUSH;
        flush_ = ptree.get<bool>("flush");
    }
    catch (const std::exception&)
    {
        return error_code;
    }
    return qng::ErrorCode::SUCCESS;
}

void qng::LogConfig::SerializeJson(qng::Ptree& ptree) const
{
    ptree.put("version", qng::LogConfig::VERSION);
    ptree.put("network", network_);
    ptree.put("rpc", rpc_);
    ptree.put("log_to_cerr", log_to_cerr_);
    ptree.put("max_size", max_size_);
    ptree.put("rotation_size", rotation_size_);
    ptree.put("flush", flush_);
}

qng::ErrorCode qng::LogConfig::UpgradeJson(bool& upgraded, uint32_t version,
                                           qng::Ptree& ptree) const
{
    switch (version)
    {
        case 1:
        {
            break;
        }
        default:
        {
            return qng::ErrorCode::CONFIG_LOG_VERSION;
        }
    }

    return qng::ErrorCode::SUCCESS;
}

bool qng::LogConfig::Network() const
{
    return network_;
}

bool qng::LogConfig::Rpc() const
{
    return rpc_;
}

bool qng::LogConfig::LogToCerr() const
{
    return log_to_cerr_;
}

bool qng::LogConfig::Flush() const
{
    return flush_;
}

uintmax_t qng::LogConfig::MaxSize() const
{
    return max_size_;
}

uintmax_t qng::LogConfig::RotationSize() const
{
    return rotation_size_;
}

void qng::Log::Init(const boost::filesystem::path& path,
                    const qng::LogConfig& config)
{
    static std::atomic_flag flag = ATOMIC_FLAG_INIT;
    if (flag.test_and_set())
    {
        return;
    }
    config_ = config;
    boost::log::add_common_attributes();
    if (config.LogToCerr())
    {
        boost::log::add_console_log(
            std::cerr,
            boost::log::keywords::format = "[%TimeStamp%]: %Message%");
    }
    boost::log::add_file_log(
        boost::log::keywords::target = path / "log",
        boost::log::keywords::file_name =
            path / "log" / "log_%Y-%m-%d_%H-%M-%S.%N.log",
        boost::log::keywords::rotation_size = config.RotationSize(),
        boost::log::keywords::auto_flush    = config.Flush(),
        boost::log::keywords::scan_method =
            boost::log::sinks::file::scan_method::scan_matching,
        boost::log::keywords::max_size = config.MaxSize(),
        boost::log::keywords::format   = "[%TimeStamp%]: %Message%");
}

void qng::Log::Error(const std::string& str)
{
    BOOST_LOG(logger_) << "[Error]" << str;
}

void qng::Log::Network(const std::string& str)
{
    if (config_.Network())
    {
        BOOST_LOG(logger_) << "[Network]" << str;
    }
}

void qng::Log::Rpc(const std::string& str)
{
    if (config_.Rpc())
    {
        BOOST_LOG(logger_) << "[Rpc]" << str;
    }
}
