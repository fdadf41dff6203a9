#include <gtest/gtest.h>
#include <fstream>
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <qng/core_test/test_util.hpp>
#include <qng/qng_bridge/config.hpp>
#include <qng/qng_bridge/daemon.hpp>
#include <qng/secure/util.hpp>

namespace
{
// the directory is left behind, the log sink opened by the daemon keeps
// writing there for the rest of the run
boost::filesystem::path WriteTestConfig(const qng::BridgeConfig& config)
{
    boost::filesystem::path path = boost::filesystem::temp_directory_path()
                                   / boost::filesystem::unique_path();
    boost::filesystem::create_directories(path);
    std::fstream stream;
    qng::ErrorCode error_code = qng::WriteObject(
        config, path / "qng_bridge_config.json", stream);
    EXPECT_EQ(qng::ErrorCode::SUCCESS, error_code);
    return path;
}
}  // namespace

TEST(Daemon, RpcDisabled)
{
    qng::BridgeConfig config;
    config.rpc_.enable_ = false;
    boost::filesystem::path path = WriteTestConfig(config);

    qng::Daemon daemon;
    ASSERT_EQ(qng::ErrorCode::RPC_DISABLED, daemon.Run(path));
    ASSERT_EQ(qng::ErrorKind::CONFIG,
              qng::ErrorCodeKind(qng::ErrorCode::RPC_DISABLED));
}

TEST(Daemon, RpcPortInUse)
{
    boost::asio::io_service service;
    boost::asio::ip::tcp::acceptor acceptor(
        service, boost::asio::ip::tcp::endpoint(
                     boost::asio::ip::address_v4::loopback(), 0));

    qng::BridgeConfig config;
    config.rpc_.address_ = boost::asio::ip::address_v4::loopback();
    config.rpc_.port_ = acceptor.local_endpoint().port();
    boost::filesystem::path path = WriteTestConfig(config);

    qng::Daemon daemon;
    ASSERT_EQ(qng::ErrorCode::RPC_START, daemon.Run(path));
}

TEST(Daemon, ErrorStrings)
{
    ASSERT_EQ("Failed to start rpc",
              qng::ErrorString(qng::ErrorCode::RPC_START));
    ASSERT_NE(qng::ErrorString(qng::ErrorCode::GENERIC),
              qng::ErrorString(qng::ErrorCode::RPC_DISABLED));
}
