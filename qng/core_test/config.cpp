#include <gtest/gtest.h>
#include <fstream>
#include <boost/filesystem.hpp>
#include <qng/core_test/test_util.hpp>
#include <qng/qng_bridge/config.hpp>
#include <qng/secure/util.hpp>

TEST(BridgeConfig, Defaults)
{
    qng::BridgeConfig config;
    ASSERT_EQ("http://127.0.0.1:18131", config.qng_url_.String());
    ASSERT_EQ(813, config.chain_id_);
    ASSERT_EQ(2000, config.block_range_);
    ASSERT_EQ(30000000, config.max_gas_limit_);
    ASSERT_EQ(4, config.io_threads_);
    ASSERT_EQ(7179, config.rpc_.port_);
    ASSERT_EQ("0x5ff137d4b0fdcd49dca30c7cf57e578a026d2789",
              config.entry_point_.StringHex());
    ASSERT_FALSE(config.BridgeEnabled());
}

TEST(BridgeConfig, EmptyWritesDefaults)
{
    qng::BridgeConfig config;
    qng::Ptree ptree;
    bool upgraded = false;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, config.DeserializeJson(upgraded, ptree));
    ASSERT_TRUE(upgraded);
    ASSERT_EQ("1", ptree.get<std::string>("version"));
    ASSERT_EQ("813", ptree.get<std::string>("chain_id"));
    ASSERT_EQ("noop", ptree.get<std::string>("providers.gas_estimate"));
}

TEST(BridgeConfig, RoundTrip)
{
    qng::BridgeConfig config;
    config.chain_id_ = 8131;
    config.meerchange_ = "0x422f6b1c7e3d5e2a8b7d4c0e3b61f28a64a4e7d2";
    config.private_key_ = "0x46";
    config.max_gas_limit_ = 0;
    config.tracer_ = "bundlerCollectorTracer";
    config.io_threads_ = 2;
    config.providers_.gas_estimate_ = qng::ProviderMode::LIVE;
    config.rpc_.enable_control_ = true;

    qng::Ptree ptree;
    config.SerializeJson(ptree);
    ASSERT_EQ("", ptree.get<std::string>("private_key"));
    ASSERT_EQ("0", ptree.get<std::string>("max_gas_limit"));

    qng::BridgeConfig loaded;
    bool upgraded = false;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, loaded.DeserializeJson(upgraded, ptree));
    ASSERT_FALSE(upgraded);
    ASSERT_EQ(8131, loaded.chain_id_);
    ASSERT_EQ(config.meerchange_, loaded.meerchange_);
    ASSERT_TRUE(loaded.BridgeEnabled());
    ASSERT_TRUE(loaded.private_key_.empty());
    ASSERT_EQ(0, loaded.max_gas_limit_);
    ASSERT_EQ("bundlerCollectorTracer", loaded.tracer_);
    ASSERT_EQ(2, loaded.io_threads_);
    ASSERT_EQ(qng::ProviderMode::LIVE, loaded.providers_.gas_estimate_);
    ASSERT_TRUE(loaded.rpc_.enable_control_);
    ASSERT_EQ(1, loaded.rpc_.whitelist_.size());
}

TEST(BridgeConfig, InvalidFields)
{
    qng::BridgeConfig defaults;
    qng::Ptree base;
    defaults.SerializeJson(base);
    bool upgraded = false;

    qng::Ptree ptree = base;
    ptree.put("version", "2");
    qng::BridgeConfig config;
    ASSERT_EQ(qng::ErrorCode::CONFIG_VERSION,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("qng_url", "ftp://127.0.0.1:18131");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_QNG_URL,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("meerchange", "0x1234");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_MEERCHANGE,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("max_gas_limit", "0x10");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_MAX_GAS_LIMIT,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("io_threads", "0");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_IO_THREADS,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("providers.receipt", "mock");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_PROVIDER_MODE,
              config.DeserializeJson(upgraded, ptree));

    ptree = base;
    ptree.put("rpc.address", "localhost");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_RPC_ADDRESS,
              config.DeserializeJson(upgraded, ptree));
}

TEST(BridgeConfig, FetchObject)
{
    boost::filesystem::path path = boost::filesystem::temp_directory_path()
                                   / boost::filesystem::unique_path();
    boost::filesystem::create_directories(path);
    boost::filesystem::path file = path / "qng_bridge_config.json";

    {
        qng::BridgeConfig config;
        std::fstream stream;
        ASSERT_EQ(qng::ErrorCode::SUCCESS,
                  qng::FetchObject(config, file, stream));
    }
    ASSERT_LT(0, boost::filesystem::file_size(file));

    {
        qng::BridgeConfig config;
        config.block_range_ = 64;
        std::fstream stream;
        ASSERT_EQ(qng::ErrorCode::SUCCESS,
                  qng::WriteObject(config, file, stream));
    }

    {
        qng::BridgeConfig config;
        std::fstream stream;
        ASSERT_EQ(qng::ErrorCode::SUCCESS,
                  qng::FetchObject(config, file, stream));
        ASSERT_EQ(64, config.block_range_);
    }

    boost::filesystem::remove_all(path);
}
