#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/bridge/invoker.hpp>
#include <qng/qng_bridge/service.hpp>

namespace
{
std::string const ENTRY_POINT = "0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789";

// Bridge service on an ephemeral loopback port, qng calls go to a stub node
class TestBridge
{
public:
    TestBridge(const std::shared_ptr<MockEthClient>& client,
               const qng::ProvidersConfig& providers_config,
               const std::string& node_response =
                   "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"1000\"}")
        : node_(node_response)
    {
        qng::BridgeConfig config;
        config.rpc_.port_ = 0;
        auto adapter = std::make_shared<qng::RpcAdapter>(
            std::make_shared<qng::JsonRpcInvoker>(node_.Url()), nullptr);
        qng::Providers providers = qng::MakeProviders(
            providers_config, client,
            std::make_shared<qng::RpcGasEstimator>(client), qng::GasOverhead(),
            config.chain_id_, config.max_gas_limit_, config.tracer_);
        service_ = std::make_unique<qng::BridgeService>(config, adapter,
                                                        providers);
        rpc_ = qng::MakeRpc(io_service_, config.rpc_,
                            service_->RpcHandlerMaker());
        if (rpc_ != nullptr && !rpc_->Start())
        {
            runner_ = std::make_unique<qng::ServiceRunner>(io_service_, 1);
        }
    }

    ~TestBridge()
    {
        io_service_.stop();
        if (runner_)
        {
            runner_->Join();
        }
    }

    qng::Error Invoke(const std::string& method, const qng::RpcParams& params,
                      qng::Json& result)
    {
        qng::Url url;
        url.Parse(qng::ToString("http://127.0.0.1:", rpc_ ? rpc_->Port() : 0));
        qng::JsonRpcInvoker invoker(url);
        return invoker.Invoke(method, params, result);
    }

    StubNode node_;

private:
    boost::asio::io_service io_service_;
    std::unique_ptr<qng::BridgeService> service_;
    std::unique_ptr<qng::Rpc> rpc_;
    std::unique_ptr<qng::ServiceRunner> runner_;
};

qng::ProvidersConfig NoopConfig()
{
    qng::ProvidersConfig config;
    config.receipt_ = qng::ProviderMode::NOOP;
    config.gas_prices_ = qng::ProviderMode::NOOP;
    config.gas_estimate_ = qng::ProviderMode::NOOP;
    config.user_op_by_hash_ = qng::ProviderMode::NOOP;
    return config;
}
}  // namespace

TEST(BridgeService, GetBalance)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig());

    qng::Json result;
    qng::Error error = bridge.Invoke(
        "qng_getBalance", qng::RpcParams().AddString("0xABC").AddInt(1),
        result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("1000", result.get<std::string>());
    ASSERT_EQ(
        "{\"method\":\"qng_getBalance\",\"params\":[\"0xABC\",1],\"id\":1,"
        "\"jsonrpc\":\"2.0\"}",
        bridge.node_.LastRequest());
}

TEST(BridgeService, RelayEmptyArray)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig(),
                      "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":[]}");

    qng::Json result;
    qng::Error error = bridge.Invoke(
        "qng_getUTXOs",
        qng::RpcParams().AddString("0xABC").AddInt(10).AddBool(false),
        result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_array());
    ASSERT_TRUE(result.empty());
}

TEST(BridgeService, RelayNumber)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig(),
                      "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":1000}");

    qng::Json result;
    qng::Error error = bridge.Invoke(
        "qng_getBalance", qng::RpcParams().AddString("0xABC").AddInt(1),
        result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_number());
    ASSERT_EQ(1000, result.get<uint64_t>());
}

TEST(BridgeService, RelayNullString)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig(),
                      "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"null\"}");

    qng::Json result;
    qng::Error error = bridge.Invoke(
        "qng_getBalance", qng::RpcParams().AddString("0xABC").AddInt(1),
        result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(result.is_string());
    ASSERT_EQ("null", result.get<std::string>());
}

TEST(BridgeService, UnknownMethod)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig());

    qng::Json result;
    qng::Error error = bridge.Invoke("qng_unknown", qng::RpcParams(), result);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ("method not found: qng_unknown", error.Message());
}

TEST(BridgeService, NoopProviders)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig());

    qng::Json result;
    ASSERT_FALSE(static_cast<bool>(
        bridge.Invoke("bundler_gasPrices", qng::RpcParams(), result)));
    ASSERT_EQ("0x0", result.at("maxFeePerGas").get<std::string>());
    ASSERT_EQ("0x0", result.at("maxPriorityFeePerGas").get<std::string>());

    // an unknown operation is reported as a null result
    qng::RpcParams params;
    params.AddString(
        "0x1111111111111111111111111111111111111111111111111111111111111111");
    qng::Error error =
        bridge.Invoke("eth_getUserOperationReceipt", params, result);
    ASSERT_EQ(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE, error.code_);
}

TEST(BridgeService, InvalidHash)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig());

    qng::Json result;
    qng::Error error = bridge.Invoke("eth_getUserOperationByHash",
                                     qng::RpcParams().AddString("0x12"),
                                     result);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ("invalid hash: 0x12", error.Message());
}

TEST(BridgeService, CrossSendWithoutBridge)
{
    TestBridge bridge(std::make_shared<MockEthClient>(), NoopConfig());

    qng::RpcParams params;
    params.AddString("0x01").AddUint(0).AddUint(100).AddString("sig");
    qng::Json result;
    qng::Error error = bridge.Invoke("qng_crossSend", params, result);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ(qng::ErrorString(qng::ErrorCode::BRIDGE_NOT_CONFIGURED),
              error.Message());
    ASSERT_EQ(0, bridge.node_.Requests());
}

TEST(BridgeService, MaxPriorityFeePerGas)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_getBlockByNumber", "{\"baseFeePerGas\":\"0x2d\"}");
    client->SetResult("eth_maxPriorityFeePerGas", "\"0xa\"");
    TestBridge bridge(client, qng::ProvidersConfig());

    qng::Json result;
    ASSERT_FALSE(static_cast<bool>(
        bridge.Invoke("eth_maxPriorityFeePerGas", qng::RpcParams(), result)));
    ASSERT_EQ("0xa", result.get<std::string>());
}

TEST(BridgeService, EstimateUserOperationGas)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_estimateUserOperationGas",
                      "{\"verificationGasLimit\":\"0x186a0\","
                      "\"callGasLimit\":\"0x5208\"}");
    qng::ProvidersConfig config;
    config.gas_estimate_ = qng::ProviderMode::LIVE;
    TestBridge bridge(client, config);

    std::string op =
        "{\"sender\":\"0x1111111111111111111111111111111111111111\","
        "\"nonce\":\"0x0\",\"initCode\":\"0x\",\"callData\":\"0x\","
        "\"callGasLimit\":\"0x0\",\"verificationGasLimit\":\"0x0\","
        "\"preVerificationGas\":\"0x0\",\"maxFeePerGas\":\"0x0\","
        "\"maxPriorityFeePerGas\":\"0x0\",\"paymasterAndData\":\"0x\","
        "\"signature\":\"0x\"}";

    qng::Json result;
    qng::Error error = bridge.Invoke(
        "eth_estimateUserOperationGas",
        qng::RpcParams().AddJson(TestJson(op)).AddString(ENTRY_POINT), result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ("0x186a0", result.at("verificationGasLimit").get<std::string>());
    ASSERT_EQ("0x5208", result.at("callGasLimit").get<std::string>());
    ASSERT_TRUE(result.at("preVerificationGas").is_string());

    error = bridge.Invoke(
        "eth_estimateUserOperationGas",
        qng::RpcParams().AddJson(TestJson(op)).AddString(
            "0x0000000000000000000000000000000000000001"),
        result);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ(1, client->Calls("eth_estimateUserOperationGas"));
}
