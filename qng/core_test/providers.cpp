#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/bridge/providers.hpp>

namespace
{
class RecordingEstimator : public qng::GasEstimator
{
public:
    RecordingEstimator() : calls_(0)
    {
    }

    qng::Error Estimate(const qng::EstimateInput& input, uint64_t& verification,
                        uint64_t& call) const override
    {
        ++calls_;
        input_ = input;
        verification = 70000;
        call = 30000;
        return qng::Error();
    }

    mutable int calls_;
    mutable qng::EstimateInput input_;
};

qng::EvmAddress EntryPoint()
{
    qng::EvmAddress entry_point;
    entry_point.DecodeHex("0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789");
    return entry_point;
}
}  // namespace

TEST(Providers, Noop)
{
    qng::Providers providers = qng::MakeNoopProviders();

    boost::optional<qng::UserOperationReceipt> receipt;
    receipt = qng::UserOperationReceipt();
    ASSERT_FALSE(static_cast<bool>(providers.receipt_->GetUserOperationReceipt(
        qng::uint256_union(1), EntryPoint(), 2000, receipt)));
    ASSERT_FALSE(static_cast<bool>(receipt));

    qng::GasPrices prices;
    prices.max_fee_per_gas_ = 7;
    prices.max_priority_fee_per_gas_ = 7;
    ASSERT_FALSE(static_cast<bool>(providers.gas_prices_->GetGasPrices(prices)));
    ASSERT_EQ(0, prices.max_fee_per_gas_);
    ASSERT_EQ(0, prices.max_priority_fee_per_gas_);

    uint64_t verification = 1;
    uint64_t call = 1;
    ASSERT_FALSE(static_cast<bool>(providers.gas_estimate_->EstimateGas(
        EntryPoint(), qng::UserOperation(), qng::StateOverrideSet(),
        verification, call)));
    ASSERT_EQ(0, verification);
    ASSERT_EQ(0, call);

    boost::optional<qng::HashLookupResult> lookup;
    ASSERT_FALSE(
        static_cast<bool>(providers.user_op_by_hash_->GetUserOperationByHash(
            qng::uint256_union(1), EntryPoint(), 813, 2000, lookup)));
    ASSERT_FALSE(static_cast<bool>(lookup));
}

TEST(Providers, LiveGasPrices)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_getBlockByNumber",
                      "{\"number\":\"0x100\",\"baseFeePerGas\":\"0x2d\"}");
    client->SetResult("eth_maxPriorityFeePerGas", "\"0xa\"");

    qng::EthGasPriceProvider provider(client);
    qng::GasPrices prices;
    ASSERT_FALSE(static_cast<bool>(provider.GetGasPrices(prices)));
    ASSERT_EQ(100, prices.max_fee_per_gas_);
    ASSERT_EQ(10, prices.max_priority_fee_per_gas_);
    ASSERT_EQ("[\"latest\",false]", client->LastParams("eth_getBlockByNumber"));

    qng::Json json;
    prices.SerializeJson(json);
    ASSERT_EQ("{\"maxFeePerGas\":\"0x64\",\"maxPriorityFeePerGas\":\"0xa\"}",
              qng::JsonToString(json));
}

TEST(Providers, LiveGasPricesLegacy)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_getBlockByNumber", "{\"number\":\"0x100\"}");
    client->SetResult("eth_gasPrice", "\"0x3b9aca00\"");

    qng::EthGasPriceProvider provider(client);
    qng::GasPrices prices;
    ASSERT_FALSE(static_cast<bool>(provider.GetGasPrices(prices)));
    ASSERT_EQ(1000000000, prices.max_fee_per_gas_);
    ASSERT_EQ(1000000000, prices.max_priority_fee_per_gas_);
    ASSERT_EQ(0, client->Calls("eth_maxPriorityFeePerGas"));
}

TEST(Providers, LiveGasPricesFailure)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_getBlockByNumber",
                      "{\"baseFeePerGas\":\"0x2d\"}");
    client->SetError("eth_maxPriorityFeePerGas",
                     qng::Error(qng::ErrorCode::JSON_RPC_ERROR,
                                "method not found"));

    qng::EthGasPriceProvider provider(client);
    qng::GasPrices prices;
    qng::Error error = provider.GetGasPrices(prices);
    ASSERT_EQ(qng::ErrorKind::RPC, error.Kind());
    ASSERT_EQ("method not found", error.Message());
}

TEST(Providers, LiveGasEstimate)
{
    auto estimator = std::make_shared<RecordingEstimator>();
    qng::GasOverhead overhead;
    qng::EthGasEstimateProvider provider(overhead, 813, 30000000,
                                         "bundlerCollectorTracer", estimator);

    qng::UserOperation op;
    op.nonce_ = 5;
    qng::StateOverrideSet overrides;
    ASSERT_EQ(qng::ErrorCode::SUCCESS,
              overrides.DeserializeJson(TestJson(
                  "{\"0x1111111111111111111111111111111111111111\":"
                  "{\"balance\":\"0x1\"}}")));

    uint64_t verification = 0;
    uint64_t call = 0;
    ASSERT_FALSE(static_cast<bool>(
        provider.EstimateGas(EntryPoint(), op, overrides, verification, call)));
    ASSERT_EQ(70000, verification);
    ASSERT_EQ(30000, call);
    ASSERT_EQ(1, estimator->calls_);
    ASSERT_EQ(EntryPoint(), estimator->input_.entry_point_);
    ASSERT_EQ(5, estimator->input_.op_.nonce_);
    ASSERT_EQ(813, estimator->input_.chain_id_);
    ASSERT_EQ(30000000, estimator->input_.max_gas_limit_);
    ASSERT_EQ("bundlerCollectorTracer", estimator->input_.tracer_);
    ASSERT_FALSE(estimator->input_.overrides_.Empty());
}

TEST(Providers, MakeProviders)
{
    auto client = std::make_shared<MockEthClient>();
    auto estimator = std::make_shared<RecordingEstimator>();

    qng::ProvidersConfig config;
    qng::Providers providers = qng::MakeProviders(
        config, client, estimator, qng::GasOverhead(), 813, 0, "");
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::EthReceiptProvider>(
                           providers.receipt_));
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::EthGasPriceProvider>(
                           providers.gas_prices_));
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::NoopGasEstimateProvider>(
                           providers.gas_estimate_));
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::EthUserOpByHashProvider>(
                           providers.user_op_by_hash_));

    config.receipt_ = qng::ProviderMode::NOOP;
    config.gas_estimate_ = qng::ProviderMode::LIVE;
    providers = qng::MakeProviders(config, client, estimator,
                                   qng::GasOverhead(), 813, 0, "");
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::NoopReceiptProvider>(
                           providers.receipt_));
    ASSERT_NE(nullptr, std::dynamic_pointer_cast<qng::EthGasEstimateProvider>(
                           providers.gas_estimate_));
}

TEST(ProvidersConfig, Json)
{
    qng::ProvidersConfig config;
    qng::Ptree ptree;
    config.SerializeJson(ptree);
    ASSERT_EQ("live", ptree.get<std::string>("receipt"));
    ASSERT_EQ("noop", ptree.get<std::string>("gas_estimate"));

    ptree.put("gas_prices", "noop");
    bool upgraded = false;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, config.DeserializeJson(upgraded, ptree));
    ASSERT_EQ(qng::ProviderMode::NOOP, config.gas_prices_);

    ptree.put("receipt", "mock");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_PROVIDER_MODE,
              config.DeserializeJson(upgraded, ptree));

    ptree.erase("receipt");
    ASSERT_EQ(qng::ErrorCode::JSON_CONFIG_PROVIDERS,
              config.DeserializeJson(upgraded, ptree));
}

TEST(GasOverhead, PreVerificationGas)
{
    qng::GasOverhead overhead;
    qng::UserOperation op;
    ASSERT_EQ(42588, overhead.CalcPreVerificationGas(op));

    // the caller's preVerificationGas and a short signature are replaced
    op.pre_verification_gas_ = 99999;
    op.signature_ = {0x01};
    ASSERT_EQ(42588, overhead.CalcPreVerificationGas(op));

    op.call_data_.assign(32, 0xff);
    ASSERT_EQ(42588 + 12 + 32 * 16 + 4, overhead.CalcPreVerificationGas(op));
}

TEST(RpcGasEstimator, Estimate)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_estimateUserOperationGas",
                      "{\"preVerificationGas\":\"0xc350\","
                      "\"verificationGasLimit\":\"0x186a0\","
                      "\"callGasLimit\":\"21000\"}");
    qng::RpcGasEstimator estimator(client);

    qng::EstimateInput input;
    input.entry_point_ = EntryPoint();
    input.max_gas_limit_ = 30000000;
    uint64_t verification = 0;
    uint64_t call = 0;
    ASSERT_FALSE(
        static_cast<bool>(estimator.Estimate(input, verification, call)));
    ASSERT_EQ(100000, verification);
    ASSERT_EQ(21000, call);
    // no overrides, two params
    std::string params = client->LastParams("eth_estimateUserOperationGas");
    ASSERT_NE(std::string::npos,
              params.find(",\"0x5ff137d4b0fdcd49dca30c7cf57e578a026d2789\"]"));

    input.max_gas_limit_ = 100000;
    qng::Error error = estimator.Estimate(input, verification, call);
    ASSERT_EQ(qng::ErrorCode::GAS_LIMIT_EXCEEDED, error.code_);
}

TEST(RpcGasEstimator, BadResult)
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_estimateUserOperationGas",
                      "{\"verificationGasLimit\":\"0x186a0\"}");
    qng::RpcGasEstimator estimator(client);

    uint64_t verification = 0;
    uint64_t call = 0;
    qng::Error error =
        estimator.Estimate(qng::EstimateInput(), verification, call);
    ASSERT_EQ(qng::ErrorCode::JSON_RPC_RESULT_TYPE, error.code_);
}
