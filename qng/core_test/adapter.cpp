#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/bridge/adapter.hpp>
#include <qng/bridge/cross.hpp>
#include <qng/common/stat.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/meerchange.hpp>
#include <qng/evm/signer.hpp>

namespace
{
std::string const MEERCHANGE = "0x422f6b1c7e3d5e2a8b7d4c0e3b61f28a64a4e7d2";
std::string const NODE_HASH =
    "0x7777777777777777777777777777777777777777777777777777777777777777";

std::shared_ptr<qng::Eoa> TestEoa()
{
    auto eoa = std::make_shared<qng::Eoa>();
    eoa->Init(
        "0x4646464646464646464646464646464646464646464646464646464646464646");
    return eoa;
}

std::shared_ptr<MockEthClient> SubmittingClient()
{
    auto client = std::make_shared<MockEthClient>();
    client->SetResult("eth_getTransactionCount", "\"0x7\"");
    client->SetResult("eth_getBlockByNumber", "{\"baseFeePerGas\":\"0x2d\"}");
    client->SetResult("eth_maxPriorityFeePerGas", "\"0xa\"");
    client->SetResult("eth_estimateGas", "\"0xea60\"");
    client->SetResult("eth_sendRawTransaction", "\"" + NODE_HASH + "\"");
    return client;
}

qng::RpcAdapter TestAdapter(const std::shared_ptr<MockEthClient>& client,
                            const std::string& meerchange, uint64_t chain_id)
{
    qng::Url url;
    url.Parse("http://127.0.0.1:1");
    auto bridge = std::make_shared<qng::CrossChainBridge>(TestEoa(), client,
                                                          meerchange, chain_id);
    return qng::RpcAdapter(std::make_shared<qng::JsonRpcInvoker>(url), bridge);
}
}  // namespace

TEST(CrossSend, NotConfigured)
{
    qng::Url url;
    ASSERT_FALSE(url.Parse("http://127.0.0.1:1"));
    qng::RpcAdapter adapter(std::make_shared<qng::JsonRpcInvoker>(url),
                            nullptr);
    ASSERT_FALSE(adapter.BridgeConfigured());

    std::string hash;
    qng::Error error = adapter.CrossSend("0x01", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::BRIDGE_NOT_CONFIGURED, error.code_);
    ASSERT_TRUE(hash.empty());
}

TEST(CrossSend, InvalidTxid)
{
    auto client = SubmittingClient();
    qng::RpcAdapter adapter = TestAdapter(client, MEERCHANGE, 813);
    ASSERT_TRUE(adapter.BridgeConfigured());

    std::string hash;
    qng::Error error = adapter.CrossSend("zz", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::HEX_STRING, error.code_);
    ASSERT_EQ(qng::ErrorKind::ENCODING, error.Kind());

    error = adapter.CrossSend("", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::HEX_STRING, error.code_);
    error = adapter.CrossSend("0x", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::HEX_STRING, error.code_);
    error = adapter.CrossSend("0x" + std::string(66, '1'), 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::HEX_STRING, error.code_);

    ASSERT_TRUE(hash.empty());
    ASSERT_EQ(0, client->TotalCalls());
}

TEST(CrossSend, InvalidBridgeConfig)
{
    auto client = SubmittingClient();
    std::string hash;

    qng::RpcAdapter bad_address = TestAdapter(client, "0x1234", 813);
    ASSERT_EQ(qng::ErrorCode::EVM_ADDRESS,
              bad_address.CrossSend("0x01", 0, 100, "sig", hash).code_);

    qng::RpcAdapter no_chain = TestAdapter(client, MEERCHANGE, 0);
    ASSERT_EQ(qng::ErrorCode::BRIDGE_CHAIN_ID,
              no_chain.CrossSend("0x01", 0, 100, "sig", hash).code_);

    ASSERT_EQ(0, client->TotalCalls());
}

TEST(CrossSend, Submitted)
{
    auto client = SubmittingClient();
    qng::RpcAdapter adapter = TestAdapter(client, MEERCHANGE, 813);

    std::string hash;
    qng::Error error = adapter.CrossSend(" 0x01 ", 2, 100, "sig", hash);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_EQ(NODE_HASH, hash);

    ASSERT_EQ(1, client->Calls("eth_sendRawTransaction"));
    ASSERT_EQ(
        "[\"0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f\",\"pending\"]",
        client->LastParams("eth_getTransactionCount"));

    qng::AbiEncoder encoder;
    encoder.Bytes32(qng::uint256_union(1)).Uint(2).Uint(100).String("sig");
    std::vector<uint8_t> input = encoder.EncodeCall(
        qng::FunctionSelector(qng::MeerChange::EXPORT_4337));
    std::string estimate = client->LastParams("eth_estimateGas");
    ASSERT_NE(std::string::npos,
              estimate.find("\"from\":\"0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f\""));
    ASSERT_NE(std::string::npos, estimate.find("\"to\":\"" + MEERCHANGE + "\""));
    ASSERT_NE(std::string::npos,
              estimate.find("\"data\":\"" + qng::BytesToEvmHex(input) + "\""));

    ASSERT_EQ(0, client->LastParams("eth_sendRawTransaction").find("[\"0x02"));
}

TEST(CrossSend, SubmitFailure)
{
    auto client = SubmittingClient();
    client->SetError("eth_sendRawTransaction",
                     qng::Error(qng::ErrorCode::JSON_RPC_ERROR,
                                "insufficient funds for gas"));
    qng::RpcAdapter adapter = TestAdapter(client, MEERCHANGE, 813);

    uint64_t count = qng::Stats::Get(qng::ErrorCode::BRIDGE_SUBMIT);
    std::string hash;
    qng::Error error = adapter.CrossSend("0x01", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::BRIDGE_SUBMIT, error.code_);
    ASSERT_EQ(qng::ErrorKind::SUBMISSION, error.Kind());
    ASSERT_NE(std::string::npos,
              error.Message().find("insufficient funds for gas"));
    ASSERT_TRUE(hash.empty());
    ASSERT_EQ(count + 1, qng::Stats::Get(qng::ErrorCode::BRIDGE_SUBMIT));
}

TEST(CrossSend, EstimateFailure)
{
    auto client = SubmittingClient();
    client->SetError("eth_estimateGas",
                     qng::Error(qng::ErrorCode::JSON_RPC_ERROR,
                                "execution reverted"));
    qng::RpcAdapter adapter = TestAdapter(client, MEERCHANGE, 813);

    std::string hash;
    qng::Error error = adapter.CrossSend("0x01", 0, 100, "sig", hash);
    ASSERT_EQ(qng::ErrorCode::BRIDGE_SUBMIT, error.code_);
    ASSERT_EQ(0, client->Calls("eth_sendRawTransaction"));
}
