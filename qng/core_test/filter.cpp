#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/evm/abi.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/filter.hpp>

namespace
{
std::string const ENTRY_POINT = "0x5ff137d4b0fdcd49dca30c7cf57e578a026d2789";
std::string const SENDER = "0x1111111111111111111111111111111111111111";
std::string const TX_HASH =
    "0xabababababababababababababababababababababababababababababababab";
std::string const BLOCK_HASH =
    "0xcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcd";

std::string Word(const qng::EvmAddress& address)
{
    return address.ToWord().StringEvmHex();
}

std::string EventJson(const qng::uint256_union& hash, uint64_t log_index)
{
    qng::EvmAddress sender;
    sender.DecodeHex(SENDER);
    qng::AbiEncoder data;
    data.Uint(3).Bool(true).Uint(1000).Uint(500);

    return qng::ToString(
        "{\"address\":\"", ENTRY_POINT, "\",\"topics\":[\"",
        qng::UserOperationEventTopic().StringEvmHex(), "\",\"",
        hash.StringEvmHex(), "\",\"", Word(sender), "\",\"",
        Word(qng::EvmAddress()), "\"],\"data\":\"",
        qng::BytesToEvmHex(data.Encode()),
        "\",\"blockNumber\":\"0xf5\",\"blockHash\":\"", BLOCK_HASH,
        "\",\"transactionHash\":\"", TX_HASH, "\",\"logIndex\":\"",
        qng::Uint64ToEvmHex(log_index), "\"}");
}

std::string PlainLogJson(const std::string& address, uint64_t log_index)
{
    return qng::ToString("{\"address\":\"", address,
                         "\",\"topics\":[],\"data\":\"0x01\",\"logIndex\":\"",
                         qng::Uint64ToEvmHex(log_index), "\"}");
}

qng::EvmAddress EntryPoint()
{
    qng::EvmAddress entry_point;
    entry_point.DecodeHex(ENTRY_POINT);
    return entry_point;
}
}  // namespace

TEST(Filter, ReceiptNotFound)
{
    MockEthClient client;
    client.SetResult("eth_blockNumber", "\"0x100\"");
    client.SetResult("eth_getLogs", "[]");

    qng::uint256_union hash = qng::Keccak256(std::string("op"));
    boost::optional<qng::UserOperationReceipt> receipt;
    qng::Error error = qng::GetUserOperationReceipt(client, hash, EntryPoint(),
                                                    16, receipt);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_FALSE(static_cast<bool>(receipt));
    ASSERT_EQ(0, client.Calls("eth_getTransactionReceipt"));

    std::string params = client.LastParams("eth_getLogs");
    ASSERT_NE(std::string::npos, params.find("\"fromBlock\":\"0xf0\""));
    ASSERT_NE(std::string::npos, params.find("\"toBlock\":\"latest\""));
    ASSERT_NE(std::string::npos, params.find(hash.StringEvmHex()));
}

TEST(Filter, ReceiptRangeStartsAtGenesis)
{
    MockEthClient client;
    client.SetResult("eth_blockNumber", "\"0x10\"");
    client.SetResult("eth_getLogs", "[]");

    boost::optional<qng::UserOperationReceipt> receipt;
    ASSERT_FALSE(static_cast<bool>(qng::GetUserOperationReceipt(
        client, qng::uint256_union(1), EntryPoint(), 2000, receipt)));
    ASSERT_NE(std::string::npos,
              client.LastParams("eth_getLogs").find("\"fromBlock\":\"0x0\""));
}

TEST(Filter, Receipt)
{
    qng::uint256_union hash = qng::Keccak256(std::string("op"));
    qng::uint256_union previous = qng::Keccak256(std::string("previous"));

    MockEthClient client;
    client.SetResult("eth_blockNumber", "\"0x100\"");
    client.SetResult("eth_getLogs", "[" + EventJson(hash, 3) + "]");
    client.SetResult(
        "eth_getTransactionReceipt",
        qng::ToString("{\"transactionHash\":\"", TX_HASH,
                      "\",\"status\":\"0x1\",\"logs\":[",
                      PlainLogJson(SENDER, 0), ",", EventJson(previous, 1),
                      ",", PlainLogJson(SENDER, 2), ",", EventJson(hash, 3),
                      ",", PlainLogJson(SENDER, 4), "]}"));

    boost::optional<qng::UserOperationReceipt> receipt;
    qng::Error error = qng::GetUserOperationReceipt(client, hash, EntryPoint(),
                                                    2000, receipt);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(static_cast<bool>(receipt));
    ASSERT_EQ(hash, receipt->user_op_hash_);
    ASSERT_EQ(EntryPoint(), receipt->entry_point_);
    ASSERT_EQ(SENDER, receipt->sender_.StringHex());
    ASSERT_TRUE(receipt->paymaster_.IsZero());
    ASSERT_EQ(3, receipt->nonce_);
    ASSERT_TRUE(receipt->success_);
    ASSERT_EQ(1000, receipt->actual_gas_cost_);
    ASSERT_EQ(500, receipt->actual_gas_used_);
    ASSERT_EQ("0x1", receipt->receipt_.at("status").get<std::string>());

    // only the log between the previous operation and this one
    ASSERT_EQ(1, receipt->logs_.size());
    ASSERT_EQ("0x2", receipt->logs_[0].at("logIndex").get<std::string>());
    ASSERT_NE(std::string::npos,
              client.LastParams("eth_getTransactionReceipt").find(TX_HASH));
}

TEST(Filter, ReceiptBadEvent)
{
    qng::uint256_union hash = qng::Keccak256(std::string("op"));
    std::string event = EventJson(hash, 0);
    // drop the paymaster topic
    std::string paymaster = ",\"" + Word(qng::EvmAddress()) + "\"";
    size_t pos = event.find(paymaster);
    ASSERT_NE(std::string::npos, pos);
    event.erase(pos, paymaster.size());

    MockEthClient client;
    client.SetResult("eth_blockNumber", "\"0x100\"");
    client.SetResult("eth_getLogs", "[" + event + "]");

    boost::optional<qng::UserOperationReceipt> receipt;
    qng::Error error = qng::GetUserOperationReceipt(client, hash, EntryPoint(),
                                                    2000, receipt);
    ASSERT_EQ(qng::ErrorCode::ABI_DECODE, error.code_);
    ASSERT_FALSE(static_cast<bool>(receipt));
}

TEST(Filter, NodeFailure)
{
    MockEthClient client;
    client.SetError("eth_blockNumber",
                    qng::Error(qng::ErrorCode::TCP_CONNECT, "refused"));

    boost::optional<qng::HashLookupResult> result;
    qng::Error error = qng::GetUserOperationByHash(
        client, qng::uint256_union(1), EntryPoint(), 813, 2000, result);
    ASSERT_EQ(qng::ErrorKind::TRANSPORT, error.Kind());
    ASSERT_EQ(0, client.Calls("eth_getLogs"));
}

TEST(Filter, UserOperationByHash)
{
    qng::UserOperation other;
    other.sender_.DecodeHex("0x4444444444444444444444444444444444444444");
    other.nonce_ = 9;
    qng::UserOperation op;
    op.sender_.DecodeHex(SENDER);
    op.nonce_ = 3;
    op.call_data_ = {0xb6, 0x1d, 0x27, 0xf6};
    op.call_gas_limit_ = 21000;
    op.signature_ = {0x01, 0x02};
    qng::uint256_union hash = op.Hash(EntryPoint(), 813);

    qng::EvmAddress beneficiary;
    beneficiary.DecodeHex("0x3333333333333333333333333333333333333333");
    std::string input =
        qng::BytesToEvmHex(TestEncodeHandleOps({other, op}, beneficiary));

    MockEthClient client;
    client.SetResult("eth_blockNumber", "\"0x100\"");
    client.SetResult("eth_getLogs", "[" + EventJson(hash, 0) + "]");
    client.SetResult("eth_getTransactionByHash",
                     "{\"hash\":\"" + TX_HASH + "\",\"input\":\"" + input
                         + "\"}");

    boost::optional<qng::HashLookupResult> result;
    qng::Error error = qng::GetUserOperationByHash(client, hash, EntryPoint(),
                                                   813, 2000, result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_TRUE(static_cast<bool>(result));
    ASSERT_EQ(op.sender_, result->user_operation_.sender_);
    ASSERT_EQ(3, result->user_operation_.nonce_);
    ASSERT_EQ(op.call_data_, result->user_operation_.call_data_);
    ASSERT_EQ(245, result->block_number_);
    ASSERT_EQ(BLOCK_HASH, result->block_hash_.StringEvmHex());
    ASSERT_EQ(TX_HASH, result->transaction_hash_.StringEvmHex());

    qng::Json json;
    result->SerializeJson(json);
    ASSERT_EQ("0xf5", json.at("blockNumber").get<std::string>());
    ASSERT_EQ(SENDER, json.at("userOperation").at("sender").get<std::string>());

    // another chain id gives another hash, nothing in the bundle matches
    error = qng::GetUserOperationByHash(client, hash, EntryPoint(), 1, 2000,
                                        result);
    ASSERT_FALSE(static_cast<bool>(error));
    ASSERT_FALSE(static_cast<bool>(result));
}
