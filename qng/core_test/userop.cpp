#include <gtest/gtest.h>
#include <qng/core_test/test_util.hpp>
#include <qng/common/jsonrpc.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/userop.hpp>

namespace
{
std::string const ENTRY_POINT = "0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789";

std::string const USER_OP_JSON =
    "{\"sender\":\"0x1111111111111111111111111111111111111111\","
    "\"nonce\":\"0x3\",\"initCode\":\"0x\",\"callData\":\"0xb61d27f6\","
    "\"callGasLimit\":\"0x5208\",\"verificationGasLimit\":\"0x186a0\","
    "\"preVerificationGas\":\"0xc350\",\"maxFeePerGas\":\"0x64\","
    "\"maxPriorityFeePerGas\":\"0xa\","
    "\"paymasterAndData\":\"0x2222222222222222222222222222222222222222ff\","
    "\"signature\":\"0x0102\"}";
}  // namespace

TEST(UserOperation, DeserializeJson)
{
    qng::UserOperation op;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, op.DeserializeJson(TestJson(USER_OP_JSON)));
    ASSERT_EQ("0x1111111111111111111111111111111111111111",
              op.sender_.StringHex());
    ASSERT_EQ(3, op.nonce_);
    ASSERT_TRUE(op.init_code_.empty());
    ASSERT_EQ("b61d27f6", TestEncodeHex(op.call_data_));
    ASSERT_EQ(21000, op.call_gas_limit_);
    ASSERT_EQ(100000, op.verification_gas_limit_);
    ASSERT_EQ(50000, op.pre_verification_gas_);
    ASSERT_EQ(100, op.max_fee_per_gas_);
    ASSERT_EQ(10, op.max_priority_fee_per_gas_);
    ASSERT_EQ("0x2222222222222222222222222222222222222222",
              op.Paymaster().StringHex());
    ASSERT_EQ("0102", TestEncodeHex(op.signature_));

    qng::Json json;
    op.SerializeJson(json);
    ASSERT_EQ("0x5208", json.at("callGasLimit").get<std::string>());
    ASSERT_EQ("0x", json.at("initCode").get<std::string>());
}

TEST(UserOperation, InvalidJson)
{
    qng::UserOperation op;
    ASSERT_EQ(qng::ErrorCode::USER_OP_JSON,
              op.DeserializeJson(TestJson("{\"nonce\":\"0x1\"}")));

    std::string bad_nonce = USER_OP_JSON;
    bad_nonce.replace(bad_nonce.find("\"0x3\""), 5, "\"3\"");
    ASSERT_EQ(qng::ErrorCode::USER_OP_JSON,
              op.DeserializeJson(TestJson(bad_nonce)));

    std::string bad_bytes = USER_OP_JSON;
    bad_bytes.replace(bad_bytes.find("0x0102"), 6, "0xzz");
    ASSERT_EQ(qng::ErrorCode::USER_OP_JSON,
              op.DeserializeJson(TestJson(bad_bytes)));
}

TEST(UserOperation, Hash)
{
    qng::UserOperation op;
    ASSERT_EQ(qng::ErrorCode::SUCCESS, op.DeserializeJson(TestJson(USER_OP_JSON)));
    qng::EvmAddress entry_point;
    ASSERT_FALSE(entry_point.DecodeHex(ENTRY_POINT));

    std::vector<uint8_t> packed = op.Pack();
    ASSERT_EQ(10 * 32, packed.size());

    qng::AbiEncoder encoder;
    encoder.Bytes32(qng::Keccak256(packed)).Address(entry_point).Uint(813);
    ASSERT_EQ(qng::Keccak256(encoder.Encode()), op.Hash(entry_point, 813));

    ASSERT_NE(op.Hash(entry_point, 813), op.Hash(entry_point, 814));

    // the signature is not part of the hash
    qng::UserOperation signed_op = op;
    signed_op.signature_ = {0xaa, 0xbb};
    ASSERT_EQ(op.Hash(entry_point, 813), signed_op.Hash(entry_point, 813));
}

TEST(HandleOpsCall, Decode)
{
    qng::UserOperation first;
    ASSERT_EQ(qng::ErrorCode::SUCCESS,
              first.DeserializeJson(TestJson(USER_OP_JSON)));
    qng::UserOperation second = first;
    second.nonce_ = 4;
    second.init_code_ = {0x01, 0x02, 0x03};
    second.paymaster_and_data_.clear();

    qng::EvmAddress beneficiary;
    ASSERT_FALSE(
        beneficiary.DecodeHex("0x3333333333333333333333333333333333333333"));
    std::vector<uint8_t> input = TestEncodeHandleOps({first, second}, beneficiary);

    qng::HandleOpsCall call;
    ASSERT_FALSE(call.Decode(input));
    ASSERT_EQ(beneficiary, call.beneficiary_);
    ASSERT_EQ(2, call.ops_.size());
    ASSERT_EQ(first.sender_, call.ops_[0].sender_);
    ASSERT_EQ(first.signature_, call.ops_[0].signature_);
    ASSERT_EQ(first.paymaster_and_data_, call.ops_[0].paymaster_and_data_);
    ASSERT_EQ(4, call.ops_[1].nonce_);
    ASSERT_EQ(second.init_code_, call.ops_[1].init_code_);
    ASSERT_TRUE(call.ops_[1].paymaster_and_data_.empty());

    input[0] ^= 0xff;
    ASSERT_TRUE(call.Decode(input));
    ASSERT_TRUE(call.Decode(std::vector<uint8_t>{0x01}));
}

TEST(UserOperationReceipt, SerializeJson)
{
    qng::UserOperationReceipt receipt;
    receipt.nonce_ = 1;
    receipt.success_ = true;
    receipt.actual_gas_cost_ = 1000;

    qng::Json json;
    receipt.SerializeJson(json);
    ASSERT_EQ("0x1", json.at("nonce").get<std::string>());
    ASSERT_EQ("0x3e8", json.at("actualGasCost").get<std::string>());
    ASSERT_EQ(true, json.at("success").get<bool>());
    ASSERT_TRUE(json.at("logs").is_array());
    ASSERT_TRUE(json.at("logs").empty());
    ASSERT_NE(std::string::npos,
              qng::JsonToString(json).find("\"logs\":[],\"receipt\":null"));
}

TEST(StateOverrideSet, DeserializeJson)
{
    qng::StateOverrideSet overrides;
    ASSERT_EQ(qng::ErrorCode::SUCCESS,
              overrides.DeserializeJson(TestJson(
                  "{\"0x1111111111111111111111111111111111111111\":"
                  "{\"balance\":\"0x1\",\"code\":\"0x00\"}}")));
    ASSERT_FALSE(overrides.Empty());
    ASSERT_EQ(1, overrides.accounts_.size());

    ASSERT_EQ(qng::ErrorCode::STATE_OVERRIDE_JSON,
              overrides.DeserializeJson(TestJson(
                  "{\"0x1111111111111111111111111111111111111111\":"
                  "{\"state\":{},\"stateDiff\":{}}}")));
    ASSERT_EQ(qng::ErrorCode::STATE_OVERRIDE_JSON,
              overrides.DeserializeJson(
                  TestJson("{\"0x11\":{\"balance\":\"0x1\"}}")));
    ASSERT_EQ(qng::ErrorCode::STATE_OVERRIDE_JSON,
              overrides.DeserializeJson(TestJson(
                  "{\"0x1111111111111111111111111111111111111111\":"
                  "{\"storage\":\"0x1\"}}")));

    ASSERT_EQ(qng::ErrorCode::STATE_OVERRIDE_JSON,
              overrides.DeserializeJson(TestJson(
                  "{\"0x1111111111111111111111111111111111111111\":\"0x1\"}")));

    ASSERT_EQ(qng::ErrorCode::SUCCESS,
              overrides.DeserializeJson(TestJson("{}")));
    ASSERT_TRUE(overrides.Empty());
}
