#include <qng/evm/userop.hpp>

#include <qng/common/jsonrpc.hpp>
#include <qng/evm/crypto.hpp>

std::string const qng::HandleOpsCall::SIGNATURE =
    "handleOps((address,uint256,bytes,bytes,uint256,uint256,uint256,uint256,"
    "uint256,bytes,bytes)[],address)";

namespace
{
bool GetQuantity(const qng::Json& json, const std::string& key,
                 qng::uint256_t& value)
{
    auto value_o = qng::JsonGetString(json, key);
    if (!value_o)
    {
        return true;
    }
    return qng::DecodeEvmQuantity(*value_o, value);
}

bool GetBytes(const qng::Json& json, const std::string& key,
              std::vector<uint8_t>& bytes)
{
    auto value_o = qng::JsonGetString(json, key);
    if (!value_o)
    {
        return true;
    }
    bytes.clear();
    return qng::EvmHexToBytes(*value_o, bytes);
}
}  // namespace

qng::UserOperation::UserOperation()
    : nonce_(0),
      call_gas_limit_(0),
      verification_gas_limit_(0),
      pre_verification_gas_(0),
      max_fee_per_gas_(0),
      max_priority_fee_per_gas_(0)
{
}

qng::ErrorCode qng::UserOperation::DeserializeJson(const qng::Json& json)
{
    auto sender_o = qng::JsonGetString(json, "sender");
    if (!sender_o || sender_.DecodeHex(*sender_o))
    {
        return qng::ErrorCode::USER_OP_JSON;
    }

    bool error = GetQuantity(json, "nonce", nonce_)
                 || GetBytes(json, "initCode", init_code_)
                 || GetBytes(json, "callData", call_data_)
                 || GetQuantity(json, "callGasLimit", call_gas_limit_)
                 || GetQuantity(json, "verificationGasLimit",
                                verification_gas_limit_)
                 || GetQuantity(json, "preVerificationGas",
                                pre_verification_gas_)
                 || GetQuantity(json, "maxFeePerGas", max_fee_per_gas_)
                 || GetQuantity(json, "maxPriorityFeePerGas",
                                max_priority_fee_per_gas_)
                 || GetBytes(json, "paymasterAndData", paymaster_and_data_)
                 || GetBytes(json, "signature", signature_);
    IF_ERROR_RETURN(error, qng::ErrorCode::USER_OP_JSON);

    return qng::ErrorCode::SUCCESS;
}

void qng::UserOperation::SerializeJson(qng::Json& json) const
{
    json["sender"] = sender_.StringHex();
    json["nonce"] = qng::EncodeEvmQuantity(nonce_);
    json["initCode"] = qng::BytesToEvmHex(init_code_);
    json["callData"] = qng::BytesToEvmHex(call_data_);
    json["callGasLimit"] = qng::EncodeEvmQuantity(call_gas_limit_);
    json["verificationGasLimit"] =
        qng::EncodeEvmQuantity(verification_gas_limit_);
    json["preVerificationGas"] = qng::EncodeEvmQuantity(pre_verification_gas_);
    json["maxFeePerGas"] = qng::EncodeEvmQuantity(max_fee_per_gas_);
    json["maxPriorityFeePerGas"] =
        qng::EncodeEvmQuantity(max_priority_fee_per_gas_);
    json["paymasterAndData"] = qng::BytesToEvmHex(paymaster_and_data_);
    json["signature"] = qng::BytesToEvmHex(signature_);
}

bool qng::UserOperation::DeserializeAbi(const qng::AbiDecoder& tuple)
{
    bool error = tuple.Address(0, sender_) || tuple.Uint(1, nonce_)
                 || tuple.Bytes(2, init_code_) || tuple.Bytes(3, call_data_)
                 || tuple.Uint(4, call_gas_limit_)
                 || tuple.Uint(5, verification_gas_limit_)
                 || tuple.Uint(6, pre_verification_gas_)
                 || tuple.Uint(7, max_fee_per_gas_)
                 || tuple.Uint(8, max_priority_fee_per_gas_)
                 || tuple.Bytes(9, paymaster_and_data_)
                 || tuple.Bytes(10, signature_);
    return error;
}

std::vector<uint8_t> qng::UserOperation::Pack() const
{
    qng::AbiEncoder encoder;
    encoder.Address(sender_)
        .Uint(nonce_)
        .Bytes32(qng::Keccak256(init_code_))
        .Bytes32(qng::Keccak256(call_data_))
        .Uint(call_gas_limit_)
        .Uint(verification_gas_limit_)
        .Uint(pre_verification_gas_)
        .Uint(max_fee_per_gas_)
        .Uint(max_priority_fee_per_gas_)
        .Bytes32(qng::Keccak256(paymaster_and_data_));
    return encoder.Encode();
}

qng::uint256_union qng::UserOperation::Hash(
    const qng::EvmAddress& entry_point, uint64_t chain_id) const
{
    qng::AbiEncoder encoder;
    encoder.Bytes32(qng::Keccak256(Pack()))
        .Address(entry_point)
        .Uint(chain_id);
    return qng::Keccak256(encoder.Encode());
}

qng::EvmAddress qng::UserOperation::Paymaster() const
{
    qng::EvmAddress paymaster;
    if (paymaster_and_data_.size() >= paymaster.bytes.size())
    {
        std::copy(paymaster_and_data_.begin(),
                  paymaster_and_data_.begin() + paymaster.bytes.size(),
                  paymaster.bytes.begin());
    }
    return paymaster;
}

bool qng::HandleOpsCall::Decode(const std::vector<uint8_t>& input)
{
    std::vector<uint8_t> selector = qng::FunctionSelector(SIGNATURE);
    if (input.size() < selector.size()
        || !std::equal(selector.begin(), selector.end(), input.begin()))
    {
        return true;
    }

    std::vector<uint8_t> args(input.begin() + selector.size(), input.end());
    qng::AbiDecoder decoder(args);
    bool error = decoder.Address(1, beneficiary_);
    IF_ERROR_RETURN(error, true);

    qng::AbiDecoder elements(args);
    size_t size = 0;
    error = decoder.Array(0, elements, size);
    IF_ERROR_RETURN(error, true);

    ops_.clear();
    for (size_t i = 0; i < size; ++i)
    {
        qng::AbiDecoder tuple(args);
        error = elements.Child(i, tuple);
        IF_ERROR_RETURN(error, true);

        qng::UserOperation op;
        error = op.DeserializeAbi(tuple);
        IF_ERROR_RETURN(error, true);
        ops_.push_back(op);
    }
    return false;
}

qng::UserOperationReceipt::UserOperationReceipt()
    : nonce_(0), actual_gas_cost_(0), actual_gas_used_(0), success_(false)
{
}

void qng::UserOperationReceipt::SerializeJson(qng::Json& json) const
{
    json["userOpHash"] = user_op_hash_.StringEvmHex();
    json["entryPoint"] = entry_point_.StringHex();
    json["sender"] = sender_.StringHex();
    json["nonce"] = qng::EncodeEvmQuantity(nonce_);
    json["paymaster"] = paymaster_.StringHex();
    json["actualGasCost"] = qng::EncodeEvmQuantity(actual_gas_cost_);
    json["actualGasUsed"] = qng::EncodeEvmQuantity(actual_gas_used_);
    json["success"] = success_;
    json["reason"] = reason_;

    qng::Json logs = qng::Json::array();
    for (const auto& i : logs_)
    {
        logs.push_back(i);
    }
    json["logs"] = logs;
    json["receipt"] = receipt_;
}

qng::HashLookupResult::HashLookupResult() : block_number_(0)
{
}

void qng::HashLookupResult::SerializeJson(qng::Json& json) const
{
    qng::Json op;
    user_operation_.SerializeJson(op);
    json["userOperation"] = op;
    json["entryPoint"] = entry_point_.StringHex();
    json["blockNumber"] = qng::Uint64ToEvmHex(block_number_);
    json["blockHash"] = block_hash_.StringEvmHex();
    json["transactionHash"] = transaction_hash_.StringEvmHex();
}

qng::ErrorCode qng::StateOverrideSet::DeserializeJson(const qng::Json& json)
{
    accounts_.clear();
    if (!json.is_object())
    {
        return qng::ErrorCode::STATE_OVERRIDE_JSON;
    }

    for (auto i = json.begin(); i != json.end(); ++i)
    {
        qng::EvmAddress address;
        if (address.DecodeHex(i.key()) || !i.value().is_object())
        {
            return qng::ErrorCode::STATE_OVERRIDE_JSON;
        }

        const qng::Json& account = i.value();
        for (auto field = account.begin(); field != account.end(); ++field)
        {
            if (field.key() != "balance" && field.key() != "nonce"
                && field.key() != "code" && field.key() != "state"
                && field.key() != "stateDiff")
            {
                return qng::ErrorCode::STATE_OVERRIDE_JSON;
            }
        }
        if (account.contains("state") && account.contains("stateDiff"))
        {
            return qng::ErrorCode::STATE_OVERRIDE_JSON;
        }
        accounts_[address] = account;
    }
    return qng::ErrorCode::SUCCESS;
}

void qng::StateOverrideSet::SerializeJson(qng::Json& json) const
{
    json = qng::Json::object();
    for (const auto& i : accounts_)
    {
        json[i.first.StringHex()] = i.second;
    }
}

bool qng::StateOverrideSet::Empty() const
{
    return accounts_.empty();
}

qng::uint256_union qng::UserOperationEventTopic()
{
    return qng::Keccak256(qng::USER_OPERATION_EVENT);
}
