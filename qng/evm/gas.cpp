#include <qng/evm/gas.hpp>

#include <limits>
#include <qng/common/jsonrpc.hpp>
#include <qng/common/log.hpp>
#include <qng/evm/abi.hpp>

namespace
{
// Hex quantity or decimal, as a string or a number
bool GetGas(const qng::Json& json, const std::string& key, uint64_t& gas)
{
    auto it = json.find(key);
    if (it == json.end())
    {
        return true;
    }
    if (it->is_number_unsigned())
    {
        gas = it->get<uint64_t>();
        return false;
    }
    auto value_o = qng::JsonGetString(json, key);
    if (!value_o)
    {
        return true;
    }
    if (!qng::EvmHexToUint64(*value_o, gas))
    {
        return false;
    }
    return qng::StringToUint(*value_o, gas);
}
}  // namespace

qng::GasOverhead::GasOverhead()
    : fixed_(21000),
      per_user_op_(18300),
      per_user_op_word_(4),
      zero_byte_(4),
      non_zero_byte_(16),
      min_bundle_size_(1),
      sig_size_(65)
{
}

qng::uint256_t qng::GasOverhead::CalcPreVerificationGas(
    const qng::UserOperation& op) const
{
    // placeholders so the result doesn't depend on fields set afterwards
    qng::UserOperation sample(op);
    sample.pre_verification_gas_ = fixed_;
    if (sample.signature_.size() < sig_size_)
    {
        sample.signature_.assign(sig_size_, 0x01);
    }

    qng::AbiEncoder encoder;
    encoder.Address(sample.sender_)
        .Uint(sample.nonce_)
        .Bytes(sample.init_code_)
        .Bytes(sample.call_data_)
        .Uint(sample.call_gas_limit_)
        .Uint(sample.verification_gas_limit_)
        .Uint(sample.pre_verification_gas_)
        .Uint(sample.max_fee_per_gas_)
        .Uint(sample.max_priority_fee_per_gas_)
        .Bytes(sample.paymaster_and_data_)
        .Bytes(sample.signature_);
    std::vector<uint8_t> packed = encoder.Encode();

    qng::uint256_t call_data_cost = 0;
    for (auto i : packed)
    {
        call_data_cost += i == 0 ? zero_byte_ : non_zero_byte_;
    }
    uint64_t words = (packed.size() + qng::AbiDecoder::WORD_SIZE - 1)
                     / qng::AbiDecoder::WORD_SIZE;
    uint64_t bundle_size = min_bundle_size_ == 0 ? 1 : min_bundle_size_;

    return call_data_cost + fixed_ / bundle_size + per_user_op_
           + per_user_op_word_ * words;
}

qng::EstimateInput::EstimateInput() : chain_id_(0), max_gas_limit_(0)
{
}

qng::RpcGasEstimator::RpcGasEstimator(
    const std::shared_ptr<qng::EthClient>& client)
    : client_(client)
{
}

qng::Error qng::RpcGasEstimator::Estimate(const qng::EstimateInput& input,
                                          uint64_t& verification_gas,
                                          uint64_t& call_gas) const
{
    qng::Json op;
    input.op_.SerializeJson(op);
    qng::RpcParams params;
    params.AddJson(op).AddString(input.entry_point_.StringHex());
    if (!input.overrides_.Empty())
    {
        qng::Json overrides;
        input.overrides_.SerializeJson(overrides);
        params.AddJson(overrides);
    }

    qng::Json result;
    qng::Error error =
        client_->Call("eth_estimateUserOperationGas", params, result);
    IF_ERROR_RETURN(error, error);

    uint64_t verification = 0;
    uint64_t call = 0;
    bool parse_error =
        GetGas(result, "verificationGasLimit", verification)
        && GetGas(result, "verificationGas", verification);
    parse_error = parse_error || GetGas(result, "callGasLimit", call);
    if (parse_error)
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_estimateUserOperationGas");
    }

    qng::uint256_t total = qng::uint256_t(verification) + call;
    if (input.max_gas_limit_ > 0 && total > input.max_gas_limit_)
    {
        return qng::Error(
            qng::ErrorCode::GAS_LIMIT_EXCEEDED,
            qng::ToString("estimated gas ", total, " exceeds max gas limit ",
                          input.max_gas_limit_));
    }

    verification_gas = verification;
    call_gas = call;
    return qng::Error();
}
