#pragma once

#include <map>
#include <vector>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>
#include <qng/common/util.hpp>
#include <qng/evm/abi.hpp>

namespace qng
{
// ERC-4337 v0.6 user operation
class UserOperation
{
public:
    UserOperation();
    qng::ErrorCode DeserializeJson(const qng::Json&);
    void SerializeJson(qng::Json&) const;
    // Reads the tuple element of a handleOps argument
    bool DeserializeAbi(const qng::AbiDecoder&);
    // abi.encode of the fields with the dynamic ones hashed
    std::vector<uint8_t> Pack() const;
    qng::uint256_union Hash(const qng::EvmAddress&, uint64_t) const;
    // Zero when paymasterAndData is empty
    qng::EvmAddress Paymaster() const;

    qng::EvmAddress sender_;
    qng::uint256_t nonce_;
    std::vector<uint8_t> init_code_;
    std::vector<uint8_t> call_data_;
    qng::uint256_t call_gas_limit_;
    qng::uint256_t verification_gas_limit_;
    qng::uint256_t pre_verification_gas_;
    qng::uint256_t max_fee_per_gas_;
    qng::uint256_t max_priority_fee_per_gas_;
    std::vector<uint8_t> paymaster_and_data_;
    std::vector<uint8_t> signature_;
};

// handleOps((address,uint256,bytes,bytes,uint256,uint256,uint256,uint256,
// uint256,bytes,bytes)[],address)
class HandleOpsCall
{
public:
    bool Decode(const std::vector<uint8_t>&);

    std::vector<qng::UserOperation> ops_;
    qng::EvmAddress beneficiary_;

    static std::string const SIGNATURE;
};

class UserOperationReceipt
{
public:
    UserOperationReceipt();
    void SerializeJson(qng::Json&) const;

    qng::uint256_union user_op_hash_;
    qng::EvmAddress entry_point_;
    qng::EvmAddress sender_;
    qng::uint256_t nonce_;
    qng::EvmAddress paymaster_;
    qng::uint256_t actual_gas_cost_;
    qng::uint256_t actual_gas_used_;
    bool success_;
    std::string reason_;
    std::vector<qng::Json> logs_;
    qng::Json receipt_;
};

class HashLookupResult
{
public:
    HashLookupResult();
    void SerializeJson(qng::Json&) const;

    qng::UserOperation user_operation_;
    qng::EvmAddress entry_point_;
    uint64_t block_number_;
    qng::uint256_union block_hash_;
    qng::uint256_union transaction_hash_;
};

// Per account state overrides passed through to eth_call
class StateOverrideSet
{
public:
    qng::ErrorCode DeserializeJson(const qng::Json&);
    void SerializeJson(qng::Json&) const;
    bool Empty() const;

    std::map<qng::EvmAddress, qng::Json> accounts_;
};

std::string const USER_OPERATION_EVENT =
    "UserOperationEvent(bytes32,address,address,uint256,bool,uint256,"
    "uint256)";
qng::uint256_union UserOperationEventTopic();
}  // namespace qng
