#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <qng/bridge/invoker.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>

namespace qng
{
class GasPrices
{
public:
    GasPrices();
    void SerializeJson(qng::Json&) const;

    qng::uint256_t max_fee_per_gas_;
    qng::uint256_t max_priority_fee_per_gas_;
};

class EvmLog
{
public:
    EvmLog();
    bool DeserializeJson(const qng::Json&);

    qng::EvmAddress address_;
    std::vector<qng::uint256_union> topics_;
    std::vector<uint8_t> data_;
    uint64_t block_number_;
    qng::uint256_union block_hash_;
    qng::uint256_union transaction_hash_;
    uint64_t log_index_;
    qng::Json json_;
};

class LogFilter
{
public:
    LogFilter();
    void SerializeJson(qng::Json&) const;

    uint64_t from_block_;
    // latest when absent
    boost::optional<uint64_t> to_block_;
    qng::EvmAddress address_;
    // An absent topic matches anything at its position
    std::vector<boost::optional<qng::uint256_union>> topics_;
};

class CallMsg
{
public:
    CallMsg();
    void SerializeJson(qng::Json&) const;

    qng::EvmAddress from_;
    qng::EvmAddress to_;
    qng::uint256_t value_;
    std::vector<uint8_t> data_;
};

// Typed view of a primary chain node. Every method is one JSON-RPC call
// except GasPrices, which combines the fee market reads.
class EthClient
{
public:
    EthClient(const std::shared_ptr<qng::JsonRpcInvoker>&);
    virtual ~EthClient() = default;

    virtual qng::Error Call(const std::string&, const qng::RpcParams&,
                            qng::Json&) const;
    virtual qng::Error ChainId(uint64_t&) const;
    virtual qng::Error BlockNumber(uint64_t&) const;
    // Base fee of the latest block, absent before London
    virtual qng::Error LatestBaseFee(boost::optional<qng::uint256_t>&) const;
    virtual qng::Error MaxPriorityFeePerGas(qng::uint256_t&) const;
    virtual qng::Error GasPrice(qng::uint256_t&) const;
    virtual qng::Error PendingNonce(const qng::EvmAddress&, uint64_t&) const;
    virtual qng::Error EstimateGas(const qng::CallMsg&, uint64_t&) const;
    virtual qng::Error SendRawTransaction(const std::vector<uint8_t>&,
                                          qng::uint256_union&) const;
    virtual qng::Error GetLogs(const qng::LogFilter&,
                               std::vector<qng::EvmLog>&) const;
    virtual qng::Error TransactionReceipt(const qng::uint256_union&,
                                          qng::Json&) const;
    virtual qng::Error TransactionByHash(const qng::uint256_union&,
                                         qng::Json&) const;
    virtual qng::Error GasPrices(qng::GasPrices&) const;

protected:
    qng::Error Quantity_(const std::string&, const qng::RpcParams&,
                         qng::uint256_t&) const;

    std::shared_ptr<qng::JsonRpcInvoker> invoker_;
};
}  // namespace qng
