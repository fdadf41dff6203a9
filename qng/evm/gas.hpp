#pragma once

#include <memory>
#include <string>
#include <qng/common/errors.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/userop.hpp>

namespace qng
{
// Calldata and per-op costs charged to a user op through preVerificationGas
class GasOverhead
{
public:
    GasOverhead();
    qng::uint256_t CalcPreVerificationGas(const qng::UserOperation&) const;

    uint64_t fixed_;
    uint64_t per_user_op_;
    uint64_t per_user_op_word_;
    uint64_t zero_byte_;
    uint64_t non_zero_byte_;
    uint64_t min_bundle_size_;
    uint64_t sig_size_;
};

class EstimateInput
{
public:
    EstimateInput();

    qng::EvmAddress entry_point_;
    qng::UserOperation op_;
    qng::StateOverrideSet overrides_;
    qng::GasOverhead overhead_;
    uint64_t chain_id_;
    qng::uint256_t max_gas_limit_;
    std::string tracer_;
};

class GasEstimator
{
public:
    virtual ~GasEstimator() = default;
    virtual qng::Error Estimate(const qng::EstimateInput&, uint64_t&,
                                uint64_t&) const = 0;
};

// Delegates to eth_estimateUserOperationGas of an upstream node
class RpcGasEstimator : public qng::GasEstimator
{
public:
    RpcGasEstimator(const std::shared_ptr<qng::EthClient>&);
    qng::Error Estimate(const qng::EstimateInput&, uint64_t&,
                        uint64_t&) const override;

private:
    std::shared_ptr<qng::EthClient> client_;
};
}  // namespace qng
