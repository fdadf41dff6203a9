#pragma once

#include <memory>
#include <string>
#include <boost/optional.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/numbers.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/gas.hpp>
#include <qng/evm/userop.hpp>

namespace qng
{
class ReceiptProvider
{
public:
    virtual ~ReceiptProvider() = default;
    virtual qng::Error GetUserOperationReceipt(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t,
        boost::optional<qng::UserOperationReceipt>&) const = 0;
};

class GasPriceProvider
{
public:
    virtual ~GasPriceProvider() = default;
    virtual qng::Error GetGasPrices(qng::GasPrices&) const = 0;
};

class GasEstimateProvider
{
public:
    virtual ~GasEstimateProvider() = default;
    // Outputs verification gas and call gas
    virtual qng::Error EstimateGas(const qng::EvmAddress&,
                                   const qng::UserOperation&,
                                   const qng::StateOverrideSet&, uint64_t&,
                                   uint64_t&) const = 0;
};

class UserOpByHashProvider
{
public:
    virtual ~UserOpByHashProvider() = default;
    virtual qng::Error GetUserOperationByHash(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t, uint64_t,
        boost::optional<qng::HashLookupResult>&) const = 0;
};

class NoopReceiptProvider : public qng::ReceiptProvider
{
public:
    qng::Error GetUserOperationReceipt(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t,
        boost::optional<qng::UserOperationReceipt>&) const override;
};

class NoopGasPriceProvider : public qng::GasPriceProvider
{
public:
    qng::Error GetGasPrices(qng::GasPrices&) const override;
};

class NoopGasEstimateProvider : public qng::GasEstimateProvider
{
public:
    qng::Error EstimateGas(const qng::EvmAddress&, const qng::UserOperation&,
                           const qng::StateOverrideSet&, uint64_t&,
                           uint64_t&) const override;
};

class NoopUserOpByHashProvider : public qng::UserOpByHashProvider
{
public:
    qng::Error GetUserOperationByHash(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t, uint64_t,
        boost::optional<qng::HashLookupResult>&) const override;
};

class EthReceiptProvider : public qng::ReceiptProvider
{
public:
    EthReceiptProvider(const std::shared_ptr<qng::EthClient>&);
    qng::Error GetUserOperationReceipt(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t,
        boost::optional<qng::UserOperationReceipt>&) const override;

private:
    std::shared_ptr<qng::EthClient> client_;
};

class EthGasPriceProvider : public qng::GasPriceProvider
{
public:
    EthGasPriceProvider(const std::shared_ptr<qng::EthClient>&);
    qng::Error GetGasPrices(qng::GasPrices&) const override;

private:
    std::shared_ptr<qng::EthClient> client_;
};

class EthGasEstimateProvider : public qng::GasEstimateProvider
{
public:
    EthGasEstimateProvider(const qng::GasOverhead&, uint64_t,
                           const qng::uint256_t&, const std::string&,
                           const std::shared_ptr<qng::GasEstimator>&);
    qng::Error EstimateGas(const qng::EvmAddress&, const qng::UserOperation&,
                           const qng::StateOverrideSet&, uint64_t&,
                           uint64_t&) const override;

private:
    qng::GasOverhead overhead_;
    uint64_t chain_id_;
    qng::uint256_t max_gas_limit_;
    std::string tracer_;
    std::shared_ptr<qng::GasEstimator> estimator_;
};

class EthUserOpByHashProvider : public qng::UserOpByHashProvider
{
public:
    EthUserOpByHashProvider(const std::shared_ptr<qng::EthClient>&);
    qng::Error GetUserOperationByHash(
        const qng::uint256_union&, const qng::EvmAddress&, uint64_t, uint64_t,
        boost::optional<qng::HashLookupResult>&) const override;

private:
    std::shared_ptr<qng::EthClient> client_;
};

enum class ProviderMode
{
    NOOP = 0,
    LIVE = 1,
};
std::string ProviderModeString(qng::ProviderMode);
bool StringToProviderMode(const std::string&, qng::ProviderMode&);

class ProvidersConfig
{
public:
    ProvidersConfig();
    qng::ErrorCode DeserializeJson(bool&, qng::Ptree&);
    void SerializeJson(qng::Ptree&) const;

    qng::ProviderMode receipt_;
    qng::ProviderMode gas_prices_;
    qng::ProviderMode gas_estimate_;
    qng::ProviderMode user_op_by_hash_;
};

// Chosen once at startup, not changed afterwards
class Providers
{
public:
    std::shared_ptr<qng::ReceiptProvider> receipt_;
    std::shared_ptr<qng::GasPriceProvider> gas_prices_;
    std::shared_ptr<qng::GasEstimateProvider> gas_estimate_;
    std::shared_ptr<qng::UserOpByHashProvider> user_op_by_hash_;
};

qng::Providers MakeNoopProviders();
qng::Providers MakeProviders(const qng::ProvidersConfig&,
                             const std::shared_ptr<qng::EthClient>&,
                             const std::shared_ptr<qng::GasEstimator>&,
                             const qng::GasOverhead&, uint64_t,
                             const qng::uint256_t&, const std::string&);
}  // namespace qng
