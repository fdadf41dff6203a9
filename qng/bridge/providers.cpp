#include <qng/bridge/providers.hpp>

#include <qng/evm/filter.hpp>

qng::Error qng::NoopReceiptProvider::GetUserOperationReceipt(
    const qng::uint256_union&, const qng::EvmAddress&, uint64_t,
    boost::optional<qng::UserOperationReceipt>& receipt) const
{
    receipt = boost::none;
    return qng::Error();
}

qng::Error qng::NoopGasPriceProvider::GetGasPrices(
    qng::GasPrices& prices) const
{
    prices = qng::GasPrices();
    return qng::Error();
}

qng::Error qng::NoopGasEstimateProvider::EstimateGas(
    const qng::EvmAddress&, const qng::UserOperation&,
    const qng::StateOverrideSet&, uint64_t& verification_gas,
    uint64_t& call_gas) const
{
    verification_gas = 0;
    call_gas = 0;
    return qng::Error();
}

qng::Error qng::NoopUserOpByHashProvider::GetUserOperationByHash(
    const qng::uint256_union&, const qng::EvmAddress&, uint64_t, uint64_t,
    boost::optional<qng::HashLookupResult>& result) const
{
    result = boost::none;
    return qng::Error();
}

qng::EthReceiptProvider::EthReceiptProvider(
    const std::shared_ptr<qng::EthClient>& client)
    : client_(client)
{
}

qng::Error qng::EthReceiptProvider::GetUserOperationReceipt(
    const qng::uint256_union& hash, const qng::EvmAddress& entry_point,
    uint64_t block_range,
    boost::optional<qng::UserOperationReceipt>& receipt) const
{
    return qng::GetUserOperationReceipt(*client_, hash, entry_point,
                                        block_range, receipt);
}

qng::EthGasPriceProvider::EthGasPriceProvider(
    const std::shared_ptr<qng::EthClient>& client)
    : client_(client)
{
}

qng::Error qng::EthGasPriceProvider::GetGasPrices(
    qng::GasPrices& prices) const
{
    return client_->GasPrices(prices);
}

qng::EthGasEstimateProvider::EthGasEstimateProvider(
    const qng::GasOverhead& overhead, uint64_t chain_id,
    const qng::uint256_t& max_gas_limit, const std::string& tracer,
    const std::shared_ptr<qng::GasEstimator>& estimator)
    : overhead_(overhead),
      chain_id_(chain_id),
      max_gas_limit_(max_gas_limit),
      tracer_(tracer),
      estimator_(estimator)
{
}

qng::Error qng::EthGasEstimateProvider::EstimateGas(
    const qng::EvmAddress& entry_point, const qng::UserOperation& op,
    const qng::StateOverrideSet& overrides, uint64_t& verification_gas,
    uint64_t& call_gas) const
{
    qng::EstimateInput input;
    input.entry_point_ = entry_point;
    input.op_ = op;
    input.overrides_ = overrides;
    input.overhead_ = overhead_;
    input.chain_id_ = chain_id_;
    input.max_gas_limit_ = max_gas_limit_;
    input.tracer_ = tracer_;
    return estimator_->Estimate(input, verification_gas, call_gas);
}

qng::EthUserOpByHashProvider::EthUserOpByHashProvider(
    const std::shared_ptr<qng::EthClient>& client)
    : client_(client)
{
}

qng::Error qng::EthUserOpByHashProvider::GetUserOperationByHash(
    const qng::uint256_union& hash, const qng::EvmAddress& entry_point,
    uint64_t chain_id, uint64_t block_range,
    boost::optional<qng::HashLookupResult>& result) const
{
    return qng::GetUserOperationByHash(*client_, hash, entry_point, chain_id,
                                       block_range, result);
}

std::string qng::ProviderModeString(qng::ProviderMode mode)
{
    switch (mode)
    {
        case qng::ProviderMode::NOOP:
        {
            return "noop";
        }
        case qng::ProviderMode::LIVE:
        {
            return "live";
        }
        default:
        {
            return "unknown";
        }
    }
}

bool qng::StringToProviderMode(const std::string& str, qng::ProviderMode& mode)
{
    if (str == "noop")
    {
        mode = qng::ProviderMode::NOOP;
    }
    else if (str == "live")
    {
        mode = qng::ProviderMode::LIVE;
    }
    else
    {
        return true;
    }
    return false;
}

qng::ProvidersConfig::ProvidersConfig()
    : receipt_(qng::ProviderMode::LIVE),
      gas_prices_(qng::ProviderMode::LIVE),
      gas_estimate_(qng::ProviderMode::NOOP),
      user_op_by_hash_(qng::ProviderMode::LIVE)
{
}

qng::ErrorCode qng::ProvidersConfig::DeserializeJson(bool& upgraded,
                                                     qng::Ptree& ptree)
{
    try
    {
        bool error = qng::StringToProviderMode(
            ptree.get<std::string>("receipt"), receipt_);
        error = error
                || qng::StringToProviderMode(
                    ptree.get<std::string>("gas_prices"), gas_prices_);
        error = error
                || qng::StringToProviderMode(
                    ptree.get<std::string>("gas_estimate"), gas_estimate_);
        error = error
                || qng::StringToProviderMode(
                    ptree.get<std::string>("user_op_by_hash"),
                    user_op_by_hash_);
        IF_ERROR_RETURN(error, qng::ErrorCode::JSON_CONFIG_PROVIDER_MODE);
    }
    catch (const std::exception&)
    {
        return qng::ErrorCode::JSON_CONFIG_PROVIDERS;
    }
    return qng::ErrorCode::SUCCESS;
}

void qng::ProvidersConfig::SerializeJson(qng::Ptree& ptree) const
{
    ptree.put("receipt", qng::ProviderModeString(receipt_));
    ptree.put("gas_prices", qng::ProviderModeString(gas_prices_));
    ptree.put("gas_estimate", qng::ProviderModeString(gas_estimate_));
    ptree.put("user_op_by_hash", qng::ProviderModeString(user_op_by_hash_));
}

qng::Providers qng::MakeNoopProviders()
{
    qng::Providers providers;
    providers.receipt_ = std::make_shared<qng::NoopReceiptProvider>();
    providers.gas_prices_ = std::make_shared<qng::NoopGasPriceProvider>();
    providers.gas_estimate_ = std::make_shared<qng::NoopGasEstimateProvider>();
    providers.user_op_by_hash_ =
        std::make_shared<qng::NoopUserOpByHashProvider>();
    return providers;
}

qng::Providers qng::MakeProviders(
    const qng::ProvidersConfig& config,
    const std::shared_ptr<qng::EthClient>& client,
    const std::shared_ptr<qng::GasEstimator>& estimator,
    const qng::GasOverhead& overhead, uint64_t chain_id,
    const qng::uint256_t& max_gas_limit, const std::string& tracer)
{
    qng::Providers providers = qng::MakeNoopProviders();
    if (config.receipt_ == qng::ProviderMode::LIVE)
    {
        providers.receipt_ = std::make_shared<qng::EthReceiptProvider>(client);
    }
    if (config.gas_prices_ == qng::ProviderMode::LIVE)
    {
        providers.gas_prices_ =
            std::make_shared<qng::EthGasPriceProvider>(client);
    }
    if (config.gas_estimate_ == qng::ProviderMode::LIVE)
    {
        providers.gas_estimate_ = std::make_shared<qng::EthGasEstimateProvider>(
            overhead, chain_id, max_gas_limit, tracer, estimator);
    }
    if (config.user_op_by_hash_ == qng::ProviderMode::LIVE)
    {
        providers.user_op_by_hash_ =
            std::make_shared<qng::EthUserOpByHashProvider>(client);
    }
    return providers;
}
