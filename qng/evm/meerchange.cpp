#include <qng/evm/meerchange.hpp>

#include <qng/common/log.hpp>
#include <qng/evm/abi.hpp>
#include <qng/evm/crypto.hpp>
#include <qng/evm/transaction.hpp>

std::string const qng::MeerChange::EXPORT_4337 =
    "export4337(bytes32,uint32,uint64,string)";

qng::TransactOpts::TransactOpts(const qng::Eoa& signer, uint64_t chain_id)
    : signer_(signer), chain_id_(chain_id), value_(0)
{
}

qng::BoundContract::BoundContract(
    const qng::EvmAddress& address,
    const std::shared_ptr<qng::EthClient>& client)
    : address_(address), client_(client)
{
}

qng::Error qng::BoundContract::Transact(const qng::TransactOpts& opts,
                                        const std::vector<uint8_t>& input,
                                        qng::uint256_union& hash) const
{
    if (opts.chain_id_ == 0)
    {
        return qng::Error(qng::ErrorCode::BRIDGE_CHAIN_ID);
    }

    qng::DynamicFeeTx tx;
    tx.chain_id_ = opts.chain_id_;
    tx.to_ = address_;
    tx.value_ = opts.value_;
    tx.data_ = input;

    qng::Error error = client_->PendingNonce(opts.signer_.Address(), tx.nonce_);
    IF_ERROR_RETURN(error, error);

    qng::GasPrices prices;
    error = client_->GasPrices(prices);
    IF_ERROR_RETURN(error, error);
    tx.max_fee_per_gas_ = prices.max_fee_per_gas_;
    tx.max_priority_fee_per_gas_ = prices.max_priority_fee_per_gas_;

    qng::CallMsg msg;
    msg.from_ = opts.signer_.Address();
    msg.to_ = address_;
    msg.value_ = opts.value_;
    msg.data_ = input;
    error = client_->EstimateGas(msg, tx.gas_);
    IF_ERROR_RETURN(error, error);

    if (opts.signer_.Sign(tx))
    {
        return qng::Error(qng::ErrorCode::SIGN_TRANSACTION);
    }

    error = client_->SendRawTransaction(tx.Serialize(), hash);
    IF_ERROR_RETURN(error, error);

    if (hash != tx.Hash())
    {
        qng::Log::Network(qng::ToString(
            "BoundContract::Transact: node returned hash ", hash.StringEvmHex(),
            ", local hash ", tx.Hash().StringEvmHex()));
    }
    return qng::Error();
}

const qng::EvmAddress& qng::BoundContract::Address() const
{
    return address_;
}

qng::MeerChange::MeerChange(const qng::EvmAddress& address,
                            const std::shared_ptr<qng::EthClient>& client)
    : BoundContract(address, client)
{
}

qng::Error qng::MeerChange::Export4337(const qng::TransactOpts& opts,
                                       const qng::uint256_union& txid,
                                       uint32_t idx, uint64_t fee,
                                       const std::string& sig,
                                       qng::uint256_union& hash) const
{
    qng::AbiEncoder encoder;
    encoder.Bytes32(txid).Uint(idx).Uint(fee).String(sig);
    return Transact(opts, encoder.EncodeCall(qng::FunctionSelector(EXPORT_4337)),
                    hash);
}
