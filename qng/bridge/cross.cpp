#include <qng/bridge/cross.hpp>

#include <qng/common/log.hpp>
#include <qng/common/stat.hpp>
#include <qng/evm/meerchange.hpp>

qng::QngUserOp::QngUserOp() : idx_(0), fee_(0)
{
}

qng::CrossChainBridge::CrossChainBridge(
    const std::shared_ptr<qng::Eoa>& eoa,
    const std::shared_ptr<qng::EthClient>& client,
    const std::string& meerchange, uint64_t chain_id)
    : eoa_(eoa), client_(client), meerchange_(meerchange), chain_id_(chain_id)
{
}

qng::Error qng::CrossChainBridge::Send(const qng::QngUserOp& op,
                                       std::string& hash) const
{
    qng::EvmAddress address;
    if (address.DecodeHex(meerchange_))
    {
        return qng::Error(qng::ErrorCode::EVM_ADDRESS, meerchange_);
    }
    qng::MeerChange meerchange(address, client_);

    if (chain_id_ == 0)
    {
        return qng::Error(qng::ErrorCode::BRIDGE_CHAIN_ID);
    }
    qng::TransactOpts opts(*eoa_, chain_id_);

    qng::uint256_union txid;
    std::string txid_hex(op.txid_);
    qng::StringTrim(txid_hex, " \t\r\n");
    if (txid_hex.empty() || txid_hex == "0x" || txid_hex == "0X"
        || txid.DecodeEvmHexPadded(txid_hex))
    {
        return qng::Error(qng::ErrorCode::HEX_STRING,
                          qng::ToString("txid ", op.txid_));
    }

    qng::uint256_union tx_hash;
    qng::Error error =
        meerchange.Export4337(opts, txid, op.idx_, op.fee_, op.sig_, tx_hash);
    if (error)
    {
        qng::Error submit(qng::ErrorCode::BRIDGE_SUBMIT,
                          qng::ToString(qng::ErrorString(error.code_), ": ",
                                        error.Message()));
        qng::Stats::Add(submit);
        qng::Log::Error(qng::ToString("Cross send of ", txid.StringEvmHex(),
                                      ":", op.idx_, " failed: ",
                                      submit.Message()));
        return submit;
    }

    hash = tx_hash.StringEvmHex();
    qng::Log::Network(qng::ToString("Cross send of ", txid.StringEvmHex(), ":",
                                    op.idx_, " submitted, tx ", hash));
    return qng::Error();
}
