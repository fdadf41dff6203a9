#include <qng/bridge/adapter.hpp>

qng::RpcAdapter::RpcAdapter(
    const std::shared_ptr<qng::JsonRpcInvoker>& invoker,
    const std::shared_ptr<qng::CrossChainBridge>& bridge)
    : invoker_(invoker), bridge_(bridge)
{
}

qng::Error qng::RpcAdapter::GetBalance(const std::string& address,
                                       int64_t coin_id,
                                       qng::Json& result) const
{
    qng::RpcParams params;
    params.AddString(address).AddInt(coin_id);
    return invoker_->Invoke("qng_getBalance", params, result);
}

qng::Error qng::RpcAdapter::AddBalance(const std::string& address,
                                       qng::Json& result) const
{
    qng::RpcParams params;
    params.AddString(address);
    return invoker_->Invoke("qng_addBalance", params, result);
}

qng::Error qng::RpcAdapter::GetUtxos(const std::string& address,
                                     int64_t limit, bool locked,
                                     qng::Json& result) const
{
    qng::RpcParams params;
    params.AddString(address).AddInt(limit).AddBool(locked);
    return invoker_->Invoke("qng_getUTXOs", params, result);
}

qng::Error qng::RpcAdapter::SendRawTransaction(const std::string& raw,
                                               bool allow_high_fee,
                                               qng::Json& result) const
{
    qng::RpcParams params;
    params.AddString(raw).AddBool(allow_high_fee);
    return invoker_->Invoke("qng_sendRawTransaction", params, result);
}

qng::Error qng::RpcAdapter::CrossSend(const std::string& txid, uint32_t idx,
                                      uint64_t fee, const std::string& sig,
                                      std::string& hash) const
{
    if (!bridge_)
    {
        return qng::Error(qng::ErrorCode::BRIDGE_NOT_CONFIGURED);
    }

    qng::QngUserOp op;
    op.txid_ = txid;
    op.idx_ = idx;
    op.fee_ = fee;
    op.sig_ = sig;
    return bridge_->Send(op, hash);
}

bool qng::RpcAdapter::BridgeConfigured() const
{
    return bridge_ != nullptr;
}
