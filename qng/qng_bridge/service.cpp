#include <qng/qng_bridge/service.hpp>

#include <limits>
#include <qng/common/jsonrpc.hpp>
#include <qng/common/stat.hpp>

qng::BridgeService::BridgeService(
    const qng::BridgeConfig& config,
    const std::shared_ptr<qng::RpcAdapter>& adapter,
    const qng::Providers& providers)
    : adapter_(adapter),
      providers_(providers),
      entry_point_(config.entry_point_),
      chain_id_(config.chain_id_),
      block_range_(config.block_range_)
{
}

qng::RpcHandlerMaker qng::BridgeService::RpcHandlerMaker()
{
    return [this](qng::Rpc& rpc, const std::string& body,
                  const boost::asio::ip::address_v4& ip,
                  const std::function<void(const std::string&)>& send_response)
               -> std::unique_ptr<qng::RpcHandler> {
        return std::make_unique<qng::BridgeRpcHandler>(*this, rpc, body, ip,
                                                       send_response);
    };
}

qng::BridgeRpcHandler::BridgeRpcHandler(
    qng::BridgeService& service, qng::Rpc& rpc, const std::string& body,
    const boost::asio::ip::address_v4& ip,
    const std::function<void(const std::string&)>& send_response)
    : qng::RpcHandler(rpc, body, ip, send_response), service_(service)
{
}

void qng::BridgeRpcHandler::ProcessImpl()
{
    if (method_ == "bridge_stats")
    {
        BridgeStats();
    }
    else if (method_ == "bridge_stop")
    {
        BridgeStop();
    }
    else if (method_ == "bundler_gasPrices")
    {
        BundlerGasPrices();
    }
    else if (method_ == "eth_estimateUserOperationGas")
    {
        EstimateUserOperationGas();
    }
    else if (method_ == "eth_getUserOperationByHash")
    {
        GetUserOperationByHash();
    }
    else if (method_ == "eth_getUserOperationReceipt")
    {
        GetUserOperationReceipt();
    }
    else if (method_ == "eth_maxPriorityFeePerGas")
    {
        MaxPriorityFeePerGas();
    }
    else if (method_ == "qng_addBalance")
    {
        QngAddBalance();
    }
    else if (method_ == "qng_crossSend")
    {
        QngCrossSend();
    }
    else if (method_ == "qng_getBalance")
    {
        QngGetBalance();
    }
    else if (method_ == "qng_getUTXOs")
    {
        QngGetUtxos();
    }
    else if (method_ == "qng_sendRawTransaction")
    {
        QngSendRawTransaction();
    }
    else
    {
        error_code_ = qng::ErrorCode::RPC_UNKNOWN_METHOD;
        error_message_ = qng::ToString("method not found: ", method_);
    }
}

void qng::BridgeRpcHandler::BridgeStats()
{
    if (CheckControl_())
    {
        return;
    }

    qng::Json stats;
    qng::Stats::SerializeJson(stats);
    SetResult_(stats);
}

void qng::BridgeRpcHandler::BridgeStop()
{
    if (CheckLocal_())
    {
        return;
    }

    Stop();
    SetResult_(true);
}

void qng::BridgeRpcHandler::BundlerGasPrices()
{
    qng::GasPrices prices;
    qng::Error error = service_.providers_.gas_prices_->GetGasPrices(prices);
    if (error)
    {
        SetError_(error);
        return;
    }

    qng::Json result;
    prices.SerializeJson(result);
    SetResult_(result);
}

void qng::BridgeRpcHandler::EstimateUserOperationGas()
{
    qng::Json op_json;
    bool error = GetParam_(0, op_json);
    IF_ERROR_RETURN_VOID(error);

    qng::UserOperation op;
    qng::ErrorCode error_code = op.DeserializeJson(op_json);
    if (error_code != qng::ErrorCode::SUCCESS)
    {
        error_code_ = error_code;
        return;
    }

    qng::EvmAddress entry_point;
    error = GetEntryPoint_(1, entry_point);
    IF_ERROR_RETURN_VOID(error);

    qng::StateOverrideSet overrides;
    if (ParamsSize_() > 2)
    {
        qng::Json overrides_json;
        error = GetParam_(2, overrides_json);
        IF_ERROR_RETURN_VOID(error);
        error_code = overrides.DeserializeJson(overrides_json);
        if (error_code != qng::ErrorCode::SUCCESS)
        {
            error_code_ = error_code;
            return;
        }
    }

    uint64_t verification_gas = 0;
    uint64_t call_gas = 0;
    qng::Error result_error = service_.providers_.gas_estimate_->EstimateGas(
        entry_point, op, overrides, verification_gas, call_gas);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }

    qng::Json result;
    result["preVerificationGas"] = qng::EncodeEvmQuantity(
        service_.overhead_.CalcPreVerificationGas(op));
    result["verificationGasLimit"] = qng::Uint64ToEvmHex(verification_gas);
    result["callGasLimit"] = qng::Uint64ToEvmHex(call_gas);
    SetResult_(result);
}

void qng::BridgeRpcHandler::GetUserOperationByHash()
{
    qng::uint256_union hash;
    bool error = GetHash_(0, hash);
    IF_ERROR_RETURN_VOID(error);

    boost::optional<qng::HashLookupResult> lookup;
    qng::Error result_error =
        service_.providers_.user_op_by_hash_->GetUserOperationByHash(
            hash, service_.entry_point_, service_.chain_id_,
            service_.block_range_, lookup);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    if (!lookup)
    {
        return;
    }

    qng::Json result;
    lookup->SerializeJson(result);
    SetResult_(result);
}

void qng::BridgeRpcHandler::GetUserOperationReceipt()
{
    qng::uint256_union hash;
    bool error = GetHash_(0, hash);
    IF_ERROR_RETURN_VOID(error);

    boost::optional<qng::UserOperationReceipt> receipt;
    qng::Error result_error =
        service_.providers_.receipt_->GetUserOperationReceipt(
            hash, service_.entry_point_, service_.block_range_, receipt);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    if (!receipt)
    {
        return;
    }

    qng::Json result;
    receipt->SerializeJson(result);
    SetResult_(result);
}

void qng::BridgeRpcHandler::MaxPriorityFeePerGas()
{
    qng::GasPrices prices;
    qng::Error error = service_.providers_.gas_prices_->GetGasPrices(prices);
    if (error)
    {
        SetError_(error);
        return;
    }

    SetResult_(qng::EncodeEvmQuantity(prices.max_priority_fee_per_gas_));
}

void qng::BridgeRpcHandler::QngAddBalance()
{
    std::string address;
    bool error = GetParamString_(0, address);
    IF_ERROR_RETURN_VOID(error);

    qng::Json result;
    qng::Error result_error = service_.adapter_->AddBalance(address, result);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    SetResult_(result);
}

void qng::BridgeRpcHandler::QngCrossSend()
{
    std::string txid;
    bool error = GetParamString_(0, txid);
    IF_ERROR_RETURN_VOID(error);

    uint64_t idx = 0;
    error = GetParamUint_(1, idx);
    IF_ERROR_RETURN_VOID(error);
    if (idx > std::numeric_limits<uint32_t>::max())
    {
        error_code_ = qng::ErrorCode::RPC_INVALID_PARAMS;
        error_message_ = "idx exceeds uint32";
        return;
    }

    uint64_t fee = 0;
    error = GetParamUint_(2, fee);
    IF_ERROR_RETURN_VOID(error);

    std::string sig;
    error = GetParamString_(3, sig);
    IF_ERROR_RETURN_VOID(error);

    std::string hash;
    qng::Error result_error = service_.adapter_->CrossSend(
        txid, static_cast<uint32_t>(idx), fee, sig, hash);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    SetResult_(hash);
}

void qng::BridgeRpcHandler::QngGetBalance()
{
    std::string address;
    bool error = GetParamString_(0, address);
    IF_ERROR_RETURN_VOID(error);

    uint64_t coin_id = 0;
    error = GetParamUint_(1, coin_id);
    IF_ERROR_RETURN_VOID(error);

    qng::Json result;
    qng::Error result_error = service_.adapter_->GetBalance(
        address, static_cast<int64_t>(coin_id), result);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    SetResult_(result);
}

void qng::BridgeRpcHandler::QngGetUtxos()
{
    std::string address;
    bool error = GetParamString_(0, address);
    IF_ERROR_RETURN_VOID(error);

    uint64_t limit = 0;
    error = GetParamUint_(1, limit);
    IF_ERROR_RETURN_VOID(error);

    bool locked = false;
    error = GetParamBool_(2, locked);
    IF_ERROR_RETURN_VOID(error);

    qng::Json result;
    qng::Error result_error = service_.adapter_->GetUtxos(
        address, static_cast<int64_t>(limit), locked, result);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    SetResult_(result);
}

void qng::BridgeRpcHandler::QngSendRawTransaction()
{
    std::string raw;
    bool error = GetParamString_(0, raw);
    IF_ERROR_RETURN_VOID(error);

    bool allow_high_fee = false;
    if (ParamsSize_() > 1)
    {
        error = GetParamBool_(1, allow_high_fee);
        IF_ERROR_RETURN_VOID(error);
    }

    qng::Json result;
    qng::Error result_error =
        service_.adapter_->SendRawTransaction(raw, allow_high_fee, result);
    if (result_error)
    {
        SetError_(result_error);
        return;
    }
    SetResult_(result);
}

bool qng::BridgeRpcHandler::GetHash_(size_t index, qng::uint256_union& hash)
{
    std::string str;
    bool error = GetParamString_(index, str);
    IF_ERROR_RETURN(error, true);

    error = hash.DecodeEvmHex(str);
    if (error)
    {
        error_code_ = qng::ErrorCode::HASH_LENGTH;
        error_message_ = qng::ToString("invalid hash: ", str);
        return true;
    }
    return false;
}

bool qng::BridgeRpcHandler::GetEntryPoint_(size_t index,
                                           qng::EvmAddress& entry_point)
{
    std::string str;
    bool error = GetParamString_(index, str);
    IF_ERROR_RETURN(error, true);

    error = entry_point.DecodeHex(str);
    if (error)
    {
        error_code_ = qng::ErrorCode::EVM_ADDRESS;
        error_message_ = qng::ToString("invalid entry point: ", str);
        return true;
    }

    if (entry_point != service_.entry_point_)
    {
        error_code_ = qng::ErrorCode::RPC_INVALID_PARAMS;
        error_message_ = qng::ToString("unsupported entry point: ", str);
        return true;
    }
    return false;
}
