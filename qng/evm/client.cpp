#include <qng/evm/client.hpp>

#include <limits>
#include <qng/common/jsonrpc.hpp>

qng::GasPrices::GasPrices()
    : max_fee_per_gas_(0), max_priority_fee_per_gas_(0)
{
}

void qng::GasPrices::SerializeJson(qng::Json& json) const
{
    json["maxFeePerGas"] = qng::EncodeEvmQuantity(max_fee_per_gas_);
    json["maxPriorityFeePerGas"] =
        qng::EncodeEvmQuantity(max_priority_fee_per_gas_);
}

qng::EvmLog::EvmLog() : block_number_(0), log_index_(0)
{
}

bool qng::EvmLog::DeserializeJson(const qng::Json& json)
{
    if (!json.is_object())
    {
        return true;
    }
    json_ = json;

    auto address_o = qng::JsonGetString(json, "address");
    if (!address_o || address_.DecodeHex(*address_o))
    {
        return true;
    }

    bool error = false;
    topics_.clear();
    auto topics_it = json.find("topics");
    if (topics_it != json.end() && !topics_it->is_null())
    {
        if (!topics_it->is_array())
        {
            return true;
        }
        for (const auto& i : *topics_it)
        {
            qng::uint256_union topic;
            if (!i.is_string() || topic.DecodeEvmHex(i.get<std::string>()))
            {
                return true;
            }
            topics_.push_back(topic);
        }
    }

    data_.clear();
    auto data_o = qng::JsonGetString(json, "data");
    error = qng::EvmHexToBytes(data_o ? *data_o : "0x", data_);
    IF_ERROR_RETURN(error, true);

    auto block_number_o = qng::JsonGetString(json, "blockNumber");
    if (block_number_o)
    {
        error = qng::EvmHexToUint64(*block_number_o, block_number_);
        IF_ERROR_RETURN(error, true);
    }

    auto block_hash_o = qng::JsonGetString(json, "blockHash");
    if (block_hash_o)
    {
        error = block_hash_.DecodeEvmHex(*block_hash_o);
        IF_ERROR_RETURN(error, true);
    }

    auto tx_hash_o = qng::JsonGetString(json, "transactionHash");
    if (tx_hash_o)
    {
        error = transaction_hash_.DecodeEvmHex(*tx_hash_o);
        IF_ERROR_RETURN(error, true);
    }

    auto log_index_o = qng::JsonGetString(json, "logIndex");
    if (log_index_o)
    {
        error = qng::EvmHexToUint64(*log_index_o, log_index_);
        IF_ERROR_RETURN(error, true);
    }

    return false;
}

qng::LogFilter::LogFilter() : from_block_(0)
{
}

void qng::LogFilter::SerializeJson(qng::Json& json) const
{
    json["fromBlock"] = qng::Uint64ToEvmHex(from_block_);
    json["toBlock"] = to_block_ ? qng::Uint64ToEvmHex(*to_block_) : "latest";
    json["address"] = address_.StringHex();

    qng::Json topics = qng::Json::array();
    for (const auto& i : topics_)
    {
        if (i)
        {
            topics.push_back(i->StringEvmHex());
        }
        else
        {
            topics.push_back(nullptr);
        }
    }
    json["topics"] = topics;
}

qng::CallMsg::CallMsg() : value_(0)
{
}

void qng::CallMsg::SerializeJson(qng::Json& json) const
{
    json["from"] = from_.StringHex();
    json["to"] = to_.StringHex();
    if (value_ > 0)
    {
        json["value"] = qng::EncodeEvmQuantity(value_);
    }
    json["data"] = qng::BytesToEvmHex(data_);
}

qng::EthClient::EthClient(
    const std::shared_ptr<qng::JsonRpcInvoker>& invoker)
    : invoker_(invoker)
{
}

qng::Error qng::EthClient::Call(const std::string& method,
                                const qng::RpcParams& params,
                                qng::Json& result) const
{
    return invoker_->Invoke(method, params, result);
}

qng::Error qng::EthClient::ChainId(uint64_t& chain_id) const
{
    qng::uint256_t value;
    qng::Error error = Quantity_("eth_chainId", qng::RpcParams(), value);
    IF_ERROR_RETURN(error, error);
    if (value > std::numeric_limits<uint64_t>::max())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE, "eth_chainId");
    }
    chain_id = static_cast<uint64_t>(value);
    return qng::Error();
}

qng::Error qng::EthClient::BlockNumber(uint64_t& number) const
{
    qng::uint256_t value;
    qng::Error error = Quantity_("eth_blockNumber", qng::RpcParams(), value);
    IF_ERROR_RETURN(error, error);
    if (value > std::numeric_limits<uint64_t>::max())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_blockNumber");
    }
    number = static_cast<uint64_t>(value);
    return qng::Error();
}

qng::Error qng::EthClient::LatestBaseFee(
    boost::optional<qng::uint256_t>& base_fee) const
{
    qng::Json block;
    qng::RpcParams params;
    params.AddString("latest").AddBool(false);
    qng::Error error = Call("eth_getBlockByNumber", params, block);
    IF_ERROR_RETURN(error, error);
    if (!block.is_object())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_getBlockByNumber");
    }

    base_fee = boost::none;
    auto base_fee_o = qng::JsonGetString(block, "baseFeePerGas");
    if (!base_fee_o)
    {
        return qng::Error();
    }

    qng::uint256_t value;
    if (qng::DecodeEvmQuantity(*base_fee_o, value))
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "baseFeePerGas");
    }
    base_fee = value;
    return qng::Error();
}

qng::Error qng::EthClient::MaxPriorityFeePerGas(qng::uint256_t& tip) const
{
    return Quantity_("eth_maxPriorityFeePerGas", qng::RpcParams(), tip);
}

qng::Error qng::EthClient::GasPrice(qng::uint256_t& price) const
{
    return Quantity_("eth_gasPrice", qng::RpcParams(), price);
}

qng::Error qng::EthClient::PendingNonce(const qng::EvmAddress& account,
                                        uint64_t& nonce) const
{
    qng::RpcParams params;
    params.AddString(account.StringHex()).AddString("pending");
    qng::uint256_t value;
    qng::Error error = Quantity_("eth_getTransactionCount", params, value);
    IF_ERROR_RETURN(error, error);
    if (value > std::numeric_limits<uint64_t>::max())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_getTransactionCount");
    }
    nonce = static_cast<uint64_t>(value);
    return qng::Error();
}

qng::Error qng::EthClient::EstimateGas(const qng::CallMsg& msg,
                                       uint64_t& gas) const
{
    qng::Json json;
    msg.SerializeJson(json);
    qng::RpcParams params;
    params.AddJson(json);
    qng::uint256_t value;
    qng::Error error = Quantity_("eth_estimateGas", params, value);
    IF_ERROR_RETURN(error, error);
    if (value > std::numeric_limits<uint64_t>::max())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_estimateGas");
    }
    gas = static_cast<uint64_t>(value);
    return qng::Error();
}

qng::Error qng::EthClient::SendRawTransaction(
    const std::vector<uint8_t>& raw, qng::uint256_union& hash) const
{
    qng::Json result;
    qng::RpcParams params;
    params.AddString(qng::BytesToEvmHex(raw));
    qng::Error error = Call("eth_sendRawTransaction", params, result);
    IF_ERROR_RETURN(error, error);

    if (!result.is_string() || hash.DecodeEvmHex(result.get<std::string>()))
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_sendRawTransaction");
    }
    return qng::Error();
}

qng::Error qng::EthClient::GetLogs(const qng::LogFilter& filter,
                                   std::vector<qng::EvmLog>& logs) const
{
    qng::Json json;
    filter.SerializeJson(json);
    qng::RpcParams params;
    params.AddJson(json);

    qng::Json result;
    qng::Error error = Call("eth_getLogs", params, result);
    IF_ERROR_RETURN(error, error);
    if (!result.is_array())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE, "eth_getLogs");
    }

    for (const auto& i : result)
    {
        qng::EvmLog log;
        if (log.DeserializeJson(i))
        {
            return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                              "eth_getLogs");
        }
        logs.push_back(log);
    }
    return qng::Error();
}

qng::Error qng::EthClient::TransactionReceipt(const qng::uint256_union& hash,
                                              qng::Json& receipt) const
{
    qng::RpcParams params;
    params.AddString(hash.StringEvmHex());
    return Call("eth_getTransactionReceipt", params, receipt);
}

qng::Error qng::EthClient::TransactionByHash(const qng::uint256_union& hash,
                                             qng::Json& transaction) const
{
    qng::RpcParams params;
    params.AddString(hash.StringEvmHex());
    return Call("eth_getTransactionByHash", params, transaction);
}

qng::Error qng::EthClient::GasPrices(qng::GasPrices& prices) const
{
    boost::optional<qng::uint256_t> base_fee;
    qng::Error error = LatestBaseFee(base_fee);
    IF_ERROR_RETURN(error, error);

    if (!base_fee)
    {
        qng::uint256_t price;
        error = GasPrice(price);
        IF_ERROR_RETURN(error, error);
        prices.max_fee_per_gas_ = price;
        prices.max_priority_fee_per_gas_ = price;
        return qng::Error();
    }

    qng::uint256_t tip;
    error = MaxPriorityFeePerGas(tip);
    IF_ERROR_RETURN(error, error);
    prices.max_priority_fee_per_gas_ = tip;
    prices.max_fee_per_gas_ = *base_fee * 2 + tip;
    return qng::Error();
}

qng::Error qng::EthClient::Quantity_(const std::string& method,
                                     const qng::RpcParams& params,
                                     qng::uint256_t& value) const
{
    qng::Json result;
    qng::Error error = Call(method, params, result);
    IF_ERROR_RETURN(error, error);

    if (!result.is_string()
        || qng::DecodeEvmQuantity(result.get<std::string>(), value))
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE, method);
    }
    return qng::Error();
}
