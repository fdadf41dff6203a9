#include <qng/evm/filter.hpp>

#include <qng/common/jsonrpc.hpp>

qng::Error qng::FindUserOperationEvent(const qng::EthClient& client,
                                       const qng::uint256_union& hash,
                                       const qng::EvmAddress& entry_point,
                                       uint64_t block_range,
                                       boost::optional<qng::EvmLog>& event)
{
    event = boost::none;

    uint64_t head = 0;
    qng::Error error = client.BlockNumber(head);
    IF_ERROR_RETURN(error, error);

    qng::LogFilter filter;
    filter.from_block_ = head > block_range ? head - block_range : 0;
    filter.address_ = entry_point;
    filter.topics_.push_back(qng::UserOperationEventTopic());
    filter.topics_.push_back(hash);

    std::vector<qng::EvmLog> logs;
    error = client.GetLogs(filter, logs);
    IF_ERROR_RETURN(error, error);

    for (const auto& i : logs)
    {
        if (i.topics_.size() >= 2 && i.topics_[1] == hash)
        {
            event = i;
            break;
        }
    }
    return qng::Error();
}

qng::Error qng::GetUserOperationReceipt(
    const qng::EthClient& client, const qng::uint256_union& hash,
    const qng::EvmAddress& entry_point, uint64_t block_range,
    boost::optional<qng::UserOperationReceipt>& receipt)
{
    receipt = boost::none;

    boost::optional<qng::EvmLog> event;
    qng::Error error =
        qng::FindUserOperationEvent(client, hash, entry_point, block_range,
                                    event);
    IF_ERROR_RETURN(error, error);
    if (!event)
    {
        return qng::Error();
    }

    // topics: signature, userOpHash, sender, paymaster
    // data: nonce, success, actualGasCost, actualGasUsed
    qng::UserOperationReceipt result;
    qng::AbiDecoder data(event->data_);
    if (event->topics_.size() != 4 || data.Uint(0, result.nonce_)
        || data.Bool(1, result.success_)
        || data.Uint(2, result.actual_gas_cost_)
        || data.Uint(3, result.actual_gas_used_))
    {
        return qng::Error(qng::ErrorCode::ABI_DECODE,
                          qng::USER_OPERATION_EVENT);
    }
    result.user_op_hash_ = hash;
    result.entry_point_ = entry_point;
    result.sender_.FromWord(event->topics_[2]);
    result.paymaster_.FromWord(event->topics_[3]);

    error = client.TransactionReceipt(event->transaction_hash_,
                                      result.receipt_);
    IF_ERROR_RETURN(error, error);

    // logs emitted by this operation lie between the previous
    // UserOperationEvent of the bundle and its own event
    qng::uint256_union topic = qng::UserOperationEventTopic();
    std::vector<qng::Json> logs;
    auto logs_it = result.receipt_.find("logs");
    if (logs_it != result.receipt_.end() && logs_it->is_array())
    {
        for (const auto& i : *logs_it)
        {
            qng::EvmLog log;
            if (log.DeserializeJson(i))
            {
                return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                                  "eth_getTransactionReceipt");
            }
            if (log.log_index_ >= event->log_index_)
            {
                break;
            }
            if (log.address_ == entry_point && !log.topics_.empty()
                && log.topics_[0] == topic)
            {
                logs.clear();
                continue;
            }
            logs.push_back(i);
        }
    }
    result.logs_ = logs;

    receipt = result;
    return qng::Error();
}

qng::Error qng::GetUserOperationByHash(
    const qng::EthClient& client, const qng::uint256_union& hash,
    const qng::EvmAddress& entry_point, uint64_t chain_id,
    uint64_t block_range, boost::optional<qng::HashLookupResult>& result)
{
    result = boost::none;

    boost::optional<qng::EvmLog> event;
    qng::Error error =
        qng::FindUserOperationEvent(client, hash, entry_point, block_range,
                                    event);
    IF_ERROR_RETURN(error, error);
    if (!event)
    {
        return qng::Error();
    }

    qng::Json transaction;
    error = client.TransactionByHash(event->transaction_hash_, transaction);
    IF_ERROR_RETURN(error, error);

    std::vector<uint8_t> input;
    auto input_o = qng::JsonGetString(transaction, "input");
    if (!input_o || qng::EvmHexToBytes(*input_o, input))
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_RESULT_TYPE,
                          "eth_getTransactionByHash");
    }

    qng::HandleOpsCall call;
    if (call.Decode(input))
    {
        return qng::Error(qng::ErrorCode::ABI_DECODE,
                          qng::HandleOpsCall::SIGNATURE);
    }

    for (const auto& op : call.ops_)
    {
        if (op.Hash(entry_point, chain_id) != hash)
        {
            continue;
        }

        qng::HashLookupResult lookup;
        lookup.user_operation_ = op;
        lookup.entry_point_ = entry_point;
        lookup.block_number_ = event->block_number_;
        lookup.block_hash_ = event->block_hash_;
        lookup.transaction_hash_ = event->transaction_hash_;
        result = lookup;
        break;
    }
    return qng::Error();
}
