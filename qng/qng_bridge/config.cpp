#include <qng/qng_bridge/config.hpp>

uint32_t constexpr qng::BridgeConfig::VERSION;
uint16_t constexpr qng::BridgeConfig::DEFAULT_RPC_PORT;
uint64_t constexpr qng::BridgeConfig::DEFAULT_CHAIN_ID;
uint64_t constexpr qng::BridgeConfig::DEFAULT_BLOCK_RANGE;
uint64_t constexpr qng::BridgeConfig::DEFAULT_MAX_GAS_LIMIT;
uint32_t constexpr qng::BridgeConfig::DEFAULT_IO_THREADS;

namespace
{
// ERC-4337 v0.6 entry point
std::string const DEFAULT_ENTRY_POINT =
    "0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789";
}  // namespace

qng::BridgeConfig::BridgeConfig()
    : chain_id_(qng::BridgeConfig::DEFAULT_CHAIN_ID),
      block_range_(qng::BridgeConfig::DEFAULT_BLOCK_RANGE),
      max_gas_limit_(qng::BridgeConfig::DEFAULT_MAX_GAS_LIMIT),
      io_threads_(qng::BridgeConfig::DEFAULT_IO_THREADS)
{
    qng_url_.Parse("http://127.0.0.1:18131");
    eth_url_.Parse("http://127.0.0.1:18545");
    entry_point_.DecodeHex(DEFAULT_ENTRY_POINT);
    rpc_.port_ = qng::BridgeConfig::DEFAULT_RPC_PORT;
}

qng::ErrorCode qng::BridgeConfig::DeserializeJson(bool& upgraded,
                                                  qng::Ptree& ptree)
{
    if (ptree.empty())
    {
        upgraded = true;
        SerializeJson(ptree);
        return qng::ErrorCode::SUCCESS;
    }

    qng::ErrorCode error_code = qng::ErrorCode::SUCCESS;
    try
    {
        error_code = qng::ErrorCode::JSON_CONFIG_VERSION;
        std::string version_str = ptree.get<std::string>("version");
        uint32_t version = 0;
        bool error = qng::StringToUint(version_str, version);
        IF_ERROR_RETURN(error, error_code);

        error_code = UpgradeJson(upgraded, version, ptree);
        IF_NOT_SUCCESS_RETURN(error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_QNG_URL;
        error = qng_url_.Parse(ptree.get<std::string>("qng_url"));
        IF_ERROR_RETURN(error, error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_ETH_URL;
        error = eth_url_.Parse(ptree.get<std::string>("eth_url"));
        IF_ERROR_RETURN(error, error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_CHAIN_ID;
        error = qng::StringToUint(ptree.get<std::string>("chain_id"), chain_id_);
        IF_ERROR_RETURN(error, error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_MEERCHANGE;
        meerchange_ = ptree.get<std::string>("meerchange");
        qng::StringTrim(meerchange_, " \t\r\n");
        if (!meerchange_.empty())
        {
            qng::EvmAddress address;
            error = address.DecodeHex(meerchange_);
            IF_ERROR_RETURN(error, error_code);
        }

        error_code = qng::ErrorCode::JSON_CONFIG_PRIVATE_KEY;
        private_key_ = ptree.get<std::string>("private_key");

        error_code = qng::ErrorCode::JSON_CONFIG_ENTRY_POINT;
        error = entry_point_.DecodeHex(ptree.get<std::string>("entry_point"));
        IF_ERROR_RETURN(error, error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_BLOCK_RANGE;
        error = qng::StringToUint(ptree.get<std::string>("block_range"),
                                  block_range_);
        IF_ERROR_RETURN(error, error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_MAX_GAS_LIMIT;
        qng::uint256_union max_gas_limit;
        error = max_gas_limit.DecodeDec(ptree.get<std::string>("max_gas_limit"));
        IF_ERROR_RETURN(error, error_code);
        max_gas_limit_ = max_gas_limit.Number();

        error_code = qng::ErrorCode::JSON_CONFIG_TRACER;
        tracer_ = ptree.get<std::string>("tracer");

        error_code = qng::ErrorCode::JSON_CONFIG_IO_THREADS;
        error = qng::StringToUint(ptree.get<std::string>("io_threads"),
                                  io_threads_);
        IF_ERROR_RETURN(error, error_code);
        if (io_threads_ == 0)
        {
            return error_code;
        }

        error_code = qng::ErrorCode::JSON_CONFIG_PROVIDERS;
        qng::Ptree& providers_ptree = ptree.get_child("providers");
        error_code = providers_.DeserializeJson(upgraded, providers_ptree);
        IF_NOT_SUCCESS_RETURN(error_code);

        error_code = qng::ErrorCode::JSON_CONFIG_RPC;
        const qng::Ptree& rpc_ptree = ptree.get_child("rpc");

        error_code = qng::ErrorCode::JSON_CONFIG_RPC_ENABLE;
        rpc_.enable_ = rpc_ptree.get<bool>("enable");

        error_code = qng::ErrorCode::JSON_CONFIG_RPC_ADDRESS;
        std::string address = rpc_ptree.get<std::string>("address");
        boost::system::error_code ec;
        rpc_.address_ = boost::asio::ip::make_address_v4(address, ec);
        if (ec)
        {
            return error_code;
        }

        error_code = qng::ErrorCode::JSON_CONFIG_RPC_PORT;
        std::string port = rpc_ptree.get<std::string>("port");
        if (port.empty() || qng::StringToUint(port, rpc_.port_))
        {
            return error_code;
        }

        error_code = qng::ErrorCode::JSON_CONFIG_RPC_ENABLE_CONTROL;
        rpc_.enable_control_ = rpc_ptree.get<bool>("enable_control");

        error_code = qng::ErrorCode::JSON_CONFIG_RPC_WHITELIST;
        rpc_.whitelist_.clear();
        auto whitelist = rpc_ptree.get_child("whitelist");
        for (const auto& i : whitelist)
        {
            address = i.second.get<std::string>("");
            boost::asio::ip::address_v4 ip =
                boost::asio::ip::make_address_v4(address, ec);
            if (ec)
            {
                return error_code;
            }
            rpc_.whitelist_.push_back(ip);
        }

        error_code = qng::ErrorCode::JSON_CONFIG_LOG;
        qng::Ptree& log_ptree = ptree.get_child("log");
        error_code = log_.DeserializeJson(upgraded, log_ptree);
        IF_NOT_SUCCESS_RETURN(error_code);
    }
    catch (const std::exception&)
    {
        return error_code;
    }
    return qng::ErrorCode::SUCCESS;
}

void qng::BridgeConfig::SerializeJson(qng::Ptree& ptree) const
{
    ptree.put("version", qng::BridgeConfig::VERSION);
    ptree.put("qng_url", qng_url_.String());
    ptree.put("eth_url", eth_url_.String());
    ptree.put("chain_id", chain_id_);
    ptree.put("meerchange", meerchange_);
    ptree.put("private_key", "");
    ptree.put("entry_point", entry_point_.StringHex());
    ptree.put("block_range", block_range_);
    ptree.put("max_gas_limit",
              qng::uint256_union(max_gas_limit_).StringDec());
    ptree.put("tracer", tracer_);
    ptree.put("io_threads", io_threads_);

    qng::Ptree providers;
    providers_.SerializeJson(providers);
    ptree.add_child("providers", providers);

    qng::Ptree rpc;
    rpc.put("enable", rpc_.enable_);
    rpc.put("address", rpc_.address_.to_string());
    rpc.put("port", std::to_string(rpc_.port_));
    rpc.put("enable_control", rpc_.enable_control_);
    qng::Ptree whitelist;
    for (const auto& i : rpc_.whitelist_)
    {
        qng::Ptree entry;
        entry.put("", i.to_string());
        whitelist.push_back(std::make_pair("", entry));
    }
    rpc.add_child("whitelist", whitelist);
    ptree.add_child("rpc", rpc);

    qng::Ptree log;
    log_.SerializeJson(log);
    ptree.add_child("log", log);
}

qng::ErrorCode qng::BridgeConfig::UpgradeJson(bool& upgraded, uint32_t version,
                                              qng::Ptree& ptree) const
{
    switch (version)
    {
        case 1:
        {
            break;
        }
        default:
        {
            return qng::ErrorCode::CONFIG_VERSION;
        }
    }

    return qng::ErrorCode::SUCCESS;
}

bool qng::BridgeConfig::BridgeEnabled() const
{
    return !meerchange_.empty();
}
