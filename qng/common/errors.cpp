#include <qng/common/errors.hpp>

std::string qng::ErrorString(qng::ErrorCode error_code)
{
    switch (error_code)
    {
        case qng::ErrorCode::SUCCESS:
        {
            return "Success";
        }
        case qng::ErrorCode::GENERIC:
        {
            return "Unknown error";
        }
        case qng::ErrorCode::STREAM:
        {
            return "Invalid stream";
        }
        case qng::ErrorCode::UNKNOWN_COMMAND:
        {
            return "Unknown command";
        }
        case qng::ErrorCode::DATA_PATH:
        {
            return "Failed to create data directory, please check <data_path>";
        }
        case qng::ErrorCode::CONFIG_VERSION:
        {
            return "Unknown config version";
        }
        case qng::ErrorCode::OPEN_OR_CREATE_FILE:
        {
            return "Failed to open or create file";
        }
        case qng::ErrorCode::WRITE_FILE:
        {
            return "Failed to write file";
        }
        case qng::ErrorCode::CONFIG_LOG_VERSION:
        {
            return "Unknown log config version";
        }
        case qng::ErrorCode::CONFIG_EXISTS:
        {
            return "The config file already exists";
        }
        case qng::ErrorCode::RPC_DISABLED:
        {
            return "Rpc is disabled in the config, nothing to serve";
        }
        case qng::ErrorCode::RPC_START:
        {
            return "Failed to start rpc";
        }
        case qng::ErrorCode::JSON_GENERIC:
        {
            return "Invalid json";
        }
        case qng::ErrorCode::JSON_CONFIG_VERSION:
        {
            return "Invalid version in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_QNG_URL:
        {
            return "Invalid qng_url in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_ETH_URL:
        {
            return "Invalid eth_url in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_CHAIN_ID:
        {
            return "Invalid chain_id in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_MEERCHANGE:
        {
            return "Invalid meerchange in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_PRIVATE_KEY:
        {
            return "Invalid private_key in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_ENTRY_POINT:
        {
            return "Invalid entry_point in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_BLOCK_RANGE:
        {
            return "Invalid block_range in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_MAX_GAS_LIMIT:
        {
            return "Invalid max_gas_limit in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_TRACER:
        {
            return "Invalid tracer in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_IO_THREADS:
        {
            return "Invalid io_threads in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_PROVIDERS:
        {
            return "Invalid providers in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_PROVIDER_MODE:
        {
            return "Invalid provider mode in config file, expect 'noop' or 'live'";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC:
        {
            return "Invalid rpc in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC_ENABLE:
        {
            return "Invalid rpc.enable in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC_ADDRESS:
        {
            return "Invalid rpc.address in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC_PORT:
        {
            return "Invalid rpc.port in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC_ENABLE_CONTROL:
        {
            return "Invalid rpc.enable_control in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_RPC_WHITELIST:
        {
            return "Invalid rpc.whitelist in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG:
        {
            return "Invalid log in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_VERSION:
        {
            return "Invalid log.version in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_NETWORK:
        {
            return "Invalid log.network in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_RPC:
        {
            return "Invalid log.rpc in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_TO_CERR:
        {
            return "Invalid log.log_to_cerr in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_MAX_SIZE:
        {
            return "Invalid log.max_size in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_ROTATION_SIZE:
        {
            return "Invalid log.rotation_size in config file";
        }
        case qng::ErrorCode::JSON_CONFIG_LOG_FLUSH:
        {
            return "Invalid log.flush in config file";
        }
        case qng::ErrorCode::INVALID_URL:
        {
            return "Invalid url";
        }
        case qng::ErrorCode::LOAD_CERT:
        {
            return "Failed to load certificate file cacert.pem";
        }
        case qng::ErrorCode::DNS_RESOLVE:
        {
            return "Failed to resolve host";
        }
        case qng::ErrorCode::TCP_CONNECT:
        {
            return "Failed to connect to host";
        }
        case qng::ErrorCode::SET_SSL_SNI:
        {
            return "Failed to set SNI";
        }
        case qng::ErrorCode::SSL_HANDSHAKE:
        {
            return "Ssl handshake failed";
        }
        case qng::ErrorCode::WRITE_STREAM:
        {
            return "Failed to write stream";
        }
        case qng::ErrorCode::READ_STREAM:
        {
            return "Failed to read stream";
        }
        case qng::ErrorCode::HTTP_POST:
        {
            return "Http post failed";
        }
        case qng::ErrorCode::HTTP_CLIENT_USED:
        {
            return "The http client has already been used";
        }
        case qng::ErrorCode::HTTP_NO_RESPONSE:
        {
            return "No http response received";
        }
        case qng::ErrorCode::HTTP_RESPONSE_JSON:
        {
            return "Invalid json in http response";
        }
        case qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE:
        {
            return "network request exception";
        }
        case qng::ErrorCode::JSON_RPC_RESULT_TYPE:
        {
            return "Unexpected result in json-rpc response";
        }
        case qng::ErrorCode::JSON_RPC_ERROR:
        {
            return "Json-rpc error";
        }
        case qng::ErrorCode::HEX_STRING:
        {
            return "Invalid hex string";
        }
        case qng::ErrorCode::HASH_LENGTH:
        {
            return "Invalid hash length";
        }
        case qng::ErrorCode::EVM_ADDRESS:
        {
            return "Invalid evm address";
        }
        case qng::ErrorCode::ABI_DECODE:
        {
            return "Failed to decode abi data";
        }
        case qng::ErrorCode::PRIVATE_KEY:
        {
            return "Invalid private key";
        }
        case qng::ErrorCode::USER_OP_JSON:
        {
            return "Invalid user operation";
        }
        case qng::ErrorCode::STATE_OVERRIDE_JSON:
        {
            return "Invalid state override set";
        }
        case qng::ErrorCode::BRIDGE_SUBMIT:
        {
            return "Failed to submit cross chain transaction";
        }
        case qng::ErrorCode::SIGN_TRANSACTION:
        {
            return "Failed to sign transaction";
        }
        case qng::ErrorCode::BRIDGE_NOT_CONFIGURED:
        {
            return "The cross chain bridge is not configured";
        }
        case qng::ErrorCode::BRIDGE_CHAIN_ID:
        {
            return "Invalid chain id for transaction signing";
        }
        case qng::ErrorCode::GAS_LIMIT_EXCEEDED:
        {
            return "The estimated gas exceeds the max gas limit";
        }
        case qng::ErrorCode::RPC_GENERIC:
        {
            return "Unknown rpc error";
        }
        case qng::ErrorCode::RPC_JSON:
        {
            return "Invalid json in rpc request";
        }
        case qng::ErrorCode::RPC_JSON_DEPTH:
        {
            return "The json depth of the rpc request exceeds the limit";
        }
        case qng::ErrorCode::RPC_HTTP_BODY_SIZE:
        {
            return "The http body size exceeds the limit";
        }
        case qng::ErrorCode::RPC_NOT_LOCALHOST:
        {
            return "The rpc request is not from localhost";
        }
        case qng::ErrorCode::RPC_ENABLE_CONTROL:
        {
            return "Please enable rpc control in config file";
        }
        case qng::ErrorCode::RPC_UNKNOWN_METHOD:
        {
            return "Unknown rpc method";
        }
        case qng::ErrorCode::RPC_MISS_PARAMS:
        {
            return "Missing params in rpc request";
        }
        case qng::ErrorCode::RPC_INVALID_PARAMS:
        {
            return "Invalid params in rpc request";
        }
        default:
        {
            return "Invalid error code";
        }
    }
}
qng::ErrorKind qng::ErrorCodeKind(qng::ErrorCode error_code)
{
    if (error_code == qng::ErrorCode::SUCCESS)
    {
        return qng::ErrorKind::NONE;
    }

    int code = static_cast<int>(error_code);
    if (code >= 100 && code < 200)
    {
        return qng::ErrorKind::CONFIG;
    }
    if (code >= 200 && code < 300)
    {
        return qng::ErrorKind::TRANSPORT;
    }
    if (code >= 300 && code < 400)
    {
        return qng::ErrorKind::PROTOCOL;
    }
    if (code >= 400 && code < 500)
    {
        return qng::ErrorKind::RPC;
    }
    if (code >= 500 && code < 600)
    {
        return qng::ErrorKind::ENCODING;
    }
    if (code >= 600 && code < 700)
    {
        return qng::ErrorKind::SUBMISSION;
    }

    switch (error_code)
    {
        case qng::ErrorCode::CONFIG_VERSION:
        case qng::ErrorCode::CONFIG_LOG_VERSION:
        case qng::ErrorCode::RPC_DISABLED:
        case qng::ErrorCode::BRIDGE_NOT_CONFIGURED:
        case qng::ErrorCode::BRIDGE_CHAIN_ID:
        {
            return qng::ErrorKind::CONFIG;
        }
        default:
        {
            return qng::ErrorKind::OTHER;
        }
    }
}

std::string qng::ErrorKindString(qng::ErrorKind kind)
{
    switch (kind)
    {
        case qng::ErrorKind::NONE:
        {
            return "None";
        }
        case qng::ErrorKind::TRANSPORT:
        {
            return "TransportError";
        }
        case qng::ErrorKind::PROTOCOL:
        {
            return "ProtocolError";
        }
        case qng::ErrorKind::RPC:
        {
            return "RpcError";
        }
        case qng::ErrorKind::ENCODING:
        {
            return "EncodingError";
        }
        case qng::ErrorKind::SUBMISSION:
        {
            return "SubmissionError";
        }
        case qng::ErrorKind::CONFIG:
        {
            return "ConfigError";
        }
        default:
        {
            return "Error";
        }
    }
}

qng::Error::Error() : code_(qng::ErrorCode::SUCCESS)
{
}

qng::Error::Error(qng::ErrorCode error_code) : code_(error_code)
{
}

qng::Error::Error(qng::ErrorCode error_code, const std::string& message)
    : code_(error_code), message_(message)
{
}

qng::Error::operator bool() const
{
    return code_ != qng::ErrorCode::SUCCESS;
}

bool qng::Error::operator==(qng::ErrorCode error_code) const
{
    return code_ == error_code;
}

bool qng::Error::operator!=(qng::ErrorCode error_code) const
{
    return code_ != error_code;
}

qng::ErrorKind qng::Error::Kind() const
{
    return qng::ErrorCodeKind(code_);
}

std::string qng::Error::Message() const
{
    if (!message_.empty())
    {
        return message_;
    }
    return qng::ErrorString(code_);
}
