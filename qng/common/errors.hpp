#pragma once

#include <cstdint>
#include <string>

namespace qng
{
enum class ErrorCode : int
{
    SUCCESS                             = 0,
    GENERIC                             = 1,
    STREAM                              = 2,
    UNKNOWN_COMMAND                     = 3,
    DATA_PATH                           = 4,
    CONFIG_VERSION                      = 5,
    OPEN_OR_CREATE_FILE                 = 6,
    WRITE_FILE                          = 7,
    CONFIG_LOG_VERSION                  = 8,
    CONFIG_EXISTS                       = 9,
    RPC_DISABLED                        = 10,
    RPC_START                           = 11,

    JSON_GENERIC                        = 100,
    JSON_CONFIG_VERSION                 = 101,
    JSON_CONFIG_QNG_URL                 = 102,
    JSON_CONFIG_ETH_URL                 = 103,
    JSON_CONFIG_CHAIN_ID                = 104,
    JSON_CONFIG_MEERCHANGE              = 105,
    JSON_CONFIG_PRIVATE_KEY             = 106,
    JSON_CONFIG_ENTRY_POINT             = 107,
    JSON_CONFIG_BLOCK_RANGE             = 108,
    JSON_CONFIG_MAX_GAS_LIMIT           = 109,
    JSON_CONFIG_TRACER                  = 110,
    JSON_CONFIG_IO_THREADS              = 111,
    JSON_CONFIG_PROVIDERS               = 112,
    JSON_CONFIG_PROVIDER_MODE           = 113,
    JSON_CONFIG_RPC                     = 114,
    JSON_CONFIG_RPC_ENABLE              = 115,
    JSON_CONFIG_RPC_ADDRESS             = 116,
    JSON_CONFIG_RPC_PORT                = 117,
    JSON_CONFIG_RPC_ENABLE_CONTROL      = 118,
    JSON_CONFIG_RPC_WHITELIST           = 119,
    JSON_CONFIG_LOG                     = 120,
    JSON_CONFIG_LOG_VERSION             = 121,
    JSON_CONFIG_LOG_NETWORK             = 122,
    JSON_CONFIG_LOG_RPC                 = 123,
    JSON_CONFIG_LOG_TO_CERR             = 124,
    JSON_CONFIG_LOG_MAX_SIZE            = 125,
    JSON_CONFIG_LOG_ROTATION_SIZE       = 126,
    JSON_CONFIG_LOG_FLUSH               = 127,

    // transport
    INVALID_URL                         = 200,
    LOAD_CERT                           = 201,
    DNS_RESOLVE                         = 202,
    TCP_CONNECT                         = 203,
    SET_SSL_SNI                         = 204,
    SSL_HANDSHAKE                       = 205,
    WRITE_STREAM                        = 206,
    READ_STREAM                         = 207,
    HTTP_POST                           = 208,
    HTTP_CLIENT_USED                    = 209,
    HTTP_NO_RESPONSE                    = 210,
    HTTP_RESPONSE_JSON                  = 211,

    // protocol
    JSON_RPC_EMPTY_RESPONSE             = 300,
    JSON_RPC_RESULT_TYPE                = 301,

    // node reported
    JSON_RPC_ERROR                      = 400,

    // encoding
    HEX_STRING                          = 500,
    HASH_LENGTH                         = 501,
    EVM_ADDRESS                         = 502,
    ABI_DECODE                          = 503,
    PRIVATE_KEY                         = 504,
    USER_OP_JSON                        = 505,
    STATE_OVERRIDE_JSON                 = 506,

    // submission
    BRIDGE_SUBMIT                       = 600,
    SIGN_TRANSACTION                    = 601,

    BRIDGE_NOT_CONFIGURED               = 700,
    BRIDGE_CHAIN_ID                     = 701,
    GAS_LIMIT_EXCEEDED                  = 702,

    RPC_GENERIC                         = 800,
    RPC_JSON                            = 801,
    RPC_JSON_DEPTH                      = 802,
    RPC_HTTP_BODY_SIZE                  = 803,
    RPC_NOT_LOCALHOST                   = 804,
    RPC_ENABLE_CONTROL                  = 805,
    RPC_UNKNOWN_METHOD                  = 806,
    RPC_MISS_PARAMS                     = 807,
    RPC_INVALID_PARAMS                  = 808,

    MAX
};
std::string ErrorString(qng::ErrorCode);

enum class ErrorKind
{
    NONE            = 0,
    TRANSPORT       = 1,
    PROTOCOL        = 2,
    RPC             = 3,
    ENCODING        = 4,
    SUBMISSION      = 5,
    CONFIG          = 6,
    OTHER           = 7,
};
qng::ErrorKind ErrorCodeKind(qng::ErrorCode);
std::string ErrorKindString(qng::ErrorKind);

// An error code plus the detail text reported by whoever failed, e.g. the
// node's own error message. Converts to true when an error occurred.
class Error
{
public:
    Error();
    Error(qng::ErrorCode);
    Error(qng::ErrorCode, const std::string&);
    explicit operator bool() const;
    bool operator==(qng::ErrorCode) const;
    bool operator!=(qng::ErrorCode) const;
    qng::ErrorKind Kind() const;
    std::string Message() const;

    qng::ErrorCode code_;
    std::string message_;
};
}  // namespace qng

#define IF_NOT_SUCCESS_RETURN(error_code)       \
    if (error_code != qng::ErrorCode::SUCCESS)  \
    {                                           \
        return error_code;                      \
    }

#define IF_NOT_SUCCESS_RETURN_VOID(error_code)  \
    if (error_code != qng::ErrorCode::SUCCESS)  \
    {                                           \
        return;                                 \
    }
