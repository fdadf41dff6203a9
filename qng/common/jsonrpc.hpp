#pragma once

#include <cstdint>
#include <string>
#include <boost/optional.hpp>
#include <qng/common/util.hpp>

namespace qng
{
// Returns true if the text is not valid JSON
bool StringToJson(const std::string&, qng::Json&);
// Compact text, invalid UTF-8 in strings is replaced
std::string JsonToString(const qng::Json&);
// String member of an object, none when absent or of another type
boost::optional<std::string> JsonGetString(const qng::Json&,
                                           const std::string&);

// Ordered, typed parameter list of a JSON-RPC request
class RpcParams
{
public:
    RpcParams();
    RpcParams& AddString(const std::string&);
    RpcParams& AddInt(int64_t);
    RpcParams& AddUint(uint64_t);
    RpcParams& AddBool(bool);
    RpcParams& AddJson(const qng::Json&);
    size_t Size() const;
    const qng::Json& Array() const;

private:
    qng::Json items_;
};

class JsonRpcRequest
{
public:
    JsonRpcRequest(const std::string&, const qng::RpcParams&, uint64_t);
    std::string Serialize() const;

    std::string method_;
    qng::RpcParams params_;
    uint64_t id_;

    static char constexpr VERSION[] = "2.0";
};

class JsonRpcResponse
{
public:
    JsonRpcResponse();
    // Returns true if the text is not a JSON object or the error member
    // is malformed
    bool Deserialize(const std::string&);
    bool IsError() const;
    bool HasResult() const;

    qng::Json id_;
    std::string jsonrpc_;
    boost::optional<std::string> message_;
    // absent when the member is missing or null
    boost::optional<qng::Json> result_;
    int64_t error_code_;
    std::string error_message_;
};

// Server side envelopes, the id is echoed as received
std::string JsonRpcResultJson(const qng::Json&, const qng::Json&);
std::string JsonRpcErrorJson(const qng::Json&, int64_t, const std::string&);

enum class JsonRpcErrorCode : int64_t
{
    PARSE_ERROR         = -32700,
    INVALID_REQUEST     = -32600,
    METHOD_NOT_FOUND    = -32601,
    INVALID_PARAMS      = -32602,
    INTERNAL_ERROR      = -32603,
    SERVER_ERROR        = -32000,
};
}  // namespace qng
