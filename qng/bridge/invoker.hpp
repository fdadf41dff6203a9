#pragma once

#include <string>
#include <qng/common/errors.hpp>
#include <qng/common/jsonrpc.hpp>
#include <qng/common/util.hpp>

namespace qng
{
// Sends one JSON-RPC 2.0 request per call with a single HTTP POST and
// returns the result member as received. Nothing is retried or shared between calls.
class JsonRpcInvoker
{
public:
    JsonRpcInvoker(const qng::Url&);
    virtual ~JsonRpcInvoker() = default;

    virtual qng::Error Invoke(const std::string&, const qng::RpcParams&,
                              qng::Json&) const;
    const qng::Url& Endpoint() const;

    static uint64_t constexpr REQUEST_ID = 1;

private:
    qng::Error Post_(const std::string&, uint32_t&, std::string&) const;
    qng::Error Decode_(qng::ErrorCode, uint32_t, const std::string&,
                       qng::Json&) const;

    qng::Url url_;
};
}  // namespace qng
