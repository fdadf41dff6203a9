#include <qng/bridge/invoker.hpp>

#include <memory>
#include <boost/asio.hpp>
#include <qng/common/log.hpp>
#include <qng/common/stat.hpp>
#include <qng/secure/http.hpp>

uint64_t constexpr qng::JsonRpcInvoker::REQUEST_ID;

qng::JsonRpcInvoker::JsonRpcInvoker(const qng::Url& url) : url_(url)
{
}

qng::Error qng::JsonRpcInvoker::Invoke(const std::string& method,
                                       const qng::RpcParams& params,
                                       qng::Json& result) const
{
    qng::JsonRpcRequest request(method, params, REQUEST_ID);

    uint32_t status = 0;
    std::string response;
    qng::Error error = Post_(request.Serialize(), status, response);
    if (!error || error == qng::ErrorCode::HTTP_POST)
    {
        error = Decode_(error.code_, status, response, result);
    }

    if (error)
    {
        qng::Stats::Add(error.code_, method, ": ", error.Message());
        qng::Log::Network(qng::ToString("JSON-RPC ", method, " to ",
                                        url_.String(), " failed: ",
                                        qng::ErrorKindString(error.Kind()),
                                        ", ", error.Message()));
    }
    return error;
}

const qng::Url& qng::JsonRpcInvoker::Endpoint() const
{
    return url_;
}

qng::Error qng::JsonRpcInvoker::Post_(const std::string& body,
                                      uint32_t& status,
                                      std::string& response) const
{
    boost::asio::io_service service;
    auto client = std::make_shared<qng::HttpClient>(service);

    bool responded = false;
    qng::ErrorCode result = qng::ErrorCode::HTTP_NO_RESPONSE;
    qng::ErrorCode error_code = client->Post(
        url_, body,
        [&](qng::ErrorCode error_code, uint32_t status_l,
            const std::string& response_l) {
            responded = true;
            result = error_code;
            status = status_l;
            response = response_l;
        });
    client.reset();
    if (error_code != qng::ErrorCode::SUCCESS)
    {
        return qng::Error(error_code, url_.String());
    }

    try
    {
        service.run();
    }
    catch (const std::exception& e)
    {
        return qng::Error(qng::ErrorCode::HTTP_NO_RESPONSE, e.what());
    }

    if (!responded)
    {
        return qng::Error(qng::ErrorCode::HTTP_NO_RESPONSE);
    }
    if (result == qng::ErrorCode::SUCCESS)
    {
        return qng::Error();
    }
    if (result == qng::ErrorCode::HTTP_POST)
    {
        return qng::Error(result, qng::ToString("http status ", status));
    }
    // the callback carries the transport cause in place of a body
    return qng::Error(result, response);
}

qng::Error qng::JsonRpcInvoker::Decode_(qng::ErrorCode transport,
                                        uint32_t status,
                                        const std::string& response,
                                        qng::Json& result) const
{
    qng::JsonRpcResponse envelope;
    bool error = envelope.Deserialize(response);
    if (error)
    {
        if (transport != qng::ErrorCode::SUCCESS)
        {
            return qng::Error(transport,
                              qng::ToString("http status ", status));
        }
        return qng::Error(qng::ErrorCode::HTTP_RESPONSE_JSON,
                          response.substr(0, 256));
    }

    // a decodable envelope is read the same way whatever the http status
    if (envelope.IsError())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_ERROR,
                          envelope.error_message_);
    }

    if (!envelope.HasResult())
    {
        return qng::Error(qng::ErrorCode::JSON_RPC_EMPTY_RESPONSE);
    }

    result = *envelope.result_;
    return qng::Error();
}
